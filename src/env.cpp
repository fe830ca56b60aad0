#include "dirpack/env.hpp"

#include "dirpack/constants.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace dirpack::env {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

}  // namespace

std::string Get(std::string_view name) {
    std::string key(name);
    const char* value = std::getenv(key.c_str());
    if (!value) {
        return {};
    }
    return std::string(value);
}

bool IsEnabled(std::string_view name, bool default_value) {
    std::string value = Get(name);
    if (value.empty()) {
        return default_value;
    }
    value = ToLower(value);
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        return false;
    }
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

std::optional<int> GetInt(std::string_view name, int min_value, int max_value) {
    std::string raw = Get(name);
    if (raw.empty()) {
        return std::nullopt;
    }
    try {
        std::size_t consumed = 0;
        int parsed = std::stoi(raw, &consumed);
        if (consumed != raw.size() || parsed < min_value || parsed > max_value) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

bool ColorDisabled() {
    // NO_COLOR disables colour whenever it is set, whatever the value.
    if (!Get(constants::kEnvNoColor).empty()) {
        return true;
    }
    return IsEnabled(constants::kEnvDirpackNoColor);
}

bool VerboseByDefault() {
    return IsEnabled(constants::kEnvVerbose);
}

}  // namespace dirpack::env
