#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace dirpack::env {

std::string Get(std::string_view name);
bool IsEnabled(std::string_view name, bool default_value = false);

// Integer value of `name` when it parses and lies in [min_value, max_value].
std::optional<int> GetInt(std::string_view name, int min_value, int max_value);

bool ColorDisabled();
bool VerboseByDefault();

}  // namespace dirpack::env
