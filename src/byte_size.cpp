#include "dirpack/byte_size.hpp"

#include "dirpack/constants.hpp"

#include <array>
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace dirpack {

namespace {

constexpr std::array<std::string_view, 6> kUnits = {"B", "KB", "MB", "GB", "TB", "PB"};

}  // namespace

ByteSize FileSize(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw NotAFileError(path);
    }
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw std::runtime_error("Failed to stat file " + path.string() + ": " + ec.message());
    }
    return {static_cast<std::uint64_t>(size)};
}

ByteSize FolderSize(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_directory(path, ec)) {
        throw NotADirectoryError(path);
    }
    ByteSize total;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(path)) {
        if (entry.is_symlink()) {
            continue;
        }
        if (entry.is_regular_file()) {
            total.bytes += static_cast<std::uint64_t>(entry.file_size());
        }
    }
    return total;
}

DisplaySize ToDisplaySize(ByteSize size) {
    const double kib = static_cast<double>(constants::kKibi);
    double value = static_cast<double>(size.bytes);
    std::size_t unit = 0;
    while (value >= kib && unit + 1 < kUnits.size()) {
        value /= kib;
        ++unit;
    }
    return {value, kUnits[unit]};
}

std::string FormatByteSize(ByteSize size, int precision) {
    DisplaySize display = ToDisplaySize(size);
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << display.value << " " << display.unit;
    return oss.str();
}

std::string FormatRatio(ByteSize numerator, ByteSize denominator) {
    if (denominator.bytes == 0) {
        throw std::invalid_argument("Ratio denominator is zero");
    }
    double ratio = static_cast<double>(numerator.bytes) / static_cast<double>(denominator.bytes);
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << ratio;
    return oss.str();
}

std::string FormatElapsed(double seconds) {
    if (seconds < 0.0) {
        seconds = 0.0;
    }
    auto whole = static_cast<std::uint64_t>(seconds);
    std::uint64_t hours = whole / 3600;
    std::uint64_t minutes = (whole % 3600) / 60;
    double secs = seconds - static_cast<double>(hours * 3600 + minutes * 60);
    char buffer[96];
    std::snprintf(buffer, sizeof(buffer), "%llu Hours, %02llu Minutes, %05.2f Seconds",
                  static_cast<unsigned long long>(hours),
                  static_cast<unsigned long long>(minutes), secs);
    return buffer;
}

}  // namespace dirpack
