#pragma once

#include <iostream>
#include <ostream>
#include <string>

namespace dirpack::cli {

// ANSI color codes
namespace color {
    constexpr const char* RESET = "\033[0m";

    constexpr const char* CYAN = "\033[0;36m";

    constexpr const char* BOLD_RED = "\033[1;31m";
    constexpr const char* BOLD_YELLOW = "\033[1;33m";

    constexpr const char* BRIGHT_BLACK = "\033[0;90m";
}

// True when `os` is std::cout or std::cerr attached to a TTY and colours
// have not been switched off.
bool ColorsEnabled(std::ostream& os = std::cerr);

// Overrides TTY detection (--no-color, NO_COLOR).
void SetColorsEnabled(bool enabled);

std::string Colorize(const std::string& text, const char* color, std::ostream& os = std::cerr);

inline std::string Dim(const std::string& text) { return Colorize(text, color::BRIGHT_BLACK); }

inline std::string BoldRed(const std::string& text) { return Colorize(text, color::BOLD_RED); }

}  // namespace dirpack::cli
