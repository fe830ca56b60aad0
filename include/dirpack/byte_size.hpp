#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

namespace dirpack {

struct ByteSize {
    std::uint64_t bytes = 0;
};

struct DisplaySize {
    double value = 0.0;
    std::string_view unit;
};

// Raised by the size helpers when a path is not of the expected type.
class PathTypeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class NotAFileError : public PathTypeError {
public:
    explicit NotAFileError(const std::filesystem::path& path)
        : PathTypeError(path.string() + " is not a file") {}
};

class NotADirectoryError : public PathTypeError {
public:
    explicit NotADirectoryError(const std::filesystem::path& path)
        : PathTypeError(path.string() + " is not a directory") {}
};

ByteSize FileSize(const std::filesystem::path& path);

// Sum of every regular file below `path`; symlinks are not followed or counted.
ByteSize FolderSize(const std::filesystem::path& path);

// Largest of B, KB, MB, GB, TB, PB (base 1024) with a magnitude in [1, 1024);
// bytes below 1 KB, PB above 1024 PB.
DisplaySize ToDisplaySize(ByteSize size);

// "12.50 MB"
std::string FormatByteSize(ByteSize size, int precision = 2);

// "2.35"; `denominator` must be non-zero.
std::string FormatRatio(ByteSize numerator, ByteSize denominator);

// "0 Hours, 01 Minutes, 02.50 Seconds"
std::string FormatElapsed(double seconds);

}  // namespace dirpack
