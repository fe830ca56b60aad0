#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace dirpack::constants {

inline constexpr std::array<std::string_view, 5> kArchiveSuffixes = {
    ".zip", ".tar", ".gz", ".bz2", ".xz"
};

inline constexpr std::string_view kDefaultArchiveFormat = "bztar";
inline constexpr std::string_view kLogDirName = "logs";
inline constexpr std::string_view kCompressionLogType = "compression";
inline constexpr std::string_view kDecompressionLogType = "decompression";
inline constexpr std::string_view kPartialSuffix = ".partial";
inline constexpr std::string_view kStagingPrefix = ".dirpack-unpack-";

inline constexpr int kGzipLevel = 9;
inline constexpr int kBzip2BlockSize = 9;
inline constexpr std::uint32_t kXzPreset = 6;

inline constexpr std::size_t kIoChunkSize = 1u << 16;
inline constexpr std::uint64_t kKibi = 1024;

inline constexpr std::string_view kEnvNoColor = "NO_COLOR";
inline constexpr std::string_view kEnvDirpackNoColor = "DIRPACK_NO_COLOR";
inline constexpr std::string_view kEnvVerbose = "DIRPACK_VERBOSE";
inline constexpr std::string_view kEnvCompressionLevel = "DIRPACK_COMPRESSION_LEVEL";

}  // namespace dirpack::constants
