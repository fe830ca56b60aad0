#pragma once

#include <filesystem>
#include <optional>

#include "dirpack/format.hpp"

namespace dirpack::codec {

// Compression level for gzip/bzip2 (1-9) or xz preset (0-9); defaults come
// from constants, overridable through DIRPACK_COMPRESSION_LEVEL.
int DefaultLevel(Compression compression);

// Whole-file transforms. Compression::None copies the file.
void CompressFile(const std::filesystem::path& input,
                  const std::filesystem::path& output,
                  Compression compression,
                  std::optional<int> level = std::nullopt);

void DecompressFile(const std::filesystem::path& input,
                    const std::filesystem::path& output,
                    Compression compression);

}  // namespace dirpack::codec
