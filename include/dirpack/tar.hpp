#pragma once

#include <filesystem>
#include <string>

namespace dirpack::tar {

// Writes an uncompressed ustar archive of `root_dir/base_dir` whose single
// top-level entry is `base_dir/`. Directories, regular files and symlinks are
// stored with their permission bits and modification time. Names and link
// targets too long for the ustar fields go into GNU 'L'/'K' records.
void WriteArchive(const std::filesystem::path& root_dir,
                  const std::string& base_dir,
                  const std::filesystem::path& tar_path);

// Extracts every entry of `tar_path` below `dest_dir`. Symlinks are restored
// with their stored target. Throws on truncated input and on entries that
// would land outside `dest_dir` or be written through a symlink.
void ExtractArchive(const std::filesystem::path& tar_path,
                    const std::filesystem::path& dest_dir);

}  // namespace dirpack::tar
