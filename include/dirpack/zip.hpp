#pragma once

#include <filesystem>
#include <string>

namespace dirpack::zip {

// Writes a zip archive of `root_dir/base_dir` whose entries all live below
// `base_dir/`. Regular files are deflated, symlinks keep their target, and
// unix permission bits go into the external attributes. Zip64 records are
// emitted where sizes or offsets need them.
void WriteArchive(const std::filesystem::path& root_dir,
                  const std::string& base_dir,
                  const std::filesystem::path& zip_path);

// Extracts every member of `zip_path` below `dest_dir`, checking CRC-32 and
// rejecting members whose path would leave `dest_dir` or pass through a
// symlink. Symlinks are restored with their stored target.
void ExtractArchive(const std::filesystem::path& zip_path,
                    const std::filesystem::path& dest_dir);

}  // namespace dirpack::zip
