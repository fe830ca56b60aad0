#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "dirpack/format.hpp"

namespace dirpack {

// Archives `root_dir/base_dir` into `destination` so that the archive's only
// top-level entry is `base_dir`. The archive is assembled at a hidden
// ".<name>.partial" sibling and renamed onto `destination` once complete, so
// `destination` never holds a half-written archive.
void MakeArchive(const std::filesystem::path& root_dir,
                 const std::string& base_dir,
                 ArchiveFormat format,
                 const std::filesystem::path& destination);

// Extracts `archive` (format detected from its suffix) into `output_dir`.
// Members are unpacked into a hidden staging directory first and each
// top-level entry is then moved into `output_dir`. An existing entry of the
// same name is replaced when `overwrite` is set; otherwise the extracted tree
// is merged into it, replacing colliding files and keeping everything else.
// Returns the top-level paths moved into place.
std::vector<std::filesystem::path> ExtractArchive(const std::filesystem::path& archive,
                                                  const std::filesystem::path& output_dir,
                                                  bool overwrite);

}  // namespace dirpack
