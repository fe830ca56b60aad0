#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace dirpack::paths {

// Absolute, lexically normal form without a trailing separator.
std::filesystem::path Normalize(const std::filesystem::path& path);

// Last component of a source directory ("/data/photos/" -> "photos").
std::string BaseName(const std::filesystem::path& path);

// Hidden sibling used while `destination` is being written.
std::filesystem::path PartialPath(const std::filesystem::path& destination);

// Creates a uniquely named directory `<parent>/<prefix><token>`.
std::filesystem::path CreateTempDir(const std::filesystem::path& parent, const std::string& prefix);

// True when `name` is relative and stays inside `dest_dir` after normalisation.
bool IsSafeEntryPath(const std::filesystem::path& dest_dir, const std::string& name);

// True when a directory component of `path` between `root` and its last
// component is a symlink, so writing `path` would land outside `root`.
bool CrossesSymlink(const std::filesystem::path& root, const std::filesystem::path& path);

// Creates the parent directories of `path` and removes a non-directory
// already occupying it.
void PrepareTarget(const std::filesystem::path& path);

// Replaces the permission bits of `path` with `mode & 07777`.
void ApplyMode(const std::filesystem::path& path, std::uint32_t mode);

// Removes `path` recursively, reporting nothing; used for cleanup on error paths.
void RemoveQuietly(const std::filesystem::path& path) noexcept;

}  // namespace dirpack::paths
