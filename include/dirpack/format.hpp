#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace dirpack {

enum class ArchiveFormat {
    Zip,
    Tar,
    GzTar,
    BzTar,
    XzTar
};

// Compression applied on top of a tar stream.
enum class Compression {
    None,
    Gzip,
    Bzip2,
    Xz
};

// Case-insensitive: "zip", "tar", "gztar", "bztar", "xztar".
// Throws std::invalid_argument for anything else.
ArchiveFormat ParseArchiveFormat(const std::string& name);

std::string_view FormatName(ArchiveFormat format);
std::string_view FormatSuffix(ArchiveFormat format);
Compression FormatCompression(ArchiveFormat format);
const std::vector<ArchiveFormat>& AllFormats();

// Detects the format of an existing archive from its file name
// (.zip, .tar, .tar.gz/.tgz, .tar.bz2/.tbz2, .tar.xz/.txz).
// Throws std::invalid_argument when the suffix is not recognised.
ArchiveFormat DetectArchiveFormat(const std::filesystem::path& path);

bool IsArchiveSuffix(std::string_view suffix);

// Removes the contiguous trailing run of archive suffixes from a file name:
// "data.tar.gz" -> "data", "data.txt" -> "data.txt", "a.tar.txt" -> "a.tar.txt".
std::string StripArchiveSuffixes(const std::string& file_name);

}  // namespace dirpack
