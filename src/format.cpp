#include "dirpack/format.hpp"

#include "dirpack/constants.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace dirpack {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

bool EndsWith(const std::string& value, std::string_view suffix) {
    return value.size() >= suffix.size()
           && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

ArchiveFormat ParseArchiveFormat(const std::string& name) {
    std::string lower = ToLower(name);
    for (ArchiveFormat format : AllFormats()) {
        if (lower == FormatName(format)) {
            return format;
        }
    }
    throw std::invalid_argument("Invalid archive format: " + name
                                + " (expected one of zip, tar, gztar, bztar, xztar)");
}

std::string_view FormatName(ArchiveFormat format) {
    switch (format) {
        case ArchiveFormat::Zip:
            return "zip";
        case ArchiveFormat::Tar:
            return "tar";
        case ArchiveFormat::GzTar:
            return "gztar";
        case ArchiveFormat::BzTar:
            return "bztar";
        case ArchiveFormat::XzTar:
            return "xztar";
    }
    throw std::logic_error("Unhandled archive format");
}

std::string_view FormatSuffix(ArchiveFormat format) {
    switch (format) {
        case ArchiveFormat::Zip:
            return ".zip";
        case ArchiveFormat::Tar:
            return ".tar";
        case ArchiveFormat::GzTar:
            return ".tar.gz";
        case ArchiveFormat::BzTar:
            return ".tar.bz2";
        case ArchiveFormat::XzTar:
            return ".tar.xz";
    }
    throw std::logic_error("Unhandled archive format");
}

Compression FormatCompression(ArchiveFormat format) {
    switch (format) {
        case ArchiveFormat::GzTar:
            return Compression::Gzip;
        case ArchiveFormat::BzTar:
            return Compression::Bzip2;
        case ArchiveFormat::XzTar:
            return Compression::Xz;
        default:
            return Compression::None;
    }
}

const std::vector<ArchiveFormat>& AllFormats() {
    static const std::vector<ArchiveFormat> kFormats = {
        ArchiveFormat::Zip, ArchiveFormat::Tar, ArchiveFormat::GzTar,
        ArchiveFormat::BzTar, ArchiveFormat::XzTar
    };
    return kFormats;
}

ArchiveFormat DetectArchiveFormat(const std::filesystem::path& path) {
    std::string name = ToLower(path.filename().string());
    if (EndsWith(name, ".tar.gz") || EndsWith(name, ".tgz")) {
        return ArchiveFormat::GzTar;
    }
    if (EndsWith(name, ".tar.bz2") || EndsWith(name, ".tbz2") || EndsWith(name, ".tbz")) {
        return ArchiveFormat::BzTar;
    }
    if (EndsWith(name, ".tar.xz") || EndsWith(name, ".txz")) {
        return ArchiveFormat::XzTar;
    }
    if (EndsWith(name, ".tar")) {
        return ArchiveFormat::Tar;
    }
    if (EndsWith(name, ".zip")) {
        return ArchiveFormat::Zip;
    }
    throw std::invalid_argument("Unknown archive format: " + path.string());
}

bool IsArchiveSuffix(std::string_view suffix) {
    std::string lower = ToLower(std::string(suffix));
    return std::find(constants::kArchiveSuffixes.begin(), constants::kArchiveSuffixes.end(), lower)
           != constants::kArchiveSuffixes.end();
}

std::string StripArchiveSuffixes(const std::string& file_name) {
    std::filesystem::path name(file_name);
    while (true) {
        // path::extension() ignores a leading dot, so ".zip" has no suffix.
        std::string ext = name.extension().string();
        if (ext.empty() || !IsArchiveSuffix(ext)) {
            break;
        }
        name.replace_extension();
    }
    return name.string();
}

}  // namespace dirpack
