#include "dirpack/tar.hpp"

#include "dirpack/constants.hpp"
#include "dirpack/paths.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <sys/stat.h>

namespace dirpack::tar {

namespace {

constexpr std::size_t kTarBlockSize = 512;
constexpr std::uint64_t kMaxOctalSize = 077777777777ULL;
constexpr std::uint64_t kMaxMetaRecord = 1u << 20;

struct TarHeader {
    char name[100];
    char mode[8];
    char uid[8];
    char gid[8];
    char size[12];
    char mtime[12];
    char chksum[8];
    char typeflag;
    char linkname[100];
    char magic[6];
    char version[2];
    char uname[32];
    char gname[32];
    char devmajor[8];
    char devminor[8];
    char prefix[155];
    char pad[12];
};

static_assert(sizeof(TarHeader) == kTarBlockSize, "Tar header must be 512 bytes");

struct EntryInfo {
    std::string name;
    char type = '0';
    std::uint64_t size = 0;
    std::uint32_t mode = 0644;
    std::int64_t mtime = 0;
    std::string linkname;
};

void WriteOctal(char* dest, std::size_t size, std::uint64_t value) {
    std::snprintf(dest, size, "%0*llo", static_cast<int>(size - 1),
                  static_cast<unsigned long long>(value));
}

// GNU base-256 encoding for sizes that do not fit eleven octal digits.
void WriteSizeField(char* dest, std::size_t size, std::uint64_t value) {
    if (value <= kMaxOctalSize) {
        WriteOctal(dest, size, value);
        return;
    }
    std::memset(dest, 0, size);
    for (std::size_t i = size; i-- > 1;) {
        dest[i] = static_cast<char>(value & 0xFF);
        value >>= 8;
    }
    dest[0] = static_cast<char>(0x80);
}

std::uint64_t ParseOctal(const char* data, std::size_t size) {
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < size; ++i) {
        char ch = data[i];
        if (ch == '\0' || ch == ' ') {
            continue;
        }
        if (ch < '0' || ch > '7') {
            break;
        }
        value = (value << 3) + static_cast<std::uint64_t>(ch - '0');
    }
    return value;
}

std::uint64_t ParseNumeric(const char* data, std::size_t size) {
    const auto* bytes = reinterpret_cast<const unsigned char*>(data);
    if ((bytes[0] & 0x80) == 0) {
        return ParseOctal(data, size);
    }
    std::uint64_t value = bytes[0] & 0x7F;
    for (std::size_t i = 1; i < size; ++i) {
        value = (value << 8) | bytes[i];
    }
    return value;
}

bool SplitTarName(const std::string& full, std::string& name, std::string& prefix) {
    if (full.size() <= sizeof(TarHeader::name)) {
        name = full;
        prefix.clear();
        return true;
    }
    if (full.size() > sizeof(TarHeader::name) + sizeof(TarHeader::prefix)) {
        return false;
    }
    auto pos = full.rfind('/');
    // A trailing slash belongs to the name part of a directory entry.
    if (pos == full.size() - 1 && pos > 0) {
        pos = full.rfind('/', pos - 1);
    }
    while (pos != std::string::npos) {
        std::string candidate_prefix = full.substr(0, pos);
        std::string candidate_name = full.substr(pos + 1);
        if (candidate_name.size() <= sizeof(TarHeader::name)
            && candidate_prefix.size() <= sizeof(TarHeader::prefix)) {
            name = candidate_name;
            prefix = candidate_prefix;
            return true;
        }
        if (pos == 0) {
            break;
        }
        pos = full.rfind('/', pos - 1);
    }
    return false;
}

void WriteBlock(std::ofstream& out,
                const EntryInfo& entry,
                const std::string& name,
                const std::string& prefix,
                const std::string& linkname) {
    TarHeader header{};
    std::memcpy(header.name, name.data(), name.size());
    std::memcpy(header.prefix, prefix.data(), prefix.size());
    std::memcpy(header.linkname, linkname.data(), linkname.size());
    WriteOctal(header.mode, sizeof(header.mode), entry.mode & 07777);
    WriteOctal(header.uid, sizeof(header.uid), 0);
    WriteOctal(header.gid, sizeof(header.gid), 0);
    WriteSizeField(header.size, sizeof(header.size), entry.size);
    WriteOctal(header.mtime, sizeof(header.mtime),
               static_cast<std::uint64_t>(std::max<std::int64_t>(entry.mtime, 0)));
    header.typeflag = entry.type;
    std::memcpy(header.magic, "ustar", 5);
    std::memcpy(header.version, "00", 2);

    std::memset(header.chksum, ' ', sizeof(header.chksum));
    unsigned int sum = 0;
    const unsigned char* bytes = reinterpret_cast<const unsigned char*>(&header);
    for (std::size_t i = 0; i < sizeof(TarHeader); ++i) {
        sum += bytes[i];
    }
    std::snprintf(header.chksum, sizeof(header.chksum), "%06o", sum);
    header.chksum[6] = '\0';
    header.chksum[7] = ' ';

    out.write(reinterpret_cast<const char*>(&header), sizeof(TarHeader));
}

void WritePadding(std::ofstream& out, std::uint64_t size) {
    std::size_t pad = static_cast<std::size_t>((kTarBlockSize - (size % kTarBlockSize)) % kTarBlockSize);
    if (pad) {
        std::array<char, kTarBlockSize> zeros{};
        out.write(zeros.data(), static_cast<std::streamsize>(pad));
    }
}

// GNU 'L' (name) or 'K' (link target) record carrying `value` for the next header.
void WriteLongRecord(std::ofstream& out, char type, const std::string& value) {
    EntryInfo record;
    record.type = type;
    record.size = value.size() + 1;
    record.mode = 0;
    WriteBlock(out, record, "././@LongLink", "", "");
    out.write(value.c_str(), static_cast<std::streamsize>(record.size));
    WritePadding(out, record.size);
}

void WriteHeader(std::ofstream& out, const EntryInfo& entry) {
    std::string name_field;
    std::string prefix_field;
    if (!SplitTarName(entry.name, name_field, prefix_field)) {
        WriteLongRecord(out, 'L', entry.name);
        name_field = entry.name.substr(0, sizeof(TarHeader::name));
        prefix_field.clear();
    }
    std::string link_field = entry.linkname;
    if (link_field.size() > sizeof(TarHeader::linkname)) {
        WriteLongRecord(out, 'K', entry.linkname);
        link_field.resize(sizeof(TarHeader::linkname));
    }
    WriteBlock(out, entry, name_field, prefix_field, link_field);
}

void WriteFileData(std::ofstream& out, const std::filesystem::path& path, std::uint64_t size) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw std::runtime_error("Failed to open file: " + path.string());
    }
    std::vector<char> buffer(constants::kIoChunkSize);
    std::uint64_t remaining = size;
    while (remaining > 0) {
        std::size_t chunk = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, buffer.size()));
        input.read(buffer.data(), static_cast<std::streamsize>(chunk));
        if (input.gcount() != static_cast<std::streamsize>(chunk)) {
            throw std::runtime_error("File changed while archiving: " + path.string());
        }
        out.write(buffer.data(), static_cast<std::streamsize>(chunk));
        remaining -= chunk;
    }
    WritePadding(out, size);
}

EntryInfo DescribeEntry(const std::filesystem::path& path, const std::string& name) {
    struct stat st {};
    if (::lstat(path.c_str(), &st) != 0) {
        throw std::system_error(errno, std::generic_category(), "Failed to stat " + path.string());
    }
    EntryInfo info;
    info.mode = static_cast<std::uint32_t>(st.st_mode & 07777);
    info.mtime = static_cast<std::int64_t>(st.st_mtime);
    if (S_ISDIR(st.st_mode)) {
        info.type = '5';
        info.name = name.back() == '/' ? name : name + "/";
    } else if (S_ISLNK(st.st_mode)) {
        info.type = '2';
        info.name = name;
        info.linkname = std::filesystem::read_symlink(path).string();
    } else if (S_ISREG(st.st_mode)) {
        info.type = '0';
        info.name = name;
        info.size = static_cast<std::uint64_t>(st.st_size);
    } else {
        // Sockets, fifos and devices are not archived.
        info.type = '\0';
        info.name = name;
    }
    return info;
}

bool IsAllZero(const TarHeader& header) {
    const unsigned char* bytes = reinterpret_cast<const unsigned char*>(&header);
    for (std::size_t i = 0; i < sizeof(TarHeader); ++i) {
        if (bytes[i] != 0) {
            return false;
        }
    }
    return true;
}

bool ChecksumMatches(const TarHeader& header) {
    TarHeader copy = header;
    std::memset(copy.chksum, ' ', sizeof(copy.chksum));
    unsigned int sum = 0;
    const unsigned char* bytes = reinterpret_cast<const unsigned char*>(&copy);
    for (std::size_t i = 0; i < sizeof(TarHeader); ++i) {
        sum += bytes[i];
    }
    return sum == ParseOctal(header.chksum, sizeof(header.chksum));
}

std::string Field(const char* data, std::size_t size) {
    return std::string(data, strnlen(data, size));
}

std::string ExtractName(const TarHeader& header) {
    std::string name = Field(header.name, sizeof(header.name));
    std::string prefix = Field(header.prefix, sizeof(header.prefix));
    if (!prefix.empty()) {
        return prefix + "/" + name;
    }
    return name;
}

void SkipPadding(std::ifstream& input, std::uint64_t size) {
    std::size_t pad = static_cast<std::size_t>((kTarBlockSize - (size % kTarBlockSize)) % kTarBlockSize);
    if (pad) {
        input.seekg(static_cast<std::streamoff>(pad), std::ios::cur);
    }
}

std::string ReadRecord(std::ifstream& input, std::uint64_t size) {
    if (size > kMaxMetaRecord) {
        throw std::runtime_error("Tar metadata record too large");
    }
    std::string data(static_cast<std::size_t>(size), '\0');
    input.read(data.data(), static_cast<std::streamsize>(size));
    if (input.gcount() != static_cast<std::streamsize>(size)) {
        throw std::runtime_error("Truncated tar archive");
    }
    SkipPadding(input, size);
    return data;
}

void CopyData(std::ifstream& input, std::ofstream* output, std::uint64_t size) {
    std::vector<char> buffer(constants::kIoChunkSize);
    std::uint64_t remaining = size;
    while (remaining > 0) {
        std::size_t chunk = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, buffer.size()));
        input.read(buffer.data(), static_cast<std::streamsize>(chunk));
        if (input.gcount() != static_cast<std::streamsize>(chunk)) {
            throw std::runtime_error("Truncated tar archive");
        }
        if (output) {
            output->write(buffer.data(), static_cast<std::streamsize>(chunk));
        }
        remaining -= chunk;
    }
    SkipPadding(input, size);
}

// pax extended header: records of the form "<len> <key>=<value>\n".
void ParsePaxRecords(const std::string& data, std::string& path, std::string& linkpath) {
    std::size_t pos = 0;
    while (pos < data.size()) {
        std::size_t space = data.find(' ', pos);
        if (space == std::string::npos) {
            break;
        }
        std::size_t len = 0;
        try {
            len = static_cast<std::size_t>(std::stoul(data.substr(pos, space - pos)));
        } catch (const std::exception&) {
            throw std::runtime_error("Malformed pax header");
        }
        if (len == 0 || pos + len > data.size()) {
            throw std::runtime_error("Malformed pax header");
        }
        std::string record = data.substr(space + 1, pos + len - space - 2);
        std::size_t eq = record.find('=');
        if (eq != std::string::npos) {
            std::string key = record.substr(0, eq);
            if (key == "path") {
                path = record.substr(eq + 1);
            } else if (key == "linkpath") {
                linkpath = record.substr(eq + 1);
            }
        }
        pos += len;
    }
}

}  // namespace

void WriteArchive(const std::filesystem::path& root_dir,
                  const std::string& base_dir,
                  const std::filesystem::path& tar_path) {
    const auto source = root_dir / base_dir;
    std::error_code ec;
    if (!std::filesystem::is_directory(source, ec)) {
        throw std::runtime_error(source.string() + " is not a directory");
    }
    std::ofstream out(tar_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Failed to open tar output: " + tar_path.string());
    }

    std::vector<std::filesystem::path> entries;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(source)) {
        entries.push_back(entry.path());
    }
    std::sort(entries.begin(), entries.end());

    WriteHeader(out, DescribeEntry(source, base_dir));
    for (const auto& path : entries) {
        auto rel = path.lexically_relative(source);
        std::string name = (std::filesystem::path(base_dir) / rel).generic_string();
        EntryInfo info = DescribeEntry(path, name);
        if (info.type == '\0') {
            continue;
        }
        WriteHeader(out, info);
        if (info.type == '0') {
            WriteFileData(out, path, info.size);
        }
    }

    std::array<char, kTarBlockSize> zeros{};
    out.write(zeros.data(), static_cast<std::streamsize>(zeros.size()));
    out.write(zeros.data(), static_cast<std::streamsize>(zeros.size()));
    out.flush();
    if (!out) {
        throw std::runtime_error("Failed to write tar archive: " + tar_path.string());
    }
}

void ExtractArchive(const std::filesystem::path& tar_path,
                    const std::filesystem::path& dest_dir) {
    std::ifstream input(tar_path, std::ios::binary);
    if (!input) {
        throw std::runtime_error("Failed to open tar archive: " + tar_path.string());
    }
    std::filesystem::create_directories(dest_dir);

    std::vector<std::pair<std::filesystem::path, std::uint32_t>> dir_modes;
    std::string long_name;
    std::string long_link;
    while (true) {
        TarHeader header{};
        input.read(reinterpret_cast<char*>(&header), sizeof(header));
        if (input.gcount() == 0) {
            break;
        }
        if (input.gcount() != static_cast<std::streamsize>(sizeof(header))) {
            throw std::runtime_error("Truncated tar archive");
        }
        if (IsAllZero(header)) {
            break;
        }
        if (!ChecksumMatches(header)) {
            throw std::runtime_error("Corrupted tar header in " + tar_path.string());
        }

        std::uint64_t size = ParseNumeric(header.size, sizeof(header.size));
        char type = header.typeflag;
        if (type == 'L' || type == 'K') {
            std::string record = ReadRecord(input, size);
            record = record.c_str();
            (type == 'L' ? long_name : long_link) = record;
            continue;
        }
        if (type == 'x') {
            ParsePaxRecords(ReadRecord(input, size), long_name, long_link);
            continue;
        }
        if (type == 'g') {
            ReadRecord(input, size);
            continue;
        }

        std::string name = long_name.empty() ? ExtractName(header) : long_name;
        std::string linkname = long_link.empty() ? Field(header.linkname, sizeof(header.linkname))
                                                 : long_link;
        long_name.clear();
        long_link.clear();
        std::uint32_t mode = static_cast<std::uint32_t>(ParseOctal(header.mode, sizeof(header.mode)));

        if (name.empty() || name == "./") {
            CopyData(input, nullptr, type == '5' ? 0 : size);
            continue;
        }
        if (!paths::IsSafeEntryPath(dest_dir, name)) {
            throw std::runtime_error("Unsafe tar entry detected: " + name);
        }
        std::filesystem::path out_path = (dest_dir / std::filesystem::path(name)).lexically_normal();
        if (!out_path.has_filename()) {
            out_path = out_path.parent_path();
        }
        if (paths::CrossesSymlink(dest_dir, out_path)) {
            throw std::runtime_error("Unsafe tar entry through symlink: " + name);
        }

        if (type == '5') {
            paths::PrepareTarget(out_path);
            std::filesystem::create_directories(out_path);
            dir_modes.emplace_back(out_path, mode);
            CopyData(input, nullptr, 0);
        } else if (type == '0' || type == '\0' || type == '7') {
            paths::PrepareTarget(out_path);
            std::ofstream output(out_path, std::ios::binary | std::ios::trunc);
            if (!output) {
                throw std::runtime_error("Failed to write output: " + out_path.string());
            }
            CopyData(input, &output, size);
            output.close();
            if (!output) {
                throw std::runtime_error("Failed to write output: " + out_path.string());
            }
            paths::ApplyMode(out_path, mode);
        } else if (type == '2') {
            // Link targets are restored as stored; they are never followed here.
            paths::PrepareTarget(out_path);
            std::filesystem::create_symlink(linkname, out_path);
            CopyData(input, nullptr, 0);
        } else if (type == '1') {
            if (!paths::IsSafeEntryPath(dest_dir, linkname)) {
                throw std::runtime_error("Unsafe tar hard link detected: " + name + " -> " + linkname);
            }
            auto source = (dest_dir / linkname).lexically_normal();
            std::error_code ec;
            if (paths::CrossesSymlink(dest_dir, source)
                || !std::filesystem::is_regular_file(std::filesystem::symlink_status(source, ec))) {
                throw std::runtime_error("Unsafe tar hard link detected: " + name + " -> " + linkname);
            }
            paths::PrepareTarget(out_path);
            std::filesystem::copy_file(source, out_path,
                                       std::filesystem::copy_options::overwrite_existing);
            CopyData(input, nullptr, 0);
        } else {
            // Devices, fifos and unknown types are skipped.
            CopyData(input, nullptr, size);
        }
    }

    // Deepest first so read-only parents do not block their children; the
    // owner keeps full access to every extracted directory.
    std::sort(dir_modes.begin(), dir_modes.end(),
              [](const auto& a, const auto& b) { return a.first.string().size() > b.first.string().size(); });
    for (const auto& [dir, mode] : dir_modes) {
        paths::ApplyMode(dir, mode | 0700);
    }
}

}  // namespace dirpack::tar
