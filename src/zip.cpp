#include "dirpack/zip.hpp"

#include "dirpack/codec.hpp"
#include "dirpack/constants.hpp"
#include "dirpack/paths.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <sys/stat.h>

#include <archive.h>
#include <archive_entry.h>

namespace dirpack::zip {

namespace {

constexpr std::size_t kReadBlockSize = 10240;

// Owns a libarchive handle; reader and writer handles are released differently.
class ArchiveHandle {
public:
    enum class Kind { Reader, Writer, Disk };

    explicit ArchiveHandle(Kind kind) : kind_(kind), handle_(Create(kind)) {
        if (!handle_) {
            throw std::runtime_error("Failed to allocate libarchive handle");
        }
    }

    ~ArchiveHandle() {
        if (kind_ == Kind::Reader) {
            archive_read_free(handle_);
        } else {
            archive_write_free(handle_);
        }
    }

    ArchiveHandle(const ArchiveHandle&) = delete;
    ArchiveHandle& operator=(const ArchiveHandle&) = delete;

    struct archive* get() const noexcept { return handle_; }

    // Throws `what` with libarchive's message unless `rc` is OK or a warning.
    void Check(la_ssize_t rc, const std::string& what) const {
        if (rc < ARCHIVE_WARN) {
            const char* message = archive_error_string(handle_);
            throw std::runtime_error(what + ": " + (message ? message : "unknown libarchive error"));
        }
    }

private:
    static struct archive* Create(Kind kind) {
        switch (kind) {
            case Kind::Reader:
                return archive_read_new();
            case Kind::Writer:
                return archive_write_new();
            case Kind::Disk:
                return archive_write_disk_new();
        }
        return nullptr;
    }

    Kind kind_;
    struct archive* handle_;
};

class EntryGuard {
public:
    EntryGuard() : entry_(archive_entry_new()) {
        if (!entry_) {
            throw std::runtime_error("Failed to allocate zip entry");
        }
    }
    ~EntryGuard() { archive_entry_free(entry_); }

    EntryGuard(const EntryGuard&) = delete;
    EntryGuard& operator=(const EntryGuard&) = delete;

    struct archive_entry* get() const noexcept { return entry_; }

private:
    struct archive_entry* entry_;
};

void WriteFileData(const ArchiveHandle& writer, const std::filesystem::path& path, std::uint64_t size) {
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
        writer.Check(archive_write_data(writer.get(), buffer.data(), chunk),
                     "Failed to write zip data for " + path.string());
        remaining -= chunk;
    }
}

void CopyEntryData(const ArchiveHandle& reader, const ArchiveHandle& disk, const std::string& name) {
    const void* block = nullptr;
    std::size_t size = 0;
    la_int64_t offset = 0;
    while (true) {
        int rc = archive_read_data_block(reader.get(), &block, &size, &offset);
        if (rc == ARCHIVE_EOF) {
            return;
        }
        // Warnings here mean a CRC mismatch or similar damage.
        if (rc != ARCHIVE_OK) {
            const char* message = archive_error_string(reader.get());
            throw std::runtime_error("Corrupted zip member " + name + ": "
                                     + (message ? message : "unknown libarchive error"));
        }
        disk.Check(archive_write_data_block(disk.get(), block, size, offset), "Failed to extract " + name);
    }
}

}  // namespace

void WriteArchive(const std::filesystem::path& root_dir,
                  const std::string& base_dir,
                  const std::filesystem::path& zip_path) {
    const auto source = root_dir / base_dir;
    std::error_code ec;
    if (!std::filesystem::is_directory(source, ec)) {
        throw std::runtime_error(source.string() + " is not a directory");
    }

    std::vector<std::filesystem::path> entries;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(source)) {
        entries.push_back(entry.path());
    }
    std::sort(entries.begin(), entries.end());
    entries.insert(entries.begin(), source);

    ArchiveHandle writer(ArchiveHandle::Kind::Writer);
    writer.Check(archive_write_set_format_zip(writer.get()), "Failed to select zip format");
    const std::string level = "zip:compression-level="
                              + std::to_string(codec::DefaultLevel(Compression::Gzip));
    writer.Check(archive_write_set_options(writer.get(), level.c_str()), "Failed to set zip options");
    writer.Check(archive_write_open_filename(writer.get(), zip_path.c_str()),
                 "Failed to open zip output " + zip_path.string());

    for (const auto& path : entries) {
        struct stat st {};
        if (::lstat(path.c_str(), &st) != 0) {
            throw std::system_error(errno, std::generic_category(), "Failed to stat " + path.string());
        }
        std::string name = path == source
                               ? base_dir
                               : (std::filesystem::path(base_dir) / path.lexically_relative(source)).generic_string();
        EntryGuard entry;
        archive_entry_copy_stat(entry.get(), &st);
        std::string link_target;
        if (S_ISDIR(st.st_mode)) {
            name += "/";
            archive_entry_set_size(entry.get(), 0);
        } else if (S_ISLNK(st.st_mode)) {
            link_target = std::filesystem::read_symlink(path).string();
            archive_entry_set_symlink(entry.get(), link_target.c_str());
            archive_entry_set_size(entry.get(), 0);
        } else if (!S_ISREG(st.st_mode)) {
            // Sockets, fifos and devices are not archived.
            continue;
        }
        archive_entry_set_pathname(entry.get(), name.c_str());
        writer.Check(archive_write_header(writer.get(), entry.get()), "Failed to write zip entry " + name);
        if (S_ISREG(st.st_mode)) {
            WriteFileData(writer, path, static_cast<std::uint64_t>(st.st_size));
        }
    }
    writer.Check(archive_write_close(writer.get()), "Failed to finish zip archive " + zip_path.string());
}

void ExtractArchive(const std::filesystem::path& zip_path,
                    const std::filesystem::path& dest_dir) {
    std::filesystem::create_directories(dest_dir);
    const auto root = std::filesystem::absolute(dest_dir).lexically_normal();

    ArchiveHandle reader(ArchiveHandle::Kind::Reader);
    reader.Check(archive_read_support_format_zip(reader.get()), "Failed to enable zip support");
    reader.Check(archive_read_open_filename(reader.get(), zip_path.c_str(), kReadBlockSize),
                 "Failed to open zip archive " + zip_path.string());

    ArchiveHandle disk(ArchiveHandle::Kind::Disk);
    disk.Check(archive_write_disk_set_options(disk.get(),
                                              ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM
                                                  | ARCHIVE_EXTRACT_SECURE_NODOTDOT),
               "Failed to configure zip extraction");
    disk.Check(archive_write_disk_set_standard_lookup(disk.get()), "Failed to configure zip extraction");

    struct archive_entry* entry = nullptr;
    while (true) {
        int rc = archive_read_next_header(reader.get(), &entry);
        if (rc == ARCHIVE_EOF) {
            break;
        }
        reader.Check(rc, "Failed to read zip entry in " + zip_path.string());

        const char* raw_name = archive_entry_pathname(entry);
        std::string name = raw_name ? raw_name : "";
        if (!paths::IsSafeEntryPath(dest_dir, name)) {
            throw std::runtime_error("Unsafe zip entry detected: " + name);
        }
        auto out_path = (root / name).lexically_normal();
        if (!out_path.has_filename()) {
            out_path = out_path.parent_path();
        }
        if (paths::CrossesSymlink(root, out_path)) {
            throw std::runtime_error("Unsafe zip entry through symlink: " + name);
        }
        paths::PrepareTarget(out_path);
        archive_entry_set_pathname(entry, out_path.c_str());
        if (const char* hardlink = archive_entry_hardlink(entry)) {
            auto link_path = (root / hardlink).lexically_normal();
            if (!paths::IsSafeEntryPath(dest_dir, hardlink) || paths::CrossesSymlink(root, link_path)) {
                throw std::runtime_error("Unsafe zip hard link detected: " + name + " -> " + hardlink);
            }
            archive_entry_set_hardlink(entry, link_path.c_str());
        }

        disk.Check(archive_write_header(disk.get(), entry), "Failed to extract " + name);
        if (archive_entry_size(entry) > 0) {
            CopyEntryData(reader, disk, name);
        }
        disk.Check(archive_write_finish_entry(disk.get()), "Failed to extract " + name);
    }
    // Directory modes and times are applied here, after their contents.
    disk.Check(archive_write_close(disk.get()), "Failed to finish extracting " + zip_path.string());
}

}  // namespace dirpack::zip
