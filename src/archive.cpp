#include "dirpack/archive.hpp"

#include "dirpack/codec.hpp"
#include "dirpack/constants.hpp"
#include "dirpack/paths.hpp"
#include "dirpack/tar.hpp"
#include "dirpack/zip.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace dirpack {

namespace {

constexpr const char* kWorkPrefix = ".dirpack-work-";

void WriteContainer(const std::filesystem::path& root_dir,
                    const std::string& base_dir,
                    ArchiveFormat format,
                    const std::filesystem::path& output,
                    std::filesystem::path& work_dir) {
    if (format == ArchiveFormat::Zip) {
        zip::WriteArchive(root_dir, base_dir, output);
        return;
    }
    Compression compression = FormatCompression(format);
    if (compression == Compression::None) {
        tar::WriteArchive(root_dir, base_dir, output);
        return;
    }
    work_dir = paths::CreateTempDir(output.parent_path(), kWorkPrefix);
    auto tar_path = work_dir / (base_dir + ".tar");
    tar::WriteArchive(root_dir, base_dir, tar_path);
    codec::CompressFile(tar_path, output, compression);
}

void ReadContainer(const std::filesystem::path& archive,
                   ArchiveFormat format,
                   const std::filesystem::path& staging,
                   std::filesystem::path& work_dir) {
    if (format == ArchiveFormat::Zip) {
        zip::ExtractArchive(archive, staging);
        return;
    }
    Compression compression = FormatCompression(format);
    if (compression == Compression::None) {
        tar::ExtractArchive(archive, staging);
        return;
    }
    work_dir = paths::CreateTempDir(staging.parent_path(), kWorkPrefix);
    auto tar_path = work_dir / "payload.tar";
    codec::DecompressFile(archive, tar_path, compression);
    tar::ExtractArchive(tar_path, staging);
}

bool Occupied(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(std::filesystem::symlink_status(path, ec));
}

// Moves `from` onto `to`. Directories present on both sides are merged entry
// by entry; anything else already at `to` is replaced.
void MergeInto(const std::filesystem::path& from, const std::filesystem::path& to) {
    std::error_code ec;
    auto existing = std::filesystem::symlink_status(to, ec);
    if (!std::filesystem::exists(existing)) {
        std::filesystem::rename(from, to);
        return;
    }
    if (std::filesystem::is_directory(existing)
        && std::filesystem::is_directory(std::filesystem::symlink_status(from))) {
        std::vector<std::filesystem::path> children;
        for (const auto& entry : std::filesystem::directory_iterator(from)) {
            children.push_back(entry.path());
        }
        for (const auto& child : children) {
            MergeInto(child, to / child.filename());
        }
        std::filesystem::remove(from);
        return;
    }
    std::filesystem::remove_all(to);
    std::filesystem::rename(from, to);
}

}  // namespace

void MakeArchive(const std::filesystem::path& root_dir,
                 const std::string& base_dir,
                 ArchiveFormat format,
                 const std::filesystem::path& destination) {
    if (base_dir.empty()) {
        throw std::invalid_argument("Archive base directory is empty");
    }
    auto partial = paths::PartialPath(destination);
    std::filesystem::path work_dir;
    // A leftover from an interrupted run is never trusted.
    paths::RemoveQuietly(partial);
    try {
        WriteContainer(root_dir, base_dir, format, partial, work_dir);
        paths::RemoveQuietly(work_dir);
        std::filesystem::rename(partial, destination);
    } catch (...) {
        paths::RemoveQuietly(work_dir);
        paths::RemoveQuietly(partial);
        throw;
    }
}

std::vector<std::filesystem::path> ExtractArchive(const std::filesystem::path& archive,
                                                  const std::filesystem::path& output_dir,
                                                  bool overwrite) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(archive, ec)) {
        throw std::runtime_error(archive.string() + " is not a file");
    }
    ArchiveFormat format = DetectArchiveFormat(archive);
    std::filesystem::create_directories(output_dir);

    auto staging = paths::CreateTempDir(output_dir, std::string(constants::kStagingPrefix));
    std::filesystem::path work_dir;
    std::vector<std::filesystem::path> placed;
    try {
        ReadContainer(archive, format, staging, work_dir);
        paths::RemoveQuietly(work_dir);

        std::vector<std::filesystem::path> members;
        for (const auto& entry : std::filesystem::directory_iterator(staging)) {
            members.push_back(entry.path());
        }
        std::sort(members.begin(), members.end());
        for (const auto& member : members) {
            auto target = output_dir / member.filename();
            if (overwrite && Occupied(target)) {
                std::filesystem::remove_all(target);
            }
            MergeInto(member, target);
            placed.push_back(target);
        }
        std::filesystem::remove(staging);
    } catch (...) {
        paths::RemoveQuietly(work_dir);
        paths::RemoveQuietly(staging);
        throw;
    }
    return placed;
}

}  // namespace dirpack
