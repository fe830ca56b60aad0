#include "dirpack/paths.hpp"

#include "dirpack/constants.hpp"

#include <algorithm>
#include <iterator>
#include <random>
#include <stdexcept>
#include <system_error>

namespace dirpack::paths {

std::filesystem::path Normalize(const std::filesystem::path& path) {
    auto normal = std::filesystem::absolute(path).lexically_normal();
    if (normal.has_filename() || !normal.has_relative_path()) {
        return normal;
    }
    // "/a/b/" normalises to "/a/b/" with an empty filename.
    return normal.parent_path();
}

std::string BaseName(const std::filesystem::path& path) {
    return Normalize(path).filename().string();
}

std::filesystem::path PartialPath(const std::filesystem::path& destination) {
    return destination.parent_path()
           / ("." + destination.filename().string() + std::string(constants::kPartialSuffix));
}

std::filesystem::path CreateTempDir(const std::filesystem::path& parent, const std::string& prefix) {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    for (int i = 0; i < 64; ++i) {
        auto candidate = parent / (prefix + std::to_string(gen()));
        std::error_code ec;
        if (std::filesystem::create_directory(candidate, ec)) {
            return candidate;
        }
    }
    throw std::runtime_error("Failed to create temporary directory in " + parent.string());
}

bool IsSafeEntryPath(const std::filesystem::path& dest_dir, const std::string& name) {
    std::filesystem::path rel(name);
    if (rel.empty() || rel.is_absolute() || rel.has_root_name()) {
        return false;
    }
    for (const auto& part : rel) {
        if (part == "..") {
            return false;
        }
    }
    auto base = dest_dir.lexically_normal();
    auto full = (dest_dir / rel).lexically_normal();
    auto mismatch = std::mismatch(base.begin(), base.end(), full.begin(), full.end());
    return mismatch.first == base.end() || (mismatch.first->empty() && std::next(mismatch.first) == base.end());
}

bool CrossesSymlink(const std::filesystem::path& root, const std::filesystem::path& path) {
    auto rel = path.lexically_normal().lexically_relative(root.lexically_normal());
    auto current = root;
    for (auto it = rel.begin(); it != rel.end() && std::next(it) != rel.end(); ++it) {
        if (it->empty() || *it == ".") {
            continue;
        }
        current /= *it;
        std::error_code ec;
        if (std::filesystem::is_symlink(std::filesystem::symlink_status(current, ec))) {
            return true;
        }
    }
    return false;
}

void PrepareTarget(const std::filesystem::path& path) {
    std::filesystem::create_directories(path.parent_path());
    std::error_code ec;
    auto status = std::filesystem::symlink_status(path, ec);
    if (!ec && std::filesystem::exists(status) && !std::filesystem::is_directory(status)) {
        std::filesystem::remove(path);
    }
}

void ApplyMode(const std::filesystem::path& path, std::uint32_t mode) {
    std::filesystem::permissions(path, static_cast<std::filesystem::perms>(mode & 07777),
                                 std::filesystem::perm_options::replace);
}

void RemoveQuietly(const std::filesystem::path& path) noexcept {
    if (path.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
}

}  // namespace dirpack::paths
