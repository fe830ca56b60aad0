#pragma once

#include "dirpack/paths.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <stdexcept>
#include <string>

namespace dirpack::test {

inline int Fail(const std::string& message) {
    std::cerr << "FAIL: " << message << std::endl;
    return 1;
}

class TempDir {
public:
    TempDir() : path_(paths::CreateTempDir(std::filesystem::temp_directory_path(), "dirpack-test-")) {}
    ~TempDir() { paths::RemoveQuietly(path_); }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(const std::string& rel) const { return path_ / rel; }

private:
    std::filesystem::path path_;
};

inline void WriteFile(const std::filesystem::path& path, const std::string& data) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!out) {
        throw std::runtime_error("test: failed to write " + path.string());
    }
}

inline std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("test: failed to read " + path.string());
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Deterministic pseudo-random bytes; poorly compressible.
inline std::string NoiseBytes(std::size_t size, std::uint32_t seed) {
    std::string out(size, '\0');
    std::uint32_t state = seed;
    for (auto& ch : out) {
        state = state * 1664525u + 1013904223u;
        ch = static_cast<char>(state >> 24);
    }
    return out;
}

// Relative path -> contents of every regular file below `root`; directories
// map to "<dir>".
inline std::map<std::string, std::string> Snapshot(const std::filesystem::path& root) {
    std::map<std::string, std::string> out;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
        auto rel = entry.path().lexically_relative(root).generic_string();
        if (entry.is_symlink()) {
            out[rel] = "<link:" + std::filesystem::read_symlink(entry.path()).string() + ">";
        } else if (entry.is_directory()) {
            out[rel] = "<dir>";
        } else if (entry.is_regular_file()) {
            out[rel] = ReadFile(entry.path());
        }
    }
    return out;
}

// A small tree with text, binary, empty and nested entries under `root`.
inline void BuildSampleTree(const std::filesystem::path& root) {
    WriteFile(root / "a.txt", "alpha\n");
    WriteFile(root / "empty.txt", "");
    WriteFile(root / "sub" / "b.bin", NoiseBytes(200 * 1024, 7));
    WriteFile(root / "sub" / "deeper" / "c.txt", std::string(50000, 'c'));
    std::filesystem::create_directories(root / "emptydir");
}

}  // namespace dirpack::test
