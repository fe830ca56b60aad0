#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "dirpack/format.hpp"
#include "dirpack/logger.hpp"

namespace dirpack {

struct ArchiveOptions {
    std::vector<std::filesystem::path> sources;
    std::filesystem::path output_dir;
    ArchiveFormat format = ArchiveFormat::BzTar;
    bool overwrite = false;
    bool delete_source = false;
};

struct UnpackOptions {
    std::vector<std::filesystem::path> sources;
    std::filesystem::path output_dir;
    bool overwrite = false;
    bool delete_source = false;
};

// One source directory and the archive it maps to.
struct ArchiveJob {
    std::filesystem::path source;
    std::filesystem::path root_dir;
    std::string base_name;
    std::filesystem::path destination;
};

// One archive file and the directory it is expected to unpack to.
struct UnpackJob {
    std::filesystem::path source;
    std::filesystem::path extract_dir;
};

// Inputs sorted by outcome, in input order.
struct BatchReport {
    std::vector<std::filesystem::path> processed;
    std::vector<std::filesystem::path> skipped;
    std::vector<std::filesystem::path> failed;
};

ArchiveJob PlanArchiveJob(const std::filesystem::path& source,
                          const std::filesystem::path& output_dir,
                          ArchiveFormat format);

UnpackJob PlanUnpackJob(const std::filesystem::path& source,
                        const std::filesystem::path& output_dir);

// Archives every source directory in turn. Failures are logged and recorded
// in the report; they never stop the batch.
BatchReport ArchiveDirectories(const ArchiveOptions& options, Logger& logger);

// Unpacks every source archive in turn, with the same failure policy.
BatchReport UnpackFiles(const UnpackOptions& options, Logger& logger);

}  // namespace dirpack
