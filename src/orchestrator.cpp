#include "dirpack/orchestrator.hpp"

#include "dirpack/archive.hpp"
#include "dirpack/byte_size.hpp"
#include "dirpack/paths.hpp"

#include <chrono>
#include <exception>
#include <optional>
#include <system_error>

namespace dirpack {

namespace {

using Clock = std::chrono::steady_clock;

template <typename Measure>
std::optional<ByteSize> TryMeasure(Measure measure, const std::filesystem::path& path, Logger& logger) {
    try {
        return measure(path);
    } catch (const PathTypeError& exc) {
        logger.Warning(std::string("Non-critical error: ") + exc.what());
    } catch (const std::filesystem::filesystem_error& exc) {
        logger.Warning(std::string("Non-critical error: ") + exc.what());
    }
    return std::nullopt;
}

void LogRatio(Logger& logger, const char* label,
              const std::optional<ByteSize>& numerator,
              const std::optional<ByteSize>& denominator) {
    if (numerator && denominator && denominator->bytes > 0) {
        logger.Info(std::string(label) + ": " + FormatRatio(*numerator, *denominator));
    }
}

double SecondsSince(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

void PrepareOutput(const std::filesystem::path& output_dir) {
    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        throw std::filesystem::filesystem_error("Failed to create output directory", output_dir, ec);
    }
}

void ArchiveOne(const ArchiveJob& job, const ArchiveOptions& options, Logger& logger) {
    logger.Info("Starting archive creation from source directory: " + job.source.string());
    auto source_size = TryMeasure(FolderSize, job.source, logger);
    if (source_size) {
        logger.Info("Original Directory Size: " + FormatByteSize(*source_size));
    }

    MakeArchive(job.root_dir, job.base_name, options.format, job.destination);
    logger.Info("Archive created at: " + job.destination.string());

    auto archive_size = TryMeasure(FileSize, job.destination, logger);
    if (archive_size) {
        logger.Info("Archive Size: " + FormatByteSize(*archive_size));
    }
    LogRatio(logger, "Compression Ratio", source_size, archive_size);

    if (options.delete_source) {
        logger.Warning("Deleting Source Directory: " + job.source.string());
        std::filesystem::remove_all(job.source);
    }
}

void UnpackOne(const UnpackJob& job, const UnpackOptions& options, Logger& logger) {
    logger.Info("Starting unpacking archive from file: " + job.source.string());
    auto archive_size = TryMeasure(FileSize, job.source, logger);
    if (archive_size) {
        logger.Info("Original Archive Size: " + FormatByteSize(*archive_size));
    }

    ExtractArchive(job.source, options.output_dir, options.overwrite);
    logger.Info("Unpacked Archive created at: " + job.extract_dir.string());

    auto unpacked_size = TryMeasure(FolderSize, job.extract_dir, logger);
    if (unpacked_size) {
        logger.Info("Unpacked Archive Size: " + FormatByteSize(*unpacked_size));
    }
    LogRatio(logger, "Decompression Ratio", unpacked_size, archive_size);

    if (options.delete_source) {
        logger.Warning("Deleting Source Archive File: " + job.source.string());
        std::error_code ec;
        if (std::filesystem::is_regular_file(job.source, ec)) {
            std::filesystem::remove(job.source);
        }
    }
}

}  // namespace

ArchiveJob PlanArchiveJob(const std::filesystem::path& source,
                          const std::filesystem::path& output_dir,
                          ArchiveFormat format) {
    ArchiveJob job;
    job.source = paths::Normalize(source);
    job.root_dir = job.source.parent_path();
    job.base_name = paths::BaseName(job.source);
    job.destination = output_dir / (job.base_name + std::string(FormatSuffix(format)));
    return job;
}

UnpackJob PlanUnpackJob(const std::filesystem::path& source,
                        const std::filesystem::path& output_dir) {
    UnpackJob job;
    job.source = source;
    job.extract_dir = output_dir / StripArchiveSuffixes(source.filename().string());
    return job;
}

BatchReport ArchiveDirectories(const ArchiveOptions& options, Logger& logger) {
    const auto start = Clock::now();
    PrepareOutput(options.output_dir);
    logger.Info("Archiving: " + std::to_string(options.sources.size()) + " directories");
    if (options.overwrite) {
        logger.Warning("Overwriting existing archives: true");
    }
    if (options.delete_source) {
        logger.Warning("Deleting source directories after archiving: true");
    }

    BatchReport report;
    for (const auto& source : options.sources) {
        try {
            ArchiveJob job = PlanArchiveJob(source, options.output_dir, options.format);
            std::error_code ec;
            bool exists = std::filesystem::exists(job.destination, ec);
            if (exists && !options.overwrite) {
                logger.Warning(source.string() + " Archive already exists at "
                               + job.destination.string() + ", Skipping...");
                report.skipped.push_back(source);
                continue;
            }
            if (exists) {
                logger.Warning("Overwriting existing archive: " + job.destination.string());
            }
            ArchiveOne(job, options, logger);
            report.processed.push_back(source);
        } catch (const std::exception& exc) {
            logger.Error("An error occurred during archiving " + source.string() + ": " + exc.what());
            report.failed.push_back(source);
        }
    }

    logger.Info("Archiving Directories Finished! Total Archives Created: "
                + std::to_string(report.processed.size()));
    logger.Info("Skipped: " + std::to_string(report.skipped.size())
                + ", Failed: " + std::to_string(report.failed.size()));
    logger.Info("Total Time Elapsed: " + FormatElapsed(SecondsSince(start)));
    return report;
}

BatchReport UnpackFiles(const UnpackOptions& options, Logger& logger) {
    const auto start = Clock::now();
    PrepareOutput(options.output_dir);
    logger.Info("Unpacking: " + std::to_string(options.sources.size()) + " archives");
    if (options.overwrite) {
        logger.Warning("Overwriting existing unpacked archives: true");
    }
    if (options.delete_source) {
        logger.Warning("Deleting source archives after unpacking: true");
    }

    BatchReport report;
    for (const auto& source : options.sources) {
        try {
            UnpackJob job = PlanUnpackJob(source, options.output_dir);
            std::error_code ec;
            bool exists = std::filesystem::is_directory(job.extract_dir, ec);
            if (exists && !options.overwrite) {
                logger.Warning(source.string() + ": unpacked archive already exists at "
                               + job.extract_dir.string() + ", Skipping...");
                report.skipped.push_back(source);
                continue;
            }
            if (exists) {
                logger.Warning("Overwriting existing unpacked archive: " + job.extract_dir.string());
            }
            UnpackOne(job, options, logger);
            report.processed.push_back(source);
        } catch (const std::exception& exc) {
            logger.Error("An error occurred during unpacking " + source.string() + ": " + exc.what());
            report.failed.push_back(source);
        }
    }

    logger.Info("Unpacking Archives Finished! Total Directories Created: "
                + std::to_string(report.processed.size()));
    logger.Info("Skipped: " + std::to_string(report.skipped.size())
                + ", Failed: " + std::to_string(report.failed.size()));
    logger.Info("Total Time Elapsed: " + FormatElapsed(SecondsSince(start)));
    return report;
}

}  // namespace dirpack
