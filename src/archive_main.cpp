#include "dirpack/cli_args.hpp"
#include "dirpack/cli_colors.hpp"
#include "dirpack/constants.hpp"
#include "dirpack/env.hpp"
#include "dirpack/logger.hpp"
#include "dirpack/orchestrator.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    dirpack::cli::ArchiveArgs opts;
    try {
        opts = dirpack::cli::ParseArchiveArgs(args);
    } catch (const std::invalid_argument& exc) {
        std::cerr << dirpack::cli::BoldRed("Error: ") << exc.what() << "\n";
        dirpack::cli::PrintArchiveUsage(std::cerr);
        return 2;
    }
    if (opts.common.help) {
        dirpack::cli::PrintArchiveUsage(std::cout);
        return 0;
    }
    if (opts.common.no_color || dirpack::env::ColorDisabled()) {
        dirpack::cli::SetColorsEnabled(false);
    }

    try {
        const std::filesystem::path output_dir(opts.common.output_dir);
        std::error_code ec;
        const bool existed = std::filesystem::is_directory(output_dir, ec);
        dirpack::Logger logger = dirpack::OpenRunLog(
            output_dir, dirpack::constants::kCompressionLogType,
            opts.common.verbose ? dirpack::LogLevel::Info : dirpack::LogLevel::Warning);
        logger.Info((existed ? "Output Directory Exists at: " : "Output Directory created at: ")
                    + output_dir.string());

        dirpack::ArchiveOptions run;
        run.sources.assign(opts.common.sources.begin(), opts.common.sources.end());
        run.output_dir = output_dir;
        run.format = opts.format;
        run.overwrite = opts.common.overwrite;
        run.delete_source = opts.common.delete_source;
        dirpack::ArchiveDirectories(run, logger);
        return 0;
    } catch (const std::exception& exc) {
        std::cerr << dirpack::cli::BoldRed("Error: ") << exc.what() << "\n";
        return 1;
    }
}
