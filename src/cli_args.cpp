#include "dirpack/cli_args.hpp"

#include "dirpack/constants.hpp"
#include "dirpack/env.hpp"

#include <cstddef>
#include <optional>

namespace dirpack::cli {

namespace {

bool IsOption(const std::string& token) {
    return token.size() > 1 && token[0] == '-';
}

// Splits "--name=value" into its parts and expands "-odv" into "-o -d -v".
std::vector<std::string> Normalize(const std::vector<std::string>& args) {
    std::vector<std::string> out;
    for (const auto& token : args) {
        if (token.rfind("--", 0) == 0) {
            auto eq = token.find('=');
            if (eq != std::string::npos) {
                out.push_back(token.substr(0, eq));
                out.push_back(token.substr(eq + 1));
                continue;
            }
            out.push_back(token);
        } else if (IsOption(token) && token.size() > 2) {
            for (std::size_t i = 1; i < token.size(); ++i) {
                out.push_back(std::string("-") + token[i]);
            }
        } else {
            out.push_back(token);
        }
    }
    return out;
}

// Parses the flags shared by both tools; returns false when `flag` is not one
// of them. `source_flag` is the long name of the source list option.
bool ParseCommonFlag(const std::vector<std::string>& tokens,
                     std::size_t& idx,
                     const std::string& source_flag,
                     CommonArgs& opts) {
    const std::string& flag = tokens[idx];
    if (flag == source_flag || flag == "-s") {
        std::size_t next = idx + 1;
        while (next < tokens.size() && !IsOption(tokens[next])) {
            opts.sources.push_back(tokens[next]);
            ++next;
        }
        if (next == idx + 1) {
            throw UsageError("Missing value for " + flag);
        }
        idx = next;
    } else if (flag == "--output_directory") {
        if (idx + 1 >= tokens.size() || IsOption(tokens[idx + 1])) {
            throw UsageError("Missing value for --output_directory");
        }
        opts.output_dir = tokens[idx + 1];
        idx += 2;
    } else if (flag == "--overwrite" || flag == "-o") {
        opts.overwrite = true;
        idx += 1;
    } else if (flag == "--delete_source" || flag == "-d") {
        opts.delete_source = true;
        idx += 1;
    } else if (flag == "--verbose" || flag == "-v") {
        opts.verbose = true;
        idx += 1;
    } else if (flag == "--no-color") {
        opts.no_color = true;
        idx += 1;
    } else if (flag == "--help" || flag == "-h") {
        opts.help = true;
        idx += 1;
    } else {
        return false;
    }
    return true;
}

void RequireCommon(const CommonArgs& opts, const std::string& source_flag) {
    if (opts.help) {
        return;
    }
    if (opts.sources.empty()) {
        throw UsageError("The following argument is required: " + source_flag + "/-s");
    }
    if (opts.output_dir.empty()) {
        throw UsageError("The following argument is required: --output_directory");
    }
}

}  // namespace

ArchiveArgs ParseArchiveArgs(const std::vector<std::string>& args) {
    const std::string source_flag = "--source_directories";
    ArchiveArgs opts;
    opts.common.verbose = env::VerboseByDefault();
    std::optional<std::string> format_name;
    std::vector<std::string> tokens = Normalize(args);
    std::size_t idx = 0;
    while (idx < tokens.size()) {
        if (ParseCommonFlag(tokens, idx, source_flag, opts.common)) {
            continue;
        }
        const std::string& flag = tokens[idx];
        if (flag == "--archive_format") {
            if (idx + 1 >= tokens.size()) {
                throw UsageError("Missing value for --archive_format");
            }
            format_name = tokens[idx + 1];
            idx += 2;
        } else {
            throw UsageError("Unrecognized argument: " + flag);
        }
    }
    RequireCommon(opts.common, source_flag);
    opts.format = ParseArchiveFormat(format_name.value_or(std::string(constants::kDefaultArchiveFormat)));
    return opts;
}

UnpackArgs ParseUnpackArgs(const std::vector<std::string>& args) {
    const std::string source_flag = "--source_files";
    UnpackArgs opts;
    opts.verbose = env::VerboseByDefault();
    std::vector<std::string> tokens = Normalize(args);
    std::size_t idx = 0;
    while (idx < tokens.size()) {
        if (!ParseCommonFlag(tokens, idx, source_flag, opts)) {
            throw UsageError("Unrecognized argument: " + tokens[idx]);
        }
    }
    RequireCommon(opts, source_flag);
    return opts;
}

void PrintArchiveUsage(std::ostream& os) {
    os << "Usage:\n";
    os << "  dirpack-archive --source_directories <dir> [<dir> ...] --output_directory <dir>\n";
    os << "                  [--archive_format zip|tar|gztar|bztar|xztar] [-o] [-d] [-v] [--no-color]\n";
    os << "\n";
    os << "  -s, --source_directories  directories to archive\n";
    os << "      --output_directory    directory receiving the archives and logs/\n";
    os << "      --archive_format      archive format (default: " << constants::kDefaultArchiveFormat << ")\n";
    os << "  -o, --overwrite           replace archives that already exist\n";
    os << "  -d, --delete_source       delete each source directory after archiving it\n";
    os << "  -v, --verbose             log progress and statistics\n";
    os << "      --no-color            plain console output\n";
}

void PrintUnpackUsage(std::ostream& os) {
    os << "Usage:\n";
    os << "  dirpack-unpack --source_files <archive> [<archive> ...] --output_directory <dir>\n";
    os << "                 [-o] [-d] [-v] [--no-color]\n";
    os << "\n";
    os << "  -s, --source_files        archives to unpack (.zip, .tar, .tar.gz, .tar.bz2, .tar.xz)\n";
    os << "      --output_directory    directory receiving the unpacked trees and logs/\n";
    os << "  -o, --overwrite           replace directories that already exist\n";
    os << "  -d, --delete_source       delete each archive after unpacking it\n";
    os << "  -v, --verbose             log progress and statistics\n";
    os << "      --no-color            plain console output\n";
}

}  // namespace dirpack::cli
