#pragma once

#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "dirpack/format.hpp"

namespace dirpack::cli {

// Thrown for malformed command lines; the tools exit with status 2.
class UsageError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

struct CommonArgs {
    std::vector<std::string> sources;
    std::string output_dir;
    bool overwrite = false;
    bool delete_source = false;
    bool verbose = false;
    bool no_color = false;
    bool help = false;
};

struct ArchiveArgs {
    CommonArgs common;
    ArchiveFormat format = ArchiveFormat::BzTar;
};

using UnpackArgs = CommonArgs;

// `args` excludes the program name. Sources may follow "-s" as several
// words, up to the next option. "--name=value" and bundled short flags
// ("-odv") are accepted. Throws UsageError, or std::invalid_argument for an
// unknown archive format.
ArchiveArgs ParseArchiveArgs(const std::vector<std::string>& args);
UnpackArgs ParseUnpackArgs(const std::vector<std::string>& args);

void PrintArchiveUsage(std::ostream& os);
void PrintUnpackUsage(std::ostream& os);

}  // namespace dirpack::cli
