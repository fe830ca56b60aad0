#pragma once

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <string_view>

namespace dirpack {

enum class LogLevel {
    Info = 20,
    Warning = 30,
    Error = 40
};

std::string_view LogLevelName(LogLevel level);

// Per-run logger: console sink on std::cerr plus an optional file sink.
// Lines read "<YYYY-MM-DD HH:MM:SS,mmm> - <LEVEL> - <message>".
class Logger {
public:
    explicit Logger(LogLevel threshold = LogLevel::Warning, bool console = true);

    Logger(Logger&&) noexcept;
    Logger& operator=(Logger&&) noexcept;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    ~Logger();

    void AttachFile(const std::filesystem::path& path);

    void Log(LogLevel level, const std::string& message);
    void Info(const std::string& message) { Log(LogLevel::Info, message); }
    void Warning(const std::string& message) { Log(LogLevel::Warning, message); }
    void Error(const std::string& message) { Log(LogLevel::Error, message); }

    bool Enabled(LogLevel level) const noexcept { return level >= threshold_; }
    const std::filesystem::path& FilePath() const noexcept { return file_path_; }

private:
    LogLevel threshold_;
    bool console_;
    std::filesystem::path file_path_;
    std::unique_ptr<std::ofstream> file_;
};

// Creates <output_dir>/logs/ and a new <log_type>_log_<YYYY-MM-DD_HH-MM-SS>.txt
// in it, and returns a logger writing to that file and the console.
Logger OpenRunLog(const std::filesystem::path& output_dir,
                  std::string_view log_type,
                  LogLevel threshold,
                  bool console = true);

std::string LogTimestamp();

}  // namespace dirpack
