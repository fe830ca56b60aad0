#include "dirpack/logger.hpp"

#include "dirpack/cli_colors.hpp"
#include "dirpack/constants.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace dirpack {

namespace {

std::tm LocalTime(std::time_t when) {
    std::tm out{};
    localtime_r(&when, &out);
    return out;
}

std::string FileStamp() {
    std::tm now = LocalTime(std::time(nullptr));
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d_%H-%M-%S", &now);
    return buffer;
}

const char* LevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::Info:
            return cli::color::CYAN;
        case LogLevel::Warning:
            return cli::color::BOLD_YELLOW;
        case LogLevel::Error:
            return cli::color::BOLD_RED;
    }
    return cli::color::RESET;
}

}  // namespace

std::string_view LogLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warning:
            return "WARNING";
        case LogLevel::Error:
            return "ERROR";
    }
    return "UNKNOWN";
}

std::string LogTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()).count() % 1000;
    std::tm local = LocalTime(std::chrono::system_clock::to_time_t(now));
    char buffer[40];
    std::size_t len = std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
    std::snprintf(buffer + len, sizeof(buffer) - len, ",%03d", static_cast<int>(millis));
    return buffer;
}

Logger::Logger(LogLevel threshold, bool console)
    : threshold_(threshold), console_(console) {}

Logger::Logger(Logger&&) noexcept = default;
Logger& Logger::operator=(Logger&&) noexcept = default;
Logger::~Logger() = default;

void Logger::AttachFile(const std::filesystem::path& path) {
    auto file = std::make_unique<std::ofstream>(path, std::ios::out | std::ios::trunc);
    if (!*file) {
        throw std::runtime_error("Failed to open log file: " + path.string());
    }
    file_ = std::move(file);
    file_path_ = path;
}

void Logger::Log(LogLevel level, const std::string& message) {
    if (!Enabled(level)) {
        return;
    }
    const std::string stamp = LogTimestamp();
    const std::string name(LogLevelName(level));
    if (console_) {
        std::cerr << cli::Dim(stamp) << " - " << cli::Colorize(name, LevelColor(level))
                  << " - " << message << '\n';
    }
    if (file_) {
        *file_ << stamp << " - " << name << " - " << message << '\n';
        file_->flush();
    }
}

Logger OpenRunLog(const std::filesystem::path& output_dir,
                  std::string_view log_type,
                  LogLevel threshold,
                  bool console) {
    auto log_dir = output_dir / std::string(constants::kLogDirName);
    std::error_code ec;
    std::filesystem::create_directories(log_dir, ec);
    if (ec) {
        throw std::runtime_error("Failed to create log directory " + log_dir.string() + ": " + ec.message());
    }
    std::string stem = log_type.empty()
                           ? "log_" + FileStamp()
                           : std::string(log_type) + "_log_" + FileStamp();
    // Two runs within the same second must not share a file.
    auto log_path = log_dir / (stem + ".txt");
    for (int n = 2; std::filesystem::exists(log_path); ++n) {
        log_path = log_dir / (stem + "_" + std::to_string(n) + ".txt");
    }
    Logger logger(threshold, console);
    logger.AttachFile(log_path);
    logger.Info("Log file output to: " + logger.FilePath().string());
    return logger;
}

}  // namespace dirpack
