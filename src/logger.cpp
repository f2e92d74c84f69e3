#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <fmt/format.h>

namespace fs = std::filesystem;

namespace {

std::string_view levelLabel(LogLevel level) {
    switch (level) {
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Debug:
        return "DEBUG";
    }
    return "INFO";
}

void appendLine(const std::string& path, const std::string& line) {
    if (path.empty()) {
        return;
    }
    fs::path logPath(path);
    std::error_code ec;
    if (logPath.has_parent_path()) {
        fs::create_directories(logPath.parent_path(), ec);
    }
    std::ofstream log(path, std::ios::app);
    if (log.is_open()) {
        log << line << '\n';
        log.flush();
    } else {
        fmt::print(stderr, "Error: Cannot write to log file: {}\n", path);
    }
}

} // namespace

LogLevel parseLogLevel(std::string_view name) {
    std::string lowered(name);
    std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "error") {
        return LogLevel::Error;
    }
    if (lowered == "warning" || lowered == "warn") {
        return LogLevel::Warning;
    }
    if (lowered == "info") {
        return LogLevel::Info;
    }
    if (lowered == "debug") {
        return LogLevel::Debug;
    }
    throw std::runtime_error(fmt::format("Unknown log level: {}", name));
}

Logger::Logger(LogLevel level, std::string logFile, std::string errorLogFile)
    : level_(level), logFile_(std::move(logFile)), errorLogFile_(std::move(errorLogFile)) {}

void Logger::logMessage(std::string_view message) const {
    write(LogLevel::Info, message);
}

void Logger::logDebug(std::string_view message) const {
    write(LogLevel::Debug, message);
}

void Logger::logWarning(std::string_view message) const {
    write(LogLevel::Warning, message);
}

void Logger::logError(std::string_view message) const {
    write(LogLevel::Error, message);
}

void Logger::write(LogLevel level, std::string_view message) const {
    if (level > level_) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    std::tm localTime{};
    localtime_r(&timeT, &localTime);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", &localTime);
    std::string logEntry = fmt::format("[{}] {}: {}", timeBuf, levelLabel(level), message);

    std::lock_guard<std::mutex> lock(mutex_);
    if (level <= LogLevel::Warning) {
        fmt::print(stderr, "{}\n", logEntry);
    } else {
        fmt::print("{}\n", logEntry);
    }
    appendLine(logFile_, logEntry);
    if (level == LogLevel::Error) {
        appendLine(errorLogFile_, logEntry);
    }
}
