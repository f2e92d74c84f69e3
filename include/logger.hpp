/**
 * @file logger.hpp
 * @brief Timestamped console and file logging for MediaRelay.
 *
 * Every line is prefixed with a local "YYYY-MM-DD HH:MM:SS" timestamp and written to the
 * console and, when configured, appended to a log file. Errors additionally land in a
 * dedicated error log. Safe to use from the engine and the progress monitor concurrently.
 *
 * @note Log directories are created on first use.
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <mutex>
#include <string>
#include <string_view>

/**
 * @brief Severity threshold; messages above the configured level are dropped.
 */
enum class LogLevel {
    Error = 0,
    Warning = 1,
    Info = 2,
    Debug = 3
};

/**
 * @brief Parses "error", "warning", "info" or "debug" (case-insensitive).
 *
 * @throws std::runtime_error On an unknown level name.
 */
LogLevel parseLogLevel(std::string_view name);

/**
 * @brief Console + file logger.
 */
class Logger {
public:
    /**
     * @brief Constructs a logger.
     *
     * @param level Most verbose level that is still written.
     * @param logFile File receiving every written line; empty disables file output.
     * @param errorLogFile File receiving error lines only; empty disables it.
     */
    explicit Logger(LogLevel level = LogLevel::Info, std::string logFile = {}, std::string errorLogFile = {});

    /**
     * @brief Logs an informational message.
     */
    void logMessage(std::string_view message) const;

    void logDebug(std::string_view message) const;
    void logWarning(std::string_view message) const;

    /**
     * @brief Logs an error to the console, the log file and the error log file.
     */
    void logError(std::string_view message) const;

    LogLevel level() const { return level_; }

private:
    void write(LogLevel level, std::string_view message) const;

    LogLevel level_;           ///< Verbosity threshold.
    std::string logFile_;      ///< General log file path.
    std::string errorLogFile_; ///< Error-only log file path.
    mutable std::mutex mutex_; ///< Serializes console and file output.
};

#endif // LOGGER_HPP
