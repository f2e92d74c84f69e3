/**
 * @file relay_config.hpp
 * @brief Configuration management for the MediaRelay transfer service.
 *
 * Defines the configuration class that selects the storage backend and carries its
 * connection settings, the transfer tunables, logging and notification settings.
 *
 * @note Configuration is loaded from a JSON file (relay_config.json by default). Missing keys
 * fall back to the defaults documented on each field.
 */

#ifndef RELAY_CONFIG_HPP
#define RELAY_CONFIG_HPP

#include <chrono>
#include <string>
#include <json/json.h>
#include "backend_settings.hpp"
#include "logger.hpp"
#include "transfer_engine.hpp"

/**
 * @brief Configuration class for the relay.
 *
 * Loads and validates settings from JSON, providing defaults for every optional key.
 */
class RelayConfig {
public:
    /**
     * @brief Smallest accepted report and poll interval.
     */
    static constexpr std::chrono::milliseconds kMinInterval{500};

    /**
     * @brief Constructs a configuration instance from a JSON file.
     *
     * @param configFile Path to the JSON configuration file.
     * @throws std::runtime_error If the file is inaccessible, is not valid JSON, or holds
     *         invalid values.
     */
    explicit RelayConfig(const std::string& configFile);

    /**
     * @brief Constructs a configuration instance from a parsed JSON document.
     *
     * @param configJson Root object of the configuration.
     * @throws std::runtime_error If a value is invalid.
     */
    explicit RelayConfig(const Json::Value& configJson);

    std::string backend;        ///< Selected backend: "local", "ftp" or "sftp".
    std::string logDir;         ///< Directory holding the log files (e.g., "./logs/").
    std::string logFile;        ///< Path to the log file.
    std::string errorLogFile;   ///< Path to the error log file.
    LogLevel logLevel;          ///< Most verbose level written.
    LocalSettings local;        ///< Local backend settings.
    FtpSettings ftp;            ///< FTP backend settings.
    SftpSettings sftp;          ///< SFTP backend settings.
    EngineOptions transfer;     ///< Copy loop and progress tunables.
    Json::Value emailConfig;    ///< Email notification settings (null when absent).

private:
    void load(const Json::Value& configJson);
};

#endif // RELAY_CONFIG_HPP
