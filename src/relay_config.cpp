#include "relay_config.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <fmt/format.h>

namespace fs = std::filesystem;

namespace {

FtpEncryption parseEncryption(const std::string& name) {
    if (name == "none") {
        return FtpEncryption::None;
    }
    if (name == "explicit") {
        return FtpEncryption::Explicit;
    }
    if (name == "implicit") {
        return FtpEncryption::Implicit;
    }
    throw std::runtime_error(fmt::format("Unknown FTP encryption mode: {}", name));
}

std::chrono::milliseconds millis(const Json::Value& section, const char* key, int fallback) {
    return std::chrono::milliseconds(section.get(key, fallback).asInt64());
}

} // namespace

RelayConfig::RelayConfig(const std::string& configFile) {
    std::ifstream file(configFile);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("Failed to open config file: {}", configFile));
    }
    Json::Value configJson;
    Json::Reader reader;
    if (!reader.parse(file, configJson)) {
        throw std::runtime_error(fmt::format("Failed to parse config file: {}: {}", configFile, reader.getFormattedErrorMessages()));
    }
    load(configJson);
}

RelayConfig::RelayConfig(const Json::Value& configJson) {
    load(configJson);
}

void RelayConfig::load(const Json::Value& configJson) {
    if (!configJson.isNull() && !configJson.isObject()) {
        throw std::runtime_error("Configuration root must be a JSON object");
    }

    backend = configJson.get("backend", "local").asString();
    if (backend != "local" && backend != "ftp" && backend != "sftp") {
        throw std::runtime_error(fmt::format("Unknown backend: {}", backend));
    }

    logDir = configJson.get("log_dir", "./logs/").asString();
    logFile = (fs::path(logDir) / "relay.log").string();
    errorLogFile = (fs::path(logDir) / "errors.log").string();
    logLevel = parseLogLevel(configJson.get("log_level", "info").asString());

    // Transfer tunables
    const Json::Value transferJson = configJson["transfer"];
    const auto chunkSize = transferJson.get("chunk_size", 8 * 1024 * 1024).asUInt64();
    if (chunkSize == 0) {
        throw std::runtime_error("transfer.chunk_size must be positive");
    }
    transfer.chunkSize = static_cast<std::size_t>(chunkSize);
    transfer.retryAttempts = std::max(0, transferJson.get("retry_attempts", 5).asInt());
    transfer.reportInterval = std::max(kMinInterval, millis(transferJson, "report_interval_ms", 500));
    transfer.pollInterval = std::max(kMinInterval, millis(transferJson, "poll_interval_ms", 1000));
    transfer.monitorStopTimeout = millis(transferJson, "monitor_stop_timeout_ms", 1000);
    const auto connectTimeout = millis(transferJson, "connect_timeout_ms", 60000);
    const auto dataTimeout = millis(transferJson, "data_timeout_ms", 600000);

    const Json::Value localJson = configJson["local"];
    local.root = localJson.get("root", "./relay_uploads/").asString();

    const Json::Value ftpJson = configJson["ftp"];
    ftp.host = ftpJson.get("host", "").asString();
    ftp.port = ftpJson.get("port", 21).asInt();
    ftp.username = ftpJson.get("username", "").asString();
    ftp.password = ftpJson.get("password", "").asString();
    ftp.root = ftpJson.get("remote_dir", "").asString();
    ftp.encryption = parseEncryption(ftpJson.get("encryption", "explicit").asString());
    ftp.passive = ftpJson.get("passive", true).asBool();
    ftp.verifyTls = ftpJson.get("verify_tls", true).asBool();
    ftp.streamingUpload = ftpJson.get("streaming_upload", true).asBool();
    ftp.chunkSize = transfer.chunkSize;
    ftp.connectTimeout = connectTimeout;
    ftp.dataTimeout = dataTimeout;
    ftp.retryAttempts = transfer.retryAttempts;

    const Json::Value sftpJson = configJson["sftp"];
    sftp.host = sftpJson.get("host", "").asString();
    sftp.port = sftpJson.get("port", 22).asInt();
    sftp.username = sftpJson.get("username", "").asString();
    sftp.password = sftpJson.get("password", "").asString();
    sftp.root = sftpJson.get("remote_dir", "").asString();
    sftp.connectTimeout = connectTimeout;

    if (backend == "ftp" && ftp.host.empty()) {
        throw std::runtime_error("ftp.host is required for the ftp backend");
    }
    if (backend == "sftp" && sftp.host.empty()) {
        throw std::runtime_error("sftp.host is required for the sftp backend");
    }

    emailConfig = configJson["notifications"]["email"];
}
