#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <json/json.h>
#include "relay_config.hpp"

namespace fs = std::filesystem;

namespace {

Json::Value parse(const std::string& text) {
    Json::Value root;
    Json::Reader reader;
    if (!reader.parse(text, root)) {
        throw std::runtime_error(reader.getFormattedErrorMessages());
    }
    return root;
}

} // namespace

TEST(RelayConfigTest, DefaultsToLocalBackend) {
    const Json::Value empty(Json::objectValue);
    RelayConfig config(empty);

    EXPECT_EQ(config.backend, "local");
    EXPECT_EQ(config.local.root, "./relay_uploads/");
    EXPECT_EQ(config.logLevel, LogLevel::Info);
    EXPECT_EQ(fs::path(config.logFile).filename().string(), "relay.log");
    EXPECT_EQ(fs::path(config.errorLogFile).filename().string(), "errors.log");
    EXPECT_EQ(config.transfer.chunkSize, 8u * 1024 * 1024);
    EXPECT_EQ(config.transfer.retryAttempts, 5);
    EXPECT_EQ(config.transfer.reportInterval, std::chrono::milliseconds(500));
    EXPECT_EQ(config.transfer.pollInterval, std::chrono::milliseconds(1000));
    EXPECT_TRUE(config.emailConfig.isNull());
}

TEST(RelayConfigTest, ReadsFtpSection) {
    RelayConfig config(parse(R"({
        "backend": "ftp",
        "log_level": "debug",
        "transfer": { "chunk_size": 1048576, "retry_attempts": 3, "data_timeout_ms": 30000 },
        "ftp": {
            "host": "ftp.example.com",
            "port": 990,
            "username": "relay",
            "password": "secret",
            "remote_dir": "incoming",
            "encryption": "implicit",
            "passive": false,
            "verify_tls": false,
            "streaming_upload": false
        }
    })"));

    EXPECT_EQ(config.backend, "ftp");
    EXPECT_EQ(config.logLevel, LogLevel::Debug);
    EXPECT_EQ(config.ftp.host, "ftp.example.com");
    EXPECT_EQ(config.ftp.port, 990);
    EXPECT_EQ(config.ftp.username, "relay");
    EXPECT_EQ(config.ftp.root, "incoming");
    EXPECT_EQ(config.ftp.encryption, FtpEncryption::Implicit);
    EXPECT_FALSE(config.ftp.passive);
    EXPECT_FALSE(config.ftp.verifyTls);
    EXPECT_FALSE(config.ftp.streamingUpload);
    EXPECT_EQ(config.ftp.chunkSize, 1048576u);
    EXPECT_EQ(config.ftp.retryAttempts, 3);
    EXPECT_EQ(config.ftp.dataTimeout, std::chrono::milliseconds(30000));
    EXPECT_EQ(config.transfer.chunkSize, 1048576u);
}

TEST(RelayConfigTest, ClampsProgressIntervals) {
    RelayConfig config(parse(R"({ "transfer": { "report_interval_ms": 10, "poll_interval_ms": 100 } })"));

    EXPECT_EQ(config.transfer.reportInterval, RelayConfig::kMinInterval);
    EXPECT_EQ(config.transfer.pollInterval, RelayConfig::kMinInterval);
}

TEST(RelayConfigTest, RejectsInvalidSettings) {
    EXPECT_THROW(RelayConfig(parse(R"({ "backend": "s3" })")), std::runtime_error);
    EXPECT_THROW(RelayConfig(parse(R"({ "backend": "ftp" })")), std::runtime_error);
    EXPECT_THROW(RelayConfig(parse(R"({ "backend": "sftp", "sftp": { "port": 22 } })")), std::runtime_error);
    EXPECT_THROW(RelayConfig(parse(R"({ "transfer": { "chunk_size": 0 } })")), std::runtime_error);
    EXPECT_THROW(RelayConfig(parse(R"({ "log_level": "verbose" })")), std::runtime_error);
    EXPECT_THROW(RelayConfig(parse(R"({ "backend": "ftp", "ftp": { "host": "h", "encryption": "ssl3" } })")),
                 std::runtime_error);
    EXPECT_THROW(RelayConfig(parse("[1, 2]")), std::runtime_error);
}

TEST(RelayConfigTest, LoadsFromFile) {
    const fs::path path = fs::temp_directory_path() / "mediarelay_config_test.json";
    {
        std::ofstream out(path);
        out << R"({ "backend": "local", "local": { "root": "/srv/media" }, "log_dir": "/var/log/relay",
                    "notifications": { "email": { "enabled": true, "to": "ops@example.com" } } })";
    }

    RelayConfig config(path.string());
    EXPECT_EQ(config.local.root, "/srv/media");
    EXPECT_EQ(config.logFile, "/var/log/relay/relay.log");
    EXPECT_TRUE(config.emailConfig.get("enabled", false).asBool());
    fs::remove(path);
}

TEST(RelayConfigTest, MissingOrMalformedFileThrows) {
    EXPECT_THROW(RelayConfig(std::string("/nonexistent/relay_config.json")), std::runtime_error);

    const fs::path path = fs::temp_directory_path() / "mediarelay_bad_config_test.json";
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_THROW(RelayConfig(path.string()), std::runtime_error);
    fs::remove(path);
}
