#include "media_relay.hpp"
#include <stdexcept>
#include <utility>
#include <fmt/format.h>
#include "ftp_backend.hpp"
#include "local_backend.hpp"
#ifdef MEDIARELAY_HAVE_LIBSSH
#include "sftp_backend.hpp"
#endif

std::unique_ptr<TransferBackend> makeBackend(const RelayConfig& config, const Logger& logger) {
    if (config.backend == "ftp") {
        return std::make_unique<FtpBackend>(config.ftp, logger);
    }
    if (config.backend == "sftp") {
#ifdef MEDIARELAY_HAVE_LIBSSH
        return std::make_unique<SftpBackend>(config.sftp, logger);
#else
        throw std::runtime_error("The sftp backend is not available: built without libssh");
#endif
    }
    return std::make_unique<LocalBackend>(config.local.root, logger);
}

MediaRelay::MediaRelay(const std::string& configFile) : MediaRelay(RelayConfig(configFile)) {}

MediaRelay::MediaRelay(RelayConfig config)
    : config_(std::move(config)),
      logger_(config_.logLevel, config_.logFile, config_.errorLogFile),
      notifier_(config_.emailConfig, logger_),
      engine_(makeBackend(config_, logger_), config_.transfer, logger_) {
    logger_.logDebug(fmt::format("Relay started with the {} backend", engine_.backend().name()));
}

TransferResult MediaRelay::upload(ByteSource& source, const Destination& destination, ProgressSink progress,
                                  std::stop_token cancel, CollisionPolicy policy) {
    TransferRequest request{source, destination, std::move(progress), std::move(cancel), policy};
    TransferResult result = engine_.upload(request);
    notifier_.notify(result);
    return result;
}

std::expected<std::vector<RemoteEntry>, TransferError> MediaRelay::listDirectory(const std::string& directory) {
    if (auto connected = engine_.backend().connect(); !connected) {
        return std::unexpected(connected.error());
    }
    return engine_.backend().list(directory);
}

std::expected<bool, TransferError> MediaRelay::deleteFile(const std::string& path) {
    if (auto connected = engine_.backend().connect(); !connected) {
        return std::unexpected(connected.error());
    }
    return engine_.backend().remove(path);
}

bool MediaRelay::testConnection() {
    const bool reachable = engine_.backend().probe();
    if (reachable) {
        logger_.logMessage(fmt::format("{} backend is reachable", engine_.backend().name()));
    } else {
        logger_.logError(fmt::format("{} backend is not reachable", engine_.backend().name()));
    }
    return reachable;
}
