/**
 * @file media_relay.hpp
 * @brief High-level API of the MediaRelay transfer service.
 *
 * Wires configuration, logging, the configured storage backend, the transfer engine and
 * notifications together, and offers the operations of the upload portal: upload, list,
 * delete and a connectivity probe.
 *
 * @note Ensure relay_config.json names a backend that this build supports; SFTP needs a
 * build with libssh.
 */

#ifndef MEDIA_RELAY_HPP
#define MEDIA_RELAY_HPP

#include <expected>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>
#include "byte_source.hpp"
#include "logger.hpp"
#include "notification.hpp"
#include "relay_config.hpp"
#include "transfer_backend.hpp"
#include "transfer_engine.hpp"
#include "transfer_types.hpp"

/**
 * @brief Creates the backend selected by the configuration.
 *
 * @param config Loaded configuration.
 * @param logger Logger handed to the backend; must outlive it.
 * @return std::unique_ptr<TransferBackend> The backend.
 * @throws std::runtime_error If the backend is not available in this build.
 */
std::unique_ptr<TransferBackend> makeBackend(const RelayConfig& config, const Logger& logger);

/**
 * @brief Main relay orchestration class.
 */
class MediaRelay {
public:
    /**
     * @brief Constructs a relay from a configuration file.
     *
     * @param configFile Path to the JSON configuration file.
     * @throws std::runtime_error If configuration is invalid or the backend is unavailable.
     */
    explicit MediaRelay(const std::string& configFile);

    /**
     * @brief Constructs a relay from a loaded configuration.
     */
    explicit MediaRelay(RelayConfig config);

    /**
     * @brief Uploads a source and sends the transfer notification.
     *
     * @param source Bytes to upload.
     * @param destination Target directory and desired file name.
     * @param progress Optional progress receiver.
     * @param cancel Cooperative cancellation signal.
     * @param policy Rename on collision, or resume an earlier attempt at the same name.
     * @return TransferResult The outcome; failures are recorded, never thrown.
     */
    TransferResult upload(ByteSource& source, const Destination& destination, ProgressSink progress = {},
                          std::stop_token cancel = {}, CollisionPolicy policy = CollisionPolicy::Rename);

    /**
     * @brief Lists a directory of the storage target.
     */
    std::expected<std::vector<RemoteEntry>, TransferError> listDirectory(const std::string& directory);

    /**
     * @brief Deletes a file of the storage target.
     *
     * @return std::expected<bool, TransferError> True if deleted, false if it did not exist.
     */
    std::expected<bool, TransferError> deleteFile(const std::string& path);

    /**
     * @brief Checks whether the storage target is reachable.
     */
    bool testConnection();

    const RelayConfig& config() const { return config_; }
    const Logger& logger() const { return logger_; }

private:
    RelayConfig config_;        ///< Relay configuration.
    Logger logger_;             ///< Relay logger.
    TransferNotifier notifier_; ///< Transfer notifications.
    TransferEngine engine_;     ///< Engine owning the backend.
};

#endif // MEDIA_RELAY_HPP
