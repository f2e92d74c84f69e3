/**
 * @file sftp_backend.hpp
 * @brief SFTP storage backend built on libssh.
 *
 * Owns one SSH session and one SFTP channel for its whole lifetime. connect() validates the
 * session with ssh_is_connected and recreates it when the peer dropped it. The destructor
 * closes both.
 *
 * @note Requires libssh. The backend is compiled only when the build finds it.
 */

#ifndef SFTP_BACKEND_HPP
#define SFTP_BACKEND_HPP

#include <cstdint>
#include <mutex>
#include <string>
#include <libssh/libssh.h>
#include <libssh/sftp.h>
#include "backend_settings.hpp"
#include "logger.hpp"
#include "transfer_backend.hpp"

/**
 * @brief Remote backend speaking SFTP.
 */
class SftpBackend : public TransferBackend {
public:
    /**
     * @brief Constructs an SFTP backend; no connection is made until connect().
     *
     * @param settings Server, credentials and root directory.
     * @param logger Logger for connection events.
     * @throws std::runtime_error If the host is empty.
     */
    SftpBackend(SftpSettings settings, const Logger& logger);
    ~SftpBackend() override;

    SftpBackend(const SftpBackend&) = delete;
    SftpBackend& operator=(const SftpBackend&) = delete;

    std::string name() const override { return "sftp"; }
    std::expected<void, TransferError> connect() override;
    std::expected<bool, TransferError> exists(const std::string& path) override;
    std::expected<std::optional<std::uint64_t>, TransferError> size(const std::string& path) override;
    std::expected<void, TransferError> ensureDirectory(const std::string& path) override;
    std::expected<std::unique_ptr<WriteSink>, TransferError> openForWrite(const std::string& path, WriteMode mode) override;
    std::expected<bool, TransferError> remove(const std::string& path) override;
    std::expected<std::vector<RemoteEntry>, TransferError> list(const std::string& path) override;
    bool probe() override;
    bool supportsResume() const override { return true; }
    bool supportsExclusiveCreate() const override { return true; }

private:
    class FileSink;

    std::expected<void, TransferError> ensureSession();
    void closeSession();
    std::string remotePath(const std::string& path) const;
    TransferError sftpError(const std::string& what, const std::string& path) const;

    SftpSettings settings_;           ///< Connection settings.
    const Logger& logger_;            ///< Backend logger.
    std::mutex mutex_;                ///< Serializes every libssh call on the session.
    ssh_session ssh_ = nullptr;       ///< SSH session, null while disconnected.
    sftp_session sftp_ = nullptr;     ///< SFTP channel on ssh_.
    std::uint64_t generation_ = 0;    ///< Incremented whenever the session is recreated.
};

#endif // SFTP_BACKEND_HPP
