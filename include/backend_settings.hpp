/**
 * @file backend_settings.hpp
 * @brief Connection settings for the storage backends.
 *
 * Plain value types filled by RelayConfig and handed to backend constructors, so the
 * backends themselves never see JSON.
 */

#ifndef BACKEND_SETTINGS_HPP
#define BACKEND_SETTINGS_HPP

#include <chrono>
#include <cstddef>
#include <string>

/**
 * @brief Settings of the local filesystem backend.
 */
struct LocalSettings {
    std::string root = "./relay_uploads/"; ///< Sandbox root directory.
};

/**
 * @brief TLS mode of an FTP connection.
 */
enum class FtpEncryption {
    None,     ///< Plain FTP.
    Explicit, ///< AUTH TLS on the standard port; control and data channels encrypted.
    Implicit  ///< FTPS, TLS from the first byte.
};

/**
 * @brief Settings of the FTP/FTPS backend.
 */
struct FtpSettings {
    std::string host;                                  ///< Server host name.
    int port = 21;                                     ///< Control port.
    std::string username;                              ///< Login name.
    std::string password;                              ///< Login password.
    std::string root;                                  ///< Base directory, relative to the login directory.
    FtpEncryption encryption = FtpEncryption::Explicit;
    bool passive = true;                               ///< Passive data connections.
    bool verifyTls = true;                             ///< Verify the server certificate and host name.
    bool streamingUpload = true;                       ///< Stream whole sources natively instead of chunked appends.
    std::size_t chunkSize = 8 * 1024 * 1024;           ///< Data phase buffer hint.
    std::chrono::milliseconds connectTimeout{60000};
    std::chrono::milliseconds dataTimeout{600000};     ///< Stall limit of the data phase.
    int retryAttempts = 5;                             ///< Retries of a streaming upload after transient errors.
};

/**
 * @brief Settings of the SFTP backend.
 */
struct SftpSettings {
    std::string host;                                  ///< Server host name.
    int port = 22;                                     ///< SSH port.
    std::string username;                              ///< Login name.
    std::string password;                              ///< Password; empty selects public key authentication.
    std::string root;                                  ///< Base directory, relative to the login directory.
    std::chrono::milliseconds connectTimeout{60000};
};

#endif // BACKEND_SETTINGS_HPP
