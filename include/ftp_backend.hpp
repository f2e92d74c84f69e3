/**
 * @file ftp_backend.hpp
 * @brief FTP/FTPS storage backend built on libcurl.
 *
 * The backend keeps two easy handles for its whole lifetime. The control handle serves
 * metadata operations (size, directory creation, deletion, listing) and is health-checked
 * with NOOP on every connect(); it is recreated when the check fails. The data handle
 * carries uploads. Progress sampling uses a third handle of its own, so a slow size query
 * from a progress monitor never holds up the metadata calls of the upload itself. Each handle keeps its connection open between
 * calls, which makes sequential uploads reuse the same login.
 *
 * @note Requires libcurl built with FTP and TLS support. FTP has no exclusive create, so two
 * simultaneous uploads resolving to the same name can overwrite each other.
 */

#ifndef FTP_BACKEND_HPP
#define FTP_BACKEND_HPP

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include "backend_settings.hpp"
#include "curl_support.hpp"
#include "logger.hpp"
#include "transfer_backend.hpp"

/**
 * @brief Parses an MLSD modify fact (UTC, YYYYMMDDHHMMSS[.sss]).
 *
 * @return The time point, or the epoch when the value is too short.
 */
std::chrono::system_clock::time_point parseMlsdTime(std::string_view value);

/**
 * @brief Parses one MLSD listing line ("fact=value;fact=value; name").
 *
 * Fact names are case-insensitive and a trailing CR is ignored. Directories report size 0.
 *
 * @return The entry, or nullopt for malformed lines and the cdir/pdir entries.
 */
std::optional<RemoteEntry> parseMlsdLine(std::string_view line);

/**
 * @brief Remote backend speaking FTP or FTPS.
 */
class FtpBackend : public TransferBackend {
public:
    /**
     * @brief Constructs an FTP backend; no connection is made until connect().
     *
     * @param settings Server, credentials and tunables.
     * @param logger Logger for connection events.
     * @throws std::runtime_error If the host is empty or libcurl cannot be initialized.
     */
    FtpBackend(FtpSettings settings, const Logger& logger);
    ~FtpBackend() override;

    FtpBackend(const FtpBackend&) = delete;
    FtpBackend& operator=(const FtpBackend&) = delete;

    std::string name() const override { return "ftp"; }
    std::expected<void, TransferError> connect() override;
    std::expected<bool, TransferError> exists(const std::string& path) override;
    std::expected<std::optional<std::uint64_t>, TransferError> size(const std::string& path) override;
    std::expected<void, TransferError> ensureDirectory(const std::string& path) override;

    /**
     * @brief Size query on the monitor handle; fails fast while a previous query is still running.
     */
    std::expected<std::optional<std::uint64_t>, TransferError> sampleSize(const std::string& path) override;

    /**
     * @brief Opens an append sink; every write() is one APPE of the chunk.
     *
     * CreateOrTruncate stores an empty file first; ResumeAt requires the remote size to equal
     * the offset. CreateExclusive is Unsupported.
     */
    std::expected<std::unique_ptr<WriteSink>, TransferError> openForWrite(const std::string& path, WriteMode mode) override;

    /**
     * @brief Deletes a file with DELE.
     */
    std::expected<bool, TransferError> remove(const std::string& path) override;

    /**
     * @brief Lists a directory with MLSD; servers without MLSD support fail with IOError.
     */
    std::expected<std::vector<RemoteEntry>, TransferError> list(const std::string& path) override;

    bool probe() override;
    bool supportsResume() const override { return true; }
    bool supportsExclusiveCreate() const override { return false; }
    bool hasNativeUpload() const override { return settings_.streamingUpload; }

    /**
     * @brief Streams a source with STOR (or APPE when resuming).
     *
     * Transient wire errors are retried up to retryAttempts times: the remote size is
     * re-read, the source is seeked to it and the upload continues with APPE. A source that
     * cannot seek makes the first transient error terminal.
     */
    std::expected<std::uint64_t, TransferError> upload(ByteSource& source, const std::string& path, WriteMode mode,
                                                       std::stop_token stop) override;

    /**
     * @brief Builds the URL of a file (or, with directory set, a directory) under the root.
     */
    std::string urlFor(const std::string& path, bool directory = false) const;

private:
    class AppendSink;
    struct UploadContext;

    void applyCommonOptions(CURL* curl) const;
    CURL* prepareHandle(CurlEasyPtr& handle) const;
    CURLcode performOn(CurlEasyPtr& handle);
    std::expected<std::optional<std::uint64_t>, TransferError> querySize(CurlEasyPtr& handle, const std::string& path);
    std::expected<void, TransferError> createEmpty(const std::string& path);
    std::expected<void, TransferError> transferData(const std::string& path, UploadContext& context, bool append);

    FtpSettings settings_;       ///< Connection settings.
    const Logger& logger_;       ///< Backend logger.
    std::mutex controlMutex_;    ///< Guards control_.
    CurlEasyPtr control_;        ///< Metadata handle.
    std::mutex dataMutex_;       ///< Guards data_.
    CurlEasyPtr data_;           ///< Upload handle.
    std::mutex monitorMutex_;    ///< Guards monitor_.
    CurlEasyPtr monitor_;        ///< Progress sampling handle.
};

#endif // FTP_BACKEND_HPP
