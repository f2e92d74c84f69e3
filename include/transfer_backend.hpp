/**
 * @file transfer_backend.hpp
 * @brief Storage backend interface for MediaRelay.
 *
 * A backend abstracts "where bytes land": a local directory, an FTP/FTPS server or an SFTP
 * server. The engine only talks to this interface, so any target that implements the
 * capability set (existence, size, directory creation, resumable write, delete, list,
 * connectivity probe) can be substituted. Paths are logical, slash-separated and relative
 * to the backend's root.
 */

#ifndef TRANSFER_BACKEND_HPP
#define TRANSFER_BACKEND_HPP

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <vector>
#include "byte_source.hpp"
#include "transfer_types.hpp"

/**
 * @brief Open destination file accepting sequential writes.
 *
 * Destroying a sink without close() releases it without flushing guarantees.
 */
class WriteSink {
public:
    virtual ~WriteSink() = default;

    /**
     * @brief Writes the whole buffer at the current position.
     *
     * @param data Bytes to append.
     * @return std::expected<void, TransferError> Success, TransientIOError for retryable
     *         failures, or another error kind.
     */
    virtual std::expected<void, TransferError> write(std::span<const char> data) = 0;

    /**
     * @brief Flushes and releases the destination.
     */
    virtual std::expected<void, TransferError> close() = 0;
};

/**
 * @brief Interface for storage backends.
 */
class TransferBackend {
public:
    /**
     * @brief Virtual destructor; releases any held connection.
     */
    virtual ~TransferBackend() = default;

    /**
     * @brief Short identifier used in log lines ("local", "ftp", "sftp").
     */
    virtual std::string name() const = 0;

    /**
     * @brief Acquires the connection, or validates it and reconnects if it went stale.
     *
     * @return std::expected<void, TransferError> Success or a ConnectionFailure.
     */
    virtual std::expected<void, TransferError> connect() = 0;

    /**
     * @brief Checks whether a file exists at path.
     */
    virtual std::expected<bool, TransferError> exists(const std::string& path) = 0;

    /**
     * @brief Queries the size of a file.
     *
     * Remote backends may be asked for the size of a file that another thread is
     * uploading to; implementations must tolerate that.
     *
     * @param path Logical file path.
     * @return std::expected<std::optional<std::uint64_t>, TransferError> The size,
     *         std::nullopt if the file does not exist, or an error.
     */
    virtual std::expected<std::optional<std::uint64_t>, TransferError> size(const std::string& path) = 0;

    /**
     * @brief Size query issued by a progress monitor while upload() runs.
     *
     * The call may outlive the upload it was sampling. Backends with a shared connection
     * override it so a stalled sample cannot block size() or other metadata calls.
     */
    virtual std::expected<std::optional<std::uint64_t>, TransferError> sampleSize(const std::string& path) { return size(path); }

    /**
     * @brief Creates a directory and any missing parents. Existing directories are fine.
     */
    virtual std::expected<void, TransferError> ensureDirectory(const std::string& path) = 0;

    /**
     * @brief Opens a file for writing.
     *
     * @param path Logical file path.
     * @param mode Create/truncate, exclusive create, or resume at an offset. The caller
     *             positions its own source at the same offset before resuming.
     * @return std::expected<std::unique_ptr<WriteSink>, TransferError> The open sink or an error
     *         (AlreadyExists for a lost exclusive create, Unsupported for unavailable modes).
     */
    virtual std::expected<std::unique_ptr<WriteSink>, TransferError> openForWrite(const std::string& path, WriteMode mode) = 0;

    /**
     * @brief Deletes a file.
     *
     * @return std::expected<bool, TransferError> True if a file was deleted, false if none existed.
     */
    virtual std::expected<bool, TransferError> remove(const std::string& path) = 0;

    /**
     * @brief Lists the entries of a directory.
     */
    virtual std::expected<std::vector<RemoteEntry>, TransferError> list(const std::string& path) = 0;

    /**
     * @brief Checks whether the backend is reachable right now.
     */
    virtual bool probe() = 0;

    /**
     * @brief Whether openForWrite() accepts WriteMode::ResumeAt.
     */
    virtual bool supportsResume() const = 0;

    /**
     * @brief Whether openForWrite() accepts WriteMode::CreateExclusive.
     */
    virtual bool supportsExclusiveCreate() const = 0;

    /**
     * @brief Whether the backend streams a whole source itself through upload().
     *
     * Engines drive native uploads with a polling progress monitor instead of their own
     * copy loop.
     */
    virtual bool hasNativeUpload() const { return false; }

    /**
     * @brief Streams the remainder of a source to path.
     *
     * May run concurrently with size() calls from a progress monitor.
     *
     * @param source Source positioned at mode.offset (or 0).
     * @param path Logical file path.
     * @param mode CreateOrTruncate or ResumeAt.
     * @param stop Cancellation signal, honoured between chunks.
     * @return std::expected<std::uint64_t, TransferError> Bytes sent by this call or an error.
     */
    virtual std::expected<std::uint64_t, TransferError> upload([[maybe_unused]] ByteSource& source,
                                                               [[maybe_unused]] const std::string& path,
                                                               [[maybe_unused]] WriteMode mode,
                                                               [[maybe_unused]] std::stop_token stop) {
        return std::unexpected(TransferError{ErrorKind::Unsupported, name() + " backend has no native upload"});
    }
};

#endif // TRANSFER_BACKEND_HPP
