/**
 * @file transfer_types.hpp
 * @brief Core value types shared by the MediaRelay transfer engine and its backends.
 *
 * Defines the error taxonomy, destination addressing, write modes, directory entries,
 * progress samples and the per-upload result record. Everything here is a plain value
 * type; ownership of a TransferResult passes to the caller once the engine returns it.
 */

#ifndef TRANSFER_TYPES_HPP
#define TRANSFER_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

/**
 * @brief Classification of every failure a transfer can end with.
 */
enum class ErrorKind {
    ConnectionFailure,  ///< Backend unreachable or authentication rejected.
    NameSpaceExhausted, ///< No collision-free name within the probe limit.
    SizeMismatch,       ///< Post-write verification found a different size.
    Cancelled,          ///< Cooperative cancellation; partial file retained.
    TransientIOError,   ///< Retryable read/write hiccup (terminal once retries are spent).
    IOError,            ///< Non-retryable local or remote I/O failure.
    AlreadyExists,      ///< An exclusive create found the name taken.
    InvalidArgument,    ///< Malformed destination or request.
    Unsupported         ///< The backend lacks the requested capability.
};

/**
 * @brief Returns the stable identifier of an error kind (e.g. "SizeMismatch").
 */
std::string_view toString(ErrorKind kind);

/**
 * @brief Error value carried by every fallible MediaRelay operation.
 */
struct TransferError {
    ErrorKind kind;      ///< Failure classification.
    std::string message; ///< Human-readable description.
};

/**
 * @brief Formats an error as "Kind: message".
 */
std::string describe(const TransferError& error);

/**
 * @brief How the engine treats a file that already carries the desired name.
 */
enum class CollisionPolicy {
    Rename, ///< Probe name_1, name_2, ... and write a fresh file.
    Resume  ///< Treat the existing file as an earlier attempt: resume, skip or rewrite it.
};

/**
 * @brief Logical target of an upload.
 */
struct Destination {
    std::string directory; ///< Slash-separated, backend-relative directory.
    std::string fileName;  ///< Desired file name (no separators).
};

/**
 * @brief Trims leading and trailing '/' from a logical directory path.
 *
 * Runs of separators inside the path are collapsed to one.
 */
std::string normalizeDirectory(std::string_view directory);

/**
 * @brief Joins a normalized directory and a file name with '/'.
 */
std::string joinPath(std::string_view directory, std::string_view name);

/**
 * @brief How a backend opens its destination for writing.
 */
struct WriteMode {
    enum class Kind {
        CreateOrTruncate, ///< Create, or truncate an existing file to zero.
        CreateExclusive,  ///< Create only if absent; fails with AlreadyExists otherwise.
        ResumeAt          ///< Keep the existing bytes and continue writing at offset.
    };

    Kind kind = Kind::CreateOrTruncate;
    std::uint64_t offset = 0; ///< Only meaningful for ResumeAt.

    static WriteMode createOrTruncate() { return {Kind::CreateOrTruncate, 0}; }
    static WriteMode createExclusive() { return {Kind::CreateExclusive, 0}; }
    static WriteMode resumeAt(std::uint64_t offset) { return {Kind::ResumeAt, offset}; }
};

/**
 * @brief One entry of a backend directory listing.
 */
struct RemoteEntry {
    std::string name;                               ///< Entry name without directory.
    bool isDirectory = false;                       ///< True for sub-directories.
    std::uint64_t size = 0;                         ///< Size in bytes (0 for directories).
    std::chrono::system_clock::time_point modified; ///< Last modification time, if known.
};

/**
 * @brief Point-in-time progress report for one transfer.
 */
struct ProgressSample {
    int percent = 0;                          ///< 0-100, capped.
    std::uint64_t bytesTransferred = 0;       ///< Bytes present at the destination so far.
    std::optional<std::uint64_t> totalBytes;  ///< Source length, when known.
    double bytesPerSecond = 0.0;              ///< Average rate since the transfer started.
    std::chrono::duration<double> eta{0.0};   ///< Estimated time remaining.
};

/**
 * @brief Caller-supplied receiver of progress samples.
 *
 * Never invoked concurrently with itself.
 */
using ProgressSink = std::function<void(const ProgressSample&)>;

/**
 * @brief Outcome of one upload attempt.
 */
struct TransferResult {
    std::string fileName;                            ///< Final name after collision resolution.
    std::string directory;                           ///< Normalized target directory.
    bool success = false;                            ///< True once the size was verified.
    bool skipped = false;                            ///< True when an identical upload was already complete.
    std::uint64_t bytesTransferred = 0;              ///< Bytes at the destination for this file.
    std::uint64_t resumeOffset = 0;                  ///< Offset the write resumed from (0 for fresh writes).
    std::chrono::system_clock::time_point startTime; ///< When the engine accepted the request.
    std::chrono::system_clock::time_point endTime;   ///< When the engine finished.
    std::optional<TransferError> error;              ///< Failure details when success is false.

    /**
     * @brief Wall-clock time between start and end.
     */
    std::chrono::milliseconds duration() const;

    /**
     * @brief Average bytes per second moved during this attempt.
     *
     * Only bytes written in this attempt count; a resumed prefix or a skipped upload
     * does not inflate the rate. Zero when the duration is zero.
     */
    double throughput() const;
};

#endif // TRANSFER_TYPES_HPP
