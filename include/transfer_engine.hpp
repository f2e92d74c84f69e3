/**
 * @file transfer_engine.hpp
 * @brief Upload orchestration: naming, resume decisions, copying, progress and verification.
 *
 * The engine owns exactly one backend, selected at construction, and reuses its connection
 * across sequential uploads. One engine instance serves one upload at a time; concurrent
 * uploads need independent engine instances.
 */

#ifndef TRANSFER_ENGINE_HPP
#define TRANSFER_ENGINE_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <stop_token>
#include <string>
#include "byte_source.hpp"
#include "logger.hpp"
#include "name_resolver.hpp"
#include "progress_monitor.hpp"
#include "transfer_backend.hpp"
#include "transfer_types.hpp"

/**
 * @brief Tunables of the copy loop and the progress monitors.
 */
struct EngineOptions {
    std::size_t chunkSize = 8 * 1024 * 1024;                ///< Bytes per read/write cycle.
    int retryAttempts = 5;                                  ///< Retries per chunk for transient write errors.
    std::chrono::milliseconds reportInterval{500};          ///< Minimum gap between inline samples.
    std::chrono::milliseconds pollInterval{1000};           ///< Polling monitor period.
    std::chrono::milliseconds monitorStopTimeout{1000};     ///< Longest wait for the monitor to stop.
};

/**
 * @brief One upload request. The source is borrowed for the duration of the call.
 */
struct TransferRequest {
    ByteSource& source;                               ///< Bytes to upload.
    Destination destination;                          ///< Target directory and desired name.
    ProgressSink progress;                            ///< Optional progress receiver.
    std::stop_token cancel;                           ///< Cooperative cancellation signal.
    CollisionPolicy policy = CollisionPolicy::Rename; ///< Handling of an existing file with the same name.
};

/**
 * @brief Streams sources into a backend and reports a structured outcome.
 */
class TransferEngine {
public:
    /**
     * @brief Maximum name re-resolutions after losing an exclusive create race.
     */
    static constexpr int kMaxCreateAttempts = 5;

    /**
     * @brief Constructs an engine.
     *
     * @param backend Backend the engine owns; its connection lives as long as the engine.
     * @param options Copy loop and monitoring tunables.
     * @param logger Logger for transfer events; must outlive the engine.
     * @throws std::invalid_argument If backend is null or chunkSize is zero.
     */
    TransferEngine(std::unique_ptr<TransferBackend> backend, EngineOptions options, const Logger& logger);

    /**
     * @brief Uploads a source.
     *
     * Never throws: every failure, including connection loss, cancellation, a size mismatch
     * detected after the write and exceptions of any type escaping a backend, is recorded in
     * the returned result. A partial
     * destination file is left in place so a later request can resume it.
     *
     * Steps: connect, resolve the final name, ensure the directory, decide between a fresh
     * write, a resume, or skipping an already complete file, copy with progress, stop the
     * monitor (bounded wait), verify the destination size, deliver the final sample.
     *
     * @param request The upload request.
     * @return TransferResult The outcome, owned by the caller.
     */
    TransferResult upload(const TransferRequest& request);

    TransferBackend& backend() { return *backend_; }
    const EngineOptions& options() const { return options_; }

private:
    /**
     * @brief Outcome of the resume/skip decision for one resolved path.
     */
    struct WritePlan {
        WriteMode mode;    ///< How to open the destination.
        bool skip = false; ///< Destination already holds the complete file.
    };

    std::expected<void, TransferError> run(const TransferRequest& request, TransferResult& result);
    std::expected<WritePlan, TransferError> planWrite(const std::string& path, ByteSource& source, CollisionPolicy policy);
    std::expected<void, TransferError> copyInline(ByteSource& source, const std::string& path, WriteMode mode,
                                                  InlineProgressMeter& meter, std::stop_token cancel);
    std::expected<void, TransferError> writeChunk(std::unique_ptr<WriteSink>& sink, const std::string& path,
                                                  std::span<const char> chunk, std::uint64_t chunkStart);
    std::expected<std::uint64_t, TransferError> uploadNative(ByteSource& source, const std::string& path, WriteMode mode,
                                                             ProgressReporter& reporter, std::stop_token cancel);

    std::shared_ptr<TransferBackend> backend_; ///< Shared with progress samplers that outlive a bounded monitor stop.
    EngineOptions options_;
    const Logger& logger_;
    NameResolver resolver_;
};

#endif // TRANSFER_ENGINE_HPP
