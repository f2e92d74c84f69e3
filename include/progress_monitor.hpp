/**
 * @file progress_monitor.hpp
 * @brief Progress telemetry for running transfers.
 *
 * Progress is reported in one of two modes:
 * - inline: the engine's own copy loop advances an InlineProgressMeter after every chunk,
 *   which emits a sample whenever the report interval has elapsed;
 * - polling: when a backend streams the source itself, a PollingProgressMonitor thread
 *   re-queries the destination size once per poll interval.
 *
 * Both feed a ProgressReporter, which serializes sink calls, drops samples that would move
 * backwards, and guarantees the final sample is the last one delivered.
 *
 * Throughput is averaged over the whole transfer (bytes moved since start divided by
 * elapsed seconds), not measured between samples.
 */

#ifndef PROGRESS_MONITOR_HPP
#define PROGRESS_MONITOR_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include "logger.hpp"
#include "transfer_types.hpp"

/**
 * @brief Builds a progress sample.
 *
 * @param transferred Bytes present at the destination.
 * @param total Source length, if known.
 * @param baseline Bytes already present when this attempt started (resume offset).
 * @param elapsed Time since this attempt started.
 * @return ProgressSample Percent capped at 100; ETA zero when the rate is not positive or
 *         the total has been reached.
 */
ProgressSample makeProgressSample(std::uint64_t transferred, std::optional<std::uint64_t> total,
                                  std::uint64_t baseline, std::chrono::steady_clock::duration elapsed);

/**
 * @brief Serializing, monotonic front end for a caller's ProgressSink.
 */
class ProgressReporter {
public:
    /**
     * @brief Constructs a reporter; the transfer clock starts now.
     *
     * @param sink Caller's sink; may be empty, in which case nothing is delivered.
     * @param total Source length, if known.
     * @param baseline Resume offset of this attempt.
     * @param logger Receives sink failures.
     */
    ProgressReporter(ProgressSink sink, std::optional<std::uint64_t> total, std::uint64_t baseline, const Logger& logger);

    /**
     * @brief Delivers a periodic sample.
     *
     * Ignored after finish() and when transferred is lower than the last delivered value.
     */
    void report(std::uint64_t transferred);

    /**
     * @brief Delivers the final sample and closes the reporter.
     *
     * @param transferred Verified bytes at the destination.
     * @param complete True for a successful transfer: the sample reads exactly 100% with
     *                 ETA zero regardless of what periodic samples said.
     */
    void finish(std::uint64_t transferred, bool complete);

    /**
     * @brief Number of samples delivered so far.
     */
    std::size_t delivered() const;

private:
    void deliver(const ProgressSample& sample);

    ProgressSink sink_;
    std::optional<std::uint64_t> total_;
    std::uint64_t baseline_;
    const Logger& logger_;
    std::chrono::steady_clock::time_point start_;
    mutable std::mutex mutex_;
    std::uint64_t lastBytes_ = 0;
    std::size_t delivered_ = 0;
    bool finished_ = false;
};

/**
 * @brief Inline-mode meter advanced by the engine's copy loop.
 *
 * The byte counter only ever grows and is safe to read from other threads.
 */
class InlineProgressMeter {
public:
    InlineProgressMeter(ProgressReporter& reporter, std::uint64_t initial, std::chrono::milliseconds interval);

    /**
     * @brief Accounts for a written chunk, emitting a sample if the interval elapsed.
     */
    void advance(std::size_t bytes);

    std::uint64_t transferred() const { return transferred_.load(std::memory_order_relaxed); }

private:
    ProgressReporter& reporter_;
    std::atomic<std::uint64_t> transferred_;
    std::chrono::milliseconds interval_;
    std::chrono::steady_clock::time_point lastReport_;
};

/**
 * @brief Polling-mode monitor running on its own thread.
 *
 * Wakes once per interval, samples the destination size and reports it. Exits when
 * stopped, when the sampled size reaches the expected total, or when the transfer's
 * cancellation signal fires. Sampling errors are logged and absorbed.
 *
 * A sampler can hang on a dead connection, so stop() waits a bounded time. When it times
 * out, the monitor is abandoned: the thread is detached, keeps only the shared state and its
 * own copy of the sampler, and exits after the pending sample without touching the
 * reporter or logger again. The sampler must therefore own everything it uses.
 */
class PollingProgressMonitor {
public:
    /**
     * @brief Callable returning the destination's current size (nullopt if not created yet).
     */
    using Sampler = std::function<std::expected<std::optional<std::uint64_t>, TransferError>()>;

    PollingProgressMonitor(ProgressReporter& reporter, Sampler sampler, std::optional<std::uint64_t> total,
                           std::chrono::milliseconds interval, std::stop_token cancel, const Logger& logger);

    /**
     * @brief Stops the thread without waiting for a sample in flight.
     */
    ~PollingProgressMonitor();

    PollingProgressMonitor(const PollingProgressMonitor&) = delete;
    PollingProgressMonitor& operator=(const PollingProgressMonitor&) = delete;

    /**
     * @brief Starts the polling thread.
     */
    void start();

    /**
     * @brief Requests the thread to stop and waits for it, at most timeout.
     *
     * @return bool True if the thread finished within the timeout; false if it was abandoned.
     */
    bool stop(std::chrono::milliseconds timeout);

private:
    /**
     * @brief State shared with the polling thread; reporter and logger are cleared on abandon.
     */
    struct State {
        std::mutex mutex;
        std::condition_variable_any wakeup;
        std::condition_variable done;
        std::stop_source stopSource;
        ProgressReporter* reporter = nullptr;
        const Logger* logger = nullptr;
        bool finished = false;
    };

    static void run(std::shared_ptr<State> state, Sampler sampler, std::optional<std::uint64_t> total,
                    std::chrono::milliseconds interval, std::stop_token cancel);

    std::shared_ptr<State> state_;
    Sampler sampler_;
    std::optional<std::uint64_t> total_;
    std::chrono::milliseconds interval_;
    std::stop_token cancel_;
    std::jthread thread_;
};

#endif // PROGRESS_MONITOR_HPP
