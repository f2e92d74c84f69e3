#include "progress_monitor.hpp"
#include <algorithm>
#include <exception>
#include <fmt/format.h>

ProgressSample makeProgressSample(std::uint64_t transferred, std::optional<std::uint64_t> total,
                                  std::uint64_t baseline, std::chrono::steady_clock::duration elapsed) {
    ProgressSample sample;
    sample.bytesTransferred = transferred;
    sample.totalBytes = total;

    const double seconds = std::chrono::duration<double>(elapsed).count();
    const std::uint64_t moved = transferred > baseline ? transferred - baseline : 0;
    sample.bytesPerSecond = seconds > 0 ? static_cast<double>(moved) / seconds : 0.0;

    if (total && *total > 0) {
        const double percent = static_cast<double>(transferred) / static_cast<double>(*total) * 100.0;
        sample.percent = static_cast<int>(std::min(percent, 100.0));
        if (transferred < *total && sample.bytesPerSecond > 0) {
            sample.eta = std::chrono::duration<double>(static_cast<double>(*total - transferred) / sample.bytesPerSecond);
        }
    }
    return sample;
}

ProgressReporter::ProgressReporter(ProgressSink sink, std::optional<std::uint64_t> total, std::uint64_t baseline,
                                   const Logger& logger)
    : sink_(std::move(sink)),
      total_(total),
      baseline_(baseline),
      logger_(logger),
      start_(std::chrono::steady_clock::now()),
      lastBytes_(baseline) {}

void ProgressReporter::report(std::uint64_t transferred) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (finished_ || !sink_ || transferred < lastBytes_) {
        return;
    }
    lastBytes_ = transferred;
    deliver(makeProgressSample(transferred, total_, baseline_, std::chrono::steady_clock::now() - start_));
}

void ProgressReporter::finish(std::uint64_t transferred, bool complete) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (finished_) {
        return;
    }
    finished_ = true;
    if (!sink_) {
        return;
    }

    auto sample = makeProgressSample(transferred, total_, baseline_, std::chrono::steady_clock::now() - start_);
    if (complete) {
        sample.percent = 100;
        sample.totalBytes = total_.value_or(transferred);
    }
    sample.eta = std::chrono::duration<double>(0.0);
    lastBytes_ = std::max(lastBytes_, transferred);
    deliver(sample);
}

std::size_t ProgressReporter::delivered() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return delivered_;
}

void ProgressReporter::deliver(const ProgressSample& sample) {
    try {
        sink_(sample);
        ++delivered_;
    } catch (const std::exception& e) {
        logger_.logWarning(fmt::format("Progress sink raised an error: {}", e.what()));
    }
}

InlineProgressMeter::InlineProgressMeter(ProgressReporter& reporter, std::uint64_t initial, std::chrono::milliseconds interval)
    : reporter_(reporter),
      transferred_(initial),
      interval_(interval),
      lastReport_(std::chrono::steady_clock::now()) {}

void InlineProgressMeter::advance(std::size_t bytes) {
    const auto total = transferred_.fetch_add(bytes, std::memory_order_relaxed) + bytes;
    const auto now = std::chrono::steady_clock::now();
    if (now - lastReport_ >= interval_) {
        reporter_.report(total);
        lastReport_ = now;
    }
}

PollingProgressMonitor::PollingProgressMonitor(ProgressReporter& reporter, Sampler sampler, std::optional<std::uint64_t> total,
                                               std::chrono::milliseconds interval, std::stop_token cancel, const Logger& logger)
    : state_(std::make_shared<State>()),
      sampler_(std::move(sampler)),
      total_(total),
      interval_(interval),
      cancel_(std::move(cancel)) {
    state_->reporter = &reporter;
    state_->logger = &logger;
}

PollingProgressMonitor::~PollingProgressMonitor() {
    stop(std::chrono::milliseconds::zero());
}

void PollingProgressMonitor::start() {
    thread_ = std::jthread(&PollingProgressMonitor::run, state_, sampler_, total_, interval_, cancel_);
}

bool PollingProgressMonitor::stop(std::chrono::milliseconds timeout) {
    state_->stopSource.request_stop();
    if (!thread_.joinable()) {
        return true;
    }

    std::unique_lock<std::mutex> lock(state_->mutex);
    if (state_->done.wait_for(lock, timeout, [this] { return state_->finished; })) {
        lock.unlock();
        thread_.join();
        return true;
    }
    state_->reporter = nullptr;
    state_->logger = nullptr;
    lock.unlock();
    thread_.detach();
    return false;
}

void PollingProgressMonitor::run(std::shared_ptr<State> state, Sampler sampler, std::optional<std::uint64_t> total,
                                 std::chrono::milliseconds interval, std::stop_token cancel) {
    std::stop_callback onCancel(cancel, [state] { state->stopSource.request_stop(); });
    auto token = state->stopSource.get_token();

    std::unique_lock<std::mutex> lock(state->mutex);
    while (!token.stop_requested()) {
        if (state->wakeup.wait_for(lock, token, interval, [&token] { return token.stop_requested(); })) {
            break;
        }
        lock.unlock();

        std::expected<std::optional<std::uint64_t>, TransferError> current;
        try {
            current = sampler();
        } catch (const std::exception& e) {
            current = std::unexpected(TransferError{ErrorKind::IOError, e.what()});
        }

        lock.lock();
        if (!state->reporter) {
            return;
        }
        bool reachedTotal = false;
        if (!current) {
            state->logger->logDebug(fmt::format("Error monitoring upload progress: {}", describe(current.error())));
        } else if (current->has_value()) {
            state->reporter->report(**current);
            reachedTotal = total && **current >= *total;
        }
        if (reachedTotal) {
            break;
        }
    }
    state->finished = true;
    state->done.notify_all();
}
