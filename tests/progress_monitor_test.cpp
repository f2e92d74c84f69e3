#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <vector>
#include "progress_monitor.hpp"

using namespace std::chrono_literals;

namespace {

struct Collected {
    std::mutex mutex;
    std::vector<ProgressSample> samples;

    ProgressSink sink() {
        return [this](const ProgressSample& sample) {
            std::lock_guard<std::mutex> lock(mutex);
            samples.push_back(sample);
        };
    }

    std::vector<ProgressSample> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return samples;
    }
};

} // namespace

TEST(ProgressSampleTest, ComputesPercentRateAndEta) {
    auto sample = makeProgressSample(250, 1000, 0, 1s);

    EXPECT_EQ(sample.percent, 25);
    EXPECT_EQ(sample.bytesTransferred, 250u);
    EXPECT_EQ(sample.totalBytes, 1000u);
    EXPECT_DOUBLE_EQ(sample.bytesPerSecond, 250.0);
    EXPECT_DOUBLE_EQ(sample.eta.count(), 3.0);
}

TEST(ProgressSampleTest, RateExcludesResumedPrefix) {
    auto sample = makeProgressSample(600, 1000, 400, 2s);

    EXPECT_EQ(sample.percent, 60);
    EXPECT_DOUBLE_EQ(sample.bytesPerSecond, 100.0);
    EXPECT_DOUBLE_EQ(sample.eta.count(), 4.0);
}

TEST(ProgressSampleTest, CapsPercentAndHandlesUnknownTotal) {
    EXPECT_EQ(makeProgressSample(1500, 1000, 0, 1s).percent, 100);

    auto unknown = makeProgressSample(500, std::nullopt, 0, 1s);
    EXPECT_EQ(unknown.percent, 0);
    EXPECT_FALSE(unknown.totalBytes.has_value());
    EXPECT_DOUBLE_EQ(unknown.eta.count(), 0.0);

    auto empty = makeProgressSample(0, 0, 0, 0s);
    EXPECT_EQ(empty.percent, 0);
    EXPECT_DOUBLE_EQ(empty.bytesPerSecond, 0.0);
}

TEST(ProgressReporterTest, DropsRegressingSamplesAndStopsAfterFinish) {
    Logger logger(LogLevel::Error);
    Collected collected;
    ProgressReporter reporter(collected.sink(), 100, 0, logger);

    reporter.report(10);
    reporter.report(5);
    reporter.report(40);
    reporter.finish(100, true);
    reporter.report(100);
    reporter.finish(100, true);

    auto samples = collected.snapshot();
    ASSERT_EQ(samples.size(), 3u);
    EXPECT_EQ(samples[0].bytesTransferred, 10u);
    EXPECT_EQ(samples[1].bytesTransferred, 40u);
    EXPECT_EQ(samples[2].percent, 100);
    EXPECT_EQ(reporter.delivered(), 3u);
}

TEST(ProgressReporterTest, IncompleteFinishReportsActualBytes) {
    Logger logger(LogLevel::Error);
    Collected collected;
    ProgressReporter reporter(collected.sink(), 100, 0, logger);

    reporter.finish(30, false);

    auto samples = collected.snapshot();
    ASSERT_EQ(samples.size(), 1u);
    EXPECT_EQ(samples[0].percent, 30);
    EXPECT_EQ(samples[0].bytesTransferred, 30u);
}

TEST(ProgressReporterTest, SinkErrorsDoNotPropagate) {
    Logger logger(LogLevel::Error);
    ProgressReporter reporter([](const ProgressSample&) { throw std::runtime_error("display gone"); }, 100, 0, logger);

    EXPECT_NO_THROW(reporter.report(10));
    EXPECT_NO_THROW(reporter.finish(100, true));
    EXPECT_EQ(reporter.delivered(), 0u);
}

TEST(ProgressReporterTest, WorksWithoutSink) {
    Logger logger(LogLevel::Error);
    ProgressReporter reporter({}, 100, 0, logger);

    reporter.report(50);
    reporter.finish(100, true);
    EXPECT_EQ(reporter.delivered(), 0u);
}

TEST(InlineProgressMeterTest, ThrottlesByInterval) {
    Logger logger(LogLevel::Error);
    Collected collected;
    ProgressReporter reporter(collected.sink(), 1000, 0, logger);
    InlineProgressMeter meter(reporter, 0, 1h);

    for (int i = 0; i < 10; ++i) {
        meter.advance(100);
    }

    EXPECT_EQ(meter.transferred(), 1000u);
    EXPECT_TRUE(collected.snapshot().empty());
}

TEST(InlineProgressMeterTest, ReportsEveryAdvanceWithZeroInterval) {
    Logger logger(LogLevel::Error);
    Collected collected;
    ProgressReporter reporter(collected.sink(), 1000, 200, logger);
    InlineProgressMeter meter(reporter, 200, 0ms);

    meter.advance(300);
    meter.advance(500);

    auto samples = collected.snapshot();
    ASSERT_EQ(samples.size(), 2u);
    EXPECT_EQ(samples[0].bytesTransferred, 500u);
    EXPECT_EQ(samples[1].bytesTransferred, 1000u);
    EXPECT_EQ(samples[1].percent, 100);
}

TEST(PollingProgressMonitorTest, SamplesUntilStopped) {
    Logger logger(LogLevel::Error);
    Collected collected;
    ProgressReporter reporter(collected.sink(), 1000, 0, logger);
    std::atomic<std::uint64_t> landed{0};
    PollingProgressMonitor monitor(
        reporter,
        [&landed]() -> std::expected<std::optional<std::uint64_t>, TransferError> { return landed += 10; },
        1000, 5ms, {}, logger);

    monitor.start();
    std::this_thread::sleep_for(60ms);
    EXPECT_TRUE(monitor.stop(1s));

    auto samples = collected.snapshot();
    ASSERT_FALSE(samples.empty());
    for (std::size_t i = 1; i < samples.size(); ++i) {
        EXPECT_GT(samples[i].bytesTransferred, samples[i - 1].bytesTransferred);
    }
}

TEST(PollingProgressMonitorTest, StopsItselfAtTotal) {
    Logger logger(LogLevel::Error);
    Collected collected;
    ProgressReporter reporter(collected.sink(), 100, 0, logger);
    PollingProgressMonitor monitor(
        reporter, []() -> std::expected<std::optional<std::uint64_t>, TransferError> { return std::optional<std::uint64_t>{100}; },
        100, 5ms, {}, logger);

    monitor.start();
    std::this_thread::sleep_for(50ms);
    EXPECT_TRUE(monitor.stop(1s));
    EXPECT_EQ(collected.snapshot().size(), 1u);
}

TEST(PollingProgressMonitorTest, SurvivesSamplerErrors) {
    Logger logger(LogLevel::Error);
    ProgressReporter reporter({}, 100, 0, logger);
    std::atomic<int> calls{0};
    PollingProgressMonitor monitor(
        reporter,
        [&calls]() -> std::expected<std::optional<std::uint64_t>, TransferError> {
            if (++calls % 2 == 0) {
                throw std::runtime_error("connection reset");
            }
            return std::unexpected(TransferError{ErrorKind::TransientIOError, "busy"});
        },
        100, 5ms, {}, logger);

    monitor.start();
    std::this_thread::sleep_for(40ms);
    EXPECT_TRUE(monitor.stop(1s));
    EXPECT_GE(calls.load(), 2);
}

TEST(PollingProgressMonitorTest, CancellationStopsPolling) {
    Logger logger(LogLevel::Error);
    std::stop_source cancel;
    ProgressReporter reporter({}, 100, 0, logger);
    std::atomic<int> calls{0};
    PollingProgressMonitor monitor(
        reporter,
        [&calls]() -> std::expected<std::optional<std::uint64_t>, TransferError> {
            ++calls;
            return std::optional<std::uint64_t>{1};
        },
        100, 5ms, cancel.get_token(), logger);

    monitor.start();
    cancel.request_stop();
    std::this_thread::sleep_for(30ms);
    const int afterCancel = calls.load();
    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(calls.load(), afterCancel);
    EXPECT_TRUE(monitor.stop(1s));
}

TEST(PollingProgressMonitorTest, StopWithoutStartReturnsImmediately) {
    Logger logger(LogLevel::Error);
    ProgressReporter reporter({}, 100, 0, logger);
    PollingProgressMonitor monitor(
        reporter, []() -> std::expected<std::optional<std::uint64_t>, TransferError> { return std::optional<std::uint64_t>{}; },
        100, 5ms, {}, logger);

    EXPECT_TRUE(monitor.stop(0ms));
}

TEST(PollingProgressMonitorTest, StopIsBoundedWhenSamplerHangs) {
    Logger logger(LogLevel::Error);
    Collected collected;
    ProgressReporter reporter(collected.sink(), 100, 0, logger);
    auto sampling = std::make_shared<std::atomic<bool>>(false);
    PollingProgressMonitor monitor(
        reporter,
        [sampling]() -> std::expected<std::optional<std::uint64_t>, TransferError> {
            sampling->store(true);
            std::this_thread::sleep_for(600ms);
            return std::optional<std::uint64_t>{50};
        },
        100, 5ms, {}, logger);

    monitor.start();
    while (!sampling->load()) {
        std::this_thread::sleep_for(1ms);
    }
    const auto begin = std::chrono::steady_clock::now();
    EXPECT_FALSE(monitor.stop(100ms));
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 400ms);

    // The abandoned sample completes without reaching the reporter.
    std::this_thread::sleep_for(700ms);
    EXPECT_TRUE(collected.snapshot().empty());
}
