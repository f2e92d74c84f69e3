#include <gtest/gtest.h>
#include <chrono>
#include "transfer_types.hpp"

TEST(TransferTypesTest, NormalizesDirectories) {
    EXPECT_EQ(normalizeDirectory(""), "");
    EXPECT_EQ(normalizeDirectory("/"), "");
    EXPECT_EQ(normalizeDirectory("/shows/ep1/"), "shows/ep1");
    EXPECT_EQ(normalizeDirectory("shows//ep1"), "shows/ep1");
    EXPECT_EQ(normalizeDirectory("///a///b///"), "a/b");
}

TEST(TransferTypesTest, JoinsPaths) {
    EXPECT_EQ(joinPath("", "clip.mp4"), "clip.mp4");
    EXPECT_EQ(joinPath("shows/ep1", "clip.mp4"), "shows/ep1/clip.mp4");
}

TEST(TransferTypesTest, DescribesErrors) {
    EXPECT_EQ(toString(ErrorKind::SizeMismatch), "SizeMismatch");
    EXPECT_EQ(describe(TransferError{ErrorKind::Cancelled, "Upload cancelled by user"}), "Cancelled: Upload cancelled by user");
}

TEST(TransferTypesTest, ThroughputCountsOnlyBytesOfThisAttempt) {
    TransferResult result;
    result.startTime = std::chrono::system_clock::time_point(std::chrono::seconds(100));
    result.endTime = result.startTime + std::chrono::seconds(2);
    result.resumeOffset = 1000;
    result.bytesTransferred = 3000;

    EXPECT_EQ(result.duration(), std::chrono::milliseconds(2000));
    EXPECT_DOUBLE_EQ(result.throughput(), 1000.0);

    result.skipped = true;
    EXPECT_DOUBLE_EQ(result.throughput(), 0.0);
}

TEST(TransferTypesTest, DurationIsZeroBeforeCompletion) {
    TransferResult result;
    result.startTime = std::chrono::system_clock::now();
    EXPECT_EQ(result.duration(), std::chrono::milliseconds(0));
    EXPECT_DOUBLE_EQ(result.throughput(), 0.0);
}
