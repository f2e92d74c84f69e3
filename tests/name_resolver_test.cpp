#include <gtest/gtest.h>
#include <string>
#include "fake_backend.hpp"
#include "name_resolver.hpp"

class NameResolverTest : public ::testing::Test {
protected:
    Logger logger_{LogLevel::Error};
    NameResolver resolver_{logger_};
    MemoryBackend backend_;
};

TEST_F(NameResolverTest, KeepsFreeName) {
    auto name = resolver_.resolve(backend_, "media", "clip.mp4");
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(*name, "clip.mp4");
}

TEST_F(NameResolverTest, AppendsFirstFreeCounter) {
    backend_.put("media/clip.mp4", "a");
    backend_.put("media/clip_1.mp4", "b");
    backend_.put("media/clip_3.mp4", "c");

    auto name = resolver_.resolve(backend_, "media", "clip.mp4");
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(*name, "clip_2.mp4");
}

TEST_F(NameResolverTest, SkipsPastNineCollisions) {
    backend_.put("media/clip.mp4", "a");
    for (int i = 1; i <= 9; ++i) {
        backend_.put("media/clip_" + std::to_string(i) + ".mp4", "a");
    }

    auto name = resolver_.resolve(backend_, "media", "clip.mp4");
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(*name, "clip_10.mp4");
}

TEST_F(NameResolverTest, OnlyLooksInTargetDirectory) {
    backend_.put("other/clip.mp4", "a");

    auto name = resolver_.resolve(backend_, "media", "clip.mp4");
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(*name, "clip.mp4");
}

TEST_F(NameResolverTest, HandlesNamesWithoutExtension) {
    backend_.put("README", "a");

    auto name = resolver_.resolve(backend_, "", "README");
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(*name, "README_1");
}

TEST_F(NameResolverTest, KeepsOnlyLastExtension) {
    backend_.put("media/archive.tar.gz", "a");

    auto name = resolver_.resolve(backend_, "media", "archive.tar.gz");
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(*name, "archive.tar_1.gz");
}

TEST_F(NameResolverTest, GivesUpAfterProbeLimit) {
    backend_.put("media/clip.mp4", "a");
    for (int i = 1; i <= NameResolver::kMaxProbes; ++i) {
        backend_.put("media/clip_" + std::to_string(i) + ".mp4", "a");
    }

    auto name = resolver_.resolve(backend_, "media", "clip.mp4");
    ASSERT_FALSE(name.has_value());
    EXPECT_EQ(name.error().kind, ErrorKind::NameSpaceExhausted);
}

TEST(NameResolverSplitTest, SplitsStemAndExtension) {
    EXPECT_EQ(NameResolver::splitName("clip.mp4"), std::make_pair(std::string("clip"), std::string(".mp4")));
    EXPECT_EQ(NameResolver::splitName("noext"), std::make_pair(std::string("noext"), std::string()));
    EXPECT_EQ(NameResolver::splitName(".hidden"), std::make_pair(std::string(".hidden"), std::string()));
}
