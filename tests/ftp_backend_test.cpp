#include <gtest/gtest.h>
#include <chrono>
#include <stdexcept>
#include <string>
#include "curl_support.hpp"
#include "ftp_backend.hpp"

namespace {

FtpSettings settingsFor(const std::string& root, FtpEncryption encryption = FtpEncryption::Explicit, int port = 21) {
    FtpSettings settings;
    settings.host = "ftp.example.com";
    settings.port = port;
    settings.root = root;
    settings.encryption = encryption;
    return settings;
}

} // namespace

TEST(EscapeUrlSegmentTest, EncodesReservedCharacters) {
    EXPECT_EQ(escapeUrlSegment("clip 01.mp4"), "clip%2001.mp4");
    EXPECT_EQ(escapeUrlSegment("a-b_c.d~e"), "a-b_c.d~e");
    EXPECT_EQ(escapeUrlSegment("a/b#c?d"), "a%2Fb%23c%3Fd");
    EXPECT_EQ(escapeUrlSegment("\xC3\xA4"), "%C3%A4");
    EXPECT_EQ(escapeUrlSegment(""), "");
}

TEST(FtpBackendTest, RequiresHost) {
    Logger logger(LogLevel::Error);
    EXPECT_THROW(FtpBackend(FtpSettings{}, logger), std::runtime_error);
}

TEST(FtpBackendTest, BuildsUrlsUnderRoot) {
    Logger logger(LogLevel::Error);
    FtpBackend backend(settingsFor("/incoming/"), logger);

    EXPECT_EQ(backend.urlFor("shows//ep 1.mp4"), "ftp://ftp.example.com:21/incoming/shows/ep%201.mp4");
    EXPECT_EQ(backend.urlFor("shows", true), "ftp://ftp.example.com:21/incoming/shows/");
}

TEST(FtpBackendTest, BuildsRootUrlWithoutBaseDirectory) {
    Logger logger(LogLevel::Error);
    FtpBackend plain(settingsFor(""), logger);
    FtpBackend implicit(settingsFor("", FtpEncryption::Implicit, 990), logger);

    EXPECT_EQ(plain.urlFor("", true), "ftp://ftp.example.com:21/");
    EXPECT_EQ(implicit.urlFor("clip.mp4"), "ftps://ftp.example.com:990/clip.mp4");
}

TEST(MlsdParserTest, ParsesFileFacts) {
    auto entry = parseMlsdLine("type=file;size=1024;modify=20240102030405; my clip.mp4\r");

    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->name, "my clip.mp4");
    EXPECT_FALSE(entry->isDirectory);
    EXPECT_EQ(entry->size, 1024u);
    EXPECT_EQ(entry->modified, std::chrono::system_clock::from_time_t(1704164645));
}

TEST(MlsdParserTest, DirectoryWithoutModifyFact) {
    auto entry = parseMlsdLine("Type=DIR;Size=4096; shows");

    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->name, "shows");
    EXPECT_TRUE(entry->isDirectory);
    EXPECT_EQ(entry->size, 0u);
    EXPECT_EQ(entry->modified, std::chrono::system_clock::time_point{});
}

TEST(MlsdParserTest, SkipsSelfParentAndMalformedLines) {
    EXPECT_FALSE(parseMlsdLine("type=cdir;modify=20240102030405; .").has_value());
    EXPECT_FALSE(parseMlsdLine("type=pdir; ..\r").has_value());
    EXPECT_FALSE(parseMlsdLine("type=file;size=5;").has_value());
    EXPECT_FALSE(parseMlsdLine("").has_value());
}

TEST(MlsdParserTest, ParsesTimestamps) {
    EXPECT_EQ(parseMlsdTime("20240102030405.123"), std::chrono::system_clock::from_time_t(1704164645));
    EXPECT_EQ(parseMlsdTime("2024"), std::chrono::system_clock::time_point{});
}
