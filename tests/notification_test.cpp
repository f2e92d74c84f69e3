#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <ctime>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <json/json.h>
#include "notification.hpp"

namespace {

struct Sent {
    std::vector<std::pair<std::string, std::string>> messages;
    bool fail = false;
    bool raise = false;
};

class RecordingStrategy : public NotificationStrategy {
public:
    explicit RecordingStrategy(Sent& sent) : sent_(sent) {}

    std::expected<void, std::string> notify(const std::string& subject, const std::string& body) override {
        if (sent_.raise) {
            throw std::runtime_error("smtp client crashed");
        }
        if (sent_.fail) {
            return std::unexpected("mailbox unavailable");
        }
        sent_.messages.emplace_back(subject, body);
        return {};
    }

private:
    Sent& sent_;
};

TransferResult finishedTransfer(bool success) {
    TransferResult result;
    result.fileName = "clip.mp4";
    result.directory = "shows/ep1";
    result.success = success;
    result.bytesTransferred = 3 * 1024 * 1024;
    result.startTime = std::chrono::system_clock::now() - std::chrono::seconds(90);
    result.endTime = result.startTime + std::chrono::seconds(90);
    if (!success) {
        result.error = TransferError{ErrorKind::SizeMismatch, "Size mismatch: expected 10, got 5"};
    }
    return result;
}

Json::Value emailSection() {
    Json::Value email(Json::objectValue);
    email["enabled"] = true;
    email["smtp_url"] = "smtp://smtp.example.com:587";
    email["from"] = "relay@example.com";
    email["to"] = "ops@example.com, archive@example.com ,";
    return email;
}

} // namespace

TEST(FormatBytesTest, UsesBinaryUnits) {
    EXPECT_EQ(formatBytes(0), "0 B");
    EXPECT_EQ(formatBytes(1023), "1023 B");
    EXPECT_EQ(formatBytes(1024), "1 KB");
    EXPECT_EQ(formatBytes(1536 * 1024), "1.5 MB");
    EXPECT_EQ(formatBytes(1288490189), "1.2 GB");
    EXPECT_EQ(formatBytes(5ull * 1024 * 1024 * 1024 * 1024 * 1024), "5120 TB");
}

TEST(RenderTemplateTest, SubstitutesPlaceholders) {
    auto result = finishedTransfer(true);

    EXPECT_EQ(renderTemplate("{FileName} in {Directory}: {Status}, {FileSize}", result, "Success"),
              "clip.mp4 in shows/ep1: Success, 3 MB");
    EXPECT_EQ(renderTemplate("{Duration}", result, "x"), "1.5 minutes");
    EXPECT_EQ(renderTemplate("{Speed}", result, "x"), "0.03 MB/s");
    EXPECT_EQ(renderTemplate("{FileName} {FileName}", result, "x"), "clip.mp4 clip.mp4");
    EXPECT_EQ(renderTemplate("{Unknown}", result, "x"), "{Unknown}");

    result.directory.clear();
    EXPECT_EQ(renderTemplate("{Directory}", result, "x"), "/");
}

TEST(RenderTemplateTest, FormatsStartTimeFromConcurrentThreads) {
    auto result = finishedTransfer(true);
    const auto timeT = std::chrono::system_clock::to_time_t(result.startTime);
    std::tm localTime{};
    localtime_r(&timeT, &localTime);
    char expected[32];
    std::strftime(expected, sizeof(expected), "%d.%m.%Y %H:%M:%S", &localTime);

    std::atomic<int> mismatches{0};
    {
        std::vector<std::jthread> workers;
        for (int i = 0; i < 4; ++i) {
            workers.emplace_back([&] {
                for (int n = 0; n < 200; ++n) {
                    if (renderTemplate("{StartTime}", result, "x") != expected) {
                        ++mismatches;
                    }
                }
            });
        }
    }
    EXPECT_EQ(mismatches.load(), 0);
}

TEST(TransferNotifierTest, DisabledWithoutEmailSection) {
    Logger logger(LogLevel::Error);
    TransferNotifier notifier(Json::Value(), logger);
    EXPECT_FALSE(notifier.enabled());
    notifier.notify(finishedTransfer(true));
}

TEST(TransferNotifierTest, DisabledWhenEmailIsSwitchedOff) {
    Logger logger(LogLevel::Error);
    Json::Value email = emailSection();
    email["enabled"] = false;
    TransferNotifier notifier(email, logger);
    EXPECT_FALSE(notifier.enabled());
}

TEST(TransferNotifierTest, EnabledEmailRequiresCompleteSettings) {
    Logger logger(LogLevel::Error);
    Json::Value email = emailSection();
    email.removeMember("smtp_url");
    EXPECT_THROW(TransferNotifier(email, logger), std::runtime_error);

    email = emailSection();
    email["to"] = " , ";
    EXPECT_THROW(TransferNotifier(email, logger), std::runtime_error);
}

TEST(TransferNotifierTest, ComposesSuccessMessage) {
    Logger logger(LogLevel::Error);
    Sent sent;
    TransferNotifier notifier(std::make_unique<RecordingStrategy>(sent), Json::Value(), logger);

    notifier.notify(finishedTransfer(true));

    ASSERT_EQ(sent.messages.size(), 1u);
    EXPECT_EQ(sent.messages[0].first, "Transfer Success: clip.mp4");
    EXPECT_NE(sent.messages[0].second.find("Status: Transfer SUCCEEDED"), std::string::npos);
    EXPECT_NE(sent.messages[0].second.find("Size: 3 MB"), std::string::npos);
    EXPECT_EQ(sent.messages[0].second.find("Error:"), std::string::npos);
}

TEST(TransferNotifierTest, ComposesFailureMessageWithError) {
    Logger logger(LogLevel::Error);
    Sent sent;
    TransferNotifier notifier(std::make_unique<RecordingStrategy>(sent), Json::Value(), logger);

    auto [subject, body] = notifier.compose(finishedTransfer(false));

    EXPECT_EQ(subject, "Transfer Failed: clip.mp4");
    EXPECT_NE(body.find("Status: Transfer FAILED"), std::string::npos);
    EXPECT_NE(body.find("\n\nError: Size mismatch: expected 10, got 5"), std::string::npos);
}

TEST(TransferNotifierTest, UsesConfiguredTemplates) {
    Logger logger(LogLevel::Error);
    Sent sent;
    Json::Value email(Json::objectValue);
    email["subject_template"] = "[relay] {FileName}";
    email["body_template"] = "{Status} {FileSize}";
    TransferNotifier notifier(std::make_unique<RecordingStrategy>(sent), email, logger);

    auto [subject, body] = notifier.compose(finishedTransfer(true));

    EXPECT_EQ(subject, "[relay] clip.mp4");
    EXPECT_EQ(body, "Transfer SUCCEEDED 3 MB");
}

TEST(TransferNotifierTest, DeliveryFailuresAreSwallowed) {
    Logger logger(LogLevel::Error);
    Sent sent;
    TransferNotifier notifier(std::make_unique<RecordingStrategy>(sent), Json::Value(), logger);

    sent.fail = true;
    EXPECT_NO_THROW(notifier.notify(finishedTransfer(true)));
    sent.fail = false;
    sent.raise = true;
    EXPECT_NO_THROW(notifier.notify(finishedTransfer(true)));
    EXPECT_TRUE(sent.messages.empty());
}

TEST(EmailNotificationStrategyTest, BuildsHtmlMessageForAllRecipients) {
    EmailNotificationStrategy email(emailSection());

    ASSERT_EQ(email.recipients().size(), 2u);
    EXPECT_EQ(email.recipients()[0], "ops@example.com");
    EXPECT_EQ(email.recipients()[1], "archive@example.com");

    const std::string message = email.buildMessage("Transfer Success: clip.mp4", "line one\nline two");
    EXPECT_NE(message.find("To: ops@example.com, archive@example.com\r\n"), std::string::npos);
    EXPECT_NE(message.find("From: \"MediaRelay\" <relay@example.com>\r\n"), std::string::npos);
    EXPECT_NE(message.find("Subject: Transfer Success: clip.mp4\r\n"), std::string::npos);
    EXPECT_NE(message.find("Content-Type: text/html; charset=UTF-8"), std::string::npos);
    EXPECT_NE(message.find("line one<br>line two"), std::string::npos);
}
