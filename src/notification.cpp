#include "notification.hpp"
#include "curl_support.hpp"
#include <algorithm>
#include <chrono>
#include <cstring>
#include <ctime>
#include <exception>
#include <iterator>
#include <stdexcept>
#include <string_view>
#include <fmt/format.h>

namespace {

constexpr const char* kDefaultSubject = "Transfer {Status}: {FileName}";
constexpr const char* kDefaultBody =
    "File: {FileName}\nDirectory: {Directory}\nStatus: {Status}\nSize: {FileSize}\n"
    "Duration: {Duration}\nSpeed: {Speed}\nStarted: {StartTime}\nReported: {DateTime}";

std::string formatTime(std::chrono::system_clock::time_point time, const char* pattern) {
    auto timeT = std::chrono::system_clock::to_time_t(time);
    std::tm localTime{};
    localtime_r(&timeT, &localTime);
    char timeBuf[64];
    std::strftime(timeBuf, sizeof(timeBuf), pattern, &localTime);
    return timeBuf;
}

void replaceAll(std::string& text, std::string_view placeholder, const std::string& value) {
    std::size_t pos = 0;
    while ((pos = text.find(placeholder, pos)) != std::string::npos) {
        text.replace(pos, placeholder.size(), value);
        pos += value.size();
    }
}

std::vector<std::string> splitRecipients(const std::string& list) {
    std::vector<std::string> recipients;
    std::size_t start = 0;
    while (start <= list.size()) {
        auto comma = list.find(',', start);
        if (comma == std::string::npos) {
            comma = list.size();
        }
        std::string entry = list.substr(start, comma - start);
        const auto first = entry.find_first_not_of(" \t");
        const auto last = entry.find_last_not_of(" \t");
        if (first != std::string::npos) {
            recipients.push_back(entry.substr(first, last - first + 1));
        }
        start = comma + 1;
    }
    return recipients;
}

std::unique_ptr<NotificationStrategy> makeEmailStrategy(const Json::Value& emailConfig) {
    if (!emailConfig.isObject() || !emailConfig.get("enabled", false).asBool()) {
        return nullptr;
    }
    return std::make_unique<EmailNotificationStrategy>(emailConfig);
}

} // namespace

std::string formatBytes(std::uint64_t bytes) {
    static constexpr const char* kUnits[] = {"B", "KB", "MB", "GB", "TB"};
    double len = static_cast<double>(bytes);
    std::size_t order = 0;
    while (len >= 1024 && order < std::size(kUnits) - 1) {
        ++order;
        len /= 1024;
    }
    std::string number = fmt::format("{:.2f}", len);
    number.erase(number.find_last_not_of('0') + 1);
    if (number.back() == '.') {
        number.pop_back();
    }
    return fmt::format("{} {}", number, kUnits[order]);
}

std::string renderTemplate(const std::string& text, const TransferResult& result, const std::string& status) {
    const double minutes = static_cast<double>(result.duration().count()) / 60000.0;
    std::string rendered = text;
    replaceAll(rendered, "{FileName}", result.fileName);
    replaceAll(rendered, "{Directory}", result.directory.empty() ? "/" : result.directory);
    replaceAll(rendered, "{Status}", status);
    replaceAll(rendered, "{FileSize}", formatBytes(result.bytesTransferred));
    replaceAll(rendered, "{Duration}", fmt::format("{:.1f} minutes", minutes));
    replaceAll(rendered, "{Speed}", fmt::format("{:.2f} MB/s", result.throughput() / (1024 * 1024)));
    replaceAll(rendered, "{StartTime}", formatTime(result.startTime, "%d.%m.%Y %H:%M:%S"));
    replaceAll(rendered, "{DateTime}", formatTime(std::chrono::system_clock::now(), "%d.%m.%Y %H:%M:%S"));
    return rendered;
}

EmailNotificationStrategy::EmailNotificationStrategy(const Json::Value& config)
    : smtpUrl_(config.get("smtp_url", "").asString()),
      username_(config.get("username", "").asString()),
      password_(config.get("password", "").asString()),
      from_(config.get("from", "").asString()),
      fromName_(config.get("from_name", "MediaRelay").asString()),
      recipients_(splitRecipients(config.get("to", "").asString())),
      useTls_(config.get("use_tls", true).asBool()) {
    if (smtpUrl_.empty()) {
        throw std::runtime_error("Email notifications require smtp_url");
    }
    if (from_.empty()) {
        throw std::runtime_error("Email notifications require a from address");
    }
    if (recipients_.empty()) {
        throw std::runtime_error("Email notifications require at least one recipient");
    }
    ensureCurlInitialized();
}

std::string EmailNotificationStrategy::buildMessage(const std::string& subject, const std::string& body) const {
    std::string html = body;
    replaceAll(html, "\n", "<br>");

    std::string to;
    for (const auto& recipient : recipients_) {
        if (!to.empty()) {
            to += ", ";
        }
        to += recipient;
    }
    return fmt::format("Date: {}\r\nTo: {}\r\nFrom: \"{}\" <{}>\r\nSubject: {}\r\nMIME-Version: 1.0\r\n"
                       "Content-Type: text/html; charset=UTF-8\r\n\r\n{}\r\n",
                       formatTime(std::chrono::system_clock::now(), "%a, %d %b %Y %H:%M:%S %z"), to, fromName_, from_,
                       subject, html);
}

std::expected<void, std::string> EmailNotificationStrategy::notify(const std::string& subject, const std::string& body) {
    CurlEasyPtr curl(curl_easy_init());
    if (!curl) {
        return std::unexpected("Failed to initialize CURL");
    }

    const std::string message = buildMessage(subject, body);
    std::string_view pending(message);
    const std::string mailFrom = fmt::format("<{}>", from_);
    CurlSlistPtr rcpt;
    for (const auto& recipient : recipients_) {
        appendToSlist(rcpt, fmt::format("<{}>", recipient));
    }

    curl_read_callback readMessage = [](char* buffer, size_t size, size_t nitems, void* userdata) -> size_t {
        auto* remaining = static_cast<std::string_view*>(userdata);
        const size_t count = std::min(size * nitems, remaining->size());
        std::memcpy(buffer, remaining->data(), count);
        remaining->remove_prefix(count);
        return count;
    };

    curl_easy_setopt(curl.get(), CURLOPT_URL, smtpUrl_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, 30L);
    curl_easy_setopt(curl.get(), CURLOPT_MAIL_FROM, mailFrom.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_MAIL_RCPT, rcpt.get());
    curl_easy_setopt(curl.get(), CURLOPT_READFUNCTION, readMessage);
    curl_easy_setopt(curl.get(), CURLOPT_READDATA, &pending);
    curl_easy_setopt(curl.get(), CURLOPT_UPLOAD, 1L);
    if (!username_.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_USERNAME, username_.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_PASSWORD, password_.c_str());
    }
    if (useTls_) {
        curl_easy_setopt(curl.get(), CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        return std::unexpected(fmt::format("Failed to send email notification: {}", curl_easy_strerror(res)));
    }
    return {};
}

TransferNotifier::TransferNotifier(const Json::Value& emailConfig, const Logger& logger)
    : TransferNotifier(makeEmailStrategy(emailConfig), emailConfig, logger) {}

TransferNotifier::TransferNotifier(std::unique_ptr<NotificationStrategy> strategy, const Json::Value& emailConfig,
                                   const Logger& logger)
    : strategy_(std::move(strategy)),
      subjectTemplate_(kDefaultSubject),
      bodyTemplate_(kDefaultBody),
      logger_(logger) {
    if (emailConfig.isObject()) {
        subjectTemplate_ = emailConfig.get("subject_template", kDefaultSubject).asString();
        bodyTemplate_ = emailConfig.get("body_template", kDefaultBody).asString();
    }
}

std::pair<std::string, std::string> TransferNotifier::compose(const TransferResult& result) const {
    std::string subject = renderTemplate(subjectTemplate_, result, result.success ? "Success" : "Failed");
    std::string body = renderTemplate(bodyTemplate_, result, result.success ? "Transfer SUCCEEDED" : "Transfer FAILED");
    if (!result.success && result.error) {
        body += fmt::format("\n\nError: {}", result.error->message);
    }
    return {subject, body};
}

void TransferNotifier::notify(const TransferResult& result) const {
    if (!strategy_) {
        return;
    }
    try {
        auto [subject, body] = compose(result);
        auto sent = strategy_->notify(subject, body);
        if (!sent) {
            logger_.logError(fmt::format("Failed to send transfer notification: {}", sent.error()));
            return;
        }
        logger_.logMessage(fmt::format("Transfer notification sent for {}", result.fileName));
    } catch (const std::exception& e) {
        logger_.logError(fmt::format("Failed to send transfer notification: {}", e.what()));
    }
}
