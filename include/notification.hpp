/**
 * @file notification.hpp
 * @brief Defines transfer notification strategies for MediaRelay.
 *
 * Provides the notification interface, an SMTP email implementation, and the notifier that
 * renders subject and body templates from a finished transfer.
 *
 * @note Requires libcurl built with SMTP support.
 */

#ifndef NOTIFICATION_HPP
#define NOTIFICATION_HPP

#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <json/json.h>
#include "logger.hpp"
#include "transfer_types.hpp"

/**
 * @brief Interface for notification strategies.
 */
class NotificationStrategy {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~NotificationStrategy() = default;

    /**
     * @brief Sends a notification.
     *
     * @param subject Subject line.
     * @param body Message body; newlines separate lines.
     * @return std::expected<void, std::string> Success or an error message.
     */
    virtual std::expected<void, std::string> notify(const std::string& subject, const std::string& body) = 0;
};

/**
 * @brief Email notification strategy.
 *
 * Sends HTML mail through an SMTP server with libcurl.
 */
class EmailNotificationStrategy : public NotificationStrategy {
public:
    /**
     * @brief Constructs an email notification strategy.
     *
     * @param config JSON object with smtp_url, from and to (comma separated), and optional
     *               username, password, from_name and use_tls.
     * @throws std::runtime_error If smtp_url, from or every recipient is missing.
     */
    explicit EmailNotificationStrategy(const Json::Value& config);

    /**
     * @brief Sends a notification via email to every recipient.
     */
    std::expected<void, std::string> notify(const std::string& subject, const std::string& body) override;

    /**
     * @brief Builds the RFC 5322 message handed to the SMTP server.
     */
    std::string buildMessage(const std::string& subject, const std::string& body) const;

    const std::vector<std::string>& recipients() const { return recipients_; }

private:
    std::string smtpUrl_;                 ///< smtp:// or smtps:// server URL.
    std::string username_;                ///< SMTP login, empty for none.
    std::string password_;                ///< SMTP password.
    std::string from_;                    ///< Sender address.
    std::string fromName_;                ///< Sender display name.
    std::vector<std::string> recipients_; ///< Recipient addresses.
    bool useTls_;                         ///< Require STARTTLS on smtp:// URLs.
};

/**
 * @brief Formats a byte count with 1024-based units ("1.5 MB").
 */
std::string formatBytes(std::uint64_t bytes);

/**
 * @brief Substitutes the transfer placeholders of a template.
 *
 * Supported placeholders: {FileName}, {Directory}, {Status}, {FileSize}, {Duration},
 * {Speed}, {StartTime}, {DateTime}.
 *
 * @param text Template text.
 * @param result Finished transfer.
 * @param status Replacement of {Status}.
 * @return std::string The rendered text.
 */
std::string renderTemplate(const std::string& text, const TransferResult& result, const std::string& status);

/**
 * @brief Sends a notification for every finished transfer when email is enabled.
 */
class TransferNotifier {
public:
    /**
     * @brief Constructs a notifier from the notifications.email section.
     *
     * @param emailConfig Email settings; null or enabled=false disables notifications.
     * @param logger Receives delivery failures.
     * @throws std::runtime_error If notifications are enabled but incompletely configured.
     */
    TransferNotifier(const Json::Value& emailConfig, const Logger& logger);

    /**
     * @brief Constructs a notifier delivering through a given strategy.
     */
    TransferNotifier(std::unique_ptr<NotificationStrategy> strategy, const Json::Value& emailConfig, const Logger& logger);

    bool enabled() const { return strategy_ != nullptr; }

    /**
     * @brief Renders the subject and body for a transfer.
     */
    std::pair<std::string, std::string> compose(const TransferResult& result) const;

    /**
     * @brief Delivers the notification; failures are logged and never thrown.
     */
    void notify(const TransferResult& result) const;

private:
    std::unique_ptr<NotificationStrategy> strategy_; ///< Null when disabled.
    std::string subjectTemplate_;                    ///< Subject template.
    std::string bodyTemplate_;                       ///< Body template.
    const Logger& logger_;                           ///< Notifier logger.
};

#endif // NOTIFICATION_HPP
