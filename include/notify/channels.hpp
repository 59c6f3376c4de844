#pragma once

#include "notify/notifier.hpp"
#include "common/process_runner.hpp"

// JSON POST to the user's webhook URL (Slack-compatible "text" field included).
class WebhookChannel : public NotificationChannel {
public:
    explicit WebhookChannel(long timeoutSeconds = 10);

    bool deliver(const Notification& notification, const UserConfig& userConfig) override;
    bool isConfigured(const UserConfig& userConfig) const override { return !userConfig.webhookUrl.empty(); }
    std::string name() const override { return "webhook"; }

private:
    long timeoutSeconds_;
};

// Plain-text mail piped to `sendmail -t`.
class EmailChannel : public NotificationChannel {
public:
    explicit EmailChannel(std::string sendmailPath, ProcessRunner runner = ProcessRunner());

    bool deliver(const Notification& notification, const UserConfig& userConfig) override;
    bool isConfigured(const UserConfig& userConfig) const override { return !userConfig.notifyEmail.empty(); }
    std::string name() const override { return "email"; }

    static std::string formatMessage(const Notification& notification, const std::string& recipient);

private:
    std::string sendmailPath_;
    ProcessRunner runner_;
};
