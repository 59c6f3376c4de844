#pragma once

#include "config/user_config.hpp"
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class NotificationEvent {
    BackupStart,
    BackupSuccess,
    BackupFailure,
    RestoreStart,
    RestoreSuccess,
    RestoreFailure
};

std::string notificationEventToString(NotificationEvent event);

struct Notification {
    NotificationEvent event{NotificationEvent::BackupStart};
    std::string subject;
    std::string body;
    // Event name, hostname, timestamp and the caller's context
    nlohmann::json payload;
};

// Entry point used by the orchestrators; preference gating happens there.
class Notifier {
public:
    virtual ~Notifier() = default;

    virtual void notify(NotificationEvent event, const nlohmann::json& context,
                        const UserConfig& userConfig) = 0;
};

class NotificationChannel {
public:
    virtual ~NotificationChannel() = default;

    // False when the channel is configured but delivery failed
    virtual bool deliver(const Notification& notification, const UserConfig& userConfig) = 0;
    virtual bool isConfigured(const UserConfig& userConfig) const = 0;
    virtual std::string name() const = 0;
};

// Builds the message once and hands it to every configured channel.
// Channel failures are logged and never reach the caller.
class NotificationDispatcher : public Notifier {
public:
    NotificationDispatcher() = default;

    void addChannel(std::shared_ptr<NotificationChannel> channel);
    void notify(NotificationEvent event, const nlohmann::json& context,
                const UserConfig& userConfig) override;

    Notification buildNotification(NotificationEvent event, const nlohmann::json& context) const;

private:
    std::vector<std::shared_ptr<NotificationChannel>> channels_;
};

class NullNotifier : public Notifier {
public:
    void notify(NotificationEvent, const nlohmann::json&, const UserConfig&) override {}
};
