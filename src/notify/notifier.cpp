#include "notify/notifier.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <sstream>
#include <unistd.h>

using json = nlohmann::json;

namespace {

std::string hostName() {
    char buffer[256] = {0};
    if (gethostname(buffer, sizeof(buffer) - 1) != 0) {
        return "localhost";
    }
    return buffer;
}

std::string listOf(const json& context, const char* key) {
    auto it = context.find(key);
    if (it == context.end()) {
        return "";
    }
    if (it->is_array()) {
        std::vector<std::string> parts;
        for (const auto& item : *it) {
            parts.push_back(item.is_string() ? item.get<std::string>() : item.dump());
        }
        return utils::join(parts, ", ");
    }
    return it->is_string() ? it->get<std::string>() : it->dump();
}

} // namespace

std::string notificationEventToString(NotificationEvent event) {
    switch (event) {
        case NotificationEvent::BackupStart:    return "backup_start";
        case NotificationEvent::BackupSuccess:  return "backup_success";
        case NotificationEvent::BackupFailure:  return "backup_failure";
        case NotificationEvent::RestoreStart:   return "restore_start";
        case NotificationEvent::RestoreSuccess: return "restore_success";
        case NotificationEvent::RestoreFailure: return "restore_failure";
        default:                                return "unknown";
    }
}

void NotificationDispatcher::addChannel(std::shared_ptr<NotificationChannel> channel) {
    if (channel) {
        channels_.push_back(std::move(channel));
    }
}

Notification NotificationDispatcher::buildNotification(NotificationEvent event, const json& context) const {
    Notification notification;
    notification.event = event;

    std::string host = hostName();
    std::string what;
    switch (event) {
        case NotificationEvent::BackupStart:    what = "Backup started"; break;
        case NotificationEvent::BackupSuccess:  what = "Backup completed"; break;
        case NotificationEvent::BackupFailure:  what = "Backup FAILED"; break;
        case NotificationEvent::RestoreStart:   what = "Restore started"; break;
        case NotificationEvent::RestoreSuccess: what = "Restore completed"; break;
        case NotificationEvent::RestoreFailure: what = "Restore FAILED"; break;
    }
    notification.subject = "[AcctVault] " + what + " on " + host;

    std::ostringstream body;
    body << what << " on " << host << "\n\n";
    if (context.contains("accounts")) {
        body << "Accounts: " << listOf(context, "accounts") << "\n";
    }
    if (context.contains("account")) {
        body << "Account: " << listOf(context, "account") << "\n";
    }
    if (context.contains("destination")) {
        body << "Destination: " << listOf(context, "destination") << "\n";
    }
    if (context.contains("user")) {
        body << "User: " << listOf(context, "user") << "\n";
    }
    if (context.contains("requestor")) {
        body << "Requested from: " << listOf(context, "requestor") << "\n";
    }
    if (context.is_object() && context.value("cancelled", false)) {
        body << "Status: cancelled before all accounts were processed\n";
    }
    if (context.contains("message")) {
        body << "\n" << listOf(context, "message") << "\n";
    }
    auto errors = context.find("errors");
    if (errors != context.end() && errors->is_array() && !errors->empty()) {
        body << "\nErrors:\n";
        for (const auto& error : *errors) {
            body << "  - " << (error.is_string() ? error.get<std::string>() : error.dump()) << "\n";
        }
    }
    body << "\nTime: " << utils::currentTimestamp() << "\n";
    notification.body = body.str();

    notification.payload = {
        {"event", notificationEventToString(event)},
        {"hostname", host},
        {"timestamp", utils::currentTimestamp()},
        {"subject", notification.subject},
        {"context", context}
    };
    return notification;
}

void NotificationDispatcher::notify(NotificationEvent event, const json& context,
                                    const UserConfig& userConfig) {
    Notification notification;
    try {
        notification = buildNotification(event, context);
    } catch (const json::exception& e) {
        Logger::error("Failed to build " + notificationEventToString(event) + " notification: " + e.what());
        return;
    }

    for (const auto& channel : channels_) {
        if (!channel->isConfigured(userConfig)) {
            continue;
        }
        try {
            if (channel->deliver(notification, userConfig)) {
                Logger::debug("Sent " + notificationEventToString(event) + " via " + channel->name());
            } else {
                Logger::warning("Failed to send " + notificationEventToString(event) + " via " + channel->name());
            }
        } catch (const std::exception& e) {
            Logger::error("Notification channel " + channel->name() + " threw: " + e.what());
        }
    }
}
