#include <gtest/gtest.h>
#include "notify/channels.hpp"
#include "notify/notifier.hpp"
#include "test_support.hpp"
#include <stdexcept>

using json = nlohmann::json;

namespace {

class RecordingChannel : public NotificationChannel {
public:
    RecordingChannel(bool configured, bool result, bool throws = false)
        : configured_(configured), result_(result), throws_(throws) {}

    bool deliver(const Notification& notification, const UserConfig&) override {
        delivered.push_back(notification);
        if (throws_) {
            throw std::runtime_error("channel broke");
        }
        return result_;
    }
    bool isConfigured(const UserConfig&) const override { return configured_; }
    std::string name() const override { return "recording"; }

    std::vector<Notification> delivered;

private:
    bool configured_;
    bool result_;
    bool throws_;
};

} // namespace

TEST(NotifierTest, EventNames) {
    EXPECT_EQ(notificationEventToString(NotificationEvent::BackupStart), "backup_start");
    EXPECT_EQ(notificationEventToString(NotificationEvent::RestoreFailure), "restore_failure");
}

TEST(NotifierTest, BuildNotificationContent) {
    NotificationDispatcher dispatcher;
    json context = {
        {"accounts", {"alice", "bob"}},
        {"destination", "Local"},
        {"cancelled", true},
        {"errors", {"bob: Archive tool failed"}}
    };
    Notification n = dispatcher.buildNotification(NotificationEvent::BackupFailure, context);
    EXPECT_EQ(n.subject.rfind("[AcctVault] Backup FAILED on ", 0), 0u);
    EXPECT_NE(n.body.find("Accounts: alice, bob"), std::string::npos);
    EXPECT_NE(n.body.find("Destination: Local"), std::string::npos);
    EXPECT_NE(n.body.find("cancelled"), std::string::npos);
    EXPECT_NE(n.body.find("  - bob: Archive tool failed"), std::string::npos);
    EXPECT_EQ(n.payload["event"], "backup_failure");
    EXPECT_EQ(n.payload["context"]["destination"], "Local");
}

// Test that only configured channels are used and failures stay inside
TEST(NotifierTest, DispatchToConfiguredChannels) {
    auto configured = std::make_shared<RecordingChannel>(true, true);
    auto unconfigured = std::make_shared<RecordingChannel>(false, true);
    auto failing = std::make_shared<RecordingChannel>(true, false);
    auto throwing = std::make_shared<RecordingChannel>(true, true, true);

    NotificationDispatcher dispatcher;
    dispatcher.addChannel(throwing);
    dispatcher.addChannel(configured);
    dispatcher.addChannel(unconfigured);
    dispatcher.addChannel(failing);
    dispatcher.addChannel(nullptr);

    EXPECT_NO_THROW(dispatcher.notify(NotificationEvent::RestoreSuccess, {{"account", "alice"}}, UserConfig()));
    EXPECT_EQ(throwing->delivered.size(), 1u);
    ASSERT_EQ(configured->delivered.size(), 1u);
    EXPECT_TRUE(unconfigured->delivered.empty());
    EXPECT_EQ(failing->delivered.size(), 1u);
    EXPECT_EQ(configured->delivered[0].event, NotificationEvent::RestoreSuccess);
}

TEST(NotifierTest, EmailFormat) {
    Notification n;
    n.subject = "[AcctVault] Backup completed on host";
    n.body = "Backup completed on host\n";
    std::string message = EmailChannel::formatMessage(n, "ops@example.com");
    EXPECT_EQ(message.rfind("To: ops@example.com\nSubject: [AcctVault] Backup completed on host\n", 0), 0u);
    EXPECT_NE(message.find("\n\nBackup completed on host\n"), std::string::npos);
}

TEST(NotifierTest, EmailViaSendmail) {
    TempDir dir("notify");
    std::string captured = dir.sub("mail.txt");
    std::string sendmail = dir.script("sendmail", "cat > '" + captured + "'\necho \"$1\" >> '" + captured + "'\n");

    UserConfig user;
    user.notifyEmail = "ops@example.com";
    EmailChannel channel(sendmail);
    EXPECT_TRUE(channel.isConfigured(user));
    EXPECT_FALSE(channel.isConfigured(UserConfig()));

    NotificationDispatcher dispatcher;
    Notification n = dispatcher.buildNotification(NotificationEvent::BackupSuccess, {{"accounts", {"alice"}}});
    ASSERT_TRUE(channel.deliver(n, user));

    std::string mail = TempDir::read(captured);
    EXPECT_NE(mail.find("To: ops@example.com"), std::string::npos);
    EXPECT_NE(mail.find("Accounts: alice"), std::string::npos);
    EXPECT_NE(mail.find("-t\n"), std::string::npos);
}

TEST(NotifierTest, EmailFailures) {
    TempDir dir("notify");
    UserConfig user;
    user.notifyEmail = "ops@example.com";
    Notification n;

    EmailChannel missing(dir.sub("no-sendmail"));
    EXPECT_FALSE(missing.deliver(n, user));

    EmailChannel failing(dir.script("sendmail", "cat > /dev/null\nexit 75\n"));
    EXPECT_FALSE(failing.deliver(n, user));
}

TEST(NotifierTest, WebhookConfiguration) {
    WebhookChannel channel;
    UserConfig user;
    EXPECT_FALSE(channel.isConfigured(user));
    user.webhookUrl = "https://hooks.example.com/x";
    EXPECT_TRUE(channel.isConfigured(user));
    EXPECT_EQ(channel.name(), "webhook");
}

TEST(NotifierTest, NullNotifierIgnoresEverything) {
    NullNotifier notifier;
    EXPECT_NO_THROW(notifier.notify(NotificationEvent::BackupStart, json::object(), UserConfig()));
}
