#include <gtest/gtest.h>
#include "config/app_config.hpp"
#include "config/user_config.hpp"
#include "test_support.hpp"

class ConfigTest : public ::testing::Test {
protected:
    TempDir dir_{"config"};
};

// Test that a missing settings file keeps every default
TEST_F(ConfigTest, MissingAppConfigUsesDefaults) {
    AppConfig config;
    std::string error;
    ASSERT_TRUE(loadAppConfig(dir_.sub("absent.json"), config, error));
    EXPECT_EQ(config.logDir, "/var/log/acctvault");
    EXPECT_EQ(config.archiveToolPath, "/scripts/pkgacct");
    EXPECT_EQ(config.restoreToolPath, "/scripts/restorepkg");
    EXPECT_EQ(config.operationLogPath(), "/var/log/acctvault/operations.log");
    EXPECT_FALSE(config.debugMode);
}

TEST_F(ConfigTest, AppConfigOverridesSomeKeys) {
    std::string path = dir_.file("config.json",
        R"({"log_dir": "/srv/logs", "temp_dir": "/srv/tmp", "debug_mode": true, "sendmail": "/bin/true"})");
    AppConfig config;
    std::string error;
    ASSERT_TRUE(loadAppConfig(path, config, error)) << error;
    EXPECT_EQ(config.logDir, "/srv/logs");
    EXPECT_EQ(config.tempDir, "/srv/tmp");
    EXPECT_TRUE(config.debugMode);
    EXPECT_EQ(config.sendmailPath, "/bin/true");
    EXPECT_EQ(config.manifestDir, "/var/lib/acctvault/manifests");
    EXPECT_EQ(config.applicationLogPath(), "/srv/logs/acctvault.log");
}

TEST_F(ConfigTest, MalformedAppConfigIsAnError) {
    AppConfig config;
    std::string error;
    EXPECT_FALSE(loadAppConfig(dir_.file("bad.json", "{not json"), config, error));
    EXPECT_FALSE(error.empty());
    EXPECT_FALSE(loadAppConfig(dir_.file("array.json", "[1,2]"), config, error));
}

// Test user defaults when nothing is saved
TEST_F(ConfigTest, UserDefaults) {
    UserConfigStore store(dir_.path());
    UserConfig config = store.getUserConfig("alice");
    EXPECT_TRUE(config.notifyBackupSuccess);
    EXPECT_TRUE(config.notifyBackupFailure);
    EXPECT_FALSE(config.notifyBackupStart);
    EXPECT_FALSE(config.notifyRestoreStart);
    EXPECT_EQ(config.compressionOption, "compress");
    EXPECT_EQ(config.dbBackupMethod, "pkgacct");
    EXPECT_FALSE(config.usesHotDatabaseBackup());
    EXPECT_TRUE(config.skipFlags.empty());
}

TEST_F(ConfigTest, SavedValuesMergeOverDefaults) {
    dir_.file("users/reseller1.json", R"({
        "notify_email": "ops@example.com",
        "slack_webhook": "https://hooks.example.com/x",
        "notify_backup_start": true,
        "db_backup_method": "mariadb-backup",
        "skip_homedir": true,
        "skip_mysql": false,
        "skip_unknown": true
    })");
    UserConfigStore store(dir_.path());
    UserConfig config = store.getUserConfig("reseller1");
    EXPECT_EQ(config.notifyEmail, "ops@example.com");
    EXPECT_EQ(config.webhookUrl, "https://hooks.example.com/x");
    EXPECT_TRUE(config.notifyBackupStart);
    EXPECT_TRUE(config.notifyBackupSuccess);
    EXPECT_TRUE(config.usesHotDatabaseBackup());
    EXPECT_TRUE(config.isSkipped("homedir"));
    EXPECT_FALSE(config.isSkipped("mysql"));
    EXPECT_FALSE(config.isSkipped("unknown"));
    EXPECT_EQ(config.skipFlags.count("unknown"), 0u);
}

TEST_F(ConfigTest, SaveAndReload) {
    UserConfigStore store(dir_.path());
    UserConfig config;
    config.webhookUrl = "https://hooks.example.com/y";
    config.compressionOption = "nocompress";
    config.skipFlags["ssl"] = true;
    ASSERT_TRUE(store.saveUserConfig("bob", config)) << store.getLastError();

    std::string path = store.pathForUser("bob");
    EXPECT_EQ(path, dir_.path() + "/users/bob.json");
    struct stat st{};
    ASSERT_EQ(stat(path.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600u);

    UserConfig loaded = store.getUserConfig("bob");
    EXPECT_EQ(loaded.webhookUrl, "https://hooks.example.com/y");
    EXPECT_EQ(loaded.compressionOption, "nocompress");
    EXPECT_TRUE(loaded.isSkipped("ssl"));
}

// Test that user names cannot escape the users directory
TEST_F(ConfigTest, UserNamesAreSanitised) {
    UserConfigStore store(dir_.path());
    EXPECT_EQ(store.pathForUser("../../etc/passwd"), dir_.path() + "/users/etcpasswd.json");
    EXPECT_EQ(store.pathForUser("///"), dir_.path() + "/users/root.json");
}

TEST_F(ConfigTest, CorruptUserFileFallsBackToDefaults) {
    dir_.file("users/carol.json", "{oops");
    UserConfigStore store(dir_.path());
    UserConfig config = store.getUserConfig("carol");
    EXPECT_TRUE(config.notifyBackupFailure);
    EXPECT_EQ(config.tempDirectory, "/home/acctvault_tmp");
}
