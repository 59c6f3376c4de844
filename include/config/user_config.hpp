#pragma once

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Per-user preferences that drive notifications and archive options.
struct UserConfig {
    std::string notifyEmail;
    std::string webhookUrl;

    bool notifyBackupSuccess = true;
    bool notifyBackupFailure = true;
    bool notifyBackupStart = false;
    bool notifyRestoreSuccess = true;
    bool notifyRestoreFailure = true;
    bool notifyRestoreStart = false;

    std::string tempDirectory = "/home/acctvault_tmp";
    // "compress" or "nocompress"
    std::string compressionOption = "compress";
    std::string compressionLevel = "5";
    // all | schema | name | skip, passed to the archive tool
    std::string dbBackupType = "all";
    // pkgacct (embedded in the archive) | mariadb-backup | mysqlbackup
    std::string dbBackupMethod = "pkgacct";
    bool incremental = false;
    int defaultRetention = 30;

    // skip_homedir, skip_mysql, ... keyed without the "skip_" prefix
    std::map<std::string, bool> skipFlags;

    bool usesHotDatabaseBackup() const {
        return dbBackupMethod == "mariadb-backup" || dbBackupMethod == "mysqlbackup";
    }
    bool isSkipped(const std::string& name) const;

    static const std::vector<std::string>& knownSkipFlags();
};

void to_json(nlohmann::json& j, const UserConfig& config);
void from_json(const nlohmann::json& j, UserConfig& config);

// Stores one JSON file per user under {configDir}/users/.
class UserConfigStore {
public:
    explicit UserConfigStore(std::string configDir);

    // Saved values merged over defaults; defaults when nothing is saved
    UserConfig getUserConfig(const std::string& user) const;
    bool saveUserConfig(const std::string& user, const UserConfig& config);

    std::string pathForUser(const std::string& user) const;
    std::string getLastError() const { return lastError_; }

private:
    std::string configDir_;
    std::string lastError_;
};
