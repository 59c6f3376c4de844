#include "config/user_config.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <filesystem>
#include <fstream>
#include <sys/stat.h>

using json = nlohmann::json;

const std::vector<std::string>& UserConfig::knownSkipFlags() {
    static const std::vector<std::string> flags = {
        "homedir", "publichtml", "mysql", "pgsql", "logs", "mailconfig", "mailman",
        "dnszones", "ssl", "bwdata", "quota", "ftpusers", "domains", "acctdb",
        "apitokens", "authnlinks", "locale", "passwd", "shell", "resellerconfig",
        "userdata", "linkednodes", "integrationlinks"
    };
    return flags;
}

bool UserConfig::isSkipped(const std::string& name) const {
    auto it = skipFlags.find(name);
    return it != skipFlags.end() && it->second;
}

void to_json(json& j, const UserConfig& config) {
    j = json{
        {"notify_email", config.notifyEmail},
        {"webhook_url", config.webhookUrl},
        {"notify_backup_success", config.notifyBackupSuccess},
        {"notify_backup_failure", config.notifyBackupFailure},
        {"notify_backup_start", config.notifyBackupStart},
        {"notify_restore_success", config.notifyRestoreSuccess},
        {"notify_restore_failure", config.notifyRestoreFailure},
        {"notify_restore_start", config.notifyRestoreStart},
        {"temp_directory", config.tempDirectory},
        {"compression_option", config.compressionOption},
        {"compression_level", config.compressionLevel},
        {"dbbackup_type", config.dbBackupType},
        {"db_backup_method", config.dbBackupMethod},
        {"opt_incremental", config.incremental},
        {"default_retention", config.defaultRetention}
    };
    for (const auto& flag : config.skipFlags) {
        j["skip_" + flag.first] = flag.second;
    }
}

void from_json(const json& j, UserConfig& config) {
    config.notifyEmail = j.value("notify_email", config.notifyEmail);
    // slack_webhook is the older key for the same setting
    config.webhookUrl = j.value("webhook_url", j.value("slack_webhook", config.webhookUrl));
    config.notifyBackupSuccess = j.value("notify_backup_success", config.notifyBackupSuccess);
    config.notifyBackupFailure = j.value("notify_backup_failure", config.notifyBackupFailure);
    config.notifyBackupStart = j.value("notify_backup_start", config.notifyBackupStart);
    config.notifyRestoreSuccess = j.value("notify_restore_success", config.notifyRestoreSuccess);
    config.notifyRestoreFailure = j.value("notify_restore_failure", config.notifyRestoreFailure);
    config.notifyRestoreStart = j.value("notify_restore_start", config.notifyRestoreStart);
    config.tempDirectory = j.value("temp_directory", config.tempDirectory);
    config.compressionOption = j.value("compression_option", config.compressionOption);
    config.compressionLevel = j.value("compression_level", config.compressionLevel);
    config.dbBackupType = j.value("dbbackup_type", config.dbBackupType);
    config.dbBackupMethod = j.value("db_backup_method", config.dbBackupMethod);
    config.incremental = j.value("opt_incremental", config.incremental);
    config.defaultRetention = j.value("default_retention", config.defaultRetention);

    for (const auto& flag : UserConfig::knownSkipFlags()) {
        auto it = j.find("skip_" + flag);
        if (it != j.end() && it->is_boolean()) {
            config.skipFlags[flag] = it->get<bool>();
        }
    }
}

UserConfigStore::UserConfigStore(std::string configDir) : configDir_(std::move(configDir)) {}

std::string UserConfigStore::pathForUser(const std::string& user) const {
    std::string safe = utils::sanitizeName(user);
    if (safe.empty()) {
        safe = "root";
    }
    return configDir_ + "/users/" + safe + ".json";
}

UserConfig UserConfigStore::getUserConfig(const std::string& user) const {
    UserConfig config;
    std::string path = pathForUser(user);

    if (!std::filesystem::exists(path)) {
        return config;
    }

    try {
        std::ifstream file(path);
        json j = json::parse(file);
        if (j.is_object()) {
            from_json(j, config);
        } else {
            Logger::warning("Ignoring user configuration that is not an object: " + path);
        }
    } catch (const json::exception& e) {
        Logger::error("Failed to parse user configuration " + path + ": " + e.what());
    }
    return config;
}

bool UserConfigStore::saveUserConfig(const std::string& user, const UserConfig& config) {
    std::string path = pathForUser(user);
    try {
        std::filesystem::create_directories(std::filesystem::path(path).parent_path());

        json j = config;
        j["updated_at"] = utils::currentTimestamp();

        std::ofstream file(path, std::ios::trunc);
        if (!file) {
            lastError_ = "Failed to open " + path + " for writing";
            return false;
        }
        file << j.dump(4) << std::endl;
        file.close();
        chmod(path.c_str(), 0600);
        return true;
    } catch (const std::exception& e) {
        lastError_ = std::string("Failed to save configuration: ") + e.what();
        Logger::error(lastError_);
        return false;
    }
}
