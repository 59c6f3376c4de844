#pragma once

#include <string>
#include <nlohmann/json.hpp>

// Process-wide settings, read once from /etc/acctvault/config.json.
// Every key is optional; missing keys keep the defaults below.
struct AppConfig {
    std::string logDir = "/var/log/acctvault";
    std::string tempDir = "/home/acctvault_tmp";
    std::string manifestDir = "/var/lib/acctvault/manifests";
    std::string cancelDir = "/var/lib/acctvault/cancel";
    std::string configDir = "/etc/acctvault";
    std::string destinationsFile = "/etc/acctvault/destinations.json";

    std::string archiveToolPath = "/scripts/pkgacct";
    std::string restoreToolPath = "/scripts/restorepkg";
    std::string transportBridgePath = "/usr/local/libexec/acctvault/transport-bridge";
    std::string databaseToolPath = "/usr/local/libexec/acctvault/db-hotcopy";
    std::string sendmailPath = "/usr/sbin/sendmail";

    bool debugMode = false;
    std::string logLevel = "info";

    static constexpr const char* DEFAULT_PATH = "/etc/acctvault/config.json";

    std::string operationLogPath() const { return logDir + "/operations.log"; }
    std::string applicationLogPath() const { return logDir + "/acctvault.log"; }
};

void to_json(nlohmann::json& j, const AppConfig& config);
void from_json(const nlohmann::json& j, AppConfig& config);

// A missing file yields the defaults; unreadable or malformed JSON is an error.
bool loadAppConfig(const std::string& path, AppConfig& config, std::string& error);
