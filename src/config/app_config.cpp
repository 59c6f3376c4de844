#include "config/app_config.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <fstream>

using json = nlohmann::json;

void to_json(json& j, const AppConfig& config) {
    j = json{
        {"log_dir", config.logDir},
        {"temp_dir", config.tempDir},
        {"manifest_dir", config.manifestDir},
        {"cancel_dir", config.cancelDir},
        {"config_dir", config.configDir},
        {"destinations_file", config.destinationsFile},
        {"archive_tool", config.archiveToolPath},
        {"restore_tool", config.restoreToolPath},
        {"transport_bridge", config.transportBridgePath},
        {"database_tool", config.databaseToolPath},
        {"sendmail", config.sendmailPath},
        {"debug_mode", config.debugMode},
        {"log_level", config.logLevel}
    };
}

void from_json(const json& j, AppConfig& config) {
    config.logDir = j.value("log_dir", config.logDir);
    config.tempDir = j.value("temp_dir", config.tempDir);
    config.manifestDir = j.value("manifest_dir", config.manifestDir);
    config.cancelDir = j.value("cancel_dir", config.cancelDir);
    config.configDir = j.value("config_dir", config.configDir);
    config.destinationsFile = j.value("destinations_file", config.destinationsFile);
    config.archiveToolPath = j.value("archive_tool", config.archiveToolPath);
    config.restoreToolPath = j.value("restore_tool", config.restoreToolPath);
    config.transportBridgePath = j.value("transport_bridge", config.transportBridgePath);
    config.databaseToolPath = j.value("database_tool", config.databaseToolPath);
    config.sendmailPath = j.value("sendmail", config.sendmailPath);
    config.debugMode = j.value("debug_mode", config.debugMode);
    config.logLevel = j.value("log_level", config.logLevel);
}

bool loadAppConfig(const std::string& path, AppConfig& config, std::string& error) {
    if (!std::filesystem::exists(path)) {
        Logger::debug("No configuration at " + path + ", using defaults");
        return true;
    }

    try {
        std::ifstream file(path);
        if (!file) {
            error = "Failed to open configuration file: " + path;
            return false;
        }
        json j = json::parse(file);
        if (!j.is_object()) {
            error = "Configuration root must be an object: " + path;
            return false;
        }
        from_json(j, config);
        return true;
    } catch (const json::exception& e) {
        error = "Invalid configuration in " + path + ": " + e.what();
        return false;
    }
}
