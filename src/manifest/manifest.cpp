#include "manifest/manifest.hpp"
#include "common/file_lock.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <set>
#include <unistd.h>

using json = nlohmann::json;

void to_json(json& j, const ManifestEntry& entry) {
    j = json{
        {"manifest_id", entry.manifestId},
        {"account", entry.account},
        {"file", entry.file},
        {"db_file", entry.dbFile.empty() ? json(nullptr) : json(entry.dbFile)},
        {"size", entry.size},
        {"destination", entry.destinationId},
        {"retention", entry.retention},
        {"checksum", entry.checksum},
        {"created_at", entry.createdAt}
    };
}

void from_json(const json& j, ManifestEntry& entry) {
    entry.manifestId = j.value("manifest_id", std::string());
    entry.account = j.value("account", std::string());
    entry.file = j.value("file", std::string());
    auto db = j.find("db_file");
    entry.dbFile = (db != j.end() && db->is_string()) ? db->get<std::string>() : std::string();
    entry.size = j.value("size", static_cast<int64_t>(0));
    entry.destinationId = j.value("destination", std::string());
    entry.retention = j.value("retention", 0);
    entry.checksum = j.value("checksum", std::string());
    entry.createdAt = j.value("created_at", std::string());
}

Manifest::Manifest(std::string manifestDir) : manifestDir_(std::move(manifestDir)) {}

std::string Manifest::pathFor(const std::string& manifestId) const {
    std::string safe = utils::sanitizeName(manifestId);
    if (safe.empty()) {
        safe = MANUAL_ID;
    }
    return manifestDir_ + "/" + safe + ".jsonl";
}

bool Manifest::addEntry(const ManifestEntry& entry) {
    try {
        std::filesystem::create_directories(manifestDir_);

        ManifestEntry stamped = entry;
        if (stamped.manifestId.empty()) {
            stamped.manifestId = MANUAL_ID;
        }
        if (stamped.createdAt.empty()) {
            stamped.createdAt = utils::currentTimestamp();
        }

        FileLock lock(pathFor(stamped.manifestId), 0600);
        if (!lock.isLocked()) {
            lastError_ = lock.getLastError();
            Logger::error("Manifest append failed: " + lastError_);
            return false;
        }
        json j = stamped;
        if (!lock.append(j.dump() + "\n")) {
            lastError_ = lock.getLastError();
            Logger::error("Manifest append failed: " + lastError_);
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        lastError_ = std::string("Manifest append failed: ") + e.what();
        Logger::error(lastError_);
        return false;
    }
}

bool Manifest::hasManifest(const std::string& manifestId) const {
    return std::filesystem::exists(pathFor(manifestId));
}

std::vector<ManifestEntry> Manifest::readEntries(const std::string& manifestId) const {
    std::vector<ManifestEntry> entries;
    std::ifstream in(pathFor(manifestId));
    std::string line;
    while (std::getline(in, line)) {
        if (utils::trim(line).empty()) {
            continue;
        }
        try {
            entries.push_back(json::parse(line).get<ManifestEntry>());
        } catch (const json::exception& e) {
            Logger::warning("Skipping corrupt manifest line in " + pathFor(manifestId) + ": " + e.what());
        }
    }
    return entries;
}

std::vector<ManifestEntry> Manifest::getExpiredEntries(const std::string& manifestId,
                                                       const std::string& account,
                                                       int retention) const {
    std::vector<ManifestEntry> expired;
    if (retention <= 0) {
        return expired;
    }

    std::vector<ManifestEntry> forAccount;
    for (const auto& entry : readEntries(manifestId)) {
        if (entry.account == account) {
            forAccount.push_back(entry);
        }
    }

    // Lines are appended in creation order, so the tail is the newest
    if (static_cast<int>(forAccount.size()) > retention) {
        expired.assign(forAccount.begin(), forAccount.end() - retention);
    }
    return expired;
}

bool Manifest::removeEntries(const std::string& manifestId, const std::vector<std::string>& files) {
    std::string path = pathFor(manifestId);
    std::set<std::string> toRemove(files.begin(), files.end());

    FileLock lock(path, 0600);
    if (!lock.isLocked()) {
        lastError_ = lock.getLastError();
        return false;
    }

    std::vector<std::string> kept;
    {
        std::ifstream in(path);
        std::string line;
        while (std::getline(in, line)) {
            if (utils::trim(line).empty()) {
                continue;
            }
            try {
                ManifestEntry entry = json::parse(line).get<ManifestEntry>();
                if (toRemove.count(entry.file)) {
                    continue;
                }
            } catch (const json::exception&) {
                // Unparseable lines are kept verbatim
            }
            kept.push_back(line);
        }
    }

    if (ftruncate(lock.fd(), 0) != 0) {
        lastError_ = "Failed to truncate manifest " + path;
        return false;
    }
    std::string content;
    for (const auto& line : kept) {
        content += line + "\n";
    }
    if (!lock.append(content)) {
        lastError_ = lock.getLastError();
        return false;
    }
    return true;
}
