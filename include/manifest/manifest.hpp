#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct ManifestEntry {
    std::string manifestId;
    std::string account;
    std::string file;
    std::string dbFile;
    int64_t size{0};
    std::string destinationId;
    int retention{0};
    std::string checksum;
    std::string createdAt;
};

void to_json(nlohmann::json& j, const ManifestEntry& entry);
void from_json(const nlohmann::json& j, ManifestEntry& entry);

// Append-only ledger of produced archives, one JSON line per archive in
// {manifestDir}/{manifestId}.jsonl. Schedules use their id; manual runs
// share MANUAL_ID.
class Manifest {
public:
    static constexpr const char* MANUAL_ID = "manual";

    explicit Manifest(std::string manifestDir);

    bool addEntry(const ManifestEntry& entry);

    bool hasManifest(const std::string& manifestId) const;
    std::vector<ManifestEntry> readEntries(const std::string& manifestId) const;

    // Entries for the account beyond the newest `retention`, oldest first.
    // A retention of 0 means unlimited and returns nothing.
    std::vector<ManifestEntry> getExpiredEntries(const std::string& manifestId,
                                                 const std::string& account,
                                                 int retention) const;

    // Rewrites the manifest without entries whose file is listed
    bool removeEntries(const std::string& manifestId, const std::vector<std::string>& files);

    std::string pathFor(const std::string& manifestId) const;
    std::string getLastError() const { return lastError_; }

private:
    std::string manifestDir_;
    std::string lastError_;
};
