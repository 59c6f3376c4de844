#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct Destination {
    std::string id;
    std::string name;
    // local, sftp, ftp, s3, backblaze, webdav, rsync, ...
    std::string type = "local";
    bool enabled = true;
    std::string path;
    std::string host;
    std::map<std::string, std::string> credentials;

    bool isLocal() const;
    // Type lowercased; anything other than "local" is remote
    std::string normalizedType() const;
    // "Destination: {name}" for local, "Host: {host}" for remote
    std::string describe() const;
};

void to_json(nlohmann::json& j, const Destination& destination);
void from_json(const nlohmann::json& j, Destination& destination);

// Destinations configured on this server, loaded from a JSON array.
class DestinationRegistry {
public:
    DestinationRegistry() = default;

    bool loadFromFile(const std::string& path);
    void addDestination(const Destination& destination);

    std::optional<Destination> findById(const std::string& id) const;
    std::vector<Destination> getDestinations() const;
    std::vector<Destination> getEnabledDestinations() const;

    std::string getLastError() const { return lastError_; }

private:
    std::vector<Destination> destinations_;
    std::string lastError_;
    mutable std::mutex mutex_;
};
