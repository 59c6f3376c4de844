#include "destination/destination.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <fstream>

using json = nlohmann::json;

bool Destination::isLocal() const {
    return normalizedType() == "local";
}

std::string Destination::normalizedType() const {
    std::string t = utils::toLower(type);
    return t.empty() ? "local" : t;
}

std::string Destination::describe() const {
    if (isLocal()) {
        return "Destination: " + (name.empty() ? id : name);
    }
    return "Host: " + (host.empty() ? (name.empty() ? id : name) : host);
}

void to_json(json& j, const Destination& destination) {
    j = json{
        {"id", destination.id},
        {"name", destination.name},
        {"type", destination.type},
        {"enabled", destination.enabled},
        {"path", destination.path},
        {"host", destination.host},
        {"credentials", destination.credentials}
    };
}

void from_json(const json& j, Destination& destination) {
    destination.id = j.at("id").get<std::string>();
    destination.name = j.value("name", destination.id);
    destination.type = j.value("type", std::string("local"));
    destination.path = j.value("path", std::string());
    destination.host = j.value("host", std::string());

    // Older configs carry "disabled" instead of "enabled"
    if (j.contains("enabled")) {
        destination.enabled = j.at("enabled").get<bool>();
    } else {
        destination.enabled = !j.value("disabled", false);
    }

    destination.credentials.clear();
    auto creds = j.find("credentials");
    if (creds != j.end() && creds->is_object()) {
        for (auto it = creds->begin(); it != creds->end(); ++it) {
            if (it.value().is_string()) {
                destination.credentials[it.key()] = it.value().get<std::string>();
            } else {
                destination.credentials[it.key()] = it.value().dump();
            }
        }
    }
}

bool DestinationRegistry::loadFromFile(const std::string& path) {
    try {
        std::ifstream file(path);
        if (!file) {
            lastError_ = "Failed to open destinations file: " + path;
            Logger::error(lastError_);
            return false;
        }

        json j = json::parse(file);
        if (!j.is_array()) {
            lastError_ = "Destinations file must hold a JSON array: " + path;
            Logger::error(lastError_);
            return false;
        }

        std::vector<Destination> loaded;
        for (const auto& entry : j) {
            loaded.push_back(entry.get<Destination>());
        }

        std::lock_guard<std::mutex> lock(mutex_);
        destinations_ = std::move(loaded);
        Logger::debug("Loaded " + std::to_string(destinations_.size()) + " destinations from " + path);
        return true;
    } catch (const json::exception& e) {
        lastError_ = "Invalid destinations file " + path + ": " + e.what();
        Logger::error(lastError_);
        return false;
    }
}

void DestinationRegistry::addDestination(const Destination& destination) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& existing : destinations_) {
        if (existing.id == destination.id) {
            existing = destination;
            return;
        }
    }
    destinations_.push_back(destination);
}

std::optional<Destination> DestinationRegistry::findById(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& destination : destinations_) {
        if (destination.id == id) {
            return destination;
        }
    }
    return std::nullopt;
}

std::vector<Destination> DestinationRegistry::getDestinations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return destinations_;
}

std::vector<Destination> DestinationRegistry::getEnabledDestinations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Destination> enabled;
    for (const auto& destination : destinations_) {
        if (destination.enabled) {
            enabled.push_back(destination);
        }
    }
    return enabled;
}
