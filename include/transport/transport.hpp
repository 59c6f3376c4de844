#pragma once

#include "destination/destination.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct TransportResult {
    bool success{false};
    std::string message;
    // Fully resolved remote or local path touched by the operation
    std::string path;
    int64_t size{0};
};

struct TransportEntry {
    std::string name;
    std::string path;
    int64_t size{0};
    // "file" or "dir"
    std::string type{"file"};
    int64_t mtime{0};

    bool isDirectory() const { return type == "dir"; }
};

// Uniform file operations against one destination kind.
class Transport {
public:
    virtual ~Transport() = default;

    virtual TransportResult upload(const std::string& localPath, const std::string& remoteKey,
                                   const Destination& destination) = 0;
    virtual TransportResult download(const std::string& remoteKey, const std::string& localPath,
                                     const Destination& destination) = 0;
    virtual TransportResult list(const std::string& path, const Destination& destination,
                                 std::vector<TransportEntry>& entries) = 0;
    virtual TransportResult remove(const std::string& path, const Destination& destination) = 0;
    virtual bool exists(const std::string& path, const Destination& destination) = 0;
    // "Already exists" counts as success
    virtual TransportResult mkdir(const std::string& path, const Destination& destination) = 0;

    virtual std::string name() const = 0;

    // Prefixes the destination base path unless the path already carries it
    static std::string resolvePath(const std::string& path, const Destination& destination);
};

class TransportFactory {
public:
    virtual ~TransportFactory() = default;
    virtual std::shared_ptr<Transport> createTransport(const Destination& destination) = 0;
};
