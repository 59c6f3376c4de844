#pragma once

#include "transport/transport.hpp"

// Destination paths on this host's filesystem.
class LocalTransport : public Transport {
public:
    TransportResult upload(const std::string& localPath, const std::string& remoteKey,
                           const Destination& destination) override;
    TransportResult download(const std::string& remoteKey, const std::string& localPath,
                             const Destination& destination) override;
    TransportResult list(const std::string& path, const Destination& destination,
                         std::vector<TransportEntry>& entries) override;
    TransportResult remove(const std::string& path, const Destination& destination) override;
    bool exists(const std::string& path, const Destination& destination) override;
    TransportResult mkdir(const std::string& path, const Destination& destination) override;

    std::string name() const override { return "local"; }
};
