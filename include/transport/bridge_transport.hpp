#pragma once

#include "transport/transport.hpp"
#include "common/process_runner.hpp"
#include <nlohmann/json.hpp>

// Remote destinations reached through an external bridge executable:
//   bridge --action=ls|upload|download|delete|mkdir --transport=ID [--path= --local= --remote=]
// The bridge prints one JSON object on stdout and diagnostics on stderr.
class BridgeTransport : public Transport {
public:
    explicit BridgeTransport(std::string bridgePath, ProcessRunner runner = ProcessRunner());

    TransportResult upload(const std::string& localPath, const std::string& remoteKey,
                           const Destination& destination) override;
    TransportResult download(const std::string& remoteKey, const std::string& localPath,
                             const Destination& destination) override;
    TransportResult list(const std::string& path, const Destination& destination,
                         std::vector<TransportEntry>& entries) override;
    TransportResult remove(const std::string& path, const Destination& destination) override;
    bool exists(const std::string& path, const Destination& destination) override;
    TransportResult mkdir(const std::string& path, const Destination& destination) override;

    std::string name() const override { return "bridge"; }

private:
    // Runs one action; false when the process or its output is unusable
    bool invoke(const std::string& action, const Destination& destination,
                const std::vector<std::string>& arguments,
                nlohmann::json& response, std::string& error) const;
    TransportResult toResult(const nlohmann::json& response) const;

    std::string bridgePath_;
    ProcessRunner runner_;
};
