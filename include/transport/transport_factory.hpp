#pragma once

#include "transport/transport.hpp"
#include <string>

// "local" destinations get the filesystem transport, everything else
// goes through the bridge executable.
class DefaultTransportFactory : public TransportFactory {
public:
    explicit DefaultTransportFactory(std::string bridgePath);

    std::shared_ptr<Transport> createTransport(const Destination& destination) override;

private:
    std::string bridgePath_;
    std::shared_ptr<Transport> local_;
    std::shared_ptr<Transport> bridge_;
};
