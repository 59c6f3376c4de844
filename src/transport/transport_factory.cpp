#include "transport/transport_factory.hpp"
#include "transport/bridge_transport.hpp"
#include "transport/local_transport.hpp"
#include "common/logger.hpp"

DefaultTransportFactory::DefaultTransportFactory(std::string bridgePath)
    : bridgePath_(std::move(bridgePath)) {}

std::shared_ptr<Transport> DefaultTransportFactory::createTransport(const Destination& destination) {
    if (destination.isLocal()) {
        if (!local_) {
            local_ = std::make_shared<LocalTransport>();
        }
        return local_;
    }

    if (!bridge_) {
        Logger::debug("Using transport bridge " + bridgePath_ + " for " + destination.normalizedType());
        bridge_ = std::make_shared<BridgeTransport>(bridgePath_);
    }
    return bridge_;
}
