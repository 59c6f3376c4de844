#include "transport/transport.hpp"
#include "common/utils.hpp"

std::string Transport::resolvePath(const std::string& path, const Destination& destination) {
    std::string base = destination.path;
    while (base.size() > 1 && base.back() == '/') {
        base.pop_back();
    }
    if (base.empty()) {
        return path;
    }
    if (path.empty()) {
        return base;
    }
    if (utils::startsWith(path, base) &&
        (path.size() == base.size() || path[base.size()] == '/' || base == "/")) {
        return path;
    }

    std::string relative = path;
    while (!relative.empty() && relative.front() == '/') {
        relative.erase(0, 1);
    }
    return base == "/" ? "/" + relative : base + "/" + relative;
}
