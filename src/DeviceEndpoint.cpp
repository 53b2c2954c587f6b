#include "DeviceEndpoint.hpp"

#include <unordered_set>

const char* discoverySourceName(DiscoverySource source) {
    switch (source) {
        case DiscoverySource::Configured: return "configured";
        case DiscoverySource::Multicast:  return "multicast";
        case DiscoverySource::Scan:       return "scan";
    }
    return "unknown";
}

std::vector<DeviceEndpoint> dedupeEndpoints(std::vector<DeviceEndpoint> endpoints) {
    std::vector<DeviceEndpoint> out;
    std::unordered_set<std::string> seenKeys;
    std::unordered_set<std::string> seenTargets;
    for (auto& ep : endpoints) {
        if (ep.address.empty()) continue;
        if (seenKeys.count(ep.key()) || seenTargets.count(ep.hostPort())) continue;
        seenKeys.insert(ep.key());
        seenTargets.insert(ep.hostPort());
        out.emplace_back(std::move(ep));
    }
    return out;
}
