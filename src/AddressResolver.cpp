#include "AddressResolver.hpp"

#include <iostream>

AddressResolver::AddressResolver(std::vector<std::string> configuredAddresses,
                                 std::unique_ptr<DiscoveryStrategy> multicast,
                                 std::unique_ptr<DiscoveryStrategy> scan,
                                 DeviceRegistry& registry,
                                 std::chrono::milliseconds multicastBudget,
                                 std::chrono::milliseconds scanBudget)
    : m_configured(std::move(configuredAddresses)),
      m_multicast(std::move(multicast)),
      m_scan(std::move(scan)),
      m_registry(registry),
      m_multicastBudget(multicastBudget),
      m_scanBudget(scanBudget) {
}

ResolveResult AddressResolver::resolve() {
    auto cached = m_registry.current();
    if (cached && !cached->endpoints.empty()) {
        ResolveResult r;
        r.result = cached;
        return r;
    }
    return refresh();
}

ResolveResult AddressResolver::refresh() {
    auto before = m_registry.current();
    std::unique_lock<std::mutex> lock(m_cycleMutex);

    // Another caller finished a cycle while we waited for the lock
    auto now = m_registry.current();
    if (now && now != before && !now->endpoints.empty()) {
        ResolveResult r;
        r.result = now;
        return r;
    }

    if (!m_configured.empty()) {
        std::vector<DeviceEndpoint> endpoints;
        for (const auto& address : m_configured) {
            DeviceEndpoint ep;
            ep.address = address;
            endpoints.emplace_back(std::move(ep));
        }
        std::cout << "[Discovery] Using " << endpoints.size() << " configured device address(es); discovery skipped" << std::endl;
        return publishCycle(std::move(endpoints), DiscoverySource::Configured);
    }

    if (m_multicast) {
        auto found = m_multicast->probe(m_multicastBudget);
        if (!found.empty()) {
            return publishCycle(std::move(found), DiscoverySource::Multicast);
        }
        std::cout << "[Discovery] SSDP found nothing; falling back to subnet scan" << std::endl;
    }

    if (m_scan) {
        auto found = m_scan->probe(m_scanBudget);
        if (!found.empty()) {
            return publishCycle(std::move(found), DiscoverySource::Scan);
        }
    }

    std::cerr << "[Discovery] ERROR: No SoundTouch device found on the network" << std::endl;
    ResolveResult r;
    r.error = ProxyError::noDeviceFound("No SoundTouch device found via SSDP or subnet scan");
    return r;
}

ResolveResult AddressResolver::publishCycle(std::vector<DeviceEndpoint> endpoints, DiscoverySource source) {
    DiscoveryResult result;
    result.endpoints = std::move(endpoints);
    result.source = source;
    ResolveResult r;
    r.result = m_registry.publish(std::move(result));
    std::cout << "[Discovery] Published " << r.result->endpoints.size() << " device(s) from "
              << discoverySourceName(source) << std::endl;
    for (const auto& ep : r.result->endpoints) {
        std::cout << "  " << ep.hostPort()
                  << (ep.displayName.empty() ? "" : " \"" + ep.displayName + "\"")
                  << (ep.identifier.empty() ? "" : " id=" + ep.identifier) << std::endl;
    }
    return r;
}

DeviceEndpoint AddressResolver::endpointFor(const std::string& address) const {
    if (auto known = m_registry.findByAddress(address)) {
        return *known;
    }
    DeviceEndpoint ep;
    ep.address = address;
    return ep;
}
