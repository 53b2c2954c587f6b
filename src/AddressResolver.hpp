// AddressResolver.hpp
#pragma once

#include "DeviceEndpoint.hpp"
#include "DeviceRegistry.hpp"
#include "DiscoveryProbe.hpp"
#include "ProxyError.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct ResolveResult {
    std::shared_ptr<const DiscoveryResult> result;
    ProxyError error;

    bool ok() const { return error.ok() && result && !result->endpoints.empty(); }
};

// Turns "configured addresses, or nothing" into a set of device endpoints.
//
// Strategies run in strict order and stop at the first non-empty answer:
//   1. configured addresses (used as-is, nothing is probed)
//   2. SSDP multicast
//   3. subnet scan
// Configured addresses are an operator assertion: when one of them is down
// the failure shows up when it is contacted; discovery never replaces it.
class AddressResolver {
public:
    AddressResolver(std::vector<std::string> configuredAddresses,
                    std::unique_ptr<DiscoveryStrategy> multicast,
                    std::unique_ptr<DiscoveryStrategy> scan,
                    DeviceRegistry& registry,
                    std::chrono::milliseconds multicastBudget = std::chrono::milliseconds(3000),
                    std::chrono::milliseconds scanBudget = std::chrono::milliseconds(10000));

    // Cached result when the registry holds one, otherwise a new cycle.
    ResolveResult resolve();

    // Always runs a new cycle and publishes it.
    ResolveResult refresh();

    // Endpoint for an address the UI names: the registry entry when known,
    // otherwise a bare endpoint on the default port.
    DeviceEndpoint endpointFor(const std::string& address) const;

    bool hasConfiguredAddresses() const { return !m_configured.empty(); }
    const std::vector<std::string>& configuredAddresses() const { return m_configured; }
    DeviceRegistry& registry() const { return m_registry; }

private:
    ResolveResult publishCycle(std::vector<DeviceEndpoint> endpoints, DiscoverySource source);

    std::vector<std::string> m_configured;
    std::unique_ptr<DiscoveryStrategy> m_multicast;
    std::unique_ptr<DiscoveryStrategy> m_scan;
    DeviceRegistry& m_registry;
    std::chrono::milliseconds m_multicastBudget;
    std::chrono::milliseconds m_scanBudget;

    // One discovery cycle at a time; concurrent callers wait and reuse it.
    std::mutex m_cycleMutex;
};
