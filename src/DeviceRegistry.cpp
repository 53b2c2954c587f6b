#include "DeviceRegistry.hpp"

#include <atomic>

std::shared_ptr<const DiscoveryResult> DeviceRegistry::current() const {
    return std::atomic_load(&m_current);
}

std::shared_ptr<const DiscoveryResult> DeviceRegistry::publish(DiscoveryResult result) {
    result.endpoints = dedupeEndpoints(std::move(result.endpoints));
    if (result.timestamp == std::chrono::system_clock::time_point{}) {
        result.timestamp = std::chrono::system_clock::now();
    }
    auto snapshot = std::make_shared<const DiscoveryResult>(std::move(result));
    std::atomic_store(&m_current, snapshot);
    return snapshot;
}

void DeviceRegistry::clear() {
    std::atomic_store(&m_current, std::shared_ptr<const DiscoveryResult>());
}

std::optional<DeviceEndpoint> DeviceRegistry::findByAddress(const std::string& address) const {
    auto snapshot = current();
    if (!snapshot) return std::nullopt;
    for (const auto& ep : snapshot->endpoints) {
        if (ep.address == address) return ep;
    }
    return std::nullopt;
}
