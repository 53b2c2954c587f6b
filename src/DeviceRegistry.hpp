// DeviceRegistry.hpp
// Process-wide holder of the current discovery result.
#pragma once

#include "DeviceEndpoint.hpp"

#include <memory>
#include <optional>
#include <string>

// Readers take a snapshot with current() and keep using it; a publish never
// touches a snapshot already handed out. Only the pointer is swapped.
class DeviceRegistry {
public:
    // nullptr until the first cycle has been published.
    std::shared_ptr<const DiscoveryResult> current() const;

    // Deduplicates, stamps the timestamp if unset, then swaps atomically.
    std::shared_ptr<const DiscoveryResult> publish(DiscoveryResult result);

    void clear();

    std::optional<DeviceEndpoint> findByAddress(const std::string& address) const;

private:
    std::shared_ptr<const DiscoveryResult> m_current;
};
