// DeviceEndpoint.hpp
#pragma once

#include <chrono>
#include <string>
#include <vector>

// Every SoundTouch device serves its native control API on this port.
constexpr int kSoundTouchApiPort = 8090;

// One reachable device. Held by value everywhere so a rediscovery never
// mutates an endpoint another component is using.
struct DeviceEndpoint {
    std::string address;            // Hostname or IPv4 address
    int port{kSoundTouchApiPort};
    std::string identifier;         // deviceID (MAC) from /info; empty until first contact
    std::string displayName;
    std::string type;               // Product type from /info, e.g. "SoundTouch 10"

    std::string hostPort() const { return address + ":" + std::to_string(port); }
    std::string baseUrl() const { return "http://" + hostPort(); }

    // Dedup identity: deviceID when known, otherwise host:port.
    std::string key() const { return identifier.empty() ? hostPort() : identifier; }

    bool sameTarget(const DeviceEndpoint& other) const {
        return address == other.address && port == other.port;
    }
};

enum class DiscoverySource {
    Configured,
    Multicast,
    Scan
};

const char* discoverySourceName(DiscoverySource source);

// Output of one discovery cycle. Published as a whole, never patched.
struct DiscoveryResult {
    std::vector<DeviceEndpoint> endpoints;
    DiscoverySource source{DiscoverySource::Configured};
    std::chrono::system_clock::time_point timestamp{};
};

// Drops entries whose identity (key() or host:port) repeats an earlier entry.
// First occurrence wins; order is preserved.
std::vector<DeviceEndpoint> dedupeEndpoints(std::vector<DeviceEndpoint> endpoints);
