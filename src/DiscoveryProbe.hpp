// DiscoveryProbe.hpp
// The two network discovery strategies: SSDP multicast and subnet scan.
#pragma once

#include "DeviceEndpoint.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class DeviceHttpClient;

constexpr const char* kSsdpAddress = "239.255.255.250";
constexpr int kSsdpPort = 1900;
constexpr const char* kSsdpSearchTarget = "urn:schemas-upnp-org:device:MediaRenderer:1";

// Looks a host up via GET /info and builds a full endpoint from it.
// nullopt means "not a SoundTouch device" (no answer, or no <name>).
using DeviceInfoFetcher = std::function<std::optional<DeviceEndpoint>(const std::string& address)>;

DeviceInfoFetcher makeInfoFetcher(std::shared_ptr<DeviceHttpClient> client, long timeoutMs = 2000);

// One discovery round. Never fails for "nothing found": an empty vector is
// a valid answer.
class DiscoveryStrategy {
public:
    virtual ~DiscoveryStrategy() = default;
    virtual std::vector<DeviceEndpoint> probe(std::chrono::milliseconds budget) = 0;
    virtual const char* name() const = 0;
};

// Interesting headers of an SSDP M-SEARCH reply.
struct SsdpReply {
    std::string location;
    std::string server;
    std::string searchTarget;
    std::string usn;
};

std::string buildSsdpSearch(const std::string& searchTarget = kSsdpSearchTarget);

// Accepts only "HTTP/1.1 200" replies that identify a Bose/SoundTouch device.
std::optional<SsdpReply> parseSsdpReply(const std::string& datagram);

// TCP reachability probe; refused or timed out gives false.
bool probeTcpPort(const std::string& host, int port, int timeoutMs);

// IPv4 address of the interface holding the default route.
std::optional<std::string> localIPv4Address();

// Usable host addresses of an IPv4 CIDR range ("192.168.1.0/24" -> .1 .. .254).
// Prefixes outside /16../30 and malformed input give an empty list.
std::vector<std::string> hostsInRange(const std::string& cidr);

// "a.b.c.0/24" around the local address; falls back to 192.168.1.0/24.
std::string defaultScanRange();

class MulticastProbe : public DiscoveryStrategy {
public:
    // maxLookups bounds the concurrent /info requests to responders.
    explicit MulticastProbe(DeviceInfoFetcher fetchInfo, int maxLookups = 8);

    // Sends one M-SEARCH and listens until the budget expires. Replies that
    // arrive after the window are never read. /info lookups for the
    // responders run after the window, in parallel.
    std::vector<DeviceEndpoint> probe(std::chrono::milliseconds budget) override;
    const char* name() const override { return "multicast"; }

private:
    std::vector<std::string> collectResponders(std::chrono::milliseconds window);

    DeviceInfoFetcher m_fetchInfo;
    int m_maxLookups;
};

class SubnetScanProbe : public DiscoveryStrategy {
public:
    // Probes one candidate host; nullopt means "not a device".
    using HostProbe = std::function<std::optional<DeviceEndpoint>(const std::string& host)>;

    // range empty -> defaultScanRange() at probe time.
    SubnetScanProbe(HostProbe hostProbe, std::string range = {}, int workers = 32);

    // Explicit candidate list, bypassing CIDR expansion.
    void setCandidates(std::vector<std::string> hosts) { m_candidates = std::move(hosts); }

    // Runs the bounded worker pool until every candidate was probed or the
    // budget expires. Workers still busy at the deadline are abandoned; their
    // late results are dropped.
    std::vector<DeviceEndpoint> probe(std::chrono::milliseconds budget) override;
    const char* name() const override { return "scan"; }

    // Connect probe on port 8090 followed by /info.
    static HostProbe makeHostProbe(DeviceInfoFetcher fetchInfo, int connectTimeoutMs = 1000);

private:
    HostProbe m_hostProbe;
    std::string m_range;
    int m_workers;
    std::vector<std::string> m_candidates;
};
