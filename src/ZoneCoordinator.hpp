// ZoneCoordinator.hpp
// Multi-room zones: one master, ordered members, synchronized playback.
#pragma once

#include "CommandForwarder.hpp"
#include "DeviceEndpoint.hpp"
#include "ProxyError.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

enum class ZoneState {
    Absent,
    Forming,
    Active
};

const char* zoneStateName(ZoneState state);

// Endpoints are copies; rediscovery never reaches into a live zone.
struct Zone {
    std::string name;
    DeviceEndpoint master;
    std::vector<DeviceEndpoint> members;   // Never contains the master
};

struct ZoneResult {
    std::optional<Zone> zone;                   // Zone after the call; empty if it no longer exists
    ProxyError error;
    ProxyError cause;                           // What made create() roll back
    ProxyError rollbackError;                   // Set only if the rollback failed too
    std::vector<DeviceEndpoint> partialMembers; // Members that had joined before the rollback

    bool ok() const { return error.ok(); }
};

struct ZoneVolumeResult {
    std::vector<DeviceEndpoint> succeeded;
    std::vector<std::pair<DeviceEndpoint, ProxyError>> failed;
    ProxyError error;   // ZoneNotFound, InvalidRequest, or PartialZoneOperationFailure

    bool ok() const { return error.ok(); }
};

// Drives the per-zone state machine absent -> forming -> active -> absent.
//
// Membership on the device side is declarative: every change re-sends the
// whole list to the master with /setZone, so coordinator and device cannot
// drift apart. Mutations of one zone are serialized; different zones proceed
// independently. A device can belong to one zone at a time, as master or member.
class ZoneCoordinator {
public:
    // After /setZone the master's /getZone is read up to joinPolls times,
    // pollInterval apart, until every member shows up.
    explicit ZoneCoordinator(const CommandForwarder& forwarder, int joinPolls = 3,
                             std::chrono::milliseconds pollInterval = std::chrono::milliseconds(500));

    // All members join or nothing does. On failure the master is sent a
    // removal for every requested member and ZoneCreationFailed is returned.
    ZoneResult create(const std::string& name, const DeviceEndpoint& master,
                      const std::vector<DeviceEndpoint>& members);

    ZoneResult addMember(const std::string& name, const DeviceEndpoint& member);

    // Removing the last member dissolves the zone.
    ZoneResult removeMember(const std::string& name, const DeviceEndpoint& member);

    ZoneResult remove(const std::string& name);

    // Best effort: every device gets the command, failures are collected.
    ZoneVolumeResult volume(const std::string& name, int level);

    ZoneState state(const std::string& name) const;
    std::optional<Zone> find(const std::string& name) const;
    std::vector<Zone> zones() const;

    // Entries in the zone table, forming ones included.
    size_t trackedZones() const;

private:
    struct ZoneSlot {
        std::mutex mutation;                 // Held for the whole of one mutation
        ZoneState state{ZoneState::Absent};  // Guarded by m_mutex
        Zone zone;                           // Guarded by m_mutex
    };

    std::shared_ptr<ZoneSlot> slotFor(const std::string& name);
    std::shared_ptr<ZoneSlot> findSlot(const std::string& name) const;

    // These expect m_mutex to be held.
    ProxyError reserveLocked(const std::string& zoneName, const std::vector<DeviceEndpoint>& devices);
    void releaseLocked(const std::string& zoneName, const std::vector<DeviceEndpoint>& devices);
    // Drops the table entry once the slot is absent again.
    void discardLocked(const std::string& zoneName, const ZoneSlot& slot);

    void release(const std::string& zoneName, const std::vector<DeviceEndpoint>& devices);
    void commit(ZoneSlot& slot, const Zone& zone);
    void dissolveLocally(ZoneSlot& slot);

    ProxyError identify(DeviceEndpoint& device) const;
    ForwardResult sendZone(const Zone& zone) const;
    ForwardResult sendRemoval(const Zone& zone, const std::vector<DeviceEndpoint>& members) const;
    std::vector<DeviceEndpoint> joinedMembers(const Zone& zone, ProxyError& error) const;

    const CommandForwarder& m_forwarder;
    int m_joinPolls;
    std::chrono::milliseconds m_pollInterval;

    mutable std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<ZoneSlot>> m_zones;
    std::map<std::string, std::string> m_membership;   // host:port -> zone name
};
