#include "ZoneCoordinator.hpp"

#include "ParallelFor.hpp"
#include "SoundTouchXml.hpp"

#include <algorithm>
#include <iostream>
#include <thread>

namespace {

bool containsTarget(const std::vector<DeviceEndpoint>& list, const DeviceEndpoint& ep) {
    return std::any_of(list.begin(), list.end(), [&ep](const DeviceEndpoint& x) { return x.sameTarget(ep); });
}

std::vector<DeviceEndpoint> withMaster(const Zone& zone) {
    std::vector<DeviceEndpoint> all;
    all.reserve(zone.members.size() + 1);
    all.push_back(zone.master);
    all.insert(all.end(), zone.members.begin(), zone.members.end());
    return all;
}

SoundTouch::ZoneMember wireMember(const DeviceEndpoint& ep) {
    return SoundTouch::ZoneMember{ep.address, ep.identifier};
}

std::string addressList(const std::vector<DeviceEndpoint>& list) {
    std::string out;
    for (const auto& ep : list) {
        if (!out.empty()) out += ", ";
        out += ep.address;
    }
    return out;
}

} // anonymous namespace

const char* zoneStateName(ZoneState state) {
    switch (state) {
        case ZoneState::Absent:  return "absent";
        case ZoneState::Forming: return "forming";
        case ZoneState::Active:  return "active";
    }
    return "unknown";
}

ZoneCoordinator::ZoneCoordinator(const CommandForwarder& forwarder, int joinPolls,
                                 std::chrono::milliseconds pollInterval)
    : m_forwarder(forwarder), m_joinPolls(std::max(1, joinPolls)), m_pollInterval(pollInterval) {
}

// ============================================================================
// Bookkeeping
// ============================================================================

std::shared_ptr<ZoneCoordinator::ZoneSlot> ZoneCoordinator::slotFor(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto& slot = m_zones[name];
    if (!slot) slot = std::make_shared<ZoneSlot>();
    return slot;
}

std::shared_ptr<ZoneCoordinator::ZoneSlot> ZoneCoordinator::findSlot(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_zones.find(name);
    return it == m_zones.end() ? nullptr : it->second;
}

ProxyError ZoneCoordinator::reserveLocked(const std::string& zoneName, const std::vector<DeviceEndpoint>& devices) {
    for (const auto& d : devices) {
        auto it = m_membership.find(d.hostPort());
        if (it != m_membership.end() && it->second != zoneName) {
            return ProxyError::invalidZoneOperation(d.address + " already belongs to zone '" + it->second + "'");
        }
    }
    for (const auto& d : devices) {
        m_membership[d.hostPort()] = zoneName;
    }
    return ProxyError{};
}

void ZoneCoordinator::releaseLocked(const std::string& zoneName, const std::vector<DeviceEndpoint>& devices) {
    for (const auto& d : devices) {
        auto it = m_membership.find(d.hostPort());
        if (it != m_membership.end() && it->second == zoneName) {
            m_membership.erase(it);
        }
    }
}

void ZoneCoordinator::discardLocked(const std::string& zoneName, const ZoneSlot& slot) {
    auto it = m_zones.find(zoneName);
    if (it != m_zones.end() && it->second.get() == &slot && slot.state == ZoneState::Absent) {
        m_zones.erase(it);
    }
}

void ZoneCoordinator::release(const std::string& zoneName, const std::vector<DeviceEndpoint>& devices) {
    std::lock_guard<std::mutex> lock(m_mutex);
    releaseLocked(zoneName, devices);
}

void ZoneCoordinator::commit(ZoneSlot& slot, const Zone& zone) {
    std::lock_guard<std::mutex> lock(m_mutex);
    slot.zone = zone;
    slot.state = ZoneState::Active;
}

void ZoneCoordinator::dissolveLocally(ZoneSlot& slot) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const std::string name = slot.zone.name;
    releaseLocked(name, withMaster(slot.zone));
    std::cout << "[Zone] Zone '" << name << "' is now absent" << std::endl;
    slot.zone = Zone{};
    slot.state = ZoneState::Absent;
    discardLocked(name, slot);
}

// ============================================================================
// Device calls
// ============================================================================

ProxyError ZoneCoordinator::identify(DeviceEndpoint& device) const {
    if (!device.identifier.empty()) return ProxyError{};
    ProxyError error;
    auto identified = m_forwarder.identify(device, error);
    if (!identified) return error;
    device = *identified;
    return ProxyError{};
}

ForwardResult ZoneCoordinator::sendZone(const Zone& zone) const {
    // The full list, master first, every time
    std::vector<SoundTouch::ZoneMember> wire;
    wire.push_back(wireMember(zone.master));
    for (const auto& m : zone.members) wire.push_back(wireMember(m));
    std::string body = SoundTouch::zoneXml(zone.master.identifier, zone.master.address, wire);
    return m_forwarder.forward(zone.master, {"POST", "/setZone", body});
}

ForwardResult ZoneCoordinator::sendRemoval(const Zone& zone, const std::vector<DeviceEndpoint>& members) const {
    std::vector<SoundTouch::ZoneMember> wire;
    for (const auto& m : members) wire.push_back(wireMember(m));
    std::string body = SoundTouch::zoneXml(zone.master.identifier, "", wire);
    return m_forwarder.forward(zone.master, {"POST", "/removeZoneSlave", body});
}

std::vector<DeviceEndpoint> ZoneCoordinator::joinedMembers(const Zone& zone, ProxyError& error) const {
    std::vector<DeviceEndpoint> joined;
    ForwardResult r = m_forwarder.forward(zone.master, {"GET", "/getZone", ""});
    if (!r.ok()) {
        error = r.error;
        return joined;
    }
    auto status = SoundTouch::parseZoneStatus(r.response.body);
    if (!status) {
        error = ProxyError::deviceError(502, r.response.body);
        error.message = "Unparseable /getZone reply from " + zone.master.hostPort();
        return joined;
    }
    if (!status->masterId.empty() && status->masterId != zone.master.identifier) {
        return joined;  // master reports a different zone; nobody joined ours
    }
    for (const auto& m : zone.members) {
        bool present = std::any_of(status->members.begin(), status->members.end(),
            [&m](const SoundTouch::ZoneMember& wm) {
                return (!m.identifier.empty() && wm.deviceId == m.identifier) || wm.ipAddress == m.address;
            });
        if (present) joined.push_back(m);
    }
    return joined;
}

// ============================================================================
// Operations
// ============================================================================

ZoneResult ZoneCoordinator::create(const std::string& name, const DeviceEndpoint& master,
                                   const std::vector<DeviceEndpoint>& members) {
    ZoneResult result;
    if (name.empty()) {
        result.error = ProxyError::invalidZoneOperation("Zone name is required");
        return result;
    }

    Zone zone;
    zone.name = name;
    zone.master = master;
    for (const auto& m : members) {
        if (m.sameTarget(master)) {
            result.error = ProxyError::invalidZoneOperation("Master " + master.address + " cannot be its own member");
            return result;
        }
        if (!containsTarget(zone.members, m)) zone.members.push_back(m);
    }
    if (zone.members.empty()) {
        result.error = ProxyError::invalidZoneOperation("A zone needs at least one member");
        return result;
    }

    // A slot dropped while we waited for its mutation lock is stale; take the current one
    std::shared_ptr<ZoneSlot> slot;
    std::unique_lock<std::mutex> mutation;
    while (true) {
        if (mutation.owns_lock()) mutation.unlock();
        slot = slotFor(name);
        mutation = std::unique_lock<std::mutex>(slot->mutation);
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_zones.find(name);
        if (it != m_zones.end() && it->second == slot) break;
    }

    const std::vector<DeviceEndpoint> everyone = withMaster(zone);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (slot->state != ZoneState::Absent) {
            result.error = ProxyError::invalidZoneOperation("Zone already exists: " + name);
            return result;
        }
        ProxyError reserved = reserveLocked(name, everyone);
        if (!reserved.ok()) {
            discardLocked(name, *slot);
            result.error = reserved;
            return result;
        }
        slot->state = ZoneState::Forming;
        slot->zone = zone;
    }
    std::cout << "[Zone] Forming '" << name << "' master=" << master.address
              << " members=[" << addressList(zone.members) << "]" << std::endl;

    auto abandon = [this, &slot, &name, &everyone]() {
        std::lock_guard<std::mutex> lock(m_mutex);
        releaseLocked(name, everyone);
        slot->zone = Zone{};
        slot->state = ZoneState::Absent;
        discardLocked(name, *slot);
    };

    // deviceIDs are needed on the wire; nothing has been sent to the master yet
    std::vector<DeviceEndpoint*> toIdentify{&zone.master};
    for (auto& m : zone.members) toIdentify.push_back(&m);
    for (DeviceEndpoint* d : toIdentify) {
        ProxyError e = identify(*d);
        if (!e.ok()) {
            abandon();
            result.cause = e;
            result.error = ProxyError::zoneCreationFailed("Could not identify " + d->address + ": " + describe(e));
            std::cerr << "[Zone] " << result.error.message << std::endl;
            return result;
        }
    }

    ProxyError failure;
    std::vector<DeviceEndpoint> joined;
    ForwardResult set = sendZone(zone);
    if (!set.ok()) {
        failure = set.error;
    } else {
        // Some firmware applies /setZone a moment after acknowledging it
        ProxyError verifyError;
        joined = joinedMembers(zone, verifyError);
        for (int poll = 1; poll < m_joinPolls && verifyError.ok() && joined.size() != zone.members.size(); ++poll) {
            std::this_thread::sleep_for(m_pollInterval);
            joined = joinedMembers(zone, verifyError);
        }
        if (!verifyError.ok()) {
            failure = verifyError;
        } else if (joined.size() != zone.members.size()) {
            std::vector<DeviceEndpoint> missing;
            for (const auto& m : zone.members) {
                if (!containsTarget(joined, m)) missing.push_back(m);
            }
            failure.kind = ProxyErrorKind::DeviceError;
            failure.statusCode = static_cast<int>(set.response.statusCode);
            failure.message = "Member(s) did not join: " + addressList(missing);
        }
    }

    if (failure.ok()) {
        commit(*slot, zone);
        std::cout << "[Zone] Zone '" << name << "' active with " << zone.members.size() << " member(s)" << std::endl;
        result.zone = zone;
        return result;
    }

    // Undo whatever the master accepted before reporting
    std::cerr << "[Zone] Creating '" << name << "' failed (" << describe(failure) << "); rolling back" << std::endl;
    ForwardResult rollback = sendRemoval(zone, zone.members);
    abandon();

    result.cause = failure;
    result.partialMembers = joined;
    std::string message = "Zone '" + name + "' rolled back: " + describe(failure);
    if (!rollback.ok()) {
        result.rollbackError = rollback.error;
        message += "; rollback also failed: " + describe(rollback.error);
        std::cerr << "[Zone] Rollback of '" << name << "' failed: " << describe(rollback.error) << std::endl;
    }
    result.error = ProxyError::zoneCreationFailed(message);
    return result;
}

ZoneResult ZoneCoordinator::addMember(const std::string& name, const DeviceEndpoint& member) {
    ZoneResult result;
    auto slot = findSlot(name);
    if (!slot) {
        result.error = ProxyError::zoneNotFound(name);
        return result;
    }

    std::lock_guard<std::mutex> mutation(slot->mutation);
    Zone current;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (slot->state != ZoneState::Active) {
            result.error = ProxyError::zoneNotFound(name);
            return result;
        }
        current = slot->zone;
        if (member.sameTarget(current.master)) {
            result.error = ProxyError::invalidZoneOperation(member.address + " is the master of '" + name + "'");
            result.zone = current;
            return result;
        }
        if (containsTarget(current.members, member)) {
            result.error = ProxyError::invalidZoneOperation(member.address + " is already in '" + name + "'");
            result.zone = current;
            return result;
        }
        ProxyError reserved = reserveLocked(name, {member});
        if (!reserved.ok()) {
            result.error = reserved;
            result.zone = current;
            return result;
        }
    }

    DeviceEndpoint joining = member;
    ProxyError idError = identify(joining);
    if (!idError.ok()) {
        release(name, {member});
        result.error = idError;
        result.zone = current;
        return result;
    }

    Zone next = current;
    next.members.push_back(joining);
    ForwardResult r = sendZone(next);
    if (!r.ok()) {
        release(name, {member});
        result.error = r.error;
        if (r.error.kind == ProxyErrorKind::DeviceUnreachable) {
            dissolveLocally(*slot);
        } else {
            result.zone = current;
        }
        return result;
    }

    commit(*slot, next);
    std::cout << "[Zone] Added " << joining.address << " to '" << name << "'" << std::endl;
    result.zone = next;
    return result;
}

ZoneResult ZoneCoordinator::removeMember(const std::string& name, const DeviceEndpoint& member) {
    ZoneResult result;
    auto slot = findSlot(name);
    if (!slot) {
        result.error = ProxyError::zoneNotFound(name);
        return result;
    }

    std::lock_guard<std::mutex> mutation(slot->mutation);
    Zone current;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (slot->state != ZoneState::Active) {
            result.error = ProxyError::zoneNotFound(name);
            return result;
        }
        current = slot->zone;
    }

    auto it = std::find_if(current.members.begin(), current.members.end(),
                           [&member](const DeviceEndpoint& m) { return m.sameTarget(member); });
    if (it == current.members.end()) {
        result.error = ProxyError::invalidZoneOperation(member.address + " is not a member of '" + name + "'");
        result.zone = current;
        return result;
    }

    if (current.members.size() == 1) {
        // Last member leaving dissolves the zone
        ForwardResult r = sendRemoval(current, current.members);
        if (!r.ok() && r.error.kind != ProxyErrorKind::DeviceUnreachable) {
            result.error = r.error;
            result.zone = current;
            return result;
        }
        dissolveLocally(*slot);
        result.error = r.error;
        return result;
    }

    Zone next = current;
    DeviceEndpoint leaving = *it;
    next.members.erase(next.members.begin() + (it - current.members.begin()));
    ForwardResult r = sendZone(next);
    if (!r.ok()) {
        result.error = r.error;
        if (r.error.kind == ProxyErrorKind::DeviceUnreachable) {
            dissolveLocally(*slot);
        } else {
            result.zone = current;
        }
        return result;
    }

    commit(*slot, next);
    release(name, {leaving});
    std::cout << "[Zone] Removed " << leaving.address << " from '" << name << "'" << std::endl;
    result.zone = next;
    return result;
}

ZoneResult ZoneCoordinator::remove(const std::string& name) {
    ZoneResult result;
    auto slot = findSlot(name);
    if (!slot) {
        result.error = ProxyError::zoneNotFound(name);
        return result;
    }

    std::lock_guard<std::mutex> mutation(slot->mutation);
    Zone current;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (slot->state != ZoneState::Active) {
            result.error = ProxyError::zoneNotFound(name);
            return result;
        }
        current = slot->zone;
    }

    ForwardResult r = sendRemoval(current, current.members);
    if (!r.ok() && r.error.kind != ProxyErrorKind::DeviceUnreachable) {
        result.error = r.error;
        result.zone = current;
        return result;
    }
    dissolveLocally(*slot);
    result.error = r.error;
    return result;
}

ZoneVolumeResult ZoneCoordinator::volume(const std::string& name, int level) {
    ZoneVolumeResult result;
    if (level < 0 || level > 100) {
        result.error = ProxyError::invalidRequest("Volume must be between 0 and 100");
        return result;
    }

    auto slot = findSlot(name);
    Zone zone;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!slot || slot->state != ZoneState::Active) {
            result.error = ProxyError::zoneNotFound(name);
            return result;
        }
        zone = slot->zone;
    }

    // Independent calls; one slow device does not hold up the others
    const std::vector<DeviceEndpoint> targets = withMaster(zone);
    std::vector<ForwardResult> outcomes(targets.size());
    parallelFor(targets.size(), static_cast<int>(targets.size()), [this, &targets, &outcomes, level](size_t i) {
        outcomes[i] = m_forwarder.setVolume(targets[i], level);
    });

    for (size_t i = 0; i < targets.size(); ++i) {
        if (outcomes[i].ok()) {
            result.succeeded.push_back(targets[i]);
        } else {
            result.failed.emplace_back(targets[i], outcomes[i].error);
        }
    }

    if (!result.failed.empty()) {
        result.error = ProxyError::partialFailure(std::to_string(result.failed.size()) + " of " +
                                                  std::to_string(targets.size()) + " device(s) did not accept the volume");
        std::cerr << "[Zone] Volume on '" << name << "': " << result.error.message << std::endl;
    }

    if (!outcomes[0].ok() && outcomes[0].error.kind == ProxyErrorKind::DeviceUnreachable) {
        std::lock_guard<std::mutex> mutation(slot->mutation);
        bool sameZone = false;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            sameZone = slot->state == ZoneState::Active && slot->zone.master.sameTarget(zone.master);
        }
        if (sameZone) {
            std::cerr << "[Zone] Master " << zone.master.address << " unreachable; dropping '" << name << "'" << std::endl;
            dissolveLocally(*slot);
        }
    }
    return result;
}

ZoneState ZoneCoordinator::state(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_zones.find(name);
    return it == m_zones.end() ? ZoneState::Absent : it->second->state;
}

std::optional<Zone> ZoneCoordinator::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_zones.find(name);
    if (it == m_zones.end() || it->second->state != ZoneState::Active) return std::nullopt;
    return it->second->zone;
}

size_t ZoneCoordinator::trackedZones() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_zones.size();
}

std::vector<Zone> ZoneCoordinator::zones() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Zone> out;
    for (const auto& entry : m_zones) {
        if (entry.second->state == ZoneState::Active) out.push_back(entry.second->zone);
    }
    return out;
}
