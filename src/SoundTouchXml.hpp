// SoundTouchXml.hpp
// Builders and parsers for the few SoundTouch device payloads the proxy
// itself has to understand. Everything else is forwarded untouched.
#pragma once

#include <optional>
#include <string>
#include <vector>

namespace SoundTouch {

// Sender name the official apps use for /key; the firmware ignores
// presses from unknown senders on some models.
constexpr const char* kKeySender = "Gabbo";

// Parsed GET /info
struct DeviceInfo {
    std::string deviceId;   // <info deviceID="...">
    std::string name;       // <name>
    std::string type;       // <type>, "Unknown" when missing
};

struct ZoneMember {
    std::string ipAddress;
    std::string deviceId;
};

// Parsed GET /getZone
struct ZoneStatus {
    std::string masterId;
    std::vector<ZoneMember> members;
};

// Returns nullopt unless the payload carries a <name>.
std::optional<DeviceInfo> parseDeviceInfo(const std::string& xml);

// Returns nullopt unless the payload contains a <zone> element. A device not
// in any zone answers "<zone />", which parses to an empty status.
std::optional<ZoneStatus> parseZoneStatus(const std::string& xml);

std::string keyXml(const std::string& key, const std::string& state);
std::string volumeXml(int level);
std::string contentItemXml(const std::string& source, const std::string& sourceAccount);

// <zone master="id" senderIPAddress="ip"><member ipaddress="..">id</member>...</zone>
// Used by /setZone, /addZoneSlave and /removeZoneSlave alike.
std::string zoneXml(const std::string& masterId, const std::string& masterIp,
                    const std::vector<ZoneMember>& members);

std::string xmlEscape(const std::string& value);
std::string xmlUnescape(const std::string& value);

} // namespace SoundTouch
