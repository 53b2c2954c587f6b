#include "SoundTouchXml.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace SoundTouch {

namespace {

// Text between <tag> and </tag>, searching from 'from'. Tag attributes are allowed.
std::optional<std::string> elementText(const std::string& xml, const std::string& tag, size_t from = 0) {
    std::string open = "<" + tag;
    size_t pos = from;
    while ((pos = xml.find(open, pos)) != std::string::npos) {
        size_t after = pos + open.size();
        if (after < xml.size() && (xml[after] == '>' || xml[after] == ' ')) break;
        pos = after;
    }
    if (pos == std::string::npos) return std::nullopt;
    size_t gt = xml.find('>', pos);
    if (gt == std::string::npos || xml[gt - 1] == '/') return std::nullopt;
    size_t close = xml.find("</" + tag + ">", gt + 1);
    if (close == std::string::npos) return std::nullopt;
    return xmlUnescape(xml.substr(gt + 1, close - gt - 1));
}

// Value of attr="..." inside the element that starts at 'elementPos'.
std::string attribute(const std::string& xml, size_t elementPos, const std::string& attr) {
    size_t gt = xml.find('>', elementPos);
    if (gt == std::string::npos) return "";
    std::string needle = " " + attr + "=\"";
    size_t pos = xml.find(needle, elementPos);
    if (pos == std::string::npos || pos > gt) return "";
    size_t start = pos + needle.size();
    size_t end = xml.find('"', start);
    if (end == std::string::npos) return "";
    return xmlUnescape(xml.substr(start, end - start));
}

std::string trim(std::string s) {
    auto notspace = [](int ch){ return !std::isspace(ch); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notspace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notspace).base(), s.end());
    return s;
}

} // anonymous namespace

std::optional<DeviceInfo> parseDeviceInfo(const std::string& xml) {
    auto name = elementText(xml, "name");
    if (!name || trim(*name).empty()) return std::nullopt;

    DeviceInfo info;
    info.name = trim(*name);
    auto type = elementText(xml, "type");
    info.type = type ? trim(*type) : "Unknown";

    size_t infoPos = xml.find("<info");
    if (infoPos != std::string::npos) {
        info.deviceId = attribute(xml, infoPos, "deviceID");
    }
    return info;
}

std::optional<ZoneStatus> parseZoneStatus(const std::string& xml) {
    size_t zonePos = xml.find("<zone");
    if (zonePos == std::string::npos) return std::nullopt;

    ZoneStatus status;
    status.masterId = attribute(xml, zonePos, "master");

    size_t pos = zonePos;
    while ((pos = xml.find("<member", pos)) != std::string::npos) {
        ZoneMember member;
        member.ipAddress = attribute(xml, pos, "ipaddress");
        size_t gt = xml.find('>', pos);
        if (gt == std::string::npos) break;
        if (xml[gt - 1] != '/') {
            size_t close = xml.find("</member>", gt + 1);
            if (close == std::string::npos) break;
            member.deviceId = trim(xmlUnescape(xml.substr(gt + 1, close - gt - 1)));
            pos = close;
        } else {
            pos = gt;
        }
        status.members.emplace_back(std::move(member));
    }
    return status;
}

std::string keyXml(const std::string& key, const std::string& state) {
    return "<key state=\"" + state + "\" sender=\"" + kKeySender + "\">" + xmlEscape(key) + "</key>";
}

std::string volumeXml(int level) {
    return "<volume>" + std::to_string(level) + "</volume>";
}

std::string contentItemXml(const std::string& source, const std::string& sourceAccount) {
    std::string xml = "<ContentItem source=\"" + xmlEscape(source) + "\"";
    if (!sourceAccount.empty()) {
        xml += " sourceAccount=\"" + xmlEscape(sourceAccount) + "\"";
    }
    xml += "></ContentItem>";
    return xml;
}

std::string zoneXml(const std::string& masterId, const std::string& masterIp,
                    const std::vector<ZoneMember>& members) {
    std::string xml = "<zone master=\"" + xmlEscape(masterId) + "\"";
    if (!masterIp.empty()) {
        xml += " senderIPAddress=\"" + xmlEscape(masterIp) + "\"";
    }
    xml += ">";
    for (const auto& m : members) {
        xml += "<member ipaddress=\"" + xmlEscape(m.ipAddress) + "\">" + xmlEscape(m.deviceId) + "</member>";
    }
    xml += "</zone>";
    return xml;
}

std::string xmlEscape(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '&':  out += "&amp;"; break;
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default:   out.push_back(c);
        }
    }
    return out;
}

std::string xmlUnescape(const std::string& value) {
    static const std::pair<const char*, char> entities[] = {
        {"&amp;", '&'}, {"&lt;", '<'}, {"&gt;", '>'}, {"&quot;", '"'}, {"&apos;", '\''}
    };
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '&') {
            bool matched = false;
            for (const auto& e : entities) {
                size_t len = std::char_traits<char>::length(e.first);
                if (value.compare(i, len, e.first) == 0) {
                    out.push_back(e.second);
                    i += len - 1;
                    matched = true;
                    break;
                }
            }
            if (matched) continue;
        }
        out.push_back(value[i]);
    }
    return out;
}

} // namespace SoundTouch
