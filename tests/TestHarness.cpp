#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include "../src/AddressResolver.hpp"
#include "../src/CommandForwarder.hpp"
#include "../src/DeviceRegistry.hpp"
#include "../src/DiscoveryProbe.hpp"
#include "../src/JsonUtil.hpp"
#include "../src/NetUtil.hpp"
#include "../src/ParallelFor.hpp"
#include "../src/ProxyConfig.hpp"
#include "../src/ProxyServer.hpp"
#include "../src/SoundTouchXml.hpp"
#include "../src/ZoneCoordinator.hpp"

namespace {

struct RecordedCall {
    std::string method;
    std::string host;
    std::string path;
    std::string body;
};

// Stands in for the speakers. Hosts without a handler refuse the connection.
class FakeDevices : public DeviceHttpClient {
public:
    using Handler = std::function<HttpOutcome(const std::string& method, const std::string& path,
                                              const std::string& body)>;

    void on(const std::string& host, Handler handler) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_handlers[host] = std::move(handler);
    }

    HttpOutcome request(const std::string& method, const std::string& url,
                        const std::string& body, long) override {
        // http://host:8090/path
        std::string rest = url.substr(url.find("://") + 3);
        size_t slash = rest.find('/');
        std::string hostPort = rest.substr(0, slash);
        std::string path = slash == std::string::npos ? "/" : rest.substr(slash);
        std::string host = hostPort.substr(0, hostPort.find(':'));

        Handler handler;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_calls.push_back({method, host, path, body});
            auto it = m_handlers.find(host);
            if (it != m_handlers.end()) handler = it->second;
        }
        if (!handler) {
            HttpOutcome refused;
            refused.error = "Couldn't connect to server";
            return refused;
        }
        return handler(method, path, body);
    }

    // The host stops answering, as if it lost power.
    void drop(const std::string& host) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_handlers.erase(host);
    }

    std::vector<RecordedCall> calls() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_calls;
    }

    std::vector<RecordedCall> callsTo(const std::string& host, const std::string& path) const {
        std::vector<RecordedCall> out;
        for (const auto& c : calls()) {
            if (c.host == host && c.path == path) out.push_back(c);
        }
        return out;
    }

private:
    mutable std::mutex m_mutex;
    std::map<std::string, Handler> m_handlers;
    std::vector<RecordedCall> m_calls;
};

HttpOutcome answer(long status, const std::string& body) {
    HttpOutcome o;
    o.transportOk = true;
    o.response.statusCode = status;
    o.response.body = body;
    o.response.contentType = "text/xml";
    return o;
}

std::string infoXml(const std::string& id, const std::string& name) {
    return "<?xml version=\"1.0\" encoding=\"UTF-8\" ?><info deviceID=\"" + id + "\"><name>" + name +
           "</name><type>SoundTouch 10</type></info>";
}

// A speaker that answers /info and accepts everything else.
FakeDevices::Handler speaker(const std::string& id, const std::string& name) {
    return [id, name](const std::string& method, const std::string& path, const std::string&) {
        if (method == "GET" && path == "/info") return answer(200, infoXml(id, name));
        return answer(200, "<status>/ok</status>");
    };
}

// Master that reports 'zoneBody' from /getZone and accepts the rest.
FakeDevices::Handler master(const std::string& id, const std::string& zoneBody) {
    return [id, zoneBody](const std::string& method, const std::string& path, const std::string&) {
        if (method == "GET" && path == "/info") return answer(200, infoXml(id, "Master"));
        if (method == "GET" && path == "/getZone") return answer(200, zoneBody);
        return answer(200, "<status>/ok</status>");
    };
}

class FakeStrategy : public DiscoveryStrategy {
public:
    FakeStrategy(const char* name, std::vector<DeviceEndpoint> answer, std::shared_ptr<int> calls)
        : m_name(name), m_answer(std::move(answer)), m_calls(std::move(calls)) {}

    std::vector<DeviceEndpoint> probe(std::chrono::milliseconds) override {
        ++*m_calls;
        return m_answer;
    }
    const char* name() const override { return m_name; }

private:
    const char* m_name;
    std::vector<DeviceEndpoint> m_answer;
    std::shared_ptr<int> m_calls;
};

// Blocking connect to 127.0.0.1:port; -1 on failure.
int connectLoopback(int port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return -1;
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

// Everything the peer sends until it closes (or 3 s pass).
std::string readUntilClosed(int fd) {
    struct timeval tv{};
    tv.tv_sec = 3;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    std::string out;
    char buf[1024];
    ssize_t n;
    while ((n = ::recv(fd, buf, sizeof(buf), 0)) > 0) {
        out.append(buf, static_cast<size_t>(n));
    }
    return out;
}

DeviceEndpoint endpoint(const std::string& address, const std::string& id = "") {
    DeviceEndpoint ep;
    ep.address = address;
    ep.identifier = id;
    return ep;
}

} // anonymous namespace

int main(){
    int failures = 0;

    // Test 1: /info and /getZone parsing
    {
        auto info = SoundTouch::parseDeviceInfo(infoXml("A0F6FD123456", "Kitchen &amp; Bath"));
        if (!info || info->deviceId != "A0F6FD123456" || info->name != "Kitchen & Bath" || info->type != "SoundTouch 10") {
            std::cerr << "[FAIL] /info parse mismatch\n";
            ++failures;
        }
        if (SoundTouch::parseDeviceInfo("<html><body>router login</body></html>")) {
            std::cerr << "[FAIL] Non-SoundTouch /info accepted\n";
            ++failures;
        }
        auto untyped = SoundTouch::parseDeviceInfo("<info deviceID=\"X\"><name>Den</name></info>");
        if (!untyped || untyped->type != "Unknown") {
            std::cerr << "[FAIL] Missing <type> should default to Unknown\n";
            ++failures;
        }

        auto zone = SoundTouch::parseZoneStatus(
            "<zone master=\"M1\"><member ipaddress=\"10.0.0.1\">M1</member>"
            "<member ipaddress=\"10.0.0.2\">A1</member></zone>");
        if (!zone || zone->masterId != "M1" || zone->members.size() != 2
            || zone->members[1].ipAddress != "10.0.0.2" || zone->members[1].deviceId != "A1") {
            std::cerr << "[FAIL] /getZone parse mismatch\n";
            ++failures;
        }
        auto empty = SoundTouch::parseZoneStatus("<zone />");
        if (!empty || !empty->members.empty() || !empty->masterId.empty()) {
            std::cerr << "[FAIL] Empty zone should parse to an empty status\n";
            ++failures;
        }
        if (SoundTouch::parseZoneStatus("<errors/>")) {
            std::cerr << "[FAIL] Non-zone payload parsed as zone\n";
            ++failures;
        }

        std::string key = SoundTouch::keyXml("NEXT_TRACK", "press");
        if (key != "<key state=\"press\" sender=\"Gabbo\">NEXT_TRACK</key>") {
            std::cerr << "[FAIL] keyXml: " << key << "\n";
            ++failures;
        }
        std::string zx = SoundTouch::zoneXml("M1", "10.0.0.1", {{"10.0.0.2", "A1"}});
        if (zx != "<zone master=\"M1\" senderIPAddress=\"10.0.0.1\"><member ipaddress=\"10.0.0.2\">A1</member></zone>") {
            std::cerr << "[FAIL] zoneXml: " << zx << "\n";
            ++failures;
        }
    }

    // Test 2: JSON helpers used by the inbound routes
    {
        std::string body = R"JSON({"name": "Downstairs", "master":"10.0.0.1", "members":["10.0.0.2", "10.0.0.3"], "level":"35"})JSON";
        if (extractJsonString(body, "name") != "Downstairs") {
            std::cerr << "[FAIL] extractJsonString name\n";
            ++failures;
        }
        auto members = extractJsonStringArray(body, "members");
        if (members.size() != 2 || members[0] != "10.0.0.2" || members[1] != "10.0.0.3") {
            std::cerr << "[FAIL] extractJsonStringArray returned " << members.size() << " entries\n";
            ++failures;
        }
        auto level = extractJsonInt(body, "level");
        if (!level || *level != 35) {
            std::cerr << "[FAIL] extractJsonInt should accept quoted numbers\n";
            ++failures;
        }
        if (extractJsonInt(body, "missing")) {
            std::cerr << "[FAIL] extractJsonInt found a missing key\n";
            ++failures;
        }
        if (jsonQuote("a\"b\\c") != "\"a\\\"b\\\\c\"") {
            std::cerr << "[FAIL] jsonQuote escaping: " << jsonQuote("a\"b\\c") << "\n";
            ++failures;
        }
    }

    // Test 3: SSDP reply filtering and scan ranges
    {
        std::string bose =
            "HTTP/1.1 200 OK\r\n"
            "CACHE-CONTROL: max-age=1800\r\n"
            "LOCATION: http://192.168.1.20:8091/XD/BO5EBO5E-F00D-F00D-FEED-A0F6FD123456.xml\r\n"
            "SERVER: Linux UPnP/1.0 Bose SoundTouch/1.0\r\n"
            "ST: urn:schemas-upnp-org:device:MediaRenderer:1\r\n"
            "USN: uuid:BO5EBO5E-F00D-F00D-FEED-A0F6FD123456::urn:schemas-upnp-org:device:MediaRenderer:1\r\n"
            "\r\n";
        auto reply = parseSsdpReply(bose);
        if (!reply || reply->location.find("192.168.1.20:8091") == std::string::npos
            || reply->searchTarget != kSsdpSearchTarget) {
            std::cerr << "[FAIL] Bose SSDP reply not parsed\n";
            ++failures;
        }

        std::string tv = "HTTP/1.1 200 OK\r\nSERVER: Linux UPnP/1.0 SomeTV/2.0\r\nST: urn:schemas-upnp-org:device:MediaRenderer:1\r\n\r\n";
        if (parseSsdpReply(tv)) {
            std::cerr << "[FAIL] Non-SoundTouch renderer accepted\n";
            ++failures;
        }
        if (parseSsdpReply("NOTIFY * HTTP/1.1\r\nSERVER: Bose SoundTouch\r\n\r\n")) {
            std::cerr << "[FAIL] NOTIFY accepted as a search reply\n";
            ++failures;
        }

        std::string search = buildSsdpSearch();
        if (search.find("M-SEARCH * HTTP/1.1\r\n") != 0 || search.find("MX: 2\r\n") == std::string::npos
            || search.find("ST: urn:schemas-upnp-org:device:MediaRenderer:1\r\n") == std::string::npos) {
            std::cerr << "[FAIL] M-SEARCH message malformed\n";
            ++failures;
        }

        auto hosts = hostsInRange("192.168.1.77/24");
        if (hosts.size() != 254 || hosts.front() != "192.168.1.1" || hosts.back() != "192.168.1.254") {
            std::cerr << "[FAIL] /24 expansion: " << hosts.size() << " hosts\n";
            ++failures;
        }
        if (hostsInRange("10.0.0.0/30").size() != 2) {
            std::cerr << "[FAIL] /30 should give two hosts\n";
            ++failures;
        }
        if (!hostsInRange("10.0.0.0/8").empty() || !hostsInRange("not-an-ip/24").empty()) {
            std::cerr << "[FAIL] Oversized or malformed range accepted\n";
            ++failures;
        }
    }

    // Test 4: registry deduplicates and hands out stable snapshots
    {
        DeviceRegistry registry;
        if (registry.current()) {
            std::cerr << "[FAIL] Fresh registry not empty\n";
            ++failures;
        }
        DiscoveryResult first;
        first.source = DiscoverySource::Multicast;
        first.endpoints = {endpoint("10.0.0.1", "AAA"), endpoint("10.0.0.9", "AAA"),
                           endpoint("10.0.0.2", "BBB"), endpoint("10.0.0.2")};
        auto snapshot = registry.publish(first);
        if (snapshot->endpoints.size() != 2 || snapshot->endpoints[0].address != "10.0.0.1") {
            std::cerr << "[FAIL] Dedupe kept " << snapshot->endpoints.size() << " endpoints\n";
            ++failures;
        }
        if (snapshot->timestamp == std::chrono::system_clock::time_point{}) {
            std::cerr << "[FAIL] Publish did not stamp the result\n";
            ++failures;
        }

        DiscoveryResult second;
        second.source = DiscoverySource::Scan;
        second.endpoints = {endpoint("10.0.0.5", "CCC")};
        registry.publish(second);
        if (snapshot->endpoints.size() != 2 || registry.current()->endpoints.size() != 1) {
            std::cerr << "[FAIL] Publishing changed an earlier snapshot\n";
            ++failures;
        }
        if (!registry.findByAddress("10.0.0.5") || registry.findByAddress("10.0.0.1")) {
            std::cerr << "[FAIL] findByAddress looked at the wrong snapshot\n";
            ++failures;
        }
    }

    // Test 5: resolution order
    {
        // Configured addresses short-circuit everything
        auto multicastCalls = std::make_shared<int>(0);
        auto scanCalls = std::make_shared<int>(0);
        DeviceRegistry registry;
        AddressResolver resolver({"192.168.1.20"},
                                 std::make_unique<FakeStrategy>("multicast", std::vector<DeviceEndpoint>{endpoint("10.0.0.1", "A")}, multicastCalls),
                                 std::make_unique<FakeStrategy>("scan", std::vector<DeviceEndpoint>{}, scanCalls),
                                 registry);
        ResolveResult r = resolver.resolve();
        if (!r.ok() || r.result->source != DiscoverySource::Configured || r.result->endpoints.size() != 1
            || r.result->endpoints[0].address != "192.168.1.20" || r.result->endpoints[0].port != kSoundTouchApiPort) {
            std::cerr << "[FAIL] Configured address not returned as-is\n";
            ++failures;
        }
        if (*multicastCalls != 0 || *scanCalls != 0) {
            std::cerr << "[FAIL] Configured resolution probed the network\n";
            ++failures;
        }
    }
    {
        // Multicast answers: scan is never tried
        auto multicastCalls = std::make_shared<int>(0);
        auto scanCalls = std::make_shared<int>(0);
        DeviceRegistry registry;
        AddressResolver resolver({},
                                 std::make_unique<FakeStrategy>("multicast", std::vector<DeviceEndpoint>{endpoint("10.0.0.1", "A"), endpoint("10.0.0.2", "B")}, multicastCalls),
                                 std::make_unique<FakeStrategy>("scan", std::vector<DeviceEndpoint>{endpoint("10.0.0.3", "C")}, scanCalls),
                                 registry);
        ResolveResult r = resolver.resolve();
        if (!r.ok() || r.result->source != DiscoverySource::Multicast || r.result->endpoints.size() != 2) {
            std::cerr << "[FAIL] Multicast result not published\n";
            ++failures;
        }
        if (*scanCalls != 0) {
            std::cerr << "[FAIL] Scan ran although multicast found devices\n";
            ++failures;
        }
        resolver.resolve();
        if (*multicastCalls != 1) {
            std::cerr << "[FAIL] Cached result not reused (" << *multicastCalls << " multicast rounds)\n";
            ++failures;
        }
        resolver.refresh();
        if (*multicastCalls != 2) {
            std::cerr << "[FAIL] refresh() did not run a new cycle\n";
            ++failures;
        }
        if (resolver.endpointFor("10.0.0.2").identifier != "B" || resolver.endpointFor("10.9.9.9").identifier != "") {
            std::cerr << "[FAIL] endpointFor lookup mismatch\n";
            ++failures;
        }
    }
    {
        // Multicast empty: scan result is used
        auto multicastCalls = std::make_shared<int>(0);
        auto scanCalls = std::make_shared<int>(0);
        DeviceRegistry registry;
        AddressResolver resolver({},
                                 std::make_unique<FakeStrategy>("multicast", std::vector<DeviceEndpoint>{}, multicastCalls),
                                 std::make_unique<FakeStrategy>("scan", std::vector<DeviceEndpoint>{endpoint("10.0.0.3", "C")}, scanCalls),
                                 registry);
        ResolveResult r = resolver.resolve();
        if (!r.ok() || r.result->source != DiscoverySource::Scan || *multicastCalls != 1 || *scanCalls != 1) {
            std::cerr << "[FAIL] Scan fallback not taken\n";
            ++failures;
        }
    }
    {
        // Nothing anywhere
        auto multicastCalls = std::make_shared<int>(0);
        auto scanCalls = std::make_shared<int>(0);
        DeviceRegistry registry;
        AddressResolver resolver({},
                                 std::make_unique<FakeStrategy>("multicast", std::vector<DeviceEndpoint>{}, multicastCalls),
                                 std::make_unique<FakeStrategy>("scan", std::vector<DeviceEndpoint>{}, scanCalls),
                                 registry);
        ResolveResult r = resolver.resolve();
        if (r.ok() || r.error.kind != ProxyErrorKind::NoDeviceFound || httpStatusFor(r.error) != 404) {
            std::cerr << "[FAIL] Expected NoDeviceFound, got " << describe(r.error) << "\n";
            ++failures;
        }
        if (registry.current()) {
            std::cerr << "[FAIL] Empty cycle was published\n";
            ++failures;
        }
    }

    // Test 6: subnet scan keeps the pool bounded and abandons stragglers
    {
        // Workers are detached and may outlive this block; the probe only
        // captures shared state.
        auto active = std::make_shared<std::atomic<int>>(0);
        auto peak = std::make_shared<std::atomic<int>>(0);
        SubnetScanProbe::HostProbe hostProbe = [active, peak](const std::string& host) -> std::optional<DeviceEndpoint> {
            int now = ++*active;
            int seen = peak->load();
            while (now > seen && !peak->compare_exchange_weak(seen, now)) {}
            std::this_thread::sleep_for(std::chrono::milliseconds(host == "10.0.0.99" ? 1500 : 50));
            --*active;
            if (host == "10.0.0.1" || host == "10.0.0.2") {
                return endpoint(host, "ID-" + host);
            }
            return std::nullopt;
        };

        SubnetScanProbe scan(hostProbe, "", 4);
        scan.setCandidates({"10.0.0.99", "10.0.0.1", "10.0.0.2", "10.0.0.3", "10.0.0.4",
                            "10.0.0.5", "10.0.0.6", "10.0.0.7", "10.0.0.8", "10.0.0.9"});
        auto start = std::chrono::steady_clock::now();
        auto found = scan.probe(std::chrono::milliseconds(500));
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
        std::cout << "[TEST] Scan returned " << found.size() << " device(s) in " << elapsed << " ms (peak "
                  << peak->load() << " workers)" << std::endl;

        if (found.size() != 2) {
            std::cerr << "[FAIL] Scan found " << found.size() << " devices, expected 2\n";
            ++failures;
        }
        if (peak->load() > 4) {
            std::cerr << "[FAIL] Scan exceeded its worker bound: " << peak->load() << "\n";
            ++failures;
        }
        if (elapsed < 400 || elapsed > 1200) {
            std::cerr << "[FAIL] Scan did not return at its deadline: " << elapsed << " ms\n";
            ++failures;
        }
    }

    // Test 7: forwarding keeps device errors intact
    {
        auto devices = std::make_shared<FakeDevices>();
        devices->on("10.0.0.1", [](const std::string&, const std::string& path, const std::string&) {
            if (path == "/select") return answer(500, "<errors deviceID=\"A\"><error value=\"1005\" name=\"UNKNOWN_SOURCE_ERROR\"/></errors>");
            return answer(200, "<status>/ok</status>");
        });
        CommandForwarder forwarder(devices);

        ForwardResult down = forwarder.forward(endpoint("10.0.0.50"), {"GET", "/now_playing", ""});
        if (down.ok() || down.error.kind != ProxyErrorKind::DeviceUnreachable || httpStatusFor(down.error) != 502) {
            std::cerr << "[FAIL] Refused connection should be DeviceUnreachable\n";
            ++failures;
        }

        ForwardResult rejected = forwarder.perform(endpoint("10.0.0.1"), "source", {{"source", "BOGUS"}});
        if (rejected.ok() || rejected.error.kind != ProxyErrorKind::DeviceError || rejected.error.statusCode != 500
            || rejected.error.body.find("UNKNOWN_SOURCE_ERROR") == std::string::npos) {
            std::cerr << "[FAIL] Device error not passed through: " << describe(rejected.error) << "\n";
            ++failures;
        }

        ForwardResult next = forwarder.perform(endpoint("10.0.0.1"), "next", {});
        auto keys = devices->callsTo("10.0.0.1", "/key");
        if (!next.ok() || keys.size() != 2
            || keys[0].body.find("state=\"press\"") == std::string::npos
            || keys[1].body.find("state=\"release\"") == std::string::npos
            || keys[0].body.find("NEXT_TRACK") == std::string::npos) {
            std::cerr << "[FAIL] Key action should send press then release\n";
            ++failures;
        }

        ForwardResult badVolume = forwarder.perform(endpoint("10.0.0.1"), "volume", {{"level", "140"}});
        if (badVolume.error.kind != ProxyErrorKind::InvalidRequest || devices->callsTo("10.0.0.1", "/volume").size() != 0) {
            std::cerr << "[FAIL] Out-of-range volume reached the device\n";
            ++failures;
        }
        if (keyForAction("preset", {{"preset", "3"}}) != "PRESET_3" || !keyForAction("preset", {{"preset", "7"}}).empty()) {
            std::cerr << "[FAIL] Preset key mapping\n";
            ++failures;
        }
    }

    // Test 8: zone creation rolls back when a member does not join
    {
        auto devices = std::make_shared<FakeDevices>();
        // Master reports only A after /setZone; B never joined
        devices->on("10.0.0.1", master("M1",
            "<zone master=\"M1\"><member ipaddress=\"10.0.0.1\">M1</member>"
            "<member ipaddress=\"10.0.0.2\">A1</member></zone>"));
        devices->on("10.0.0.2", speaker("A1", "Kitchen"));
        devices->on("10.0.0.3", speaker("B1", "Patio"));
        CommandForwarder forwarder(devices);
        ZoneCoordinator zones(forwarder, 3, std::chrono::milliseconds(10));

        ZoneResult r = zones.create("Downstairs", endpoint("10.0.0.1"), {endpoint("10.0.0.2"), endpoint("10.0.0.3")});
        if (r.ok() || r.error.kind != ProxyErrorKind::ZoneCreationFailed || httpStatusFor(r.error) != 409) {
            std::cerr << "[FAIL] Expected ZoneCreationFailed, got " << describe(r.error) << "\n";
            ++failures;
        }
        if (r.partialMembers.size() != 1 || r.partialMembers[0].address != "10.0.0.2") {
            std::cerr << "[FAIL] Partial members not reported\n";
            ++failures;
        }
        if (zones.state("Downstairs") != ZoneState::Absent || zones.find("Downstairs")) {
            std::cerr << "[FAIL] Rolled-back zone still present\n";
            ++failures;
        }
        auto removals = devices->callsTo("10.0.0.1", "/removeZoneSlave");
        if (removals.size() != 1 || removals[0].body.find(">A1</member>") == std::string::npos
            || removals[0].body.find(">B1</member>") == std::string::npos) {
            std::cerr << "[FAIL] Rollback did not remove every requested member\n";
            ++failures;
        }
        auto sets = devices->callsTo("10.0.0.1", "/setZone");
        if (sets.size() != 1 || sets[0].body.find("<zone master=\"M1\" senderIPAddress=\"10.0.0.1\">") != 0) {
            std::cerr << "[FAIL] /setZone body malformed\n";
            ++failures;
        }

        // Devices were released; a zone without B can be formed now
        ZoneResult retry = zones.create("Downstairs", endpoint("10.0.0.1"), {endpoint("10.0.0.2")});
        if (!retry.ok() || zones.state("Downstairs") != ZoneState::Active) {
            std::cerr << "[FAIL] Zone could not be formed after rollback: " << describe(retry.error) << "\n";
            ++failures;
        }
    }

    // Test 9: an unreachable member aborts creation before the master is touched
    {
        auto devices = std::make_shared<FakeDevices>();
        devices->on("10.0.0.1", master("M1", "<zone />"));
        devices->on("10.0.0.2", speaker("A1", "Kitchen"));
        CommandForwarder forwarder(devices);
        ZoneCoordinator zones(forwarder, 3, std::chrono::milliseconds(10));

        ZoneResult r = zones.create("Upstairs", endpoint("10.0.0.1"), {endpoint("10.0.0.2"), endpoint("10.0.0.44")});
        if (r.error.kind != ProxyErrorKind::ZoneCreationFailed || r.cause.kind != ProxyErrorKind::DeviceUnreachable) {
            std::cerr << "[FAIL] Unreachable member not reported as cause\n";
            ++failures;
        }
        if (!devices->callsTo("10.0.0.1", "/setZone").empty()) {
            std::cerr << "[FAIL] /setZone sent despite identification failure\n";
            ++failures;
        }

        ZoneResult self = zones.create("Loop", endpoint("10.0.0.1"), {endpoint("10.0.0.1")});
        if (self.error.kind != ProxyErrorKind::InvalidZoneOperation) {
            std::cerr << "[FAIL] Master accepted as its own member\n";
            ++failures;
        }
    }

    // Test 10: membership changes and the last member leaving
    {
        auto devices = std::make_shared<FakeDevices>();
        devices->on("10.0.0.1", master("M1",
            "<zone master=\"M1\"><member ipaddress=\"10.0.0.1\">M1</member>"
            "<member ipaddress=\"10.0.0.2\">A1</member></zone>"));
        devices->on("10.0.0.2", speaker("A1", "Kitchen"));
        devices->on("10.0.0.3", speaker("B1", "Patio"));
        CommandForwarder forwarder(devices);
        ZoneCoordinator zones(forwarder, 3, std::chrono::milliseconds(10));

        ZoneResult created = zones.create("Living", endpoint("10.0.0.1"), {endpoint("10.0.0.2")});
        if (!created.ok()) {
            std::cerr << "[FAIL] Zone creation failed: " << describe(created.error) << "\n";
            ++failures;
        }

        ZoneResult clash = zones.create("Other", endpoint("10.0.0.3"), {endpoint("10.0.0.2")});
        if (clash.error.kind != ProxyErrorKind::InvalidZoneOperation) {
            std::cerr << "[FAIL] Device joined two zones at once\n";
            ++failures;
        }

        ZoneResult added = zones.addMember("Living", endpoint("10.0.0.3"));
        auto sets = devices->callsTo("10.0.0.1", "/setZone");
        if (!added.ok() || !added.zone || added.zone->members.size() != 2 || sets.size() != 2
            || sets.back().body.find(">B1</member>") == std::string::npos
            || sets.back().body.find(">A1</member>") == std::string::npos) {
            std::cerr << "[FAIL] addMember did not re-send the full list\n";
            ++failures;
        }

        ZoneResult removedB = zones.removeMember("Living", endpoint("10.0.0.3"));
        if (!removedB.ok() || zones.state("Living") != ZoneState::Active) {
            std::cerr << "[FAIL] removeMember of one of two members\n";
            ++failures;
        }

        ZoneResult removedA = zones.removeMember("Living", endpoint("10.0.0.2"));
        if (!removedA.ok() || removedA.zone || zones.state("Living") != ZoneState::Absent) {
            std::cerr << "[FAIL] Removing the last member should dissolve the zone\n";
            ++failures;
        }
        ZoneVolumeResult v = zones.volume("Living", 20);
        if (v.error.kind != ProxyErrorKind::ZoneNotFound) {
            std::cerr << "[FAIL] Volume on dissolved zone: " << describe(v.error) << "\n";
            ++failures;
        }
        if (zones.removeMember("Living", endpoint("10.0.0.2")).error.kind != ProxyErrorKind::ZoneNotFound) {
            std::cerr << "[FAIL] Mutation of an absent zone should be ZoneNotFound\n";
            ++failures;
        }
    }

    // Test 11: zone volume is best effort
    {
        auto devices = std::make_shared<FakeDevices>();
        devices->on("10.0.0.1", master("M1",
            "<zone master=\"M1\"><member ipaddress=\"10.0.0.1\">M1</member>"
            "<member ipaddress=\"10.0.0.2\">A1</member><member ipaddress=\"10.0.0.3\">B1</member></zone>"));
        devices->on("10.0.0.2", speaker("A1", "Kitchen"));
        devices->on("10.0.0.3", [](const std::string& method, const std::string& path, const std::string&) {
            if (method == "GET" && path == "/info") return answer(200, infoXml("B1", "Patio"));
            if (path == "/volume") return answer(500, "<errors><error name=\"HTTP_STATUS_INTERNAL_SERVER_ERROR\"/></errors>");
            return answer(200, "<status>/ok</status>");
        });
        CommandForwarder forwarder(devices);
        ZoneCoordinator zones(forwarder, 3, std::chrono::milliseconds(10));

        ZoneResult created = zones.create("Party", endpoint("10.0.0.1"), {endpoint("10.0.0.2"), endpoint("10.0.0.3")});
        if (!created.ok()) {
            std::cerr << "[FAIL] Zone creation failed: " << describe(created.error) << "\n";
            ++failures;
        }

        ZoneVolumeResult v = zones.volume("Party", 40);
        if (v.error.kind != ProxyErrorKind::PartialZoneOperationFailure || httpStatusFor(v.error) != 207) {
            std::cerr << "[FAIL] Expected PartialZoneOperationFailure, got " << describe(v.error) << "\n";
            ++failures;
        }
        if (v.succeeded.size() != 2 || v.failed.size() != 1 || v.failed[0].first.address != "10.0.0.3"
            || v.failed[0].second.statusCode != 500) {
            std::cerr << "[FAIL] Volume outcome split wrong: " << v.succeeded.size() << " ok, " << v.failed.size() << " failed\n";
            ++failures;
        }
        if (devices->callsTo("10.0.0.2", "/volume").size() != 1 || zones.state("Party") != ZoneState::Active) {
            std::cerr << "[FAIL] Healthy member skipped or zone dropped\n";
            ++failures;
        }
        if (zones.volume("Party", 101).error.kind != ProxyErrorKind::InvalidRequest) {
            std::cerr << "[FAIL] Out-of-range zone volume accepted\n";
            ++failures;
        }
    }

    // Test 12: configuration precedence
    {
        std::map<std::string, std::string> env = {
            {"SOUNDTOUCH_PORT", "7000"},
            {"SOUNDTOUCH_DEVICE_IP", "10.1.1.1"},
            {"SOUNDTOUCH_SCAN_RANGE", "10.1.1.0/24"},
        };
        EnvLookup lookup = [&env](const char* name) -> const char* {
            auto it = env.find(name);
            return it == env.end() ? nullptr : it->second.c_str();
        };

        const char* argv[] = {"soundtouch-proxy", "10.0.0.5, 10.0.0.6", "--port=9000", "--scan-workers=abc"};
        ProxyConfig cfg = loadProxyConfig(4, argv, lookup);
        if (cfg.listenPort != 9000 || cfg.deviceAddresses.size() != 2 || cfg.deviceAddresses[1] != "10.0.0.6") {
            std::cerr << "[FAIL] argv should override the environment\n";
            ++failures;
        }
        if (cfg.scanRange != "10.1.1.0/24" || cfg.scanWorkers != 32 || cfg.warnings.size() != 1) {
            std::cerr << "[FAIL] Invalid value handling: workers=" << cfg.scanWorkers << " warnings=" << cfg.warnings.size() << "\n";
            ++failures;
        }

        const char* bare[] = {"soundtouch-proxy"};
        ProxyConfig defaults = loadProxyConfig(1, bare, [](const char*) -> const char* { return nullptr; });
        if (defaults.listenPort != 8000 || !defaults.deviceAddresses.empty() || defaults.webRoot != ".") {
            std::cerr << "[FAIL] Defaults mismatch\n";
            ++failures;
        }
    }

    // Test 13: inbound routes
    {
        auto devices = std::make_shared<FakeDevices>();
        devices->on("10.0.0.1", [](const std::string& method, const std::string& path, const std::string&) {
            if (method == "GET" && path == "/now_playing") return answer(200, "<nowPlaying source=\"STANDBY\"/>");
            return answer(200, "<status>/ok</status>");
        });
        ProxyConfig cfg;
        cfg.deviceAddresses = {"10.0.0.1"};
        cfg.webRoot = "/nonexistent-web-root";
        DeviceRegistry registry;
        auto none = std::make_shared<int>(0);
        AddressResolver resolver(cfg.deviceAddresses,
                                 std::make_unique<FakeStrategy>("multicast", std::vector<DeviceEndpoint>{}, none),
                                 std::make_unique<FakeStrategy>("scan", std::vector<DeviceEndpoint>{}, none),
                                 registry);
        CommandForwarder forwarder(devices);
        ZoneCoordinator zones(forwarder, 3, std::chrono::milliseconds(10));
        ProxyServer server(cfg, resolver, forwarder, zones);

        auto raw = [](const std::string& text) {
            auto parsed = parseHttpRequest(text);
            return parsed ? *parsed : HttpRequest{};
        };

        HttpReply nowPlaying = server.handle(raw("GET /api/now_playing HTTP/1.1\r\nHost: localhost\r\n\r\n"));
        if (nowPlaying.status != 200 || nowPlaying.body != "<nowPlaying source=\"STANDBY\"/>"
            || devices->callsTo("10.0.0.1", "/now_playing").size() != 1) {
            std::cerr << "[FAIL] /api passthrough: status " << nowPlaying.status << "\n";
            ++failures;
        }

        HttpReply down = server.handle(raw("GET /api/volume?device=10.0.0.77 HTTP/1.1\r\n\r\n"));
        if (down.status != 502 || down.body.find("DeviceUnreachable") == std::string::npos) {
            std::cerr << "[FAIL] Unreachable device should map to 502, got " << down.status << "\n";
            ++failures;
        }

        std::string body = "{\"ip\": \"10.0.0.2\"}";
        HttpReply set = server.handle(raw("POST /set-device HTTP/1.1\r\nContent-Type: application/json\r\nContent-Length: "
                                          + std::to_string(body.size()) + "\r\n\r\n" + body));
        HttpReply current = server.handle(raw("GET /current-device HTTP/1.1\r\n\r\n"));
        if (set.status != 200 || server.currentDevice() != "10.0.0.2"
            || current.body.find("\"ip\":\"10.0.0.2\"") == std::string::npos) {
            std::cerr << "[FAIL] /set-device did not change the current device\n";
            ++failures;
        }

        HttpReply discover = server.handle(raw("GET /discover HTTP/1.1\r\n\r\n"));
        if (discover.status != 200 || discover.body.find("\"10.0.0.1\"") == std::string::npos || *none != 0) {
            std::cerr << "[FAIL] /discover should list configured devices without probing\n";
            ++failures;
        }

        HttpReply preflight = server.handle(raw("OPTIONS /api/key HTTP/1.1\r\n\r\n"));
        std::string wire = serializeReply(preflight);
        if (preflight.status != 200 || wire.find("Access-Control-Allow-Origin: *") == std::string::npos
            || wire.find("Access-Control-Allow-Methods: GET, POST, OPTIONS") == std::string::npos) {
            std::cerr << "[FAIL] CORS preflight headers missing\n";
            ++failures;
        }

        if (server.handle(raw("GET /../etc/passwd HTTP/1.1\r\n\r\n")).status != 403) {
            std::cerr << "[FAIL] Path traversal not rejected\n";
            ++failures;
        }

        std::string zoneBody = "{\"name\":\"Nowhere\",\"level\":30}";
        HttpReply missingZone = server.handle(raw("POST /zone/volume HTTP/1.1\r\nContent-Length: "
                                                  + std::to_string(zoneBody.size()) + "\r\n\r\n" + zoneBody));
        if (missingZone.status != 404 || missingZone.body.find("ZoneNotFound") == std::string::npos) {
            std::cerr << "[FAIL] Zone volume on unknown zone: " << missingZone.status << "\n";
            ++failures;
        }

        // Out-of-range levels are rejected before they can wrap into 0..100
        std::string hugeLevel = "{\"name\":\"Z\",\"level\":4294967336}";
        HttpReply wrapped = server.handle(raw("POST /zone/volume HTTP/1.1\r\nContent-Length: "
                                              + std::to_string(hugeLevel.size()) + "\r\n\r\n" + hugeLevel));
        if (wrapped.status != 400) {
            std::cerr << "[FAIL] Zone volume 4294967336 should be 400, got " << wrapped.status << "\n";
            ++failures;
        }

        // The device sees the query exactly as sent, minus our own 'device' pair
        HttpReply search = server.handle(raw("GET /api/search?q=a%20b%26c&device=10.0.0.1&page=2 HTTP/1.1\r\n\r\n"));
        if (search.status != 200 || devices->callsTo("10.0.0.1", "/search?q=a%20b%26c&page=2").size() != 1) {
            std::cerr << "[FAIL] Query not forwarded verbatim:";
            for (const auto& c : devices->calls()) std::cerr << " [" << c.path << "]";
            std::cerr << "\n";
            ++failures;
        }
        server.handle(raw("GET /api/presets?device=10.0.0.1 HTTP/1.1\r\n\r\n"));
        if (devices->callsTo("10.0.0.1", "/presets").size() != 1) {
            std::cerr << "[FAIL] Lone device pair left a dangling '?'\n";
            ++failures;
        }

        if (parseHttpRequest("GET /api/info HTTP/1.1\r\nContent-Length: 10\r\n\r\nabc")) {
            std::cerr << "[FAIL] Truncated body accepted\n";
            ++failures;
        }
    }

    // Test 14: a failed rollback is reported next to its cause
    {
        auto devices = std::make_shared<FakeDevices>();
        devices->on("10.0.0.1", [](const std::string& method, const std::string& path, const std::string&) {
            if (method == "GET" && path == "/info") return answer(200, infoXml("M1", "Master"));
            if (path == "/setZone") return answer(500, "<errors><error name=\"ZONE_ERROR\"/></errors>");
            if (path == "/removeZoneSlave") return answer(503, "<errors><error name=\"BUSY\"/></errors>");
            return answer(200, "<status>/ok</status>");
        });
        devices->on("10.0.0.2", speaker("A1", "Kitchen"));
        CommandForwarder forwarder(devices);
        ZoneCoordinator zones(forwarder, 3, std::chrono::milliseconds(10));

        ZoneResult r = zones.create("Attic", endpoint("10.0.0.1"), {endpoint("10.0.0.2")});
        if (r.error.kind != ProxyErrorKind::ZoneCreationFailed) {
            std::cerr << "[FAIL] Expected ZoneCreationFailed, got " << describe(r.error) << "\n";
            ++failures;
        }
        if (r.cause.kind != ProxyErrorKind::DeviceError || r.cause.statusCode != 500) {
            std::cerr << "[FAIL] Cause should be the 500 from /setZone: " << describe(r.cause) << "\n";
            ++failures;
        }
        if (r.rollbackError.kind != ProxyErrorKind::DeviceError || r.rollbackError.statusCode != 503
            || r.rollbackError.body.find("BUSY") == std::string::npos) {
            std::cerr << "[FAIL] Rollback error should be the 503 from /removeZoneSlave: " << describe(r.rollbackError) << "\n";
            ++failures;
        }
        if (r.error.message.find("HTTP 500") == std::string::npos || r.error.message.find("HTTP 503") == std::string::npos) {
            std::cerr << "[FAIL] Message should carry both failures: " << r.error.message << "\n";
            ++failures;
        }
        if (zones.state("Attic") != ZoneState::Absent || zones.trackedZones() != 0) {
            std::cerr << "[FAIL] Failed zone left behind in the table\n";
            ++failures;
        }
    }

    // Test 15: a member that joins late is picked up by the re-read
    {
        auto getZoneReads = std::make_shared<std::atomic<int>>(0);
        auto devices = std::make_shared<FakeDevices>();
        devices->on("10.0.0.1", [getZoneReads](const std::string& method, const std::string& path, const std::string&) {
            if (method == "GET" && path == "/info") return answer(200, infoXml("M1", "Master"));
            if (method == "GET" && path == "/getZone") {
                if (++*getZoneReads == 1) {
                    return answer(200, "<zone master=\"M1\"><member ipaddress=\"10.0.0.2\">A1</member></zone>");
                }
                return answer(200, "<zone master=\"M1\"><member ipaddress=\"10.0.0.2\">A1</member>"
                                   "<member ipaddress=\"10.0.0.3\">B1</member></zone>");
            }
            return answer(200, "<status>/ok</status>");
        });
        devices->on("10.0.0.2", speaker("A1", "Kitchen"));
        devices->on("10.0.0.3", speaker("B1", "Patio"));
        CommandForwarder forwarder(devices);
        ZoneCoordinator zones(forwarder, 3, std::chrono::milliseconds(10));

        ZoneResult r = zones.create("Garden", endpoint("10.0.0.1"), {endpoint("10.0.0.2"), endpoint("10.0.0.3")});
        if (!r.ok() || getZoneReads->load() != 2 || !devices->callsTo("10.0.0.1", "/removeZoneSlave").empty()) {
            std::cerr << "[FAIL] Late join rolled back: " << describe(r.error) << " after "
                      << getZoneReads->load() << " reads\n";
            ++failures;
        }
    }

    // Test 16: unreachable devices during zone operations
    {
        const std::string fullZone = "<zone master=\"M1\"><member ipaddress=\"10.0.0.2\">A1</member>"
                                     "<member ipaddress=\"10.0.0.3\">B1</member></zone>";
        auto devices = std::make_shared<FakeDevices>();
        devices->on("10.0.0.1", master("M1", fullZone));
        devices->on("10.0.0.2", speaker("A1", "Kitchen"));
        devices->on("10.0.0.3", speaker("B1", "Patio"));
        devices->on("10.0.0.4", speaker("C1", "Garage"));
        CommandForwarder forwarder(devices);
        ZoneCoordinator zones(forwarder, 3, std::chrono::milliseconds(10));

        if (!zones.create("Home", endpoint("10.0.0.1"), {endpoint("10.0.0.2"), endpoint("10.0.0.3")}).ok()) {
            std::cerr << "[FAIL] Zone creation failed\n";
            ++failures;
        }

        // Member B stops answering: reported, zone kept
        devices->drop("10.0.0.3");
        ZoneVolumeResult memberDown = zones.volume("Home", 25);
        if (memberDown.error.kind != ProxyErrorKind::PartialZoneOperationFailure || memberDown.failed.size() != 1
            || memberDown.failed[0].first.address != "10.0.0.3"
            || memberDown.failed[0].second.kind != ProxyErrorKind::DeviceUnreachable
            || memberDown.succeeded.size() != 2 || zones.state("Home") != ZoneState::Active) {
            std::cerr << "[FAIL] Unreachable member should fail alone: " << memberDown.failed.size() << " failed\n";
            ++failures;
        }

        // Master stops answering: the zone is gone
        devices->drop("10.0.0.1");
        ZoneVolumeResult masterDown = zones.volume("Home", 25);
        bool masterFailed = false;
        for (const auto& f : masterDown.failed) {
            if (f.first.address == "10.0.0.1" && f.second.kind == ProxyErrorKind::DeviceUnreachable) masterFailed = true;
        }
        if (!masterFailed || zones.state("Home") != ZoneState::Absent || zones.trackedZones() != 0) {
            std::cerr << "[FAIL] Unreachable master should dissolve the zone\n";
            ++failures;
        }

        // Same for a membership change against a dead master
        devices->on("10.0.0.1", master("M1", fullZone));
        devices->on("10.0.0.3", speaker("B1", "Patio"));
        if (!zones.create("Home", endpoint("10.0.0.1"), {endpoint("10.0.0.2"), endpoint("10.0.0.3")}).ok()) {
            std::cerr << "[FAIL] Zone could not be re-formed\n";
            ++failures;
        }
        devices->drop("10.0.0.1");
        ZoneResult add = zones.addMember("Home", endpoint("10.0.0.4"));
        if (add.error.kind != ProxyErrorKind::DeviceUnreachable || add.zone || zones.state("Home") != ZoneState::Absent) {
            std::cerr << "[FAIL] addMember against a dead master should dissolve the zone\n";
            ++failures;
        }
        devices->on("10.0.0.4", master("C1", "<zone master=\"C1\"><member ipaddress=\"10.0.0.2\">A1</member></zone>"));
        ZoneResult shed = zones.create("Shed", endpoint("10.0.0.4"), {endpoint("10.0.0.2")});
        if (!shed.ok() || zones.trackedZones() != 1) {
            std::cerr << "[FAIL] Devices of a dissolved zone stayed reserved: " << describe(shed.error) << "\n";
            ++failures;
        }
    }

    // Test 17: bounded fan-out
    {
        std::mutex mutex;
        int active = 0;
        int peak = 0;
        std::vector<int> runs(20, 0);
        parallelFor(runs.size(), 4, [&](size_t i) {
            {
                std::lock_guard<std::mutex> lock(mutex);
                peak = std::max(peak, ++active);
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            std::lock_guard<std::mutex> lock(mutex);
            --active;
            ++runs[i];
        });
        bool eachOnce = true;
        for (int r : runs) if (r != 1) eachOnce = false;
        if (!eachOnce || peak > 4 || peak < 1) {
            std::cerr << "[FAIL] parallelFor ran with peak " << peak << " workers\n";
            ++failures;
        }
    }

    // Test 18: loopback sockets: port check and the connection cap
    {
        int boundPort = 0;
        std::string error;
        int listener = openListener(0, 4, boundPort, error);
        if (listener < 0 || boundPort <= 0) {
            std::cerr << "[FAIL] openListener: " << error << "\n";
            ++failures;
        } else {
            if (!probeTcpPort("127.0.0.1", boundPort, 500)) {
                std::cerr << "[FAIL] Listening port reported closed\n";
                ++failures;
            }
            ::close(listener);
            if (probeTcpPort("127.0.0.1", boundPort, 500)) {
                std::cerr << "[FAIL] Closed port reported open\n";
                ++failures;
            }
        }

        auto devices = std::make_shared<FakeDevices>();
        ProxyConfig cfg;
        cfg.listenPort = 0;
        cfg.maxConnections = 1;
        cfg.deviceAddresses = {"10.0.0.1"};
        DeviceRegistry registry;
        auto none = std::make_shared<int>(0);
        AddressResolver resolver(cfg.deviceAddresses,
                                 std::make_unique<FakeStrategy>("multicast", std::vector<DeviceEndpoint>{}, none),
                                 std::make_unique<FakeStrategy>("scan", std::vector<DeviceEndpoint>{}, none),
                                 registry);
        CommandForwarder forwarder(devices);
        ZoneCoordinator zones(forwarder);
        ProxyServer server(cfg, resolver, forwarder, zones);

        if (!server.start()) {
            std::cerr << "[FAIL] Server did not start: " << server.getLastError() << "\n";
            ++failures;
        } else {
            // First client holds the only slot without sending anything
            int held = connectLoopback(server.port());
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
            int second = connectLoopback(server.port());
            std::string reply = second >= 0 ? readUntilClosed(second) : "";
            if (held < 0 || reply.find("HTTP/1.1 503") != 0) {
                std::cerr << "[FAIL] Connection over the cap should get 503, got: " << reply.substr(0, 40) << "\n";
                ++failures;
            }
            if (second >= 0) ::close(second);
            if (held >= 0) ::close(held);

            // With the slot free again, requests are served
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
            int third = connectLoopback(server.port());
            std::string zonesReply;
            if (third >= 0) {
                std::string req = "GET /zones HTTP/1.1\r\nHost: localhost\r\n\r\n";
                sendAll(third, req);
                zonesReply = readUntilClosed(third);
                ::close(third);
            }
            if (zonesReply.find("HTTP/1.1 200") != 0 || zonesReply.find("[]") == std::string::npos) {
                std::cerr << "[FAIL] Request after the cap cleared: " << zonesReply.substr(0, 40) << "\n";
                ++failures;
            }
            server.stop();
        }
    }

    if (failures == 0) {
        std::cout << "ALL TESTS PASS" << std::endl;
        return 0;
    } else {
        std::cout << failures << " TEST(S) FAILED" << std::endl;
        return 1;
    }
}
