#include "DiscoveryProbe.hpp"

#include "DeviceHttpClient.hpp"
#include "NetUtil.hpp"
#include "ParallelFor.hpp"
#include "SoundTouchXml.hpp"

#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <thread>

#include <arpa/inet.h>
#include <errno.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace std::chrono;

namespace {

bool verboseDiscovery() {
    return std::getenv("SOUNDTOUCH_VERBOSE") != nullptr;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

// Header value for "name:" (case-insensitive), trimmed.
std::string headerValue(const std::string& line, const std::string& name) {
    if (line.size() <= name.size() || lower(line.substr(0, name.size())) != name || line[name.size()] != ':') {
        return "";
    }
    std::string value = line.substr(name.size() + 1);
    size_t start = value.find_first_not_of(" \t");
    size_t end = value.find_last_not_of(" \t\r");
    if (start == std::string::npos) return "";
    return value.substr(start, end - start + 1);
}

} // anonymous namespace

DeviceInfoFetcher makeInfoFetcher(std::shared_ptr<DeviceHttpClient> client, long timeoutMs) {
    return [client, timeoutMs](const std::string& address) -> std::optional<DeviceEndpoint> {
        DeviceEndpoint ep;
        ep.address = address;
        HttpOutcome outcome = client->request("GET", ep.baseUrl() + "/info", "", timeoutMs);
        if (!outcome.transportOk || outcome.response.statusCode < 200 || outcome.response.statusCode >= 300) {
            return std::nullopt;
        }
        auto info = SoundTouch::parseDeviceInfo(outcome.response.body);
        if (!info) return std::nullopt;
        ep.identifier = info->deviceId;
        ep.displayName = info->name;
        ep.type = info->type;
        return ep;
    };
}

std::string buildSsdpSearch(const std::string& searchTarget) {
    std::ostringstream msg;
    msg << "M-SEARCH * HTTP/1.1\r\n"
        << "HOST: " << kSsdpAddress << ":" << kSsdpPort << "\r\n"
        << "MAN: \"ssdp:discover\"\r\n"
        << "MX: 2\r\n"
        << "ST: " << searchTarget << "\r\n"
        << "\r\n";
    return msg.str();
}

std::optional<SsdpReply> parseSsdpReply(const std::string& datagram) {
    std::istringstream lines(datagram);
    std::string line;
    if (!std::getline(lines, line)) return std::nullopt;
    std::string status = lower(line);
    if (status.rfind("http/1.1 200", 0) != 0 && status.rfind("http/1.0 200", 0) != 0) {
        return std::nullopt;
    }
    // Any UPnP renderer answers the search; only keep SoundTouch speakers
    if (datagram.find("Bose") == std::string::npos && datagram.find("SoundTouch") == std::string::npos) {
        return std::nullopt;
    }

    SsdpReply reply;
    while (std::getline(lines, line)) {
        std::string v;
        if (!(v = headerValue(line, "location")).empty()) reply.location = v;
        else if (!(v = headerValue(line, "server")).empty()) reply.server = v;
        else if (!(v = headerValue(line, "st")).empty()) reply.searchTarget = v;
        else if (!(v = headerValue(line, "usn")).empty()) reply.usn = v;
    }
    return reply;
}

bool probeTcpPort(const std::string& host, int port, int timeoutMs) {
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    if (getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res) != 0) {
        return false;
    }

    bool reachable = false;
    for (addrinfo* rp = res; rp && !reachable; rp = rp->ai_next) {
        int fd = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (fd < 0) continue;
        reachable = connectWithin(fd, rp->ai_addr, rp->ai_addrlen, timeoutMs);
        ::close(fd);
    }
    freeaddrinfo(res);
    return reachable;
}

std::optional<std::string> localIPv4Address() {
    // connect() on a UDP socket only selects a route; nothing is sent
    int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) return std::nullopt;

    sockaddr_in remote{};
    remote.sin_family = AF_INET;
    remote.sin_port = htons(80);
    inet_pton(AF_INET, "8.8.8.8", &remote.sin_addr);

    std::optional<std::string> result;
    if (::connect(fd, reinterpret_cast<sockaddr*>(&remote), sizeof(remote)) == 0) {
        sockaddr_in local{};
        socklen_t len = sizeof(local);
        if (::getsockname(fd, reinterpret_cast<sockaddr*>(&local), &len) == 0) {
            char buf[INET_ADDRSTRLEN];
            if (inet_ntop(AF_INET, &local.sin_addr, buf, sizeof(buf))) {
                result = std::string(buf);
            }
        }
    }
    ::close(fd);
    return result;
}

std::vector<std::string> hostsInRange(const std::string& cidr) {
    std::vector<std::string> hosts;
    size_t slash = cidr.find('/');
    std::string base = cidr.substr(0, slash);
    int prefix = 24;
    if (slash != std::string::npos) {
        try {
            prefix = std::stoi(cidr.substr(slash + 1));
        } catch (const std::exception&) {
            return hosts;
        }
    }
    if (prefix < 16 || prefix > 30) return hosts;

    in_addr addr{};
    if (inet_pton(AF_INET, base.c_str(), &addr) != 1) return hosts;

    uint32_t ip = ntohl(addr.s_addr);
    uint32_t mask = 0xFFFFFFFFu << (32 - prefix);
    uint32_t network = ip & mask;
    uint32_t broadcast = network | ~mask;

    hosts.reserve(broadcast - network - 1);
    for (uint32_t h = network + 1; h < broadcast; ++h) {
        in_addr a{};
        a.s_addr = htonl(h);
        char buf[INET_ADDRSTRLEN];
        if (inet_ntop(AF_INET, &a, buf, sizeof(buf))) {
            hosts.emplace_back(buf);
        }
    }
    return hosts;
}

std::string defaultScanRange() {
    std::string local = localIPv4Address().value_or("192.168.1.1");
    size_t lastDot = local.rfind('.');
    if (lastDot == std::string::npos) return "192.168.1.0/24";
    return local.substr(0, lastDot) + ".0/24";
}

// ============================================================================
// Multicast (SSDP)
// ============================================================================

MulticastProbe::MulticastProbe(DeviceInfoFetcher fetchInfo, int maxLookups)
    : m_fetchInfo(std::move(fetchInfo)), m_maxLookups(std::max(1, maxLookups)) {
}

std::vector<std::string> MulticastProbe::collectResponders(milliseconds window) {
    std::vector<std::string> responders;

    int fd = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (fd < 0) {
        std::cerr << "[Discovery] Failed to create SSDP socket: " << std::strerror(errno) << std::endl;
        return responders;
    }

    int opt = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    unsigned char ttl = 2;
    setsockopt(fd, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl));

    sockaddr_in group{};
    group.sin_family = AF_INET;
    group.sin_port = htons(kSsdpPort);
    inet_pton(AF_INET, kSsdpAddress, &group.sin_addr);

    const std::string search = buildSsdpSearch();
    ssize_t sent = ::sendto(fd, search.data(), search.size(), 0,
                            reinterpret_cast<sockaddr*>(&group), sizeof(group));
    if (sent < 0) {
        std::cerr << "[Discovery] SSDP send failed: " << std::strerror(errno) << std::endl;
        ::close(fd);
        return responders;
    }

    const bool verbose = verboseDiscovery();
    auto deadline = steady_clock::now() + window;
    while (true) {
        auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now()).count();
        if (remaining <= 0) break;

        int ready = waitReadable(fd, static_cast<int>(remaining));
        if (ready < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[Discovery] SSDP wait failed: " << std::strerror(errno) << std::endl;
            break;
        }
        if (ready == 0) break; // window closed

        char buf[4096];
        sockaddr_in from{};
        socklen_t fromLen = sizeof(from);
        ssize_t r = ::recvfrom(fd, buf, sizeof(buf), 0, reinterpret_cast<sockaddr*>(&from), &fromLen);
        if (r <= 0) continue;

        char ip[INET_ADDRSTRLEN];
        if (!inet_ntop(AF_INET, &from.sin_addr, ip, sizeof(ip))) continue;

        auto reply = parseSsdpReply(std::string(buf, static_cast<size_t>(r)));
        if (!reply) {
            if (verbose) {
                std::cout << "[Discovery]   -> Ignoring non-SoundTouch reply from " << ip << std::endl;
            }
            continue;
        }
        if (verbose) {
            std::cout << "[Discovery]   -> SoundTouch reply from " << ip
                      << " (" << (reply->server.empty() ? reply->usn : reply->server) << ")" << std::endl;
        }
        if (std::find(responders.begin(), responders.end(), ip) == responders.end()) {
            responders.emplace_back(ip);
        }
    }

    // Replies still queued on the socket are discarded with it
    ::close(fd);
    return responders;
}

std::vector<DeviceEndpoint> MulticastProbe::probe(milliseconds budget) {
    std::cout << "[Discovery] Sending SSDP M-SEARCH (window " << budget.count() << " ms)..." << std::endl;
    auto responders = collectResponders(budget);

    std::vector<std::optional<DeviceEndpoint>> lookups(responders.size());
    parallelFor(responders.size(), m_maxLookups, [this, &lookups, &responders](size_t i) {
        lookups[i] = m_fetchInfo(responders[i]);
    });

    std::vector<DeviceEndpoint> found;
    for (size_t i = 0; i < lookups.size(); ++i) {
        if (lookups[i]) {
            found.emplace_back(std::move(*lookups[i]));
        } else {
            std::cerr << "[Discovery] " << responders[i] << " answered SSDP but not /info; skipping" << std::endl;
        }
    }
    found = dedupeEndpoints(std::move(found));
    std::cout << "[Discovery] SSDP found " << found.size() << " device(s)" << std::endl;
    return found;
}

// ============================================================================
// Subnet scan
// ============================================================================

namespace {

// Shared between the scan call and its workers. Workers may outlive the call
// when they are abandoned at the deadline, so they hold it by shared_ptr.
struct ScanState {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::string> hosts;
    size_t next{0};
    int activeWorkers{0};
    bool closed{false};
    std::vector<DeviceEndpoint> found;
    steady_clock::time_point deadline;
    SubnetScanProbe::HostProbe hostProbe;
};

void scanWorker(std::shared_ptr<ScanState> state) {
    while (true) {
        std::string host;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->closed || state->next >= state->hosts.size() || steady_clock::now() >= state->deadline) {
                break;
            }
            host = state->hosts[state->next++];
        }

        auto endpoint = state->hostProbe(host);

        std::lock_guard<std::mutex> lock(state->mutex);
        if (endpoint && !state->closed) {
            state->found.emplace_back(std::move(*endpoint));
        }
    }

    {
        std::lock_guard<std::mutex> lock(state->mutex);
        --state->activeWorkers;
    }
    state->cv.notify_all();
}

} // anonymous namespace

SubnetScanProbe::SubnetScanProbe(HostProbe hostProbe, std::string range, int workers)
    : m_hostProbe(std::move(hostProbe)), m_range(std::move(range)), m_workers(std::max(1, workers)) {
}

SubnetScanProbe::HostProbe SubnetScanProbe::makeHostProbe(DeviceInfoFetcher fetchInfo, int connectTimeoutMs) {
    return [fetchInfo, connectTimeoutMs](const std::string& host) -> std::optional<DeviceEndpoint> {
        // Refused or timed out means "not a device", not an error
        if (!probeTcpPort(host, kSoundTouchApiPort, connectTimeoutMs)) return std::nullopt;
        return fetchInfo(host);
    };
}

std::vector<DeviceEndpoint> SubnetScanProbe::probe(milliseconds budget) {
    auto state = std::make_shared<ScanState>();
    if (!m_candidates.empty()) {
        state->hosts = m_candidates;
        std::cout << "[Scan] Scanning " << state->hosts.size() << " configured host(s)..." << std::endl;
    } else {
        std::string range = m_range.empty() ? defaultScanRange() : m_range;
        state->hosts = hostsInRange(range);
        if (state->hosts.empty()) {
            std::cerr << "[Scan] Invalid or unsupported scan range: " << range << std::endl;
            return {};
        }
        std::cout << "[Scan] Scanning network " << range << " for SoundTouch devices..." << std::endl;
    }

    state->deadline = steady_clock::now() + budget;
    state->hostProbe = m_hostProbe;

    int workers = static_cast<int>(std::min<size_t>(static_cast<size_t>(m_workers), state->hosts.size()));
    state->activeWorkers = workers;
    for (int i = 0; i < workers; ++i) {
        try {
            std::thread(scanWorker, state).detach();
        } catch (const std::system_error& e) {
            std::cerr << "[Scan] Started " << i << " of " << workers << " workers: " << e.what() << std::endl;
            std::lock_guard<std::mutex> lock(state->mutex);
            state->activeWorkers -= workers - i;
            break;
        }
    }

    std::vector<DeviceEndpoint> found;
    size_t probed = 0;
    bool finished = false;
    {
        std::unique_lock<std::mutex> lock(state->mutex);
        finished = state->cv.wait_until(lock, state->deadline, [&state]() { return state->activeWorkers == 0; });
        state->closed = true;
        found = state->found;
        probed = state->next;
    }

    if (!finished) {
        std::cerr << "[Scan] Deadline reached after " << probed << "/" << state->hosts.size()
                  << " hosts; abandoning outstanding probes" << std::endl;
    }
    found = dedupeEndpoints(std::move(found));
    std::cout << "[Scan] Found " << found.size() << " device(s)" << std::endl;
    return found;
}
