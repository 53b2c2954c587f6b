// ProxyServer.cpp - Serves the UI and relays its requests to SoundTouch devices
#include "ProxyServer.hpp"

#include "AddressResolver.hpp"
#include "CommandForwarder.hpp"
#include "JsonUtil.hpp"
#include "NetUtil.hpp"
#include "ZoneCoordinator.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include <errno.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

constexpr size_t kMaxRequestBytes = 1024 * 1024;

// Polled by the UI every second
bool isPollingPath(const std::string& path) {
    return path == "/api/now_playing" || path == "/api/volume";
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string contentTypeFor(const std::string& path) {
    auto dot = path.rfind('.');
    std::string ext = dot == std::string::npos ? "" : lower(path.substr(dot));
    if (ext == ".html" || ext == ".htm") return "text/html; charset=utf-8";
    if (ext == ".js")   return "application/javascript";
    if (ext == ".css")  return "text/css";
    if (ext == ".json") return "application/json";
    if (ext == ".ico")  return "image/x-icon";
    if (ext == ".png")  return "image/png";
    if (ext == ".svg")  return "image/svg+xml";
    if (ext == ".xml")  return "application/xml";
    return "application/octet-stream";
}

HttpReply jsonReply(int status, std::string body) {
    HttpReply reply;
    reply.status = status;
    reply.body = std::move(body);
    return reply;
}

HttpReply messageReply(int status, const std::string& error, const std::string& message) {
    return jsonReply(status, "{\"error\":" + jsonQuote(error) + ",\"message\":" + jsonQuote(message) + "}");
}

// Raw query minus every 'name' pair; encoding and order are kept.
std::string withoutQueryParam(const std::string& query, const std::string& name) {
    std::string out;
    size_t start = 0;
    while (start <= query.size()) {
        size_t amp = query.find('&', start);
        std::string pair = query.substr(start, amp == std::string::npos ? std::string::npos : amp - start);
        std::string key = urlDecode(pair.substr(0, pair.find('=')));
        if (!pair.empty() && key != name) {
            if (!out.empty()) out += "&";
            out += pair;
        }
        if (amp == std::string::npos) break;
        start = amp + 1;
    }
    return out;
}

} // anonymous namespace

// ============================================================================
// HTTP helpers
// ============================================================================

std::string urlDecode(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '%' && i + 2 < value.size() && std::isxdigit(static_cast<unsigned char>(value[i + 1]))
            && std::isxdigit(static_cast<unsigned char>(value[i + 2]))) {
            out.push_back(static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        } else if (c == '+') {
            out.push_back(' ');
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::map<std::string, std::string> HttpRequest::queryParams() const {
    std::map<std::string, std::string> params;
    std::istringstream in(query);
    std::string pair;
    while (std::getline(in, pair, '&')) {
        if (pair.empty()) continue;
        auto eq = pair.find('=');
        if (eq == std::string::npos) params[urlDecode(pair)] = "";
        else params[urlDecode(pair.substr(0, eq))] = urlDecode(pair.substr(eq + 1));
    }
    return params;
}

std::string HttpRequest::queryParam(const std::string& name) const {
    auto params = queryParams();
    auto it = params.find(name);
    return it == params.end() ? "" : it->second;
}

std::optional<HttpRequest> parseHttpRequest(const std::string& raw) {
    size_t headerEnd = raw.find("\r\n\r\n");
    if (headerEnd == std::string::npos) return std::nullopt;

    std::istringstream head(raw.substr(0, headerEnd));
    std::string requestLine;
    if (!std::getline(head, requestLine)) return std::nullopt;
    if (!requestLine.empty() && requestLine.back() == '\r') requestLine.pop_back();

    // Format: GET /api/volume?device=192.168.1.20 HTTP/1.1
    std::istringstream rl(requestLine);
    HttpRequest req;
    std::string target, version;
    if (!(rl >> req.method >> target >> version)) return std::nullopt;
    if (version.rfind("HTTP/", 0) != 0 || target.empty() || target[0] != '/') return std::nullopt;

    auto q = target.find('?');
    req.rawPath = target.substr(0, q);
    req.path = urlDecode(req.rawPath);
    if (q != std::string::npos) req.query = target.substr(q + 1);

    std::string line;
    while (std::getline(head, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string value = line.substr(colon + 1);
        size_t start = value.find_first_not_of(" \t");
        req.headers[lower(line.substr(0, colon))] = start == std::string::npos ? "" : value.substr(start);
    }

    size_t contentLength = 0;
    auto cl = req.headers.find("content-length");
    if (cl != req.headers.end()) {
        try {
            contentLength = static_cast<size_t>(std::stoul(cl->second));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    std::string rest = raw.substr(headerEnd + 4);
    if (rest.size() < contentLength) return std::nullopt;
    req.body = rest.substr(0, contentLength);
    return req;
}

const char* reasonPhrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 204: return "No Content";
        case 207: return "Multi-Status";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        default:  return "Unknown";
    }
}

std::string serializeReply(const HttpReply& reply) {
    std::ostringstream out;
    out << "HTTP/1.1 " << reply.status << " " << reasonPhrase(reply.status) << "\r\n";
    out << "Content-Type: " << reply.contentType << "\r\n";
    out << "Access-Control-Allow-Origin: *\r\n";
    for (const auto& h : reply.extraHeaders) {
        out << h.first << ": " << h.second << "\r\n";
    }
    out << "Content-Length: " << reply.body.size() << "\r\n";
    out << "Connection: close\r\n\r\n";
    out << reply.body;
    return out.str();
}

// ============================================================================
// Routing
// ============================================================================

ProxyServer::ProxyServer(const ProxyConfig& config, AddressResolver& resolver,
                         const CommandForwarder& forwarder, ZoneCoordinator& zones)
    : m_config(config), m_resolver(resolver), m_forwarder(forwarder), m_zones(zones) {
    if (!config.deviceAddresses.empty()) {
        m_currentDevice = config.deviceAddresses.front();
    }
}

ProxyServer::~ProxyServer() {
    stop();
}

std::string ProxyServer::currentDevice() const {
    std::lock_guard<std::mutex> lock(m_deviceMutex);
    return m_currentDevice;
}

void ProxyServer::setCurrentDevice(const std::string& address) {
    std::lock_guard<std::mutex> lock(m_deviceMutex);
    m_currentDevice = address;
}

HttpReply ProxyServer::handle(const HttpRequest& request) {
    const std::string& path = request.path;

    if (request.method == "OPTIONS") return preflight();

    if (request.method == "GET") {
        if (path == "/discover") return handleDiscover();
        if (path == "/current-device") return handleCurrentDevice();
        if (path == "/zones") return handleZones();
        if (path.rfind("/api/", 0) == 0) return handleApi(request);
        if (path.rfind("/action/", 0) == 0) return handleAction(request);
        return serveStatic(request);
    }

    if (request.method == "POST") {
        if (path == "/set-device") return handleSetDevice(request);
        if (path.rfind("/api/", 0) == 0) return handleApi(request);
        if (path.rfind("/action/", 0) == 0) return handleAction(request);
        if (path.rfind("/zone/", 0) == 0) return handleZone(request);
        return messageReply(404, "NotFound", "No route for POST " + path);
    }

    return messageReply(405, "MethodNotAllowed", request.method + " is not supported");
}

HttpReply ProxyServer::preflight() {
    HttpReply reply;
    reply.contentType = "text/plain";
    reply.extraHeaders.emplace_back("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    reply.extraHeaders.emplace_back("Access-Control-Allow-Headers", "Content-Type");
    return reply;
}

HttpReply ProxyServer::errorReply(const ProxyError& error) const {
    if (error.kind == ProxyErrorKind::DeviceError && error.statusCode > 0) {
        // Device-native error text goes back untouched
        HttpReply reply;
        reply.status = error.statusCode;
        reply.contentType = "application/xml";
        reply.body = error.body;
        return reply;
    }
    return messageReply(httpStatusFor(error), errorKindName(error.kind), error.message);
}

std::string ProxyServer::devicesJson(const DiscoveryResult* result) const {
    std::string json = "{";
    if (result) {
        bool first = true;
        for (const auto& ep : result->endpoints) {
            if (!first) json += ",";
            first = false;
            json += jsonQuote(ep.address) + ":{"
                  + "\"name\":" + jsonQuote(ep.displayName.empty() ? ep.address : ep.displayName)
                  + ",\"type\":" + jsonQuote(ep.type.empty() ? "Unknown" : ep.type)
                  + ",\"deviceId\":" + jsonQuote(ep.identifier.empty() ? "Unknown" : ep.identifier)
                  + ",\"ip\":" + jsonQuote(ep.address) + "}";
        }
    }
    json += "}";
    return json;
}

std::string ProxyServer::zoneJson(const Zone& zone) const {
    std::string json = "{\"name\":" + jsonQuote(zone.name) + ",\"master\":" + jsonQuote(zone.master.address)
                     + ",\"members\":[";
    for (size_t i = 0; i < zone.members.size(); ++i) {
        if (i) json += ",";
        json += jsonQuote(zone.members[i].address);
    }
    json += "]}";
    return json;
}

HttpReply ProxyServer::handleDiscover() {
    std::cout << "[ProxyServer] Starting device discovery..." << std::endl;
    ResolveResult r = m_resolver.refresh();
    if (!r.ok()) {
        return errorReply(r.error);
    }
    std::cout << "[ProxyServer] Found " << r.result->endpoints.size() << " device(s) via "
              << discoverySourceName(r.result->source) << std::endl;
    return jsonReply(200, devicesJson(r.result.get()));
}

HttpReply ProxyServer::handleCurrentDevice() {
    std::string current = currentDevice();
    auto snapshot = m_resolver.registry().current();
    std::string json = "{\"ip\":" + (current.empty() ? std::string("null") : jsonQuote(current))
                     + ",\"devices\":" + devicesJson(snapshot.get()) + "}";
    return jsonReply(200, json);
}

HttpReply ProxyServer::handleSetDevice(const HttpRequest& request) {
    std::string ip = extractJsonString(request.body, "ip");
    if (ip.empty()) {
        return messageReply(400, "InvalidRequest", "Body must be {\"ip\": \"<device address>\"}");
    }
    setCurrentDevice(ip);
    std::cout << "[ProxyServer] Device set to: " << ip << std::endl;
    return jsonReply(200, "{\"success\":true,\"ip\":" + jsonQuote(ip) + "}");
}

bool ProxyServer::targetDevice(const HttpRequest& request, std::string& address, ProxyError& error) {
    address = request.queryParam("device");
    if (!address.empty()) return true;

    address = currentDevice();
    if (!address.empty()) return true;

    ResolveResult r = m_resolver.resolve();
    if (!r.ok()) {
        error = r.error;
        return false;
    }
    address = r.result->endpoints.front().address;
    setCurrentDevice(address);
    std::cout << "[ProxyServer] No device selected; using " << address << std::endl;
    return true;
}

HttpReply ProxyServer::handleApi(const HttpRequest& request) {
    std::string address;
    ProxyError error;
    if (!targetDevice(request, address, error)) {
        return errorReply(error);
    }

    // Everything after /api goes to the device as sent; only 'device' is ours
    ControlRequest control;
    control.method = request.method;
    control.path = request.rawPath.substr(4);
    control.body = request.body;
    std::string forwardedQuery = withoutQueryParam(request.query, "device");
    if (!forwardedQuery.empty()) {
        control.path += "?" + forwardedQuery;
    }

    ForwardResult result = m_forwarder.forward(m_resolver.endpointFor(address), control);
    if (!result.ok()) {
        return errorReply(result.error);
    }
    HttpReply reply;
    reply.status = static_cast<int>(result.response.statusCode);
    reply.contentType = "application/xml";
    reply.body = std::move(result.response.body);
    return reply;
}

HttpReply ProxyServer::handleAction(const HttpRequest& request) {
    std::string action = request.path.substr(std::string("/action/").size());
    std::string address;
    ProxyError error;
    if (!targetDevice(request, address, error)) {
        return errorReply(error);
    }

    auto params = request.queryParams();
    for (const char* key : {"level", "preset", "source", "sourceAccount"}) {
        if (params.count(key)) continue;
        if (auto n = extractJsonInt(request.body, key)) params[key] = std::to_string(*n);
        else if (auto s = extractJsonString(request.body, key); !s.empty()) params[key] = s;
    }

    ForwardResult result = m_forwarder.perform(m_resolver.endpointFor(address), action, params);
    if (!result.ok()) {
        return errorReply(result.error);
    }
    HttpReply reply;
    reply.status = static_cast<int>(result.response.statusCode);
    reply.contentType = "application/xml";
    reply.body = std::move(result.response.body);
    return reply;
}

HttpReply ProxyServer::handleZones() {
    std::string json = "[";
    auto zones = m_zones.zones();
    for (size_t i = 0; i < zones.size(); ++i) {
        if (i) json += ",";
        json += zoneJson(zones[i]);
    }
    json += "]";
    return jsonReply(200, json);
}

HttpReply ProxyServer::handleZone(const HttpRequest& request) {
    const std::string op = request.path.substr(std::string("/zone/").size());
    const std::string name = extractJsonString(request.body, "name");
    if (name.empty()) {
        return messageReply(400, "InvalidRequest", "Zone name is required");
    }

    if (op == "volume") {
        auto level = extractJsonInt(request.body, "level");
        if (!level) {
            return messageReply(400, "InvalidRequest", "Volume level is required");
        }
        if (*level < 0 || *level > 100) {
            return messageReply(400, "InvalidRequest", "Volume must be between 0 and 100");
        }
        ZoneVolumeResult r = m_zones.volume(name, static_cast<int>(*level));
        if (r.error.kind == ProxyErrorKind::ZoneNotFound || r.error.kind == ProxyErrorKind::InvalidRequest) {
            return errorReply(r.error);
        }
        std::string json = "{\"succeeded\":[";
        for (size_t i = 0; i < r.succeeded.size(); ++i) {
            if (i) json += ",";
            json += jsonQuote(r.succeeded[i].address);
        }
        json += "],\"failed\":[";
        for (size_t i = 0; i < r.failed.size(); ++i) {
            if (i) json += ",";
            json += "{\"ip\":" + jsonQuote(r.failed[i].first.address)
                  + ",\"error\":" + jsonQuote(errorKindName(r.failed[i].second.kind))
                  + ",\"message\":" + jsonQuote(r.failed[i].second.message) + "}";
        }
        json += "]}";
        return jsonReply(httpStatusFor(r.error), json);
    }

    ZoneResult r;
    if (op == "create") {
        std::string master = extractJsonString(request.body, "master");
        auto memberAddresses = extractJsonStringArray(request.body, "members");
        if (master.empty() || memberAddresses.empty()) {
            return messageReply(400, "InvalidRequest", "Zone needs a master and at least one member");
        }
        std::vector<DeviceEndpoint> members;
        for (const auto& a : memberAddresses) members.push_back(m_resolver.endpointFor(a));
        r = m_zones.create(name, m_resolver.endpointFor(master), members);
    } else if (op == "add" || op == "remove-member") {
        std::string member = extractJsonString(request.body, "member");
        if (member.empty()) {
            return messageReply(400, "InvalidRequest", "Member address is required");
        }
        r = op == "add" ? m_zones.addMember(name, m_resolver.endpointFor(member))
                        : m_zones.removeMember(name, m_resolver.endpointFor(member));
    } else if (op == "remove") {
        r = m_zones.remove(name);
    } else {
        return messageReply(404, "NotFound", "Unknown zone operation: " + op);
    }

    if (r.ok()) {
        std::string json = "{\"success\":true,\"state\":" + jsonQuote(zoneStateName(m_zones.state(name)));
        if (r.zone) json += ",\"zone\":" + zoneJson(*r.zone);
        json += "}";
        return jsonReply(200, json);
    }

    std::string json = "{\"error\":" + jsonQuote(errorKindName(r.error.kind))
                     + ",\"message\":" + jsonQuote(r.error.message);
    if (r.error.kind == ProxyErrorKind::DeviceError) {
        json += ",\"status\":" + std::to_string(r.error.statusCode) + ",\"body\":" + jsonQuote(r.error.body);
    }
    if (r.error.kind == ProxyErrorKind::ZoneCreationFailed) {
        json += ",\"partialMembers\":[";
        for (size_t i = 0; i < r.partialMembers.size(); ++i) {
            if (i) json += ",";
            json += jsonQuote(r.partialMembers[i].address);
        }
        json += "],\"cause\":" + jsonQuote(describe(r.cause));
        if (!r.rollbackError.ok()) json += ",\"rollbackError\":" + jsonQuote(describe(r.rollbackError));
    }
    json += ",\"state\":" + jsonQuote(zoneStateName(m_zones.state(name))) + "}";
    int status = r.error.kind == ProxyErrorKind::DeviceError ? 502 : httpStatusFor(r.error);
    return jsonReply(status, json);
}

HttpReply ProxyServer::serveStatic(const HttpRequest& request) {
    std::string path = request.path == "/" ? "/soundtouch-controller-proxy.html" : request.path;
    if (path.find("..") != std::string::npos) {
        return messageReply(403, "Forbidden", "Path traversal is not allowed");
    }
    std::string file = m_config.webRoot + path;
    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        return messageReply(404, "NotFound", "File not found: " + path);
    }
    std::ostringstream content;
    content << in.rdbuf();
    HttpReply reply;
    reply.contentType = contentTypeFor(path);
    reply.body = content.str();
    return reply;
}

// ============================================================================
// Socket server
// ============================================================================

bool ProxyServer::start() {
    if (m_running) {
        return true;
    }

    m_serverFd = openListener(m_config.listenPort, 16, m_port, m_lastError);
    if (m_serverFd < 0) {
        return false;
    }

    m_running = true;
    try {
        m_serverThread = std::make_unique<std::thread>(&ProxyServer::serverThread, this);
    } catch (const std::system_error& e) {
        m_running = false;
        m_lastError = std::string("Failed to start server thread: ") + e.what();
        close(m_serverFd);
        m_serverFd = -1;
        return false;
    }

    std::cout << "[ProxyServer] Listening on port " << m_port << std::endl;
    return true;
}

void ProxyServer::stop() {
    if (!m_running) {
        return;
    }

    m_running = false;

    if (m_serverThread && m_serverThread->joinable()) {
        m_serverThread->join();
    }
    m_serverThread.reset();

    if (m_serverFd >= 0) {
        close(m_serverFd);
        m_serverFd = -1;
    }

    std::unique_lock<std::mutex> lock(m_connMutex);
    m_connCv.wait(lock, [this]() { return m_activeConnections == 0; });
    std::cout << "[ProxyServer] Stopped" << std::endl;
}

void ProxyServer::serverThread() {
    while (m_running) {
        // Wake up once a second to notice stop()
        int ready = waitReadable(m_serverFd, 1000);
        if (ready < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[ProxyServer] Waiting for connections failed: " << std::strerror(errno) << std::endl;
            break;
        }
        if (ready == 0 || !m_running) {
            continue;
        }

        int clientFd = accept(m_serverFd, nullptr, nullptr);
        if (clientFd < 0) {
            if (m_running) {
                std::cerr << "[ProxyServer] Failed to accept connection: " << std::strerror(errno) << std::endl;
            }
            continue;
        }
        dispatch(clientFd);
    }
}

void ProxyServer::dispatch(int clientFd) {
    bool admitted = false;
    {
        std::lock_guard<std::mutex> lock(m_connMutex);
        if (m_activeConnections < m_config.maxConnections) {
            ++m_activeConnections;
            admitted = true;
        }
    }
    if (!admitted) {
        refuse(clientFd, "Too many concurrent requests");
        return;
    }

    try {
        std::thread([this, clientFd]() {
            handleConnection(clientFd);
            close(clientFd);
            finishConnection();
        }).detach();
    } catch (const std::system_error& e) {
        std::cerr << "[ProxyServer] Could not start connection thread: " << e.what() << std::endl;
        finishConnection();
        refuse(clientFd, "Server is out of threads");
    }
}

void ProxyServer::finishConnection() {
    {
        std::lock_guard<std::mutex> lock(m_connMutex);
        --m_activeConnections;
    }
    m_connCv.notify_all();
}

void ProxyServer::refuse(int clientFd, const std::string& reason) {
    std::cerr << "[ProxyServer] Refusing connection: " << reason << std::endl;
    // The request itself is never read
    if (!sendAll(clientFd, serializeReply(messageReply(503, "ServiceUnavailable", reason)))) {
        std::cerr << "[ProxyServer] Failed to send 503: " << std::strerror(errno) << std::endl;
    }
    close(clientFd);
}

bool ProxyServer::readRequest(int clientFd, std::string& raw) {
    struct timeval tv{};
    tv.tv_sec = 10;
    setsockopt(clientFd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    char buffer[4096];
    size_t needed = std::string::npos;
    while (raw.size() < kMaxRequestBytes) {
        ssize_t bytesRead = recv(clientFd, buffer, sizeof(buffer), 0);
        if (bytesRead <= 0) return false;
        raw.append(buffer, static_cast<size_t>(bytesRead));

        if (needed == std::string::npos) {
            size_t headerEnd = raw.find("\r\n\r\n");
            if (headerEnd == std::string::npos) continue;
            size_t contentLength = 0;
            std::string head = lower(raw.substr(0, headerEnd));
            size_t cl = head.find("\r\ncontent-length:");
            if (cl != std::string::npos) {
                try {
                    contentLength = static_cast<size_t>(std::stoul(head.substr(cl + 17)));
                } catch (const std::exception&) {
                    return false;
                }
            }
            needed = headerEnd + 4 + contentLength;
        }
        if (raw.size() >= needed) return true;
    }
    return false;
}

void ProxyServer::handleConnection(int clientFd) {
    std::string raw;
    HttpReply reply;
    std::string label = "(unreadable request)";

    if (!readRequest(clientFd, raw)) {
        reply = messageReply(400, "BadRequest", "Incomplete or oversized request");
    } else if (auto request = parseHttpRequest(raw)) {
        label = request->method + " " + request->path;
        reply = handle(*request);
        if (!isPollingPath(request->path)) {
            std::cout << "[ProxyServer] " << label << " -> " << reply.status << std::endl;
        }
    } else {
        reply = messageReply(400, "BadRequest", "Malformed HTTP request");
    }

    if (!sendAll(clientFd, serializeReply(reply))) {
        std::cerr << "[ProxyServer] Failed to send reply for " << label << ": " << std::strerror(errno) << std::endl;
    }
}
