// ProxyServer.hpp
// Inbound HTTP surface used by the browser UI.
#pragma once

#include "ProxyConfig.hpp"
#include "ProxyError.hpp"

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

class AddressResolver;
class CommandForwarder;
class ZoneCoordinator;
struct DiscoveryResult;
struct Zone;

struct HttpRequest {
    std::string method;
    std::string path;                              // URL-decoded, without query
    std::string rawPath;                           // As received
    std::string query;                             // Raw, without '?'
    std::map<std::string, std::string> headers;    // Lower-case names
    std::string body;

    std::map<std::string, std::string> queryParams() const;
    std::string queryParam(const std::string& name) const;
};

struct HttpReply {
    int status{200};
    std::string contentType{"application/json"};
    std::string body;
    std::vector<std::pair<std::string, std::string>> extraHeaders;
};

// Parses one complete request (head + body). nullopt when malformed.
std::optional<HttpRequest> parseHttpRequest(const std::string& raw);

// Status line, CORS header, Content-Type/Length, body.
std::string serializeReply(const HttpReply& reply);

const char* reasonPhrase(int status);
std::string urlDecode(const std::string& value);

class ProxyServer {
public:
    ProxyServer(const ProxyConfig& config, AddressResolver& resolver,
                const CommandForwarder& forwarder, ZoneCoordinator& zones);
    ~ProxyServer();

    ProxyServer(const ProxyServer&) = delete;
    ProxyServer& operator=(const ProxyServer&) = delete;

    bool start();
    // Stops accepting and waits for in-flight connections to finish.
    void stop();
    bool running() const { return m_running; }
    int port() const { return m_port; }
    const std::string& getLastError() const { return m_lastError; }

    // Routes one request. Public so the routing can be driven without sockets.
    HttpReply handle(const HttpRequest& request);

    std::string currentDevice() const;
    void setCurrentDevice(const std::string& address);

private:
    HttpReply handleDiscover();
    HttpReply handleCurrentDevice();
    HttpReply handleSetDevice(const HttpRequest& request);
    HttpReply handleApi(const HttpRequest& request);
    HttpReply handleAction(const HttpRequest& request);
    HttpReply handleZones();
    HttpReply handleZone(const HttpRequest& request);
    HttpReply serveStatic(const HttpRequest& request);
    HttpReply preflight();

    // Device named in ?device=, else the selected one, else the first resolved.
    bool targetDevice(const HttpRequest& request, std::string& address, ProxyError& error);

    std::string devicesJson(const DiscoveryResult* result) const;
    std::string zoneJson(const Zone& zone) const;
    HttpReply errorReply(const ProxyError& error) const;

    void serverThread();
    // Hands a connection to its own thread, or answers 503 when over the cap.
    void dispatch(int clientFd);
    void finishConnection();
    void refuse(int clientFd, const std::string& reason);
    void handleConnection(int clientFd);
    bool readRequest(int clientFd, std::string& raw);

    const ProxyConfig& m_config;
    AddressResolver& m_resolver;
    const CommandForwarder& m_forwarder;
    ZoneCoordinator& m_zones;

    mutable std::mutex m_deviceMutex;
    std::string m_currentDevice;

    int m_serverFd{-1};
    int m_port{0};
    std::atomic<bool> m_running{false};
    std::unique_ptr<std::thread> m_serverThread;
    std::string m_lastError;

    std::mutex m_connMutex;
    std::condition_variable m_connCv;
    int m_activeConnections{0};
};
