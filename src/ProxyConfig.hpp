// ProxyConfig.hpp
#pragma once

#include <functional>
#include <string>
#include <vector>

struct ProxyConfig {
    std::vector<std::string> deviceAddresses;   // Empty -> discover
    int listenPort{8000};
    std::string webRoot{"."};
    std::string scanRange;                      // Empty -> local /24
    int discoveryTimeoutMs{3000};               // SSDP listen window
    int scanTimeoutMs{10000};                   // Overall subnet scan deadline
    int scanWorkers{32};
    int probeTimeoutMs{1000};                   // Per-host connect timeout during scan
    int requestTimeoutMs{10000};                // Forwarded calls
    int maxConnections{64};                     // Concurrent inbound requests
    bool showHelp{false};

    std::vector<std::string> warnings;          // Rejected values, kept defaults
};

using EnvLookup = std::function<const char*(const char*)>;

// Environment first, then argv on top of it:
//   [device_ip[,device_ip...]] [-p PORT|--port=PORT] [--web-root=DIR]
//   [--scan-range=CIDR] [--discovery-timeout=MS] [--scan-timeout=MS]
//   [--scan-workers=N] [--max-connections=N] [-h|--help]
// Env: SOUNDTOUCH_DEVICE_IP, SOUNDTOUCH_PORT, SOUNDTOUCH_WEB_ROOT,
//      SOUNDTOUCH_SCAN_RANGE, SOUNDTOUCH_DISCOVERY_TIMEOUT_MS,
//      SOUNDTOUCH_SCAN_TIMEOUT_MS, SOUNDTOUCH_SCAN_WORKERS,
//      SOUNDTOUCH_MAX_CONNECTIONS
ProxyConfig loadProxyConfig(int argc, const char* const* argv, const EnvLookup& getenvFn);
ProxyConfig loadProxyConfig(int argc, const char* const* argv);

// "a, b,,c" -> {"a","b","c"}
std::vector<std::string> splitAddressList(const std::string& list);

std::string usage(const std::string& program);
