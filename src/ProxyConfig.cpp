#include "ProxyConfig.hpp"

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// Parses value into target when it is an integer in [minValue, maxValue].
void setInt(ProxyConfig& cfg, const std::string& what, const std::string& value,
            int minValue, int maxValue, int& target) {
    try {
        size_t used = 0;
        int v = std::stoi(value, &used);
        if (used == value.size() && v >= minValue && v <= maxValue) {
            target = v;
            return;
        }
    } catch (const std::exception&) {
    }
    cfg.warnings.push_back("Ignoring invalid " + what + " '" + value + "' (keeping " + std::to_string(target) + ")");
}

} // anonymous namespace

std::vector<std::string> splitAddressList(const std::string& list) {
    std::vector<std::string> out;
    std::istringstream in(list);
    std::string item;
    while (std::getline(in, item, ',')) {
        item = trim(item);
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

ProxyConfig loadProxyConfig(int argc, const char* const* argv, const EnvLookup& getenvFn) {
    ProxyConfig cfg;

    auto env = [&getenvFn](const char* name) -> std::string {
        const char* v = getenvFn(name);
        return v ? std::string(v) : std::string();
    };

    if (auto v = env("SOUNDTOUCH_DEVICE_IP"); !v.empty()) cfg.deviceAddresses = splitAddressList(v);
    if (auto v = env("SOUNDTOUCH_PORT"); !v.empty()) setInt(cfg, "port", v, 1, 65535, cfg.listenPort);
    if (auto v = env("SOUNDTOUCH_WEB_ROOT"); !v.empty()) cfg.webRoot = v;
    if (auto v = env("SOUNDTOUCH_SCAN_RANGE"); !v.empty()) cfg.scanRange = v;
    if (auto v = env("SOUNDTOUCH_DISCOVERY_TIMEOUT_MS"); !v.empty())
        setInt(cfg, "discovery timeout", v, 100, 60000, cfg.discoveryTimeoutMs);
    if (auto v = env("SOUNDTOUCH_SCAN_TIMEOUT_MS"); !v.empty())
        setInt(cfg, "scan timeout", v, 500, 300000, cfg.scanTimeoutMs);
    if (auto v = env("SOUNDTOUCH_SCAN_WORKERS"); !v.empty())
        setInt(cfg, "scan workers", v, 1, 256, cfg.scanWorkers);
    if (auto v = env("SOUNDTOUCH_MAX_CONNECTIONS"); !v.empty())
        setInt(cfg, "max connections", v, 1, 1024, cfg.maxConnections);

    const std::string portFlag = "--port=";
    const std::string webRootFlag = "--web-root=";
    const std::string scanRangeFlag = "--scan-range=";
    const std::string discoveryFlag = "--discovery-timeout=";
    const std::string scanTimeoutFlag = "--scan-timeout=";
    const std::string workersFlag = "--scan-workers=";
    const std::string connectionsFlag = "--max-connections=";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") cfg.showHelp = true;
        else if (arg == "-p" || arg == "--port") {
            if (i + 1 < argc) setInt(cfg, "port", argv[++i], 1, 65535, cfg.listenPort);
            else cfg.warnings.push_back(arg + " needs a value");
        }
        else if (arg.rfind(portFlag, 0) == 0) setInt(cfg, "port", arg.substr(portFlag.size()), 1, 65535, cfg.listenPort);
        else if (arg.rfind(webRootFlag, 0) == 0) cfg.webRoot = arg.substr(webRootFlag.size());
        else if (arg.rfind(scanRangeFlag, 0) == 0) cfg.scanRange = arg.substr(scanRangeFlag.size());
        else if (arg.rfind(discoveryFlag, 0) == 0)
            setInt(cfg, "discovery timeout", arg.substr(discoveryFlag.size()), 100, 60000, cfg.discoveryTimeoutMs);
        else if (arg.rfind(scanTimeoutFlag, 0) == 0)
            setInt(cfg, "scan timeout", arg.substr(scanTimeoutFlag.size()), 500, 300000, cfg.scanTimeoutMs);
        else if (arg.rfind(workersFlag, 0) == 0)
            setInt(cfg, "scan workers", arg.substr(workersFlag.size()), 1, 256, cfg.scanWorkers);
        else if (arg.rfind(connectionsFlag, 0) == 0)
            setInt(cfg, "max connections", arg.substr(connectionsFlag.size()), 1, 1024, cfg.maxConnections);
        else if (!arg.empty() && arg[0] == '-') cfg.warnings.push_back("Unknown option " + arg);
        else cfg.deviceAddresses = splitAddressList(arg);
    }

    if (cfg.webRoot.empty()) cfg.webRoot = ".";
    return cfg;
}

ProxyConfig loadProxyConfig(int argc, const char* const* argv) {
    return loadProxyConfig(argc, argv, [](const char* name) -> const char* { return std::getenv(name); });
}

std::string usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [device_ip[,device_ip...]] [options]\n"
        << "\n"
        << "Proxy server for Bose SoundTouch controllers.\n"
        << "\n"
        << "  device_ip                 Device address(es); skips discovery (env: SOUNDTOUCH_DEVICE_IP)\n"
        << "  -p, --port PORT           Port to run the server on, default 8000 (env: SOUNDTOUCH_PORT)\n"
        << "  --web-root=DIR            Directory served for non-API paths (env: SOUNDTOUCH_WEB_ROOT)\n"
        << "  --scan-range=CIDR         Subnet scanned when SSDP finds nothing (env: SOUNDTOUCH_SCAN_RANGE)\n"
        << "  --discovery-timeout=MS    SSDP listen window, default 3000 (env: SOUNDTOUCH_DISCOVERY_TIMEOUT_MS)\n"
        << "  --scan-timeout=MS         Overall subnet scan deadline, default 10000 (env: SOUNDTOUCH_SCAN_TIMEOUT_MS)\n"
        << "  --scan-workers=N          Concurrent scan probes, default 32 (env: SOUNDTOUCH_SCAN_WORKERS)\n"
        << "  --max-connections=N       Concurrent inbound requests, default 64 (env: SOUNDTOUCH_MAX_CONNECTIONS)\n"
        << "  -h, --help                Show this help\n"
        << "\n"
        << "Set SOUNDTOUCH_VERBOSE=1 to trace every discovery reply.\n";
    return out.str();
}
