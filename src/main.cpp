// main.cpp
#include "AddressResolver.hpp"
#include "CommandForwarder.hpp"
#include "DeviceHttpClient.hpp"
#include "DeviceRegistry.hpp"
#include "DiscoveryProbe.hpp"
#include "ProxyConfig.hpp"
#include "ProxyServer.hpp"
#include "ZoneCoordinator.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

namespace {
std::atomic<bool> g_shutdown{false};

void onSignal(int) {
    g_shutdown = true;
}
}

int main(int argc, char** argv) {
    ProxyConfig config = loadProxyConfig(argc, argv);
    if (config.showHelp) {
        std::cout << usage(argv[0]);
        return 0;
    }
    for (const auto& w : config.warnings) {
        std::cerr << "[main] " << w << std::endl;
    }

    auto http = std::make_shared<CurlHttpClient>();
    DeviceInfoFetcher fetchInfo = makeInfoFetcher(http);

    auto multicast = std::make_unique<MulticastProbe>(fetchInfo);
    auto scan = std::make_unique<SubnetScanProbe>(
        SubnetScanProbe::makeHostProbe(fetchInfo, config.probeTimeoutMs), config.scanRange, config.scanWorkers);

    DeviceRegistry registry;
    AddressResolver resolver(config.deviceAddresses, std::move(multicast), std::move(scan), registry,
                             std::chrono::milliseconds(config.discoveryTimeoutMs),
                             std::chrono::milliseconds(config.scanTimeoutMs));
    CommandForwarder forwarder(http, config.requestTimeoutMs);
    ZoneCoordinator zones(forwarder);
    ProxyServer server(config, resolver, forwarder, zones);

    if (!server.start()) {
        std::cerr << "[main] Failed to start proxy: " << server.getLastError() << std::endl;
        return 1;
    }

    std::cout << "[main] ===================================" << std::endl;
    std::cout << "[main] SoundTouch proxy running on http://localhost:" << server.port() << std::endl;
    if (resolver.hasConfiguredAddresses()) {
        std::cout << "[main] Device(s): ";
        const auto& addrs = resolver.configuredAddresses();
        for (size_t i = 0; i < addrs.size(); ++i) {
            std::cout << (i ? ", " : "") << addrs[i];
        }
        std::cout << std::endl;
    } else {
        std::cout << "[main] No device configured; discovery runs on first use" << std::endl;
    }
    std::cout << "[main] Open http://localhost:" << server.port() << "/ in your browser" << std::endl;
    std::cout << "[main] Press Ctrl+C to stop" << std::endl;
    std::cout << "[main] ===================================" << std::endl;

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    while (!g_shutdown && server.running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "[main] Shutting down..." << std::endl;
    server.stop();
    return 0;
}
