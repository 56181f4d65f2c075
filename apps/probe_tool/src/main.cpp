// apps/probe_tool/src/main.cpp
// drguard probe_tool
// Purpose: one-shot TCP probe of an endpoint, printing each HealthSample.
// This is NOT the daemon; use it to check that a configured probe target
// answers within its timeout from this host.
//
// Usage:
//   ./probe_tool <host> <port> [count] [timeout_ms] [interval_ms]
//
// Exit status is 0 when the last sample succeeded, 1 otherwise.

#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <thread>

#include "drguard/config/constants.hpp"
#include "drguard/health/region_probe.hpp"
#include "drguard/obs/logging.hpp"

static bool run_probes(drguard::health::RegionProbe& probe, int count, std::uint32_t interval_ms) {
    bool last_ok = false;
    for (int i = 0; i < count; ++i) {
        const drguard::HealthSample s = probe.sample();
        last_ok = s.success;
        std::cout << "PROBE region=" << s.region
                  << " probe=" << s.probe
                  << " seq=" << i
                  << " ts=" << s.timestamp_ms
                  << " success=" << (s.success ? "true" : "false");
        if (s.latency_ms) std::cout << " latency=" << *s.latency_ms << " ms";
        std::cout << std::endl;

        if (i + 1 < count) std::this_thread::sleep_for(std::chrono::milliseconds(interval_ms));
    }
    return last_ok;
}

int main(int argc, char** argv) {
    namespace constants = drguard::config::constants;

    if (argc < 3) {
        std::cerr << "usage: " << argv[0] << " <host> <port> [count] [timeout_ms] [interval_ms]\n";
        return 2;
    }

    std::string host = argv[1];
    int port = 0;
    int count = 3;
    std::uint32_t timeout_ms = constants::PROBE_TIMEOUT_MS;
    std::uint32_t interval_ms = 1000;
    try {
        port = std::stoi(argv[2]);
        if (argc > 3) count = std::stoi(argv[3]);
        if (argc > 4) timeout_ms = static_cast<std::uint32_t>(std::stoul(argv[4]));
        if (argc > 5) interval_ms = static_cast<std::uint32_t>(std::stoul(argv[5]));
    } catch (const std::exception& ex) {
        std::cerr << "probe_tool: bad argument: " << ex.what() << "\n";
        return 2;
    }
    if (port <= 0 || port > 65535 || count <= 0 || timeout_ms == 0) {
        std::cerr << "probe_tool: port must be 1..65535, count and timeout positive\n";
        return 2;
    }

    drguard::obs::LoggingConfig log;
    log.level = "debug";
    drguard::obs::configure_logging(log);

    drguard::health::ProbeSpec spec;
    spec.id = 0;
    spec.region = drguard::kPrimaryRegion;
    spec.check = drguard::health::TcpConnectCheck{host, static_cast<std::uint16_t>(port)};
    spec.timeout_ms = timeout_ms;
    drguard::health::RegionProbe probe(spec);

    std::cout << "drguard probe_tool starting" << std::endl;
    std::cout << "Target: " << host << ":" << port << ", count: " << count
              << ", timeout: " << timeout_ms << " ms" << std::endl;

    const bool ok = run_probes(probe, count, interval_ms);

    std::cout << "probe_tool finished" << std::endl;
    return ok ? 0 : 1;
}
