#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "common/json.hpp"

namespace q2browse::discovery {

struct DiscoveryConfig {
    std::string masterServerAddress = "master.quake2.com";
    uint16_t masterServerPort = 27900;
    std::chrono::milliseconds masterTimeout{5000};

    bool useHttpMaster = true;
    std::string httpMasterUrl = "http://q2servers.com/?raw=2";
    std::chrono::seconds httpTimeout{10};

    bool enableLanBroadcast = true;
    std::string lanBroadcastAddress = "255.255.255.255";
    uint16_t lanPort = 27910;
    std::chrono::milliseconds lanListenWindow{1500};

    std::chrono::milliseconds probeTimeout{3000};
    std::size_t maxConcurrentProbes = 75;
};

// Defaults layer for ConfigStore, mirroring DiscoveryConfig's initializers.
q2browse::json::Value DefaultConfigJson();

// Snapshot of the current ConfigStore values, clamped to supported ranges.
DiscoveryConfig LoadDiscoveryConfig();

} // namespace q2browse::discovery
