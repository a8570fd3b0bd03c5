#include "discovery/discovery_config.hpp"

#include "common/config_helpers.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace {

constexpr int MIN_PROBES = 1;
constexpr int MAX_PROBES = 200;
constexpr int MIN_PROBE_TIMEOUT_MS = 1;
constexpr int MAX_PROBE_TIMEOUT_MS = 30000;

int clampSetting(const char *path, int value, int low, int high) {
    const int clamped = std::clamp(value, low, high);
    if (clamped != value) {
        spdlog::warn("Config '{}' value {} outside {}..{}; using {}", path, value, low, high, clamped);
    }
    return clamped;
}

} // namespace

namespace q2browse::discovery {

q2browse::json::Value DefaultConfigJson() {
    const DiscoveryConfig defaults;
    return {
        {"discovery", {
            {"Master", {
                {"Address", defaults.masterServerAddress},
                {"Port", defaults.masterServerPort},
                {"TimeoutMs", defaults.masterTimeout.count()}
            }},
            {"Http", {
                {"Enabled", defaults.useHttpMaster},
                {"Url", defaults.httpMasterUrl},
                {"TimeoutSeconds", defaults.httpTimeout.count()}
            }},
            {"Lan", {
                {"Enabled", defaults.enableLanBroadcast},
                {"BroadcastAddress", defaults.lanBroadcastAddress},
                {"Port", defaults.lanPort},
                {"ListenMs", defaults.lanListenWindow.count()}
            }}
        }},
        {"probe", {
            {"MaxConcurrent", defaults.maxConcurrentProbes},
            {"TimeoutMs", defaults.probeTimeout.count()}
        }}
    };
}

DiscoveryConfig LoadDiscoveryConfig() {
    using namespace q2browse::config;
    const DiscoveryConfig defaults;
    DiscoveryConfig config;

    config.masterServerAddress = ReadStringConfig("discovery.Master.Address", defaults.masterServerAddress);
    config.masterServerPort = ReadUInt16Config({"discovery.Master.Port"}, defaults.masterServerPort);
    config.masterTimeout = std::chrono::milliseconds(clampSetting(
        "discovery.Master.TimeoutMs",
        ReadIntConfig({"discovery.Master.TimeoutMs"}, static_cast<int>(defaults.masterTimeout.count())),
        100, 60000));

    config.useHttpMaster = ReadBoolConfig({"discovery.Http.Enabled"}, defaults.useHttpMaster);
    config.httpMasterUrl = ReadStringConfig("discovery.Http.Url", defaults.httpMasterUrl);
    config.httpTimeout = std::chrono::seconds(clampSetting(
        "discovery.Http.TimeoutSeconds",
        ReadIntConfig({"discovery.Http.TimeoutSeconds"}, static_cast<int>(defaults.httpTimeout.count())),
        1, 120));

    config.enableLanBroadcast = ReadBoolConfig({"discovery.Lan.Enabled"}, defaults.enableLanBroadcast);
    config.lanBroadcastAddress = ReadStringConfig("discovery.Lan.BroadcastAddress", defaults.lanBroadcastAddress);
    config.lanPort = ReadUInt16Config({"discovery.Lan.Port"}, defaults.lanPort);
    config.lanListenWindow = std::chrono::milliseconds(clampSetting(
        "discovery.Lan.ListenMs",
        ReadIntConfig({"discovery.Lan.ListenMs"}, static_cast<int>(defaults.lanListenWindow.count())),
        100, 10000));

    config.maxConcurrentProbes = static_cast<std::size_t>(clampSetting(
        "probe.MaxConcurrent",
        ReadIntConfig({"probe.MaxConcurrent"}, static_cast<int>(defaults.maxConcurrentProbes)),
        MIN_PROBES, MAX_PROBES));
    config.probeTimeout = std::chrono::milliseconds(clampSetting(
        "probe.TimeoutMs",
        ReadIntConfig({"probe.TimeoutMs"}, static_cast<int>(defaults.probeTimeout.count())),
        MIN_PROBE_TIMEOUT_MS, MAX_PROBE_TIMEOUT_MS));

    return config;
}

} // namespace q2browse::discovery
