#include "spdlog/spdlog.h"
#include "app/cli_options.hpp"
#include "common/cancellation.hpp"
#include "common/config_store.hpp"
#include "common/config_validation.hpp"
#include "common/file_utils.hpp"
#include "common/json.hpp"
#include "common/logging.hpp"
#include "discovery/discovery_config.hpp"
#include "discovery/discovery_cycle.hpp"
#include "net/datagram_exchanger.hpp"
#include "net/http_transport.hpp"
#include "probe/color_text.hpp"
#include "probe/server_record.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <thread>

namespace {

constexpr const char *CLI_LAYER = "command line";

volatile std::sig_atomic_t g_interrupted = 0;

void signalHandler(int) {
    g_interrupted = 1;
}

std::string trimTrailingNewline(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    return text;
}

q2browse::json::Value segmentsJson(const std::vector<q2browse::probe::TextSegment> &segments) {
    q2browse::json::Value array = q2browse::json::Array();
    for (const auto &segment : segments) {
        array.push_back({{"text", segment.text}, {"color", segment.color}});
    }
    return array;
}

q2browse::json::Value recordJson(const q2browse::probe::ServerRecord &record) {
    q2browse::json::Value players = q2browse::json::Array();
    for (const auto &player : record.players) {
        players.push_back({
            {"name", player.name},
            {"nameSegments", segmentsJson(player.nameSegments)},
            {"score", player.score},
            {"time", player.time}
        });
    }

    q2browse::json::Value attributes = q2browse::json::Object();
    for (const auto &[key, value] : record.attributes) {
        if (!attributes.contains(key)) {
            attributes[key] = value;
        }
    }

    return {
        {"address", record.key()},
        {"hostname", record.hostname},
        {"hostnameSegments", segmentsJson(record.hostnameSegments)},
        {"map", record.map},
        {"mod", record.mod},
        {"players", record.playerCount},
        {"maxPlayers", record.maxPlayers},
        {"latencyMs", record.latency.count()},
        {"playerList", players},
        {"attributes", attributes}
    };
}

void printRecord(const q2browse::probe::ServerRecord &record, bool asJson) {
    if (asJson) {
        std::cout << q2browse::json::Dump(recordJson(record)) << std::endl;
        return;
    }

    char line[256];
    std::snprintf(line, sizeof(line), "%-22s %5lldms %3d/%-3d %-12s %-10s ",
                  record.key().c_str(),
                  static_cast<long long>(record.latency.count()),
                  record.playerCount,
                  record.maxPlayers,
                  record.map.c_str(),
                  record.mod.c_str());
    std::cout << line << q2browse::probe::StripColorCodes(record.hostname) << std::endl;
}

} // namespace

int main(int argc, char *argv[]) {
    q2browse::logging::ConfigureLogging(spdlog::level::info, false);

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    q2browse::app::CLIOptions cliOptions;
    try {
        cliOptions = q2browse::app::ParseCLIOptions(argc, argv);
    } catch (const std::exception &ex) {
        spdlog::error("Failed to parse command line options: {}", ex.what());
        return 1;
    }

    const spdlog::level::level_enum logLevel = cliOptions.logLevelExplicit
        ? q2browse::logging::ParseLogLevel(cliOptions.logLevel)
        : (cliOptions.verbose >= 2 ? spdlog::level::trace
           : cliOptions.verbose == 1 ? spdlog::level::debug
           : spdlog::level::info);
    q2browse::logging::ConfigureLogging(logLevel, cliOptions.timestampLogging);

    const std::filesystem::path userConfigPath = cliOptions.userConfigExplicit
        ? std::filesystem::path(cliOptions.userConfigPath)
        : q2browse::file::UserConfigDirectory() / "config.json";
    q2browse::config::ConfigStore::Initialize(q2browse::discovery::DefaultConfigJson(),
                                              userConfigPath,
                                              cliOptions.userConfigExplicit ? spdlog::level::err
                                                                            : spdlog::level::debug);

    const auto overrides = q2browse::app::CLIOverridesJson(cliOptions);
    if (!overrides.empty()) {
        q2browse::config::ConfigStore::AddRuntimeLayer(CLI_LAYER, overrides);
    }

    const auto issues = q2browse::config::ValidateRequiredKeys(q2browse::config::DiscoveryRequiredKeys());
    for (const auto &issue : issues) {
        spdlog::warn("main: Config '{}' {}; using the built-in default", issue.path, issue.message);
    }

    const q2browse::discovery::DiscoveryConfig config = q2browse::discovery::LoadDiscoveryConfig();

    q2browse::net::CurlHttpTransport httpTransport;
    if (!httpTransport.isReady()) {
        spdlog::warn("main: HTTP transport unavailable; the HTTP master will return no servers");
    }
    q2browse::net::UdpDatagramExchanger exchanger;

    q2browse::CancellationSource cancellation;
    std::atomic<bool> finished{false};
    std::thread signalWatcher([&]() {
        while (!finished.load()) {
            if (g_interrupted) {
                spdlog::info("Interrupt received; cancelling refresh...");
                cancellation.cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    q2browse::discovery::CycleSummary summary;
    try {
        q2browse::discovery::DiscoveryCycle cycle(config, exchanger, httpTransport);
        summary = cycle.run([&](const q2browse::probe::ServerRecord &record) {
            printRecord(record, cliOptions.jsonOutput);
        }, cancellation.token());
    } catch (const std::exception &ex) {
        spdlog::error("main: Discovery failed: {}", ex.what());
    }

    finished.store(true);
    signalWatcher.join();

    spdlog::info("{} of {} server(s) responded ({} listed by HTTP, {} by master, {} on LAN){}",
                 summary.recordsProduced, summary.probesAttempted,
                 summary.httpEndpoints, summary.masterEndpoints, summary.lanEndpoints,
                 summary.cancelled ? "; refresh cancelled" : "");

    if (cliOptions.diagnostics) {
        std::cerr << "---- diagnostics ----" << std::endl;
        for (const auto &entry : q2browse::logging::RecentDiagnostics()) {
            std::cerr << trimTrailingNewline(entry) << std::endl;
        }
    }

    return 0;
}
