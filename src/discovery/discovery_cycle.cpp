#include "discovery/discovery_cycle.hpp"

#include "common/logging.hpp"
#include "discovery/discovery_merge.hpp"
#include "discovery/http_master_client.hpp"
#include "discovery/lan_broadcast_client.hpp"
#include "discovery/master_server_client.hpp"

#include <future>
#include <string>
#include <system_error>

namespace {

using EndpointList = std::vector<q2browse::net::Endpoint>;

// Each source is isolated: a failure inside it only empties its own list.
template <typename Query>
std::future<EndpointList> startSource(const char *name, spdlog::logger &logger, Query query) {
    auto guarded = [name, &logger, query = std::move(query)]() -> EndpointList {
        try {
            return query();
        } catch (const std::exception &ex) {
            logger.error("DiscoveryCycle: {} source failed: {}", name, ex.what());
        }
        return {};
    };

    try {
        return std::async(std::launch::async, guarded);
    } catch (const std::system_error &ex) {
        logger.warn("DiscoveryCycle: Running {} source inline: {}", name, ex.what());
    }
    return std::async(std::launch::deferred, guarded);
}

} // namespace

namespace q2browse::discovery {

DiscoveryCycle::DiscoveryCycle(DiscoveryConfig config,
                               net::DatagramExchanger &exchanger,
                               net::HttpTransport &httpTransport,
                               std::shared_ptr<spdlog::logger> logger)
    : config(std::move(config)),
      exchanger(exchanger),
      httpTransport(httpTransport),
      logger(logger ? std::move(logger) : logging::ComponentLogger("discovery")) {}

std::vector<net::Endpoint> DiscoveryCycle::gatherEndpoints(const CancellationToken &cancellation,
                                                           CycleSummary &summary) {
    std::future<EndpointList> httpTask;
    std::future<EndpointList> masterTask;
    std::future<EndpointList> lanTask;

    if (config.useHttpMaster) {
        if (config.httpMasterUrl.empty()) {
            logger->warn("DiscoveryCycle: HTTP master enabled without a URL; skipping it");
        } else {
            summary.httpQueried = true;
            httpTask = startSource("HTTP master", *logger, [this, &cancellation]() {
                HttpMasterClient client(config.httpMasterUrl, config.httpTimeout, httpTransport, logger);
                return client.queryServers(cancellation);
            });
        }
    } else if (config.masterServerAddress.empty()) {
        logger->error("DiscoveryCycle: Master server address is not set; skipping the UDP master");
    } else {
        summary.masterQueried = true;
        masterTask = startSource("UDP master", *logger, [this, &cancellation]() {
            MasterServerClient client(config.masterServerAddress, config.masterServerPort,
                                      config.masterTimeout, exchanger, logger);
            return client.queryServers(cancellation);
        });
    }

    if (config.enableLanBroadcast) {
        summary.lanQueried = true;
        lanTask = startSource("LAN", *logger, [this, &cancellation]() {
            LanBroadcastOptions options;
            options.broadcastAddress = config.lanBroadcastAddress;
            options.port = config.lanPort;
            options.listenWindow = config.lanListenWindow;
            LanBroadcastClient client(options, logger);
            return client.discover(cancellation);
        });
    }

    const EndpointList httpEndpoints = httpTask.valid() ? httpTask.get() : EndpointList{};
    const EndpointList masterEndpoints = masterTask.valid() ? masterTask.get() : EndpointList{};
    const EndpointList lanEndpoints = lanTask.valid() ? lanTask.get() : EndpointList{};

    summary.httpEndpoints = httpEndpoints.size();
    summary.masterEndpoints = masterEndpoints.size();
    summary.lanEndpoints = lanEndpoints.size();

    auto merged = MergeEndpoints({&httpEndpoints, &masterEndpoints, &lanEndpoints});
    summary.mergedEndpoints = merged.size();
    logger->info("DiscoveryCycle: {} unique endpoint(s) (HTTP {}, master {}, LAN {})",
                 merged.size(), httpEndpoints.size(), masterEndpoints.size(), lanEndpoints.size());
    return merged;
}

CycleSummary DiscoveryCycle::run(const probe::RecordCallback &onRecord, const CancellationToken &cancellation) {
    CycleSummary summary;
    const auto endpoints = gatherEndpoints(cancellation, summary);

    if (cancellation.isCancelled()) {
        summary.cancelled = true;
        logger->info("DiscoveryCycle: Cancelled before probing");
        return summary;
    }

    probe::ProbeOptions probeOptions;
    probeOptions.maxConcurrentProbes = config.maxConcurrentProbes;
    probeOptions.timeout = config.probeTimeout;
    probe::ServerProber prober(probeOptions, exchanger, logging::ComponentLogger("prober"));

    const auto probeSummary = prober.probeServers(endpoints, onRecord, cancellation);
    summary.probesAttempted = probeSummary.attempted;
    summary.recordsProduced = probeSummary.produced;
    summary.cancelled = probeSummary.cancelled || cancellation.isCancelled();

    logger->info("DiscoveryCycle: {} of {} server(s) responded{}",
                 summary.recordsProduced, summary.probesAttempted,
                 summary.cancelled ? " (cancelled)" : "");
    return summary;
}

} // namespace q2browse::discovery
