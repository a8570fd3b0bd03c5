#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include <spdlog/spdlog.h>

#include "common/cancellation.hpp"
#include "discovery/discovery_config.hpp"
#include "net/datagram_exchanger.hpp"
#include "net/http_transport.hpp"
#include "probe/server_prober.hpp"

namespace q2browse::discovery {

struct CycleSummary {
    std::size_t httpEndpoints = 0;
    std::size_t masterEndpoints = 0;
    std::size_t lanEndpoints = 0;
    std::size_t mergedEndpoints = 0;
    std::size_t probesAttempted = 0;
    std::size_t recordsProduced = 0;
    bool httpQueried = false;
    bool masterQueried = false;
    bool lanQueried = false;
    bool cancelled = false;
};

// One refresh: gather endpoints from the enabled sources, merge them and
// probe the result. Both transports are borrowed.
class DiscoveryCycle {
public:
    DiscoveryCycle(DiscoveryConfig config,
                   net::DatagramExchanger &exchanger,
                   net::HttpTransport &httpTransport,
                   std::shared_ptr<spdlog::logger> logger = nullptr);

    CycleSummary run(const probe::RecordCallback &onRecord, const CancellationToken &cancellation);

    // Sources only; nothing is probed.
    std::vector<net::Endpoint> gatherEndpoints(const CancellationToken &cancellation, CycleSummary &summary);

private:
    DiscoveryConfig config;
    net::DatagramExchanger &exchanger;
    net::HttpTransport &httpTransport;
    std::shared_ptr<spdlog::logger> logger;
};

} // namespace q2browse::discovery
