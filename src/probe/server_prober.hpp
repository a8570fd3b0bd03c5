#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include <spdlog/spdlog.h>

#include "common/cancellation.hpp"
#include "net/datagram_exchanger.hpp"
#include "net/endpoint.hpp"
#include "probe/server_record.hpp"

namespace q2browse::probe {

constexpr std::size_t DEFAULT_MAX_CONCURRENT_PROBES = 75;
constexpr std::chrono::milliseconds DEFAULT_PROBE_TIMEOUT{3000};

struct ProbeOptions {
    std::size_t maxConcurrentProbes = DEFAULT_MAX_CONCURRENT_PROBES;
    std::chrono::milliseconds timeout = DEFAULT_PROBE_TIMEOUT;
};

struct ProbeRequest {
    net::Endpoint endpoint;
    // Counted from the moment the query is sent.
    std::chrono::milliseconds timeout{0};
};

struct ProbeSummary {
    std::size_t attempted = 0;
    std::size_t produced = 0;
    bool cancelled = false;
};

using RecordCallback = std::function<void(const ServerRecord &)>;

class ServerProber {
public:
    ServerProber(ProbeOptions probeOptions,
                 net::DatagramExchanger &exchanger,
                 std::shared_ptr<spdlog::logger> logger = nullptr);

    // Sends one status query per endpoint with at most maxConcurrentProbes in
    // flight. onRecord runs once per parsed reply, in completion order, never
    // concurrently with itself and never after cancellation is observed.
    // Returns after every dispatched probe has finished.
    ProbeSummary probeServers(const std::vector<net::Endpoint> &endpoints,
                              const RecordCallback &onRecord,
                              const CancellationToken &cancellation);

private:
    std::optional<ServerRecord> probeOne(const ProbeRequest &request, const CancellationToken &cancellation);

    ProbeOptions options;
    net::DatagramExchanger &exchanger;
    std::shared_ptr<spdlog::logger> logger;
};

} // namespace q2browse::probe
