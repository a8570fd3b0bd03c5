#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "common/cancellation.hpp"
#include "net/datagram_exchanger.hpp"
#include "net/endpoint.hpp"

namespace q2browse::discovery {

// Queries a UDP master server ("query" / "servers") for its server list.
class MasterServerClient {
public:
    MasterServerClient(std::string host,
                       uint16_t port,
                       std::chrono::milliseconds timeout,
                       net::DatagramExchanger &exchanger,
                       std::shared_ptr<spdlog::logger> logger = nullptr);

    // Empty on timeout, lookup failure, socket error or an unexpected reply.
    std::vector<net::Endpoint> queryServers(const CancellationToken &cancellation);

    // Parses a full reply datagram. Returns nothing when the reply marker is
    // missing; an empty list is a valid answer from an idle master.
    static std::optional<std::vector<net::Endpoint>> ParseServersResponse(std::string_view datagram);

private:
    std::string host;
    uint16_t port;
    std::chrono::milliseconds timeout;
    net::DatagramExchanger &exchanger;
    std::shared_ptr<spdlog::logger> logger;
};

} // namespace q2browse::discovery
