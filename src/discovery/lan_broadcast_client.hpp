#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "common/cancellation.hpp"
#include "net/endpoint.hpp"

namespace q2browse::discovery {

struct LanBroadcastOptions {
    std::string broadcastAddress = "255.255.255.255";
    uint16_t port = 27910;
    std::chrono::milliseconds listenWindow{1500};
};

// Broadcasts a status query and collects the servers that answer it.
class LanBroadcastClient {
public:
    explicit LanBroadcastClient(LanBroadcastOptions options,
                                std::shared_ptr<spdlog::logger> logger = nullptr);

    // Blocks for the listen window unless cancelled. Each responding server
    // is listed once, in order of its first reply.
    std::vector<net::Endpoint> discover(const CancellationToken &cancellation);

private:
    LanBroadcastOptions options;
    std::shared_ptr<spdlog::logger> logger;
};

} // namespace q2browse::discovery
