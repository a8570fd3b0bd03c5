#include "discovery/lan_broadcast_client.hpp"

#include "common/logging.hpp"
#include "net/oob_protocol.hpp"
#include "net/udp_socket.hpp"
#include "probe/status_response.hpp"

#include <unordered_set>

namespace q2browse::discovery {

LanBroadcastClient::LanBroadcastClient(LanBroadcastOptions options, std::shared_ptr<spdlog::logger> logger)
    : options(std::move(options)),
      logger(logger ? std::move(logger) : logging::ComponentLogger("lan")) {}

std::vector<net::Endpoint> LanBroadcastClient::discover(const CancellationToken &cancellation) {
    if (cancellation.isCancelled()) {
        return {};
    }

    const auto target = net::Endpoint::Parse(options.broadcastAddress, options.port);
    if (!target || target->family() != net::Endpoint::Family::IPv4) {
        logger->error("LanBroadcastClient: Invalid broadcast address '{}'", options.broadcastAddress);
        return {};
    }

    net::UdpSocket socket;
    if (!socket.open(net::Endpoint::Family::IPv4)) {
        logger->warn("LanBroadcastClient: Unable to create socket for LAN scan: {}", socket.lastError());
        return {};
    }
    if (!socket.enableBroadcast()) {
        logger->warn("LanBroadcastClient: Failed to enable broadcast: {}", socket.lastError());
        return {};
    }

    static const std::string query = oob::PrependOobHeader(oob::STATUS_QUERY);
    if (!socket.sendTo(*target, query)) {
        logger->warn("LanBroadcastClient: Broadcast to {} failed: {}", target->toString(), socket.lastError());
        return {};
    }
    logger->debug("LanBroadcastClient: Listening {} ms for replies to {}",
                  options.listenWindow.count(), target->toString());

    const auto deadline = std::chrono::steady_clock::now() + options.listenWindow;
    std::vector<net::Endpoint> servers;
    std::unordered_set<net::Endpoint, net::EndpointHash> seen;
    std::string payload;

    while (true) {
        net::Endpoint from;
        const auto status = socket.receiveFrom(payload, from, deadline, cancellation);
        if (status == net::UdpSocket::ReceiveStatus::Timeout) {
            break;
        }
        if (status == net::UdpSocket::ReceiveStatus::Cancelled) {
            logger->debug("LanBroadcastClient: Scan cancelled");
            break;
        }
        if (status == net::UdpSocket::ReceiveStatus::Error) {
            logger->warn("LanBroadcastClient: Receive failed while scanning: {}", socket.lastError());
            break;
        }

        if (!probe::IsStatusReply(payload)) {
            continue;
        }
        if (seen.insert(from).second) {
            servers.push_back(from);
        }
    }

    logger->info("LanBroadcastClient: {} server(s) answered on the local network", servers.size());
    return servers;
}

} // namespace q2browse::discovery
