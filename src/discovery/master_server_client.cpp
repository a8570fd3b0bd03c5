#include "discovery/master_server_client.hpp"

#include "common/logging.hpp"
#include "net/oob_protocol.hpp"

namespace q2browse::discovery {

MasterServerClient::MasterServerClient(std::string host,
                                       uint16_t port,
                                       std::chrono::milliseconds timeout,
                                       net::DatagramExchanger &exchanger,
                                       std::shared_ptr<spdlog::logger> logger)
    : host(std::move(host)),
      port(port),
      timeout(timeout),
      exchanger(exchanger),
      logger(logger ? std::move(logger) : logging::ComponentLogger("master")) {}

std::vector<net::Endpoint> MasterServerClient::queryServers(const CancellationToken &cancellation) {
    if (host.empty() || port == 0) {
        logger->error("MasterServerClient: Master server address is not configured");
        return {};
    }
    if (cancellation.isCancelled()) {
        return {};
    }

    const auto master = net::Endpoint::Resolve(host, port);
    if (!master) {
        logger->warn("MasterServerClient: Could not resolve master server {}:{}", host, port);
        return {};
    }

    logger->info("MasterServerClient: Querying {}", master->toString());
    static const std::string query = oob::PrependOobHeader(oob::MASTER_QUERY);
    const auto result = exchanger.exchange(*master, query, timeout, cancellation);
    switch (result.status) {
    case net::ExchangeStatus::Ok:
        break;
    case net::ExchangeStatus::Timeout:
        logger->warn("MasterServerClient: No reply from {} within {} ms", master->toString(), timeout.count());
        return {};
    case net::ExchangeStatus::Cancelled:
        logger->debug("MasterServerClient: Query cancelled");
        return {};
    case net::ExchangeStatus::Error:
        logger->warn("MasterServerClient: Query to {} failed: {}", master->toString(), result.error);
        return {};
    }

    auto endpoints = ParseServersResponse(result.payload);
    if (!endpoints) {
        logger->warn("MasterServerClient: Unexpected reply from {} ({} bytes)",
                     master->toString(), result.payload.size());
        return {};
    }
    logger->info("MasterServerClient: {} server(s) listed by {}", endpoints->size(), master->toString());
    return std::move(*endpoints);
}

std::optional<std::vector<net::Endpoint>> MasterServerClient::ParseServersResponse(std::string_view datagram) {
    const std::string_view payload = oob::RemoveOobHeader(datagram);
    if (payload.substr(0, oob::MASTER_REPLY.size()) != oob::MASTER_REPLY) {
        return std::nullopt;
    }

    std::size_t offset = oob::MASTER_REPLY.size();
    // A first record may start with 0x0a or 0x20; a list that already tiles
    // into whole records has no separator.
    if (offset < payload.size() && (payload[offset] == ' ' || payload[offset] == '\n') &&
        (payload.size() - offset) % oob::ADDRESS_RECORD_SIZE != 0) {
        ++offset;
    }

    std::vector<net::Endpoint> endpoints;
    endpoints.reserve((payload.size() - offset) / oob::ADDRESS_RECORD_SIZE);
    for (; offset + oob::ADDRESS_RECORD_SIZE <= payload.size(); offset += oob::ADDRESS_RECORD_SIZE) {
        const auto endpoint = oob::ParseEndpoint(payload, offset);
        if (!endpoint) {
            break;
        }
        // All-zero record terminates the list.
        if (endpoint->isUnspecified()) {
            break;
        }
        endpoints.push_back(*endpoint);
    }
    return endpoints;
}

} // namespace q2browse::discovery
