#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include "common/cancellation.hpp"
#include "net/endpoint.hpp"

namespace q2browse::net {

enum class ExchangeStatus {
    Ok,
    Timeout,
    Cancelled,
    Error
};

struct ExchangeResult {
    ExchangeStatus status = ExchangeStatus::Error;
    std::string payload;
    // Measured from the moment the request left the socket.
    std::chrono::milliseconds roundTrip{0};
    std::string error;
};

// One request datagram, one reply datagram from the same peer.
class DatagramExchanger {
public:
    virtual ~DatagramExchanger() = default;

    virtual ExchangeResult exchange(const Endpoint &target,
                                    std::string_view request,
                                    std::chrono::milliseconds timeout,
                                    const CancellationToken &cancellation) = 0;
};

// Opens a fresh socket per exchange; it is closed before exchange() returns.
class UdpDatagramExchanger final : public DatagramExchanger {
public:
    ExchangeResult exchange(const Endpoint &target,
                            std::string_view request,
                            std::chrono::milliseconds timeout,
                            const CancellationToken &cancellation) override;
};

} // namespace q2browse::net
