#include "net/datagram_exchanger.hpp"

#include "net/udp_socket.hpp"

namespace q2browse::net {

ExchangeResult UdpDatagramExchanger::exchange(const Endpoint &target,
                                              std::string_view request,
                                              std::chrono::milliseconds timeout,
                                              const CancellationToken &cancellation) {
    ExchangeResult result;
    if (cancellation.isCancelled()) {
        result.status = ExchangeStatus::Cancelled;
        return result;
    }

    UdpSocket socket;
    if (!socket.open(target.family())) {
        result.error = socket.lastError();
        return result;
    }

    if (!socket.sendTo(target, request)) {
        result.error = socket.lastError();
        return result;
    }

    const auto sentAt = std::chrono::steady_clock::now();
    const auto deadline = sentAt + timeout;

    while (true) {
        Endpoint from;
        const auto status = socket.receiveFrom(result.payload, from, deadline, cancellation);
        switch (status) {
        case UdpSocket::ReceiveStatus::Received:
            if (from != target) {
                // Stray datagram from another peer; keep waiting for ours.
                continue;
            }
            result.roundTrip = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - sentAt);
            result.status = ExchangeStatus::Ok;
            return result;
        case UdpSocket::ReceiveStatus::Timeout:
            result.payload.clear();
            result.status = ExchangeStatus::Timeout;
            return result;
        case UdpSocket::ReceiveStatus::Cancelled:
            result.payload.clear();
            result.status = ExchangeStatus::Cancelled;
            return result;
        case UdpSocket::ReceiveStatus::Error:
            result.payload.clear();
            result.error = socket.lastError();
            result.status = ExchangeStatus::Error;
            return result;
        }
    }
}

} // namespace q2browse::net
