#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "common/cancellation.hpp"
#include "net/endpoint.hpp"

namespace q2browse::net {

// Owns one datagram socket; closed on destruction.
class UdpSocket {
public:
    enum class ReceiveStatus {
        Received,
        Timeout,
        Cancelled,
        Error
    };

    // Largest UDP payload; anything bigger cannot arrive.
    static constexpr std::size_t MAX_DATAGRAM = 65536;
    // Longest a blocking receive sleeps before re-checking cancellation.
    static constexpr std::chrono::milliseconds CANCEL_POLL_INTERVAL{50};

    UdpSocket() = default;
    ~UdpSocket();

    UdpSocket(const UdpSocket &) = delete;
    UdpSocket &operator=(const UdpSocket &) = delete;
    UdpSocket(UdpSocket &&other) noexcept;
    UdpSocket &operator=(UdpSocket &&other) noexcept;

    bool open(Endpoint::Family family);
    bool bind(const Endpoint &local);
    bool enableBroadcast();
    void close();

    bool sendTo(const Endpoint &target, std::string_view payload);

    // Waits until `deadline` for one datagram.
    ReceiveStatus receiveFrom(std::string &payload,
                              Endpoint &from,
                              std::chrono::steady_clock::time_point deadline,
                              const CancellationToken &cancellation);

    std::optional<Endpoint> localEndpoint() const;
    const std::string &lastError() const { return error; }

private:
    void recordError(const char *operation);

    int socketFd = -1;
    std::string error;
};

} // namespace q2browse::net
