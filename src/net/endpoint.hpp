#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <sys/socket.h>

namespace q2browse::net {

// Address plus port. The canonical string form ("1.2.3.4:27910",
// "[::1]:27910") is the dedup and lookup key used across discovery.
class Endpoint {
public:
    enum class Family : uint8_t {
        IPv4,
        IPv6
    };

    Endpoint() = default;

    static Endpoint FromIPv4(const std::array<uint8_t, 4> &octets, uint16_t port);
    static Endpoint FromIPv6(const std::array<uint8_t, 16> &bytes, uint16_t port);

    // Numeric forms only: "a.b.c.d[:port]" or "[v6][:port]".
    static std::optional<Endpoint> Parse(std::string_view text, uint16_t defaultPort = 0);
    // Numeric parse first, then a DNS lookup preferring IPv4.
    static std::optional<Endpoint> Resolve(const std::string &host, uint16_t port);
    static std::optional<Endpoint> FromSockaddr(const sockaddr *address, socklen_t length);

    socklen_t toSockaddr(sockaddr_storage &out) const;

    Family family() const { return addressFamily; }
    uint16_t port() const { return portNumber; }
    const std::array<uint8_t, 16> &bytes() const { return addressBytes; }
    bool isUnspecified() const;

    std::string address() const;
    std::string toString() const;

    bool operator==(const Endpoint &other) const {
        return addressFamily == other.addressFamily && portNumber == other.portNumber &&
               addressBytes == other.addressBytes;
    }
    bool operator!=(const Endpoint &other) const { return !(*this == other); }

private:
    Family addressFamily = Family::IPv4;
    std::array<uint8_t, 16> addressBytes{};
    uint16_t portNumber = 0;
};

struct EndpointHash {
    std::size_t operator()(const Endpoint &endpoint) const;
};

} // namespace q2browse::net
