#include "net/endpoint.hpp"

#include <algorithm>
#include <cstring>
#include <limits>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>

namespace {

std::optional<uint16_t> parsePort(std::string_view text) {
    if (text.empty() || text.size() > 5) {
        return std::nullopt;
    }
    uint32_t value = 0;
    for (char ch : text) {
        if (ch < '0' || ch > '9') {
            return std::nullopt;
        }
        value = value * 10 + static_cast<uint32_t>(ch - '0');
    }
    if (value > std::numeric_limits<uint16_t>::max()) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(value);
}

} // namespace

namespace q2browse::net {

Endpoint Endpoint::FromIPv4(const std::array<uint8_t, 4> &octets, uint16_t port) {
    Endpoint endpoint;
    endpoint.addressFamily = Family::IPv4;
    std::copy(octets.begin(), octets.end(), endpoint.addressBytes.begin());
    endpoint.portNumber = port;
    return endpoint;
}

Endpoint Endpoint::FromIPv6(const std::array<uint8_t, 16> &bytes, uint16_t port) {
    Endpoint endpoint;
    endpoint.addressFamily = Family::IPv6;
    endpoint.addressBytes = bytes;
    endpoint.portNumber = port;
    return endpoint;
}

std::optional<Endpoint> Endpoint::Parse(std::string_view text, uint16_t defaultPort) {
    std::string host;
    uint16_t port = defaultPort;

    if (!text.empty() && text.front() == '[') {
        const auto closing = text.find(']');
        if (closing == std::string_view::npos) {
            return std::nullopt;
        }
        host = std::string(text.substr(1, closing - 1));
        const auto rest = text.substr(closing + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') {
                return std::nullopt;
            }
            const auto parsed = parsePort(rest.substr(1));
            if (!parsed) {
                return std::nullopt;
            }
            port = *parsed;
        }
        in6_addr address6{};
        if (inet_pton(AF_INET6, host.c_str(), &address6) != 1) {
            return std::nullopt;
        }
        std::array<uint8_t, 16> bytes{};
        std::memcpy(bytes.data(), &address6, bytes.size());
        return FromIPv6(bytes, port);
    }

    const auto colon = text.rfind(':');
    if (colon != std::string_view::npos) {
        const auto parsed = parsePort(text.substr(colon + 1));
        if (!parsed) {
            return std::nullopt;
        }
        port = *parsed;
        host = std::string(text.substr(0, colon));
    } else {
        host = std::string(text);
    }

    in_addr address4{};
    if (inet_pton(AF_INET, host.c_str(), &address4) != 1) {
        return std::nullopt;
    }
    std::array<uint8_t, 4> octets{};
    std::memcpy(octets.data(), &address4, octets.size());
    return FromIPv4(octets, port);
}

std::optional<Endpoint> Endpoint::Resolve(const std::string &host, uint16_t port) {
    if (host.empty()) {
        return std::nullopt;
    }
    if (auto numeric = Parse(host, port)) {
        return numeric;
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_DGRAM;

    addrinfo *results = nullptr;
    if (getaddrinfo(host.c_str(), nullptr, &hints, &results) != 0 || !results) {
        return std::nullopt;
    }

    std::optional<Endpoint> fallback;
    std::optional<Endpoint> preferred;
    for (addrinfo *entry = results; entry; entry = entry->ai_next) {
        auto candidate = FromSockaddr(entry->ai_addr, static_cast<socklen_t>(entry->ai_addrlen));
        if (!candidate) {
            continue;
        }
        candidate->portNumber = port;
        if (candidate->family() == Family::IPv4) {
            preferred = candidate;
            break;
        }
        if (!fallback) {
            fallback = candidate;
        }
    }
    freeaddrinfo(results);
    return preferred ? preferred : fallback;
}

std::optional<Endpoint> Endpoint::FromSockaddr(const sockaddr *address, socklen_t length) {
    if (!address) {
        return std::nullopt;
    }
    if (address->sa_family == AF_INET && length >= static_cast<socklen_t>(sizeof(sockaddr_in))) {
        const auto *in4 = reinterpret_cast<const sockaddr_in *>(address);
        std::array<uint8_t, 4> octets{};
        std::memcpy(octets.data(), &in4->sin_addr, octets.size());
        return FromIPv4(octets, ntohs(in4->sin_port));
    }
    if (address->sa_family == AF_INET6 && length >= static_cast<socklen_t>(sizeof(sockaddr_in6))) {
        const auto *in6 = reinterpret_cast<const sockaddr_in6 *>(address);
        std::array<uint8_t, 16> bytes{};
        std::memcpy(bytes.data(), &in6->sin6_addr, bytes.size());
        return FromIPv6(bytes, ntohs(in6->sin6_port));
    }
    return std::nullopt;
}

socklen_t Endpoint::toSockaddr(sockaddr_storage &out) const {
    std::memset(&out, 0, sizeof(out));
    if (addressFamily == Family::IPv4) {
        auto *in4 = reinterpret_cast<sockaddr_in *>(&out);
        in4->sin_family = AF_INET;
        in4->sin_port = htons(portNumber);
        std::memcpy(&in4->sin_addr, addressBytes.data(), 4);
        return sizeof(sockaddr_in);
    }
    auto *in6 = reinterpret_cast<sockaddr_in6 *>(&out);
    in6->sin6_family = AF_INET6;
    in6->sin6_port = htons(portNumber);
    std::memcpy(&in6->sin6_addr, addressBytes.data(), addressBytes.size());
    return sizeof(sockaddr_in6);
}

bool Endpoint::isUnspecified() const {
    return portNumber == 0 && std::all_of(addressBytes.begin(), addressBytes.end(), [](uint8_t b) { return b == 0; });
}

std::string Endpoint::address() const {
    char buffer[INET6_ADDRSTRLEN] = {0};
    if (addressFamily == Family::IPv4) {
        inet_ntop(AF_INET, addressBytes.data(), buffer, sizeof(buffer));
    } else {
        inet_ntop(AF_INET6, addressBytes.data(), buffer, sizeof(buffer));
    }
    return std::string(buffer);
}

std::string Endpoint::toString() const {
    if (addressFamily == Family::IPv6) {
        return "[" + address() + "]:" + std::to_string(portNumber);
    }
    return address() + ":" + std::to_string(portNumber);
}

std::size_t EndpointHash::operator()(const Endpoint &endpoint) const {
    // FNV-1a over family, address bytes and port.
    std::size_t hash = 1469598103934665603ULL;
    auto mix = [&hash](uint8_t value) {
        hash ^= value;
        hash *= 1099511628211ULL;
    };
    mix(static_cast<uint8_t>(endpoint.family()));
    for (uint8_t byte : endpoint.bytes()) {
        mix(byte);
    }
    mix(static_cast<uint8_t>(endpoint.port() >> 8));
    mix(static_cast<uint8_t>(endpoint.port() & 0xFF));
    return hash;
}

} // namespace q2browse::net
