#include "net/udp_socket.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

void setNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        flags = 0;
    }
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

void closeSocketHandle(int fd) {
    if (fd >= 0) {
        ::close(fd);
    }
}

} // namespace

namespace q2browse::net {

UdpSocket::~UdpSocket() {
    close();
}

UdpSocket::UdpSocket(UdpSocket &&other) noexcept
    : socketFd(other.socketFd), error(std::move(other.error)) {
    other.socketFd = -1;
}

UdpSocket &UdpSocket::operator=(UdpSocket &&other) noexcept {
    if (this != &other) {
        close();
        socketFd = other.socketFd;
        error = std::move(other.error);
        other.socketFd = -1;
    }
    return *this;
}

bool UdpSocket::open(Endpoint::Family family) {
    close();
    const int domain = family == Endpoint::Family::IPv6 ? AF_INET6 : AF_INET;
    socketFd = ::socket(domain, SOCK_DGRAM, 0);
    if (socketFd < 0) {
        recordError("socket");
        return false;
    }
    setNonBlocking(socketFd);
    return true;
}

bool UdpSocket::bind(const Endpoint &local) {
    if (socketFd < 0) {
        error = "bind: socket not open";
        return false;
    }
    sockaddr_storage address{};
    const socklen_t length = local.toSockaddr(address);
    if (::bind(socketFd, reinterpret_cast<sockaddr *>(&address), length) < 0) {
        recordError("bind");
        return false;
    }
    return true;
}

bool UdpSocket::enableBroadcast() {
    if (socketFd < 0) {
        error = "setsockopt: socket not open";
        return false;
    }
    int broadcast = 1;
    if (setsockopt(socketFd, SOL_SOCKET, SO_BROADCAST, &broadcast, sizeof(broadcast)) < 0) {
        recordError("setsockopt(SO_BROADCAST)");
        return false;
    }
    return true;
}

void UdpSocket::close() {
    if (socketFd >= 0) {
        closeSocketHandle(socketFd);
        socketFd = -1;
    }
}

bool UdpSocket::sendTo(const Endpoint &target, std::string_view payload) {
    if (socketFd < 0) {
        error = "sendto: socket not open";
        return false;
    }
    sockaddr_storage address{};
    const socklen_t length = target.toSockaddr(address);
    const auto sent = ::sendto(socketFd, payload.data(), payload.size(), 0,
                               reinterpret_cast<sockaddr *>(&address), length);
    if (sent < 0 || static_cast<std::size_t>(sent) != payload.size()) {
        recordError("sendto");
        return false;
    }
    return true;
}

UdpSocket::ReceiveStatus UdpSocket::receiveFrom(std::string &payload,
                                                Endpoint &from,
                                                std::chrono::steady_clock::time_point deadline,
                                                const CancellationToken &cancellation) {
    if (socketFd < 0) {
        error = "recvfrom: socket not open";
        return ReceiveStatus::Error;
    }

    while (true) {
        if (cancellation.isCancelled()) {
            return ReceiveStatus::Cancelled;
        }

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return ReceiveStatus::Timeout;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        const auto slice = std::max(std::chrono::milliseconds(1), std::min(remaining, CANCEL_POLL_INTERVAL));

        pollfd descriptor{};
        descriptor.fd = socketFd;
        descriptor.events = POLLIN;
        const int ready = ::poll(&descriptor, 1, static_cast<int>(slice.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            recordError("poll");
            return ReceiveStatus::Error;
        }
        if (ready == 0) {
            continue;
        }

        payload.resize(MAX_DATAGRAM);
        sockaddr_storage sender{};
        socklen_t senderLength = sizeof(sender);
        const auto received = ::recvfrom(socketFd, payload.data(), payload.size(), 0,
                                         reinterpret_cast<sockaddr *>(&sender), &senderLength);
        if (received < 0) {
            if (errno == EWOULDBLOCK || errno == EAGAIN || errno == EINTR) {
                continue;
            }
            // Linux reports an earlier ICMP port-unreachable on the next receive.
            recordError("recvfrom");
            payload.clear();
            return ReceiveStatus::Error;
        }
        payload.resize(static_cast<std::size_t>(received));

        const auto sourceEndpoint = Endpoint::FromSockaddr(reinterpret_cast<sockaddr *>(&sender), senderLength);
        if (!sourceEndpoint) {
            continue;
        }
        from = *sourceEndpoint;
        return ReceiveStatus::Received;
    }
}

std::optional<Endpoint> UdpSocket::localEndpoint() const {
    if (socketFd < 0) {
        return std::nullopt;
    }
    sockaddr_storage address{};
    socklen_t length = sizeof(address);
    if (::getsockname(socketFd, reinterpret_cast<sockaddr *>(&address), &length) < 0) {
        return std::nullopt;
    }
    return Endpoint::FromSockaddr(reinterpret_cast<sockaddr *>(&address), length);
}

void UdpSocket::recordError(const char *operation) {
    error = std::string(operation) + ": " + std::strerror(errno);
}

} // namespace q2browse::net
