#include <gtest/gtest.h>

#include <thread>

#include "discovery/lan_broadcast_client.hpp"
#include "net/udp_socket.hpp"
#include "test_support.hpp"

using namespace q2browse;
using namespace std::chrono_literals;

namespace {

// Answers the first status query it sees; `replies` copies of the answer go back.
class LoopbackResponder {
public:
    explicit LoopbackResponder(int replies) : replies(replies) {
        EXPECT_TRUE(socket.open(net::Endpoint::Family::IPv4));
        EXPECT_TRUE(socket.bind(test::V4(127, 0, 0, 1, 0)));
        const auto local = socket.localEndpoint();
        EXPECT_TRUE(local.has_value());
        if (local) {
            endpoint = *local;
        }
        worker = std::thread([this]() { serve(); });
    }

    ~LoopbackResponder() {
        stop.cancel();
        worker.join();
    }

    net::Endpoint endpoint;

private:
    void serve() {
        std::string payload;
        net::Endpoint from;
        const auto deadline = std::chrono::steady_clock::now() + 2s;
        while (socket.receiveFrom(payload, from, deadline, stop.token()) == net::UdpSocket::ReceiveStatus::Received) {
            if (payload != oob::PrependOobHeader("status\n")) {
                continue;
            }
            socket.sendTo(from, oob::PrependOobHeader("ack\n"));
            for (int i = 0; i < replies; ++i) {
                socket.sendTo(from, test::StatusReply("\\hostname\\lan box\\mapname\\q2dm2"));
            }
            return;
        }
    }

    int replies;
    net::UdpSocket socket;
    CancellationSource stop;
    std::thread worker;
};

} // namespace

TEST(LanBroadcastClient, CollectsEachResponderOnce) {
    LoopbackResponder responder(2);

    discovery::LanBroadcastOptions options;
    options.broadcastAddress = "127.0.0.1";
    options.port = responder.endpoint.port();
    options.listenWindow = 400ms;
    discovery::LanBroadcastClient client(options);
    CancellationSource source;

    const auto servers = client.discover(source.token());
    ASSERT_EQ(servers.size(), 1u);
    EXPECT_EQ(servers[0], responder.endpoint);
}

TEST(LanBroadcastClient, SilentNetworkYieldsNothingAfterWindow) {
    LoopbackResponder responder(0);

    discovery::LanBroadcastOptions options;
    options.broadcastAddress = "127.0.0.1";
    options.port = responder.endpoint.port();
    options.listenWindow = 150ms;
    discovery::LanBroadcastClient client(options);
    CancellationSource source;

    const auto started = std::chrono::steady_clock::now();
    EXPECT_TRUE(client.discover(source.token()).empty());
    EXPECT_GE(std::chrono::steady_clock::now() - started, 140ms);
}

TEST(LanBroadcastClient, CancellationEndsListenWindowEarly) {
    LoopbackResponder responder(0);

    discovery::LanBroadcastOptions options;
    options.broadcastAddress = "127.0.0.1";
    options.port = responder.endpoint.port();
    options.listenWindow = 5000ms;
    discovery::LanBroadcastClient client(options);
    CancellationSource source;

    std::thread canceller([&]() {
        std::this_thread::sleep_for(50ms);
        source.cancel();
    });
    const auto started = std::chrono::steady_clock::now();
    const auto servers = client.discover(source.token());
    canceller.join();

    EXPECT_TRUE(servers.empty());
    EXPECT_LT(std::chrono::steady_clock::now() - started, 2000ms);
}

TEST(LanBroadcastClient, InvalidBroadcastAddressIsEmpty) {
    discovery::LanBroadcastOptions options;
    options.broadcastAddress = "not-an-address";
    discovery::LanBroadcastClient client(options);
    CancellationSource source;
    EXPECT_TRUE(client.discover(source.token()).empty());
}
