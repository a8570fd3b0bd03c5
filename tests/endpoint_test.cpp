#include <gtest/gtest.h>

#include <unordered_set>

#include "net/endpoint.hpp"

using q2browse::net::Endpoint;
using q2browse::net::EndpointHash;

TEST(Endpoint, ParsesIPv4WithPort) {
    const auto endpoint = Endpoint::Parse("192.168.0.10:27911");
    ASSERT_TRUE(endpoint.has_value());
    EXPECT_EQ(endpoint->family(), Endpoint::Family::IPv4);
    EXPECT_EQ(endpoint->port(), 27911);
    EXPECT_EQ(endpoint->address(), "192.168.0.10");
    EXPECT_EQ(endpoint->toString(), "192.168.0.10:27911");
}

TEST(Endpoint, DefaultPortAppliesWhenOmitted) {
    const auto endpoint = Endpoint::Parse("10.1.2.3", 27910);
    ASSERT_TRUE(endpoint.has_value());
    EXPECT_EQ(endpoint->toString(), "10.1.2.3:27910");
}

TEST(Endpoint, ParsesBracketedIPv6) {
    const auto endpoint = Endpoint::Parse("[::1]:27910");
    ASSERT_TRUE(endpoint.has_value());
    EXPECT_EQ(endpoint->family(), Endpoint::Family::IPv6);
    EXPECT_EQ(endpoint->toString(), "[::1]:27910");
}

TEST(Endpoint, RejectsMalformedText) {
    EXPECT_FALSE(Endpoint::Parse("").has_value());
    EXPECT_FALSE(Endpoint::Parse("master.quake2.com:27900").has_value());
    EXPECT_FALSE(Endpoint::Parse("1.2.3.4:70000").has_value());
    EXPECT_FALSE(Endpoint::Parse("1.2.3.4:").has_value());
    EXPECT_FALSE(Endpoint::Parse("[::1").has_value());
    EXPECT_FALSE(Endpoint::Parse("256.1.1.1:1").has_value());
}

TEST(Endpoint, ResolveAcceptsNumericHost) {
    const auto endpoint = Endpoint::Resolve("127.0.0.1", 27900);
    ASSERT_TRUE(endpoint.has_value());
    EXPECT_EQ(endpoint->toString(), "127.0.0.1:27900");
    EXPECT_FALSE(Endpoint::Resolve("", 27900).has_value());
}

TEST(Endpoint, SockaddrConversionKeepsAddressAndPort) {
    const auto original = Endpoint::FromIPv4({172, 16, 5, 4}, 27910);
    sockaddr_storage storage{};
    const socklen_t length = original.toSockaddr(storage);
    const auto back = Endpoint::FromSockaddr(reinterpret_cast<const sockaddr *>(&storage), length);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, original);
}

TEST(Endpoint, UnspecifiedMeansZeroAddressAndPort) {
    EXPECT_TRUE(Endpoint::FromIPv4({0, 0, 0, 0}, 0).isUnspecified());
    EXPECT_FALSE(Endpoint::FromIPv4({0, 0, 0, 0}, 27910).isUnspecified());
    EXPECT_FALSE(Endpoint::FromIPv4({1, 0, 0, 0}, 0).isUnspecified());
}

TEST(Endpoint, EqualityAndHashFollowAddressAndPort) {
    const auto a = Endpoint::FromIPv4({1, 2, 3, 4}, 27910);
    const auto sameAsA = *Endpoint::Parse("1.2.3.4:27910");
    const auto otherPort = Endpoint::FromIPv4({1, 2, 3, 4}, 27911);

    EXPECT_EQ(a, sameAsA);
    EXPECT_NE(a, otherPort);
    EXPECT_EQ(EndpointHash{}(a), EndpointHash{}(sameAsA));

    std::unordered_set<Endpoint, EndpointHash> set{a, sameAsA, otherPort};
    EXPECT_EQ(set.size(), 2u);
}
