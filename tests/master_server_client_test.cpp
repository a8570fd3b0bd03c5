#include <gtest/gtest.h>

#include "discovery/master_server_client.hpp"
#include "test_support.hpp"

using namespace q2browse;
using q2browse::discovery::MasterServerClient;
using namespace std::chrono_literals;

TEST(MasterServerClient, ParsesRecordsAfterMarker) {
    const std::string datagram = oob::PrependOobHeader(
        "servers " + test::AddressRecord(1, 2, 3, 4, 27910) + test::AddressRecord(5, 6, 7, 8, 27911));
    const auto endpoints = MasterServerClient::ParseServersResponse(datagram);
    ASSERT_TRUE(endpoints.has_value());
    ASSERT_EQ(endpoints->size(), 2u);
    EXPECT_EQ((*endpoints)[0].toString(), "1.2.3.4:27910");
    EXPECT_EQ((*endpoints)[1].toString(), "5.6.7.8:27911");
}

TEST(MasterServerClient, MarkerSeparatorIsOptional) {
    const std::string record = test::AddressRecord(9, 9, 9, 9, 27910);
    for (const std::string separator : {"", "\n"}) {
        const auto endpoints = MasterServerClient::ParseServersResponse(
            oob::PrependOobHeader("servers" + separator + record));
        ASSERT_TRUE(endpoints.has_value());
        ASSERT_EQ(endpoints->size(), 1u);
        EXPECT_EQ((*endpoints)[0].toString(), "9.9.9.9:27910");
    }
}

TEST(MasterServerClient, FirstRecordLookingLikeSeparatorIsKept) {
    // 10 is '\n' and 32 is ' '; with no separator those bytes start the record.
    auto endpoints = MasterServerClient::ParseServersResponse(oob::PrependOobHeader(
        "servers" + test::AddressRecord(10, 0, 0, 5, 27910) + test::AddressRecord(1, 2, 3, 4, 27911)));
    ASSERT_TRUE(endpoints.has_value());
    ASSERT_EQ(endpoints->size(), 2u);
    EXPECT_EQ((*endpoints)[0].toString(), "10.0.0.5:27910");
    EXPECT_EQ((*endpoints)[1].toString(), "1.2.3.4:27911");

    endpoints = MasterServerClient::ParseServersResponse(
        oob::PrependOobHeader("servers" + test::AddressRecord(32, 7, 7, 7, 27910)));
    ASSERT_TRUE(endpoints.has_value());
    ASSERT_EQ(endpoints->size(), 1u);
    EXPECT_EQ((*endpoints)[0].toString(), "32.7.7.7:27910");
}

TEST(MasterServerClient, SeparatorBeforeSeparatorLikeRecord) {
    for (const std::string separator : {" ", "\n"}) {
        const auto endpoints = MasterServerClient::ParseServersResponse(oob::PrependOobHeader(
            "servers" + separator + test::AddressRecord(10, 1, 2, 3, 27910) +
            test::AddressRecord(32, 4, 5, 6, 27911)));
        ASSERT_TRUE(endpoints.has_value());
        ASSERT_EQ(endpoints->size(), 2u);
        EXPECT_EQ((*endpoints)[0].toString(), "10.1.2.3:27910");
        EXPECT_EQ((*endpoints)[1].toString(), "32.4.5.6:27911");
    }
}

TEST(MasterServerClient, StopsAtZeroSentinel) {
    const std::string datagram = oob::PrependOobHeader(
        "servers " + test::AddressRecord(1, 1, 1, 1, 27910) + std::string(6, '\0') +
        test::AddressRecord(2, 2, 2, 2, 27910));
    const auto endpoints = MasterServerClient::ParseServersResponse(datagram);
    ASSERT_TRUE(endpoints.has_value());
    ASSERT_EQ(endpoints->size(), 1u);
    EXPECT_EQ((*endpoints)[0].toString(), "1.1.1.1:27910");
}

TEST(MasterServerClient, DiscardsShortTrailingRecord) {
    const std::string datagram = oob::PrependOobHeader(
        "servers " + test::AddressRecord(3, 3, 3, 3, 27910) + std::string("\x04\x04\x04", 3));
    const auto endpoints = MasterServerClient::ParseServersResponse(datagram);
    ASSERT_TRUE(endpoints.has_value());
    EXPECT_EQ(endpoints->size(), 1u);
}

TEST(MasterServerClient, EmptyListIsValid) {
    const auto endpoints = MasterServerClient::ParseServersResponse(oob::PrependOobHeader("servers "));
    ASSERT_TRUE(endpoints.has_value());
    EXPECT_TRUE(endpoints->empty());
}

TEST(MasterServerClient, RejectsUnexpectedMarker) {
    EXPECT_FALSE(MasterServerClient::ParseServersResponse(oob::PrependOobHeader("print\nhello")).has_value());
    EXPECT_FALSE(MasterServerClient::ParseServersResponse("").has_value());
}

TEST(MasterServerClient, QueriesResolvedMasterWithQueryCommand) {
    test::FakeExchanger exchanger([](const net::Endpoint &, std::string_view, std::chrono::milliseconds,
                                     const CancellationToken &) {
        return test::Reply(oob::PrependOobHeader("servers " + test::AddressRecord(8, 8, 4, 4, 27910)));
    });
    MasterServerClient client("127.0.0.1", 27900, 750ms, exchanger);
    CancellationSource source;

    const auto endpoints = client.queryServers(source.token());
    ASSERT_EQ(endpoints.size(), 1u);
    EXPECT_EQ(endpoints[0].toString(), "8.8.4.4:27910");

    const auto targets = exchanger.seenTargets();
    ASSERT_EQ(targets.size(), 1u);
    EXPECT_EQ(targets[0].toString(), "127.0.0.1:27900");
    EXPECT_EQ(exchanger.seenRequests()[0], oob::PrependOobHeader("query\n"));
}

TEST(MasterServerClient, TimeoutAndBadReplyYieldEmptyList) {
    test::FakeExchanger silent([](const net::Endpoint &, std::string_view, std::chrono::milliseconds,
                                  const CancellationToken &) { return test::TimedOut(); });
    CancellationSource source;
    EXPECT_TRUE(MasterServerClient("127.0.0.1", 27900, 50ms, silent).queryServers(source.token()).empty());

    test::FakeExchanger confused([](const net::Endpoint &, std::string_view, std::chrono::milliseconds,
                                    const CancellationToken &) {
        return test::Reply(oob::PrependOobHeader("print\nunknown command"));
    });
    EXPECT_TRUE(MasterServerClient("127.0.0.1", 27900, 50ms, confused).queryServers(source.token()).empty());
}

TEST(MasterServerClient, MissingAddressSkipsQuery) {
    test::FakeExchanger exchanger([](const net::Endpoint &, std::string_view, std::chrono::milliseconds,
                                     const CancellationToken &) {
        ADD_FAILURE() << "no exchange expected";
        return test::TimedOut();
    });
    CancellationSource source;
    EXPECT_TRUE(MasterServerClient("", 27900, 50ms, exchanger).queryServers(source.token()).empty());
}
