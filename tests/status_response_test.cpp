#include <gtest/gtest.h>

#include "probe/status_response.hpp"
#include "test_support.hpp"

using namespace q2browse;
using namespace std::chrono_literals;

namespace {

const net::Endpoint kServer = test::V4(10, 0, 0, 5, 27910);

std::optional<probe::ServerRecord> parse(const std::string &datagram) {
    return probe::ParseStatusResponse(datagram, kServer, 42ms);
}

} // namespace

TEST(StatusResponse, ParsesInfoAndPlayers) {
    const auto record = parse(test::StatusReply(
        "\\hostname\\^1Rail ^7Arena\\mapname\\q2dm1\\game\\ctf\\maxclients\\16",
        {"12 50 \"Player1\"", "-3 120 \"^2Camper\"", "0 999 \"Joe\""}));

    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->endpoint, kServer);
    EXPECT_EQ(record->key(), "10.0.0.5:27910");
    EXPECT_EQ(record->latency, 42ms);
    EXPECT_EQ(record->hostname, "^1Rail ^7Arena");
    ASSERT_EQ(record->hostnameSegments.size(), 2u);
    EXPECT_EQ(record->hostnameSegments[0].text, "Rail ");
    EXPECT_EQ(record->hostnameSegments[0].color, 1);
    EXPECT_EQ(record->map, "q2dm1");
    EXPECT_EQ(record->mod, "ctf");
    EXPECT_EQ(record->maxPlayers, 16);
    EXPECT_EQ(record->playerCount, 3);

    ASSERT_EQ(record->players.size(), 3u);
    EXPECT_EQ(record->players[0].name, "Player1");
    EXPECT_EQ(record->players[0].score, 12);
    EXPECT_EQ(record->players[0].time, 50);
    EXPECT_EQ(record->players[1].score, -3);
    EXPECT_EQ(record->players[1].nameSegments.size(), 1u);
    EXPECT_EQ(record->players[1].nameSegments[0].color, 2);
    EXPECT_EQ(record->players[2].time, 999);
}

TEST(StatusResponse, ModFallsBackToGamename) {
    const auto record = parse(test::StatusReply("\\hostname\\x\\gamename\\baseq2"));
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->mod, "baseq2");
    EXPECT_EQ(record->playerCount, 0);
}

TEST(StatusResponse, KeepsAttributesInWireOrder) {
    const auto record = parse(test::StatusReply("\\b\\2\\a\\1\\flag"));
    ASSERT_TRUE(record.has_value());
    ASSERT_EQ(record->attributes.size(), 3u);
    EXPECT_EQ(record->attributes[0].first, "b");
    EXPECT_EQ(record->attributes[1].first, "a");
    EXPECT_EQ(record->attributes[2].first, "flag");
    EXPECT_EQ(record->attributes[2].second, "");
}

TEST(StatusResponse, SkipsMalformedPlayerLines) {
    const auto record = parse(test::StatusReply("\\hostname\\x", {"garbage", "5 10 \"ok\"", "7"}));
    ASSERT_TRUE(record.has_value());
    ASSERT_EQ(record->players.size(), 1u);
    EXPECT_EQ(record->players[0].name, "ok");
}

TEST(StatusResponse, RejectsWrongHeaderOrMissingInfo) {
    EXPECT_FALSE(parse(oob::PrependOobHeader("info\n\\hostname\\x\n")).has_value());
    EXPECT_FALSE(parse(oob::PrependOobHeader("printer\n\\hostname\\x\n")).has_value());
    EXPECT_FALSE(parse(oob::PrependOobHeader("print\n")).has_value());
    EXPECT_FALSE(parse(oob::PrependOobHeader("print\n\n5 10 \"x\"\n")).has_value());
    EXPECT_FALSE(parse("").has_value());
}

TEST(StatusResponse, CapsPlayerLines) {
    std::vector<std::string> lines;
    for (int i = 0; i < 300; ++i) {
        lines.push_back(std::to_string(i) + " 10 \"p" + std::to_string(i) + "\"");
    }
    const auto record = parse(test::StatusReply("\\hostname\\busy", lines));
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->players.size(), probe::MAX_PLAYERS);
    EXPECT_EQ(record->playerCount, static_cast<int>(probe::MAX_PLAYERS));
}

TEST(StatusResponse, CapsAttributePairs) {
    std::string info;
    for (int i = 0; i < 400; ++i) {
        info += "\\k" + std::to_string(i) + "\\v";
    }
    const auto record = parse(test::StatusReply(info));
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->attributes.size(), probe::MAX_ATTRIBUTES);
}

TEST(StatusResponse, TruncatesOversizedPayloadInsteadOfRejecting) {
    std::vector<std::string> lines;
    lines.push_back("1 2 \"first\"");
    lines.push_back(std::string(probe::MAX_STATUS_PAYLOAD, 'x'));
    const auto record = parse(test::StatusReply("\\hostname\\huge", lines));
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->hostname, "huge");
    ASSERT_EQ(record->players.size(), 1u);
    EXPECT_EQ(record->players[0].name, "first");
}

TEST(StatusResponse, StatusReplyDetection) {
    EXPECT_TRUE(probe::IsStatusReply(test::StatusReply("\\hostname\\x")));
    EXPECT_TRUE(probe::IsStatusReply(oob::PrependOobHeader("print")));
    EXPECT_FALSE(probe::IsStatusReply("print\n\\hostname\\x\n"));
    EXPECT_FALSE(probe::IsStatusReply(oob::PrependOobHeader("status\n")));
}

TEST(StatusResponse, InfoStringHandlesEmptyKeysAndTruncationFlag) {
    bool truncated = true;
    auto pairs = probe::ParseInfoString("\\\\ignored\\key\\value", 10, &truncated);
    EXPECT_FALSE(truncated);
    ASSERT_EQ(pairs.size(), 1u);
    EXPECT_EQ(pairs[0].first, "key");
    EXPECT_EQ(pairs[0].second, "value");

    pairs = probe::ParseInfoString("\\a\\1\\b\\2\\c\\3", 2, &truncated);
    EXPECT_TRUE(truncated);
    EXPECT_EQ(pairs.size(), 2u);
}

TEST(StatusResponse, PlayerLineWithoutQuotes) {
    const auto player = probe::ParsePlayerLine("  4 33 bare name\r");
    ASSERT_TRUE(player.has_value());
    EXPECT_EQ(player->score, 4);
    EXPECT_EQ(player->time, 33);
    EXPECT_EQ(player->name, "bare name");
}
