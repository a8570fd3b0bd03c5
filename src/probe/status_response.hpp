#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "net/endpoint.hpp"
#include "probe/server_record.hpp"

namespace q2browse::probe {

constexpr std::size_t MAX_STATUS_PAYLOAD = 64 * 1024;
constexpr std::size_t MAX_ATTRIBUTES = 256;
constexpr std::size_t MAX_PLAYERS = 128;

// True when the datagram carries the OOB marker followed by the "print" reply
// header. LAN discovery uses this to accept a broadcast reply.
bool IsStatusReply(std::string_view datagram);

// "\key\value\key\value". A trailing key without value maps to "".
std::vector<std::pair<std::string, std::string>> ParseInfoString(std::string_view line,
                                                                 std::size_t maxPairs,
                                                                 bool *truncated = nullptr);

// `score time "name"`; the quotes are optional.
std::optional<PlayerEntry> ParsePlayerLine(std::string_view line);

// Returns nothing when the reply is not a status reply or carries no info
// line. Oversized payloads are cut to MAX_STATUS_PAYLOAD before parsing;
// pair and player counts are capped.
std::optional<ServerRecord> ParseStatusResponse(std::string_view datagram,
                                                const net::Endpoint &endpoint,
                                                std::chrono::milliseconds latency,
                                                spdlog::logger *logger = nullptr);

} // namespace q2browse::probe
