#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "net/endpoint.hpp"

// Connectionless ("out-of-band") packets of the Quake II protocol family.
// Every control datagram starts with four 0xFF bytes; the rest is text
// commands or, for server lists, packed 6-byte address records.
namespace q2browse::oob {

constexpr std::string_view HEADER{"\xFF\xFF\xFF\xFF", 4};
constexpr std::size_t HEADER_SIZE = 4;
constexpr std::size_t ADDRESS_RECORD_SIZE = 6;

constexpr uint16_t SERVER_PORT = 27910;
constexpr uint16_t MASTER_PORT = 27900;

constexpr std::string_view MASTER_QUERY = "query\n";
constexpr std::string_view MASTER_REPLY = "servers";
constexpr std::string_view STATUS_QUERY = "status\n";
constexpr std::string_view STATUS_REPLY = "print";

std::string PrependOobHeader(std::string_view payload);
bool HasOobHeader(std::string_view data);
// Best-effort normalizer: returns the input unchanged when no header is present.
std::string_view RemoveOobHeader(std::string_view data);

// Returns nothing when fewer than two bytes remain at `offset`.
std::optional<uint16_t> ReadBigEndianUInt16(std::string_view buffer, std::size_t offset);
// Four address bytes then a big-endian port. Returns nothing when fewer than
// six bytes remain at `offset`.
std::optional<net::Endpoint> ParseEndpoint(std::string_view buffer, std::size_t offset);

} // namespace q2browse::oob
