#include "net/oob_protocol.hpp"

#include <array>

namespace q2browse::oob {

std::string PrependOobHeader(std::string_view payload) {
    std::string framed;
    framed.reserve(HEADER_SIZE + payload.size());
    framed.append(HEADER);
    framed.append(payload);
    return framed;
}

bool HasOobHeader(std::string_view data) {
    if (data.size() < HEADER_SIZE) {
        return false;
    }
    return data.substr(0, HEADER_SIZE) == HEADER;
}

std::string_view RemoveOobHeader(std::string_view data) {
    if (!HasOobHeader(data)) {
        return data;
    }
    return data.substr(HEADER_SIZE);
}

std::optional<uint16_t> ReadBigEndianUInt16(std::string_view buffer, std::size_t offset) {
    if (offset > buffer.size() || buffer.size() - offset < 2) {
        return std::nullopt;
    }
    const auto high = static_cast<uint8_t>(buffer[offset]);
    const auto low = static_cast<uint8_t>(buffer[offset + 1]);
    return static_cast<uint16_t>((high << 8) | low);
}

std::optional<net::Endpoint> ParseEndpoint(std::string_view buffer, std::size_t offset) {
    if (offset > buffer.size() || buffer.size() - offset < ADDRESS_RECORD_SIZE) {
        return std::nullopt;
    }
    std::array<uint8_t, 4> octets{};
    for (std::size_t i = 0; i < octets.size(); ++i) {
        octets[i] = static_cast<uint8_t>(buffer[offset + i]);
    }
    return net::Endpoint::FromIPv4(octets, *ReadBigEndianUInt16(buffer, offset + 4));
}

} // namespace q2browse::oob
