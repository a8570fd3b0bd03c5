#include "probe/status_response.hpp"

#include "net/oob_protocol.hpp"

#include <charconv>

namespace {

std::string_view trimLine(std::string_view line) {
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t')) {
        line.remove_suffix(1);
    }
    while (!line.empty() && (line.front() == ' ' || line.front() == '\t')) {
        line.remove_prefix(1);
    }
    return line;
}

std::string_view nextLine(std::string_view &text) {
    const auto newline = text.find('\n');
    std::string_view line = text.substr(0, newline);
    text.remove_prefix(newline == std::string_view::npos ? text.size() : newline + 1);
    return line;
}

bool readInt(std::string_view &text, int &out) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    if (text.empty()) {
        return false;
    }
    const char *begin = text.data();
    const char *end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(begin, end, out);
    if (ec != std::errc() || ptr == begin) {
        return false;
    }
    text.remove_prefix(static_cast<std::size_t>(ptr - begin));
    return true;
}

int toInt(const std::string &text, int fallback) {
    int value = fallback;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr == text.data()) {
        return fallback;
    }
    return value;
}

// The reply header is "print" on its own line.
bool stripReplyHeader(std::string_view &payload) {
    const auto header = q2browse::oob::STATUS_REPLY;
    if (payload.substr(0, header.size()) != header) {
        return false;
    }
    payload.remove_prefix(header.size());
    if (!payload.empty() && payload.front() == '\r') {
        payload.remove_prefix(1);
    }
    if (payload.empty()) {
        return true;
    }
    if (payload.front() != '\n') {
        return false;
    }
    payload.remove_prefix(1);
    return true;
}

} // namespace

namespace q2browse::probe {

bool IsStatusReply(std::string_view datagram) {
    if (!oob::HasOobHeader(datagram)) {
        return false;
    }
    std::string_view payload = oob::RemoveOobHeader(datagram);
    return stripReplyHeader(payload);
}

std::vector<std::pair<std::string, std::string>> ParseInfoString(std::string_view line,
                                                                 std::size_t maxPairs,
                                                                 bool *truncated) {
    std::vector<std::pair<std::string, std::string>> pairs;
    if (truncated) {
        *truncated = false;
    }
    if (!line.empty() && line.front() == '\\') {
        line.remove_prefix(1);
    }

    while (!line.empty()) {
        if (pairs.size() >= maxPairs) {
            if (truncated) {
                *truncated = true;
            }
            break;
        }
        const auto keyEnd = line.find('\\');
        std::string key(line.substr(0, keyEnd));
        if (keyEnd == std::string_view::npos) {
            if (!key.empty()) {
                pairs.emplace_back(std::move(key), std::string());
            }
            break;
        }
        line.remove_prefix(keyEnd + 1);

        const auto valueEnd = line.find('\\');
        std::string value(line.substr(0, valueEnd));
        line.remove_prefix(valueEnd == std::string_view::npos ? line.size() : valueEnd + 1);

        if (key.empty()) {
            continue;
        }
        pairs.emplace_back(std::move(key), std::move(value));
    }
    return pairs;
}

std::optional<PlayerEntry> ParsePlayerLine(std::string_view line) {
    line = trimLine(line);
    if (line.empty()) {
        return std::nullopt;
    }

    PlayerEntry entry;
    if (!readInt(line, entry.score) || !readInt(line, entry.time)) {
        return std::nullopt;
    }

    line = trimLine(line);
    if (!line.empty() && line.front() == '"') {
        line.remove_prefix(1);
        const auto closing = line.find('"');
        entry.name = std::string(line.substr(0, closing));
    } else {
        entry.name = std::string(line);
    }
    entry.nameSegments = SegmentColorCodes(entry.name);
    return entry;
}

std::optional<ServerRecord> ParseStatusResponse(std::string_view datagram,
                                                const net::Endpoint &endpoint,
                                                std::chrono::milliseconds latency,
                                                spdlog::logger *logger) {
    std::string_view payload = oob::RemoveOobHeader(datagram);
    if (payload.size() > MAX_STATUS_PAYLOAD) {
        if (logger) {
            logger->debug("StatusResponse: {} sent {} bytes; parsing the first {}",
                          endpoint.toString(), payload.size(), MAX_STATUS_PAYLOAD);
        }
        payload = payload.substr(0, MAX_STATUS_PAYLOAD);
    }

    if (!stripReplyHeader(payload)) {
        if (logger) {
            logger->debug("StatusResponse: {} replied without a status header", endpoint.toString());
        }
        return std::nullopt;
    }

    const std::string_view infoLine = trimLine(nextLine(payload));
    if (infoLine.empty()) {
        if (logger) {
            logger->debug("StatusResponse: {} replied without server info", endpoint.toString());
        }
        return std::nullopt;
    }

    ServerRecord record;
    record.endpoint = endpoint;
    record.latency = latency;

    bool attributesTruncated = false;
    record.attributes = ParseInfoString(infoLine, MAX_ATTRIBUTES, &attributesTruncated);
    if (record.attributes.empty()) {
        if (logger) {
            logger->debug("StatusResponse: {} sent an empty info string", endpoint.toString());
        }
        return std::nullopt;
    }
    if (attributesTruncated && logger) {
        logger->warn("StatusResponse: {} exceeded {} info pairs; extra pairs ignored",
                     endpoint.toString(), MAX_ATTRIBUTES);
    }

    while (!payload.empty()) {
        const std::string_view line = nextLine(payload);
        if (trimLine(line).empty()) {
            continue;
        }
        if (record.players.size() >= MAX_PLAYERS) {
            if (logger) {
                logger->warn("StatusResponse: {} exceeded {} player lines; extra players ignored",
                             endpoint.toString(), MAX_PLAYERS);
            }
            break;
        }
        if (auto player = ParsePlayerLine(line)) {
            record.players.push_back(std::move(*player));
        }
    }

    record.hostname = record.attribute("hostname");
    record.hostnameSegments = SegmentColorCodes(record.hostname);
    record.map = record.attribute("mapname");
    record.mod = record.attribute("game");
    if (record.mod.empty()) {
        record.mod = record.attribute("gamename");
    }
    record.maxPlayers = toInt(record.attribute("maxclients"), 0);
    record.playerCount = static_cast<int>(record.players.size());
    return record;
}

} // namespace q2browse::probe
