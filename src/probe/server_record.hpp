#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "net/endpoint.hpp"
#include "probe/color_text.hpp"

namespace q2browse::probe {

struct PlayerEntry {
    std::string name;
    std::vector<TextSegment> nameSegments;
    int score = 0;
    // Second numeric column of a player line; ping in milliseconds on stock servers.
    int time = 0;
};

// Built once by ParseStatusResponse and handed out as const. A later probe of
// the same endpoint yields a new record that replaces this one by key().
struct ServerRecord {
    net::Endpoint endpoint;
    std::string hostname;
    std::vector<TextSegment> hostnameSegments;
    std::string map;
    std::string mod;
    int playerCount = 0;
    int maxPlayers = 0;
    std::chrono::milliseconds latency{0};
    std::vector<PlayerEntry> players;
    // Server info pairs in wire order.
    std::vector<std::pair<std::string, std::string>> attributes;

    std::string key() const { return endpoint.toString(); }

    // First value stored under `name`, or empty.
    std::string attribute(std::string_view name) const {
        for (const auto &[attrKey, value] : attributes) {
            if (attrKey == name) {
                return value;
            }
        }
        return {};
    }
};

} // namespace q2browse::probe
