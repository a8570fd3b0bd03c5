#include "discovery/discovery_merge.hpp"

#include <unordered_set>

namespace q2browse::discovery {

std::vector<net::Endpoint> MergeEndpoints(std::initializer_list<const std::vector<net::Endpoint> *> sources) {
    std::size_t total = 0;
    for (const auto *source : sources) {
        if (source) {
            total += source->size();
        }
    }

    std::vector<net::Endpoint> merged;
    merged.reserve(total);
    std::unordered_set<net::Endpoint, net::EndpointHash> seen;
    seen.reserve(total);

    for (const auto *source : sources) {
        if (!source) {
            continue;
        }
        for (const auto &endpoint : *source) {
            if (seen.insert(endpoint).second) {
                merged.push_back(endpoint);
            }
        }
    }
    return merged;
}

} // namespace q2browse::discovery
