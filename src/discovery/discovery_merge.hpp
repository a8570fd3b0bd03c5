#pragma once

#include <initializer_list>
#include <vector>

#include "net/endpoint.hpp"

namespace q2browse::discovery {

// Concatenates the lists in order and drops repeated endpoints, keeping the
// first occurrence.
std::vector<net::Endpoint> MergeEndpoints(std::initializer_list<const std::vector<net::Endpoint> *> sources);

} // namespace q2browse::discovery
