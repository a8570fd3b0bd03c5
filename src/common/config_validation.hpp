#pragma once

#include <string>
#include <vector>

namespace q2browse::config {

enum class RequiredType {
    Bool,
    UInt16,
    Int,
    String
};

struct RequiredKey {
    const char* path;
    RequiredType type;
};

struct ValidationIssue {
    std::string path;
    std::string message;
};

std::vector<ValidationIssue> ValidateRequiredKeys(const std::vector<RequiredKey>& keys);

std::vector<RequiredKey> DiscoveryRequiredKeys();

} // namespace q2browse::config
