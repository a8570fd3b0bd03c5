#include "common/config_validation.hpp"

#include "common/config_store.hpp"
#include "common/json.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

namespace {

using q2browse::config::RequiredKey;
using q2browse::config::RequiredType;

bool IsBoolLike(const q2browse::json::Value& value) {
    if (value.is_boolean() || value.is_number_integer()) {
        return true;
    }
    if (!value.is_string()) {
        return false;
    }
    std::string text = value.get<std::string>();
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return text == "true" || text == "false" || text == "1" || text == "0"
        || text == "yes" || text == "no" || text == "on" || text == "off";
}

bool IsUInt16Like(const q2browse::json::Value& value) {
    if (value.is_number_integer()) {
        const auto raw = value.get<long long>();
        return raw >= 0 && raw <= std::numeric_limits<uint16_t>::max();
    }
    return false;
}

bool IsIntLike(const q2browse::json::Value& value) {
    return value.is_number_integer();
}

bool IsValidType(const q2browse::json::Value& value, RequiredType type) {
    switch (type) {
    case RequiredType::Bool:
        return IsBoolLike(value);
    case RequiredType::UInt16:
        return IsUInt16Like(value);
    case RequiredType::Int:
        return IsIntLike(value);
    case RequiredType::String:
        return value.is_string();
    }
    return false;
}

const char* TypeLabel(RequiredType type) {
    switch (type) {
    case RequiredType::Bool:
        return "bool";
    case RequiredType::UInt16:
        return "uint16";
    case RequiredType::Int:
        return "int";
    case RequiredType::String:
        return "string";
    }
    return "unknown";
}

} // namespace

namespace q2browse::config {

std::vector<ValidationIssue> ValidateRequiredKeys(const std::vector<RequiredKey>& keys) {
    std::vector<ValidationIssue> issues;
    for (const auto& entry : keys) {
        const auto value = ConfigStore::GetCopy(entry.path);
        if (!value) {
            issues.push_back({entry.path, "missing required config"});
            continue;
        }
        if (!IsValidType(*value, entry.type)) {
            issues.push_back({entry.path, std::string("invalid type (expected ") + TypeLabel(entry.type) + ")"});
        }
    }
    return issues;
}

std::vector<RequiredKey> DiscoveryRequiredKeys() {
    return {
        {"discovery.Master.Address", RequiredType::String},
        {"discovery.Master.Port", RequiredType::UInt16},
        {"discovery.Master.TimeoutMs", RequiredType::Int},
        {"discovery.Http.Enabled", RequiredType::Bool},
        {"discovery.Http.Url", RequiredType::String},
        {"discovery.Http.TimeoutSeconds", RequiredType::Int},
        {"discovery.Lan.Enabled", RequiredType::Bool},
        {"discovery.Lan.BroadcastAddress", RequiredType::String},
        {"discovery.Lan.Port", RequiredType::UInt16},
        {"discovery.Lan.ListenMs", RequiredType::Int},
        {"probe.MaxConcurrent", RequiredType::Int},
        {"probe.TimeoutMs", RequiredType::Int}
    };
}

} // namespace q2browse::config
