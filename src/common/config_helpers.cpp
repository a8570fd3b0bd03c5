#include "common/config_helpers.hpp"

#include "common/config_store.hpp"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <cctype>
#include <limits>

namespace q2browse::config {

bool ReadBoolConfig(std::initializer_list<const char*> paths, bool defaultValue) {
    for (const char* path : paths) {
        if (const auto value = ConfigStore::GetCopy(path)) {
            if (value->is_boolean()) {
                return value->get<bool>();
            }
            if (value->is_number_integer()) {
                return value->get<long long>() != 0;
            }
            if (value->is_string()) {
                std::string text = value->get<std::string>();
                std::transform(text.begin(), text.end(), text.begin(),
                               [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
                if (text == "true" || text == "1" || text == "yes" || text == "on") {
                    return true;
                }
                if (text == "false" || text == "0" || text == "no" || text == "off") {
                    return false;
                }
            }
            spdlog::warn("Config '{}' cannot be interpreted as boolean", path);
        }
    }
    return defaultValue;
}

uint16_t ReadUInt16Config(std::initializer_list<const char*> paths, uint16_t defaultValue) {
    for (const char* path : paths) {
        const auto value = ConfigStore::GetCopy(path);
        if (!value) {
            continue;
        }

        if (value->is_number_integer()) {
            const auto raw = value->get<long long>();
            if (raw > 0 && raw <= std::numeric_limits<uint16_t>::max()) {
                return static_cast<uint16_t>(raw);
            }
            spdlog::warn("Config '{}' must be in 1..65535; falling back", path);
            return defaultValue;
        }

        if (value->is_string()) {
            try {
                const auto parsed = std::stoul(value->get<std::string>());
                if (parsed > 0 && parsed <= std::numeric_limits<uint16_t>::max()) {
                    return static_cast<uint16_t>(parsed);
                }
            } catch (const std::exception &) {
                spdlog::warn("Config '{}' string value is not a valid uint16", path);
            }
            return defaultValue;
        }

        spdlog::warn("Config '{}' cannot be interpreted as uint16", path);
    }
    return defaultValue;
}

int ReadIntConfig(std::initializer_list<const char*> paths, int defaultValue) {
    for (const char* path : paths) {
        const auto value = ConfigStore::GetCopy(path);
        if (!value) {
            continue;
        }
        if (value->is_number_integer()) {
            const auto raw = value->get<long long>();
            if (raw >= std::numeric_limits<int>::min() && raw <= std::numeric_limits<int>::max()) {
                return static_cast<int>(raw);
            }
            spdlog::warn("Config '{}' is out of range", path);
            return defaultValue;
        }
        if (value->is_number_float()) {
            return static_cast<int>(value->get<double>());
        }
        if (value->is_string()) {
            try {
                return std::stoi(value->get<std::string>());
            } catch (const std::exception &) {
                spdlog::warn("Config '{}' string value is not a valid integer", path);
            }
            return defaultValue;
        }
        spdlog::warn("Config '{}' cannot be interpreted as integer", path);
    }
    return defaultValue;
}

std::string ReadStringConfig(const char *path, const std::string &defaultValue) {
    if (const auto value = ConfigStore::GetCopy(path)) {
        if (value->is_string()) {
            return value->get<std::string>();
        }
        spdlog::warn("Config '{}' is not a string", path);
    }
    return defaultValue;
}

} // namespace q2browse::config
