#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "common/json.hpp"
#include <spdlog/spdlog.h>

namespace q2browse::config {

struct ConfigLayer {
    q2browse::json::Value json;
    std::string label;
};

// Layered, read-mostly configuration: built-in defaults, then the user file,
// then runtime layers (command line overrides) in insertion order.
class ConfigStore {
public:
    static void Initialize(q2browse::json::Value defaults,
                           const std::filesystem::path &userConfigPath,
                           spdlog::level::level_enum missingUserLevel = spdlog::level::debug);
    static uint64_t Revision();
    static void Reset();

    static const std::filesystem::path &UserConfigPath();

    static const q2browse::json::Value *Get(std::string_view path);
    static std::optional<q2browse::json::Value> GetCopy(std::string_view path);

    static bool AddRuntimeLayer(const std::string &label, const q2browse::json::Value &layerJson);
    static bool RemoveRuntimeLayer(const std::string &label);
    static const q2browse::json::Value *LayerByLabel(const std::string &label);

    // Writes a value into the named runtime layer, creating the layer if needed.
    static bool SetRuntime(const std::string &label, std::string_view path, q2browse::json::Value value);

private:
    static void rebuildMergedLocked();
    static bool setValueAtPath(q2browse::json::Value &root, std::string_view path, q2browse::json::Value value);
};

} // namespace q2browse::config
