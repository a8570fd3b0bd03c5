#include "common/config_store.hpp"

#include "common/file_utils.hpp"

#include <mutex>

namespace {

struct ConfigStoreState {
    std::mutex mutex;
    bool initialized = false;
    uint64_t revision = 0;
    q2browse::json::Value defaults = q2browse::json::Object();
    std::optional<q2browse::config::ConfigLayer> userLayer;
    std::vector<q2browse::config::ConfigLayer> runtimeLayers;
    q2browse::json::Value merged = q2browse::json::Object();
    std::filesystem::path userConfigPath;
};

ConfigStoreState g_state;

const q2browse::json::Value *resolvePath(const q2browse::json::Value &root, std::string_view path) {
    if (path.empty()) {
        return &root;
    }

    const q2browse::json::Value *current = &root;
    std::size_t position = 0;

    while (position < path.size()) {
        const std::size_t dot = path.find('.', position);
        const bool lastSegment = (dot == std::string_view::npos);
        const std::string segment(path.substr(position, lastSegment ? std::string_view::npos : dot - position));
        if (segment.empty()) {
            return nullptr;
        }

        if (!current->is_object()) {
            return nullptr;
        }
        const auto it = current->find(segment);
        if (it == current->end()) {
            return nullptr;
        }
        current = &(*it);

        if (lastSegment) {
            break;
        }

        position = dot + 1;
    }

    return current;
}

void mergeJsonObjects(q2browse::json::Value &destination, const q2browse::json::Value &source) {
    if (!destination.is_object() || !source.is_object()) {
        destination = source;
        return;
    }
    for (auto it = source.begin(); it != source.end(); ++it) {
        const auto &key = it.key();
        const auto &value = it.value();
        if (value.is_object() && destination.contains(key) && destination[key].is_object()) {
            mergeJsonObjects(destination[key], value);
        } else {
            destination[key] = value;
        }
    }
}

} // namespace

namespace q2browse::config {

void ConfigStore::Initialize(q2browse::json::Value defaults,
                             const std::filesystem::path &userConfigPath,
                             spdlog::level::level_enum missingUserLevel) {
    std::optional<ConfigLayer> userLayer;
    if (!userConfigPath.empty()) {
        spdlog::trace("config_store: loading user config '{}'", userConfigPath.string());
        if (auto userOpt = q2browse::file::LoadJsonFile(userConfigPath, "user config", missingUserLevel)) {
            if (userOpt->is_object()) {
                userLayer = ConfigLayer{std::move(*userOpt), "user config"};
            } else {
                spdlog::warn("config_store: User config {} is not a JSON object", userConfigPath.string());
            }
        }
    }

    if (!defaults.is_object()) {
        spdlog::error("config_store: Defaults are not a JSON object; starting empty");
        defaults = q2browse::json::Object();
    }

    std::lock_guard<std::mutex> lock(g_state.mutex);
    g_state.defaults = std::move(defaults);
    g_state.userLayer = std::move(userLayer);
    g_state.runtimeLayers.clear();
    g_state.userConfigPath = userConfigPath;
    rebuildMergedLocked();
    g_state.revision++;
    g_state.initialized = true;
}

uint64_t ConfigStore::Revision() {
    std::lock_guard<std::mutex> lock(g_state.mutex);
    return g_state.revision;
}

void ConfigStore::Reset() {
    std::lock_guard<std::mutex> lock(g_state.mutex);
    g_state.defaults = q2browse::json::Object();
    g_state.userLayer.reset();
    g_state.runtimeLayers.clear();
    g_state.merged = q2browse::json::Object();
    g_state.userConfigPath.clear();
    g_state.revision++;
    g_state.initialized = false;
}

const std::filesystem::path &ConfigStore::UserConfigPath() {
    std::lock_guard<std::mutex> lock(g_state.mutex);
    return g_state.userConfigPath;
}

const q2browse::json::Value *ConfigStore::Get(std::string_view path) {
    std::lock_guard<std::mutex> lock(g_state.mutex);
    if (!g_state.initialized) {
        return nullptr;
    }
    spdlog::trace("config_store: request for key '{}'", path);
    return resolvePath(g_state.merged, path);
}

std::optional<q2browse::json::Value> ConfigStore::GetCopy(std::string_view path) {
    std::lock_guard<std::mutex> lock(g_state.mutex);
    if (!g_state.initialized) {
        return std::nullopt;
    }
    if (const auto *value = resolvePath(g_state.merged, path)) {
        return std::optional<q2browse::json::Value>(std::in_place, *value);
    }
    return std::nullopt;
}

bool ConfigStore::AddRuntimeLayer(const std::string &label, const q2browse::json::Value &layerJson) {
    if (!layerJson.is_object()) {
        spdlog::warn("config_store: Runtime layer '{}' is not a JSON object", label);
        return false;
    }
    std::lock_guard<std::mutex> lock(g_state.mutex);
    if (!g_state.initialized) {
        return false;
    }
    for (auto &layer : g_state.runtimeLayers) {
        if (layer.label == label) {
            layer.json = layerJson;
            rebuildMergedLocked();
            g_state.revision++;
            return true;
        }
    }
    g_state.runtimeLayers.push_back({layerJson, label});
    rebuildMergedLocked();
    g_state.revision++;
    return true;
}

bool ConfigStore::RemoveRuntimeLayer(const std::string &label) {
    std::lock_guard<std::mutex> lock(g_state.mutex);
    for (auto it = g_state.runtimeLayers.begin(); it != g_state.runtimeLayers.end(); ++it) {
        if (it->label == label) {
            g_state.runtimeLayers.erase(it);
            rebuildMergedLocked();
            g_state.revision++;
            return true;
        }
    }
    return false;
}

const q2browse::json::Value *ConfigStore::LayerByLabel(const std::string &label) {
    std::lock_guard<std::mutex> lock(g_state.mutex);
    if (g_state.userLayer && g_state.userLayer->label == label) {
        return &g_state.userLayer->json;
    }
    for (const auto &layer : g_state.runtimeLayers) {
        if (layer.label == label) {
            return &layer.json;
        }
    }
    return nullptr;
}

bool ConfigStore::SetRuntime(const std::string &label, std::string_view path, q2browse::json::Value value) {
    std::lock_guard<std::mutex> lock(g_state.mutex);
    if (!g_state.initialized) {
        return false;
    }
    ConfigLayer *target = nullptr;
    for (auto &layer : g_state.runtimeLayers) {
        if (layer.label == label) {
            target = &layer;
            break;
        }
    }
    if (!target) {
        g_state.runtimeLayers.push_back({q2browse::json::Object(), label});
        target = &g_state.runtimeLayers.back();
    }
    spdlog::trace("config_store: writing key '{}' into layer '{}'", path, label);
    if (!setValueAtPath(target->json, path, std::move(value))) {
        return false;
    }
    rebuildMergedLocked();
    g_state.revision++;
    return true;
}

void ConfigStore::rebuildMergedLocked() {
    q2browse::json::Value merged = g_state.defaults;
    if (g_state.userLayer) {
        mergeJsonObjects(merged, g_state.userLayer->json);
    }
    for (const auto &layer : g_state.runtimeLayers) {
        mergeJsonObjects(merged, layer.json);
    }
    g_state.merged = std::move(merged);
}

bool ConfigStore::setValueAtPath(q2browse::json::Value &root, std::string_view path, q2browse::json::Value value) {
    if (path.empty()) {
        return false;
    }
    if (!root.is_object()) {
        root = q2browse::json::Object();
    }

    q2browse::json::Value *current = &root;
    std::size_t position = 0;
    while (true) {
        const std::size_t dot = path.find('.', position);
        const bool lastSegment = (dot == std::string_view::npos);
        const std::string segment(path.substr(position, lastSegment ? std::string_view::npos : dot - position));
        if (segment.empty()) {
            return false;
        }
        if (lastSegment) {
            (*current)[segment] = std::move(value);
            return true;
        }
        auto &child = (*current)[segment];
        if (!child.is_object()) {
            child = q2browse::json::Object();
        }
        current = &child;
        position = dot + 1;
    }
}

} // namespace q2browse::config
