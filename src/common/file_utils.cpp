#include "common/file_utils.hpp"

#include <cstdlib>
#include <fstream>

namespace q2browse::file {

std::optional<q2browse::json::Value> LoadJsonFile(const std::filesystem::path &path,
                                                  const std::string &label,
                                                  spdlog::level::level_enum missingLevel) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        spdlog::log(missingLevel, "file_utils: {} not found: {}", label, path.string());
        return std::nullopt;
    }

    std::ifstream stream(path);
    if (!stream) {
        spdlog::error("file_utils: Failed to open {}: {}", label, path.string());
        return std::nullopt;
    }

    try {
        q2browse::json::Value json;
        stream >> json;
        return json;
    } catch (const std::exception &e) {
        spdlog::error("file_utils: Failed to parse {}: {}", label, e.what());
        return std::nullopt;
    }
}

std::filesystem::path UserConfigDirectory() {
    if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "q2browse";
    }
    if (const char *home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "q2browse";
    }
    return std::filesystem::current_path() / ".q2browse";
}

} // namespace q2browse::file
