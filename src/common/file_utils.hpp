#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "common/json.hpp"
#include <spdlog/spdlog.h>

namespace q2browse::file {

std::optional<q2browse::json::Value> LoadJsonFile(const std::filesystem::path &path,
                                                  const std::string &label,
                                                  spdlog::level::level_enum missingLevel);

// $XDG_CONFIG_HOME/q2browse, falling back to ~/.config/q2browse.
std::filesystem::path UserConfigDirectory();

} // namespace q2browse::file
