#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace q2browse::logging {

constexpr std::size_t kDiagnosticHistory = 1000;

spdlog::level::level_enum ParseLogLevel(const std::string &level);
bool IsValidLogLevel(const std::string &level);

// Installs the default logger: colored stderr plus an in-memory ring of the
// most recent kDiagnosticHistory formatted entries.
void ConfigureLogging(spdlog::level::level_enum level, bool includeTimestamp);

// Named logger sharing the default logger's sinks and level.
std::shared_ptr<spdlog::logger> ComponentLogger(const std::string &name);

// Oldest first. Empty until ConfigureLogging has run.
std::vector<std::string> RecentDiagnostics();

} // namespace q2browse::logging
