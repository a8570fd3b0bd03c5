#include "common/logging.hpp"

#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <mutex>

namespace {

std::mutex g_sinkMutex;
std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> g_diagnosticSink;

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

} // namespace

namespace q2browse::logging {

spdlog::level::level_enum ParseLogLevel(const std::string &level) {
    const std::string normalized = toLower(level);
    if (normalized == "trace") {
        return spdlog::level::trace;
    }
    if (normalized == "debug") {
        return spdlog::level::debug;
    }
    if (normalized == "info") {
        return spdlog::level::info;
    }
    if (normalized == "warn") {
        return spdlog::level::warn;
    }
    if (normalized == "err" || normalized == "error") {
        return spdlog::level::err;
    }
    if (normalized == "critical") {
        return spdlog::level::critical;
    }
    if (normalized == "off") {
        return spdlog::level::off;
    }
    return spdlog::level::info;
}

bool IsValidLogLevel(const std::string &level) {
    const std::string normalized = toLower(level);
    return normalized == "trace" ||
           normalized == "debug" ||
           normalized == "info" ||
           normalized == "warn" ||
           normalized == "error" ||
           normalized == "err" ||
           normalized == "critical" ||
           normalized == "off";
}

void ConfigureLogging(spdlog::level::level_enum level, bool includeTimestamp) {
    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto ring = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(kDiagnosticHistory);
    ring->set_pattern("%H:%M:%S.%e [%l] %v");

    auto logger = std::make_shared<spdlog::logger>("q2browse", spdlog::sinks_init_list{console, ring});
    spdlog::set_default_logger(logger);

    if (includeTimestamp) {
        console->set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v");
    } else {
        console->set_pattern("[%^%l%$] %v");
    }
    spdlog::set_level(level);

    std::lock_guard<std::mutex> lock(g_sinkMutex);
    g_diagnosticSink = std::move(ring);
}

std::shared_ptr<spdlog::logger> ComponentLogger(const std::string &name) {
    auto logger = spdlog::default_logger()->clone(name);
    logger->set_level(spdlog::default_logger()->level());
    return logger;
}

std::vector<std::string> RecentDiagnostics() {
    std::lock_guard<std::mutex> lock(g_sinkMutex);
    if (!g_diagnosticSink) {
        return {};
    }
    return g_diagnosticSink->last_formatted();
}

} // namespace q2browse::logging
