#include "app/cli_options.hpp"

#include "common/logging.hpp"
#include "cxxopts.hpp"
#include "net/oob_protocol.hpp"

#include <charconv>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <utility>

namespace {

[[noreturn]] void FailWithUsage(const cxxopts::Options &options, const std::string &message) {
    std::cerr << "Error: " << message << "\n";
    std::cerr << options.help() << std::endl;
    std::exit(1);
}

// "host", "host:port" or "[v6]:port".
std::optional<std::pair<std::string, uint16_t>> SplitHostPort(const std::string &text) {
    std::string host = text;
    std::string portText;
    bool hasPort = false;

    if (!text.empty() && text.front() == '[') {
        const std::size_t close = text.find(']');
        if (close == std::string::npos) {
            return std::nullopt;
        }
        host = text.substr(1, close - 1);
        if (close + 1 < text.size()) {
            if (text[close + 1] != ':') {
                return std::nullopt;
            }
            hasPort = true;
            portText = text.substr(close + 2);
        }
    } else {
        const std::size_t colon = text.rfind(':');
        // More than one colon is a bare IPv6 address.
        if (colon != std::string::npos && text.find(':') == colon) {
            hasPort = true;
            host = text.substr(0, colon);
            portText = text.substr(colon + 1);
        }
    }

    uint16_t port = q2browse::oob::MASTER_PORT;
    if (hasPort) {
        unsigned int value = 0;
        const char *begin = portText.data();
        const char *end = begin + portText.size();
        const auto [ptr, ec] = std::from_chars(begin, end, value);
        if (portText.empty() || ec != std::errc() || ptr != end || value == 0 || value > 65535) {
            return std::nullopt;
        }
        port = static_cast<uint16_t>(value);
    }
    if (host.empty()) {
        return std::nullopt;
    }
    return std::make_pair(host, port);
}

} // namespace

namespace q2browse::app {

CLIOptions ParseCLIOptions(int argc, char *argv[]) {
    cxxopts::Options options("q2browse", "Quake II server browser");
    options.add_options()
        ("c,config", "User config file path", cxxopts::value<std::string>());
    options.add_options()
        ("m,master", "UDP master server (host[:port]); used when the HTTP master is off", cxxopts::value<std::string>())
        ("http-url", "HTTP master server URL", cxxopts::value<std::string>())
        ("no-http", "Query the UDP master instead of the HTTP master")
        ("no-lan", "Skip the LAN broadcast");
    options.add_options()
        ("probe-timeout", "Per-server probe timeout in milliseconds (1-30000)", cxxopts::value<int>())
        ("max-probes", "Maximum concurrent probes (1-200)", cxxopts::value<int>());
    options.add_options()
        ("json", "Print one JSON object per server")
        ("diagnostics", "Print the recent log history after the run");
    options.add_options()
        ("v,verbose", "Increase logging verbosity (-v debug, -vv trace)")
        ("L,log-level", "Logging level (trace, debug, info, warn, err, critical, off)", cxxopts::value<std::string>());
    options.add_options()
        ("T,timestamp-logging", "Enable timestamped logging output");
    options.add_options()
        ("h,help", "Show help");

    cxxopts::ParseResult result;
    try {
        result = options.parse(argc, argv);
    } catch (const cxxopts::exceptions::exception &ex) {
        FailWithUsage(options, ex.what());
    }

    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    CLIOptions parsed;
    parsed.userConfigExplicit = result.count("config") > 0;
    parsed.userConfigPath = parsed.userConfigExplicit ? result["config"].as<std::string>() : std::string();
    parsed.httpUrlExplicit = result.count("http-url") > 0;
    parsed.httpUrl = parsed.httpUrlExplicit ? result["http-url"].as<std::string>() : std::string();
    parsed.noHttp = result.count("no-http") > 0;
    parsed.noLan = result.count("no-lan") > 0;
    parsed.jsonOutput = result.count("json") > 0;
    parsed.diagnostics = result.count("diagnostics") > 0;
    parsed.verbose = static_cast<int>(result.count("verbose"));
    parsed.logLevelExplicit = result.count("log-level") > 0;
    parsed.logLevel = parsed.logLevelExplicit ? result["log-level"].as<std::string>() : std::string();
    parsed.timestampLogging = result.count("timestamp-logging") > 0;

    if (result.count("master")) {
        const std::string master = result["master"].as<std::string>();
        const auto hostPort = SplitHostPort(master);
        if (!hostPort) {
            FailWithUsage(options, "invalid --master value '" + master + "'.");
        }
        parsed.masterExplicit = true;
        parsed.masterHost = hostPort->first;
        parsed.masterPort = hostPort->second;
    }

    if (result.count("probe-timeout")) {
        parsed.probeTimeoutExplicit = true;
        parsed.probeTimeoutMs = result["probe-timeout"].as<int>();
        if (parsed.probeTimeoutMs < 1 || parsed.probeTimeoutMs > 30000) {
            FailWithUsage(options, "--probe-timeout must be between 1 and 30000.");
        }
    }
    if (result.count("max-probes")) {
        parsed.maxProbesExplicit = true;
        parsed.maxProbes = result["max-probes"].as<int>();
        if (parsed.maxProbes < 1 || parsed.maxProbes > 200) {
            FailWithUsage(options, "--max-probes must be between 1 and 200.");
        }
    }

    if (parsed.logLevelExplicit && !q2browse::logging::IsValidLogLevel(parsed.logLevel)) {
        FailWithUsage(options, "invalid --log-level value '" + parsed.logLevel + "'.");
    }
    return parsed;
}

q2browse::json::Value CLIOverridesJson(const CLIOptions &options) {
    q2browse::json::Value layer = q2browse::json::Object();
    if (options.masterExplicit) {
        layer["discovery"]["Master"]["Address"] = options.masterHost;
        layer["discovery"]["Master"]["Port"] = options.masterPort;
    }
    if (options.httpUrlExplicit) {
        layer["discovery"]["Http"]["Url"] = options.httpUrl;
    }
    if (options.noHttp) {
        layer["discovery"]["Http"]["Enabled"] = false;
    }
    if (options.noLan) {
        layer["discovery"]["Lan"]["Enabled"] = false;
    }
    if (options.probeTimeoutExplicit) {
        layer["probe"]["TimeoutMs"] = options.probeTimeoutMs;
    }
    if (options.maxProbesExplicit) {
        layer["probe"]["MaxConcurrent"] = options.maxProbes;
    }
    return layer;
}

} // namespace q2browse::app
