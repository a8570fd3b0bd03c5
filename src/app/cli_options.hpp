#pragma once

#include <cstdint>
#include <string>

#include "common/json.hpp"

namespace q2browse::app {

struct CLIOptions {
    std::string userConfigPath;
    std::string masterHost;
    uint16_t masterPort = 0;
    std::string httpUrl;
    int probeTimeoutMs = 0;
    int maxProbes = 0;
    bool userConfigExplicit = false;
    bool masterExplicit = false;
    bool httpUrlExplicit = false;
    bool noHttp = false;
    bool noLan = false;
    bool probeTimeoutExplicit = false;
    bool maxProbesExplicit = false;
    bool jsonOutput = false;
    bool diagnostics = false;
    int verbose = 0;
    std::string logLevel;
    bool logLevelExplicit = false;
    bool timestampLogging = false;
};

// Prints usage and exits on --help or on invalid options.
CLIOptions ParseCLIOptions(int argc, char *argv[]);

// Config layer holding only the settings given on the command line.
q2browse::json::Value CLIOverridesJson(const CLIOptions &options);

} // namespace q2browse::app
