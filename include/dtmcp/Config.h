//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.h
// Purpose: Immutable server configuration resolved from command-line arguments and the environment
//==========================================================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dtmcp {

// Port used when HTTP transport is selected but no usable port is given
constexpr uint16_t DEFAULT_HTTP_PORT = 3000;

struct Viewport {
    int width{0};
    int height{0};
};

//==========================================================================================================
// Config
// Purpose: Snapshot of every setting the server reads. Built once by LoadConfig, read-only afterward.
//==========================================================================================================
struct Config {
    // Browser connection
    std::optional<std::string> browserUrl;
    std::optional<std::string> wsEndpoint;
    std::map<std::string, std::string> wsHeaders;

    // Browser launch
    bool headless{false};
    std::optional<std::string> executablePath;
    std::optional<std::string> channel;   // stable | canary | beta | dev
    bool isolated{false};
    std::optional<Viewport> viewport;
    std::vector<std::string> chromeArgs;
    std::optional<std::string> proxyServer;
    bool acceptInsecureCerts{false};

    // Server
    std::optional<int> port;              // present when --port or PORT was given
    std::optional<std::string> logFile;
    std::string logLevel{"INFO"};

    // Feature flags
    bool experimentalDevtools{false};
    bool experimentalIncludeAllPages{false};

    // Tool categories
    bool categoryEmulation{true};
    bool categoryPerformance{true};
    bool categoryNetwork{true};

    // Environment
    bool isProduction{false};

    // Informational requests; main exits 0 after printing
    bool showHelp{false};
    bool showVersion{false};

    bool UsesHttp() const { return port.has_value(); }
    uint16_t HttpPort() const {
        return (port.has_value() && *port != 0) ? static_cast<uint16_t>(*port) : DEFAULT_HTTP_PORT;
    }
    // All interfaces in production, loopback otherwise
    std::string HttpHost() const { return isProduction ? "0.0.0.0" : "127.0.0.1"; }
};

using EnvLookup = std::function<std::optional<std::string>(const char*)>;

//==========================================================================================================
// LoadConfig
// Purpose: Parse `--key=value`, `--key value`, bare boolean `--flag` and negated `--no-flag` arguments
//          (program name excluded) and merge the PORT, DTMCP_ENV and DTMCP_LOG_LEVEL variables.
// Throws:
//   errors::ConfigError on unknown options or invalid values.
//==========================================================================================================
Config LoadConfig(const std::vector<std::string>& args, const EnvLookup& env);
Config LoadConfig(const std::vector<std::string>& args);

// Parses "WIDTHxHEIGHT"; std::nullopt when malformed or non-positive.
std::optional<Viewport> ParseViewport(const std::string& text);

// Usage text printed by --help.
std::string Usage();

} // namespace dtmcp
