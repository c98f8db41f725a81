//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.cpp
// Purpose: Command-line and environment parsing into an immutable Config
//==========================================================================================================

#include "dtmcp/Config.h"

#include <algorithm>
#include <cctype>
#include <sstream>

#include <fmt/format.h>

#include "dtmcp/JSONRPCTypes.h"
#include "dtmcp/errors/Errors.h"
#include "env/EnvVars.h"

namespace dtmcp {

namespace {

enum class OptionKind {
    Flag,       // --name, --no-name, --name=true|false
    Value,      // --name=value or --name value
    Repeated    // like Value, may appear more than once
};

struct OptionSpec {
    const char* name;
    OptionKind kind;
    const char* help;
};

const OptionSpec kOptions[] = {
    {"browser-url", OptionKind::Value, "Connect to a running Chrome instance, e.g. http://127.0.0.1:9222"},
    {"ws-endpoint", OptionKind::Value, "WebSocket endpoint of a running Chrome instance (ws:// or wss://)"},
    {"ws-headers", OptionKind::Value, "JSON object of extra headers for the WebSocket handshake"},
    {"headless", OptionKind::Flag, "Launch Chrome without a visible window"},
    {"executable-path", OptionKind::Value, "Path to the Chrome executable to launch"},
    {"channel", OptionKind::Value, "Chrome channel to launch: stable, canary, beta or dev"},
    {"isolated", OptionKind::Flag, "Use a temporary user data directory removed on exit"},
    {"viewport", OptionKind::Value, "Initial window size, e.g. 1280x720"},
    {"chrome-arg", OptionKind::Repeated, "Additional argument passed to Chrome (repeatable)"},
    {"proxy-server", OptionKind::Value, "Proxy server configuration passed to Chrome"},
    {"accept-insecure-certs", OptionKind::Flag, "Ignore TLS certificate errors in the browser"},
    {"port", OptionKind::Value, "Serve MCP over HTTP on this port instead of stdio"},
    {"log-file", OptionKind::Value, "Append server and browser logs to this file"},
    {"log-level", OptionKind::Value, "Minimum log level: DEBUG, INFO, WARN, ERROR or FATAL"},
    {"experimental-devtools", OptionKind::Flag, "Open DevTools for new tabs and expose DevTools windows"},
    {"experimental-include-all-pages", OptionKind::Flag, "Include DevTools and extension pages in page lists"},
    {"category-emulation", OptionKind::Flag, "Expose emulation tools (default on)"},
    {"category-performance", OptionKind::Flag, "Expose performance tools (default on)"},
    {"category-network", OptionKind::Flag, "Expose network tools (default on)"},
    {"help", OptionKind::Flag, "Print this help and exit"},
    {"version", OptionKind::Flag, "Print the version and exit"},
};

const OptionSpec* findOption(const std::string& name) {
    for (const auto& opt : kOptions) {
        if (name == opt.name) {
            return &opt;
        }
    }
    return nullptr;
}

struct ParsedArgs {
    std::map<std::string, bool> flags;
    std::map<std::string, std::vector<std::string>> values;

    std::optional<std::string> value(const std::string& name) const {
        auto it = values.find(name);
        if (it == values.end() || it->second.empty()) {
            return std::nullopt;
        }
        return it->second.back();
    }

    bool flag(const std::string& name, bool defaultValue) const {
        auto it = flags.find(name);
        return it == flags.end() ? defaultValue : it->second;
    }
};

bool parseBool(const std::string& name, const std::string& v) {
    std::string lower;
    for (char c : v) lower.push_back(static_cast<char>(::tolower(static_cast<unsigned char>(c))));
    if (lower == "true" || lower == "1" || lower == "yes") return true;
    if (lower == "false" || lower == "0" || lower == "no") return false;
    throw errors::ConfigError(fmt::format("Invalid boolean for --{}: '{}'", name, v));
}

ParsedArgs parseArgs(const std::vector<std::string>& args) {
    ParsedArgs parsed;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (a == "-h") { parsed.flags["help"] = true; continue; }
        if (a == "-v") { parsed.flags["version"] = true; continue; }
        if (a.rfind("--", 0) != 0 || a.size() == 2) {
            throw errors::ConfigError(fmt::format("Unexpected argument: {}", a));
        }
        std::string body = a.substr(2);
        std::optional<std::string> inlineValue;
        if (auto eq = body.find('='); eq != std::string::npos) {
            inlineValue = body.substr(eq + 1);
            body = body.substr(0, eq);
        }

        const OptionSpec* opt = findOption(body);
        bool negated = false;
        if (opt == nullptr && body.rfind("no-", 0) == 0) {
            opt = findOption(body.substr(3));
            negated = opt != nullptr && opt->kind == OptionKind::Flag;
            if (!negated) opt = nullptr;
        }
        if (opt == nullptr) {
            throw errors::ConfigError(fmt::format("Unknown option: --{}", body));
        }

        if (opt->kind == OptionKind::Flag) {
            bool v = inlineValue.has_value() ? parseBool(opt->name, *inlineValue) : true;
            parsed.flags[opt->name] = negated ? !v : v;
            continue;
        }

        std::string v;
        if (inlineValue.has_value()) {
            v = *inlineValue;
        } else if (i + 1 < args.size()) {
            v = args[++i];
        } else {
            throw errors::ConfigError(fmt::format("Missing value for --{}", opt->name));
        }
        auto& slot = parsed.values[opt->name];
        if (opt->kind == OptionKind::Value) {
            slot.clear();
        }
        slot.push_back(std::move(v));
    }
    return parsed;
}

int parsePort(const std::string& text, const char* source) {
    if (text.empty() || text.size() > 5 ||
        !std::all_of(text.begin(), text.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; })) {
        throw errors::ConfigError(fmt::format("Invalid port from {}: '{}'", source, text));
    }
    int port = std::stoi(text);
    if (port > 65535) {
        throw errors::ConfigError(fmt::format("Port out of range from {}: {}", source, port));
    }
    return port;
}

std::map<std::string, std::string> parseWsHeaders(const std::string& text) {
    JSONValue v;
    try {
        v = ParseJSON(text);
    } catch (const std::exception& e) {
        throw errors::ConfigError(fmt::format("--ws-headers is not valid JSON: {}", e.what()));
    }
    if (!v.IsObject()) {
        throw errors::ConfigError("--ws-headers must be a JSON object");
    }
    std::map<std::string, std::string> headers;
    for (const auto& [key, val] : std::get<JSONValue::Object>(v.value)) {
        if (!val || !val->IsString()) {
            throw errors::ConfigError(fmt::format("--ws-headers value for '{}' must be a string", key));
        }
        headers[key] = std::get<std::string>(val->value);
    }
    return headers;
}

std::string normalizeLevel(const std::string& level) {
    std::string upper;
    for (char c : level) upper.push_back(static_cast<char>(::toupper(static_cast<unsigned char>(c))));
    if (upper == "WARNING") upper = "WARN";
    static const char* kLevels[] = {"DEBUG", "INFO", "WARN", "ERROR", "FATAL"};
    for (const char* l : kLevels) {
        if (upper == l) return upper;
    }
    throw errors::ConfigError(fmt::format("Invalid log level: '{}'", level));
}

} // namespace

std::optional<Viewport> ParseViewport(const std::string& text) {
    auto x = text.find('x');
    if (x == std::string::npos || x == 0 || x + 1 >= text.size()) {
        return std::nullopt;
    }
    auto digits = [](const std::string& s) {
        return !s.empty() && s.size() <= 5 &&
               std::all_of(s.begin(), s.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
    };
    std::string w = text.substr(0, x);
    std::string h = text.substr(x + 1);
    if (!digits(w) || !digits(h)) {
        return std::nullopt;
    }
    Viewport vp{std::stoi(w), std::stoi(h)};
    if (vp.width <= 0 || vp.height <= 0) {
        return std::nullopt;
    }
    return vp;
}

Config LoadConfig(const std::vector<std::string>& args, const EnvLookup& env) {
    ParsedArgs parsed = parseArgs(args);
    Config cfg;

    cfg.showHelp = parsed.flag("help", false);
    cfg.showVersion = parsed.flag("version", false);

    cfg.browserUrl = parsed.value("browser-url");
    cfg.wsEndpoint = parsed.value("ws-endpoint");
    if (cfg.browserUrl.has_value() && cfg.wsEndpoint.has_value()) {
        throw errors::ConfigError("--browser-url and --ws-endpoint are mutually exclusive");
    }
    if (cfg.wsEndpoint.has_value() &&
        cfg.wsEndpoint->rfind("ws://", 0) != 0 && cfg.wsEndpoint->rfind("wss://", 0) != 0) {
        throw errors::ConfigError(fmt::format("--ws-endpoint must start with ws:// or wss://: {}", *cfg.wsEndpoint));
    }
    if (auto h = parsed.value("ws-headers")) {
        cfg.wsHeaders = parseWsHeaders(*h);
    }

    cfg.headless = parsed.flag("headless", false);
    cfg.executablePath = parsed.value("executable-path");
    if (auto ch = parsed.value("channel")) {
        if (*ch != "stable" && *ch != "canary" && *ch != "beta" && *ch != "dev") {
            throw errors::ConfigError(fmt::format("Invalid channel: '{}' (expected stable, canary, beta or dev)", *ch));
        }
        cfg.channel = *ch;
    }
    cfg.isolated = parsed.flag("isolated", false);
    if (auto vp = parsed.value("viewport")) {
        cfg.viewport = ParseViewport(*vp);
        if (!cfg.viewport.has_value()) {
            throw errors::ConfigError(fmt::format("Invalid viewport: '{}' (expected WIDTHxHEIGHT)", *vp));
        }
    }
    if (auto it = parsed.values.find("chrome-arg"); it != parsed.values.end()) {
        cfg.chromeArgs = it->second;
    }
    cfg.proxyServer = parsed.value("proxy-server");
    cfg.acceptInsecureCerts = parsed.flag("accept-insecure-certs", false);

    if (auto p = parsed.value("port")) {
        cfg.port = parsePort(*p, "--port");
    } else if (auto envPort = env("PORT")) {
        cfg.port = parsePort(*envPort, "PORT");
    }
    cfg.logFile = parsed.value("log-file");
    if (auto lvl = parsed.value("log-level")) {
        cfg.logLevel = normalizeLevel(*lvl);
    } else if (auto envLvl = env("DTMCP_LOG_LEVEL")) {
        cfg.logLevel = normalizeLevel(*envLvl);
    }

    cfg.experimentalDevtools = parsed.flag("experimental-devtools", false);
    cfg.experimentalIncludeAllPages = parsed.flag("experimental-include-all-pages", false);

    cfg.categoryEmulation = parsed.flag("category-emulation", true);
    cfg.categoryPerformance = parsed.flag("category-performance", true);
    cfg.categoryNetwork = parsed.flag("category-network", true);

    cfg.isProduction = env("DTMCP_ENV").value_or("development") == "production";
    return cfg;
}

Config LoadConfig(const std::vector<std::string>& args) {
    return LoadConfig(args, [](const char* name) { return GetEnvOptional(name); });
}

std::string Usage() {
    std::ostringstream oss;
    oss << "Usage: dtmcp-server [options]\n\n"
        << "Serves Chrome DevTools automation tools over MCP (stdio by default, HTTP with --port).\n\n"
        << "Options:\n";
    for (const auto& opt : kOptions) {
        std::string name = std::string("--") + opt.name;
        if (opt.kind != OptionKind::Flag) {
            name += "=<value>";
        }
        oss << fmt::format("  {:<40} {}\n", name, opt.help);
    }
    oss << "\nEnvironment:\n"
        << "  PORT              HTTP port when --port is not given\n"
        << "  DTMCP_ENV         'production' listens on all interfaces\n"
        << "  DTMCP_LOG_LEVEL   Minimum log level when --log-level is not given\n"
        << "  DTMCP_LOG_COLOR   0 disables colored log labels\n";
    return oss.str();
}

} // namespace dtmcp
