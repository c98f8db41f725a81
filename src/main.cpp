//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: dtmcp-server entry point: stdio session or multi-session HTTP listener
//==========================================================================================================

#include <csignal>
#include <cstdio>
#include <exception>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <fmt/format.h>

#include "dtmcp/Config.h"
#include "dtmcp/HTTPServer.hpp"
#include "dtmcp/Server.h"
#include "dtmcp/StdioTransport.hpp"
#include "dtmcp/browser/CdpBrowserDriver.hpp"
#include "dtmcp/errors/Errors.h"
#include "dtmcp/version.h"
#include "logging/Logger.h"

using namespace dtmcp;

namespace {

int runHttp(const Config& config, const std::shared_ptr<browser::CdpBrowserDriver>& driver) {
    HTTPServer::Options opts;
    opts.address = config.HttpHost();
    opts.port = config.HttpPort();
    opts.isProduction = config.isProduction;

    HTTPServer server(opts, [config, driver]() { return Server::Create(config, driver); });
    try {
        server.Start().get();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to listen on {}:{}: {}", opts.address, opts.port, e.what());
        return 1;
    }

    // Block until the operator asks us to stop
    net::io_context signals;
    net::signal_set set(signals, SIGINT, SIGTERM);
    set.async_wait([](const boost::system::error_code&, int signo) {
        LOG_INFO("Received signal {}, shutting down", signo);
    });
    signals.run();

    server.Stop().get();
    driver->Shutdown();
    return 0;
}

int runStdio(const Config& config, const std::shared_ptr<browser::CdpBrowserDriver>& driver) {
    net::io_context ioc;
    auto server = Server::Create(config, driver);
    auto transport = std::make_shared<StdioTransport>(ioc.get_executor(), ::dup(STDIN_FILENO), ::dup(STDOUT_FILENO));
    server->Connect(*transport);

    net::signal_set set(ioc, SIGINT, SIGTERM);
    set.async_wait([transport](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            LOG_INFO("Received signal {}, shutting down", signo);
            transport->Close();
        }
    });

    net::co_spawn(ioc, [transport, driver, &set]() -> net::awaitable<void> {
        // Returns after end of input once every call already read has been answered
        co_await transport->Run();
        // The browser connection's read loop would keep the context alive otherwise
        driver->Shutdown();
        boost::system::error_code ignored;
        set.cancel(ignored);
    }, net::detached);

    ioc.run();
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    FUNC_SCOPE();
    std::vector<std::string> args(argv + 1, argv + argc);

    Config config;
    try {
        config = LoadConfig(args);
    } catch (const errors::ConfigError& e) {
        fmt::print(stderr, "{}\n\n{}", e.what(), Usage());
        return 1;
    }
    if (config.showHelp) {
        fmt::print("{}", Usage());
        return 0;
    }
    if (config.showVersion) {
        fmt::print("{}\n", getVersionString());
        return 0;
    }

    // stdout carries protocol frames in stdio mode
    Logger::setConsoleToStderr(!config.UsesHttp());
    Logger::setLogLevelFromString(config.logLevel);
    if (config.logFile.has_value() && !Logger::setLogFile(*config.logFile)) {
        fmt::print(stderr, "Cannot open log file {}\n", *config.logFile);
        return 1;
    }
    LOG_INFO("dtmcp-server {} starting", getVersionString());

    auto driver = std::make_shared<browser::CdpBrowserDriver>();
    try {
        return config.UsesHttp() ? runHttp(config, driver) : runStdio(config, driver);
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal: {}", e.what());
        driver->Shutdown();
        return 1;
    }
}
