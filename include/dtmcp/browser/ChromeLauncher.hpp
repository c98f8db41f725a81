//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ChromeLauncher.hpp
// Purpose: Locate, spawn and supervise a local Chrome process exposing the DevTools protocol
//==========================================================================================================

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include <utility>

#include <boost/asio/awaitable.hpp>

#include "dtmcp/browser/Browser.h"

namespace dtmcp {
namespace browser {

struct ChromeCommandLine {
    std::string executable;
    std::vector<std::string> args;
    std::string userDataDir;
};

// Well-known install location of a release channel; "stable" when channel is unset.
std::string ChannelExecutablePath(const std::optional<std::string>& channel);

//==========================================================================================================
// ResolveChromeExecutable
// Purpose: Pick the binary to run: explicit path first, then the channel install location, then
//          (stable only) google-chrome / chromium found on PATH.
// Returns:
//   std::nullopt when nothing usable exists.
//==========================================================================================================
std::optional<std::string> ResolveChromeExecutable(const std::optional<std::string>& executablePath,
                                                   const std::optional<std::string>& channel);

// Persistent profile directory per channel under $XDG_CACHE_HOME (or ~/.cache).
std::string DefaultUserDataDir(const std::optional<std::string>& channel);

// Fresh empty directory under $TMPDIR for an isolated profile.
// Throws errors::BrowserConnectionError when it cannot be created.
std::string CreateTemporaryProfileDir();

//==========================================================================================================
// BuildChromeCommandLine
// Purpose: Arguments for a browser listening on an ephemeral debugging port.
//==========================================================================================================
ChromeCommandLine BuildChromeCommandLine(const LaunchOptions& options, const std::string& executable,
                                         const std::string& userDataDir);

// Converts DevToolsActivePort contents (port line, browser path line) into a ws:// URL.
std::optional<std::string> ParseDevToolsActivePort(const std::string& contents);

//==========================================================================================================
// ChromeProcess
// Purpose: RAII owner of a spawned browser. Destruction terminates the process (SIGTERM, then
//          SIGKILL after a grace period), reaps it and removes a temporary profile directory.
// Notes:
//   Terminate() sleeps through the grace period. Code running on an I/O thread uses Stop() instead.
//==========================================================================================================
class ChromeProcess {
public:
    // Throws errors::BrowserConnectionError when the process cannot be spawned.
    static std::unique_ptr<ChromeProcess> Spawn(const ChromeCommandLine& commandLine,
                                                const std::optional<std::string>& logFile,
                                                bool removeProfileOnExit);

    ~ChromeProcess();
    ChromeProcess(const ChromeProcess&) = delete;
    ChromeProcess& operator=(const ChromeProcess&) = delete;

    pid_t Pid() const { return pid_; }
    const std::string& UserDataDir() const { return userDataDir_; }
    bool HasExited();
    void Terminate();

    // Same escalation as Terminate(), waiting on a timer between polls.
    static net::awaitable<void> Stop(std::shared_ptr<ChromeProcess> process);

    // Polls the profile's DevToolsActivePort file until it names an endpoint.
    // Throws errors::BrowserConnectionError on timeout or early process exit.
    net::awaitable<std::string> WaitForEndpoint(std::chrono::milliseconds timeout);

private:
    ChromeProcess(pid_t pid, std::string userDataDir, bool removeProfileOnExit);
    void forceKill();

    pid_t pid_;
    bool reaped_{false};
    std::string userDataDir_;
    bool removeProfileOnExit_;
};

} // namespace browser
} // namespace dtmcp
