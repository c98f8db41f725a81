//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ChromeLauncher.cpp
// Purpose: Chrome executable lookup, command line construction and process supervision (POSIX)
//==========================================================================================================

#include "dtmcp/browser/ChromeLauncher.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <fmt/format.h>

#include "dtmcp/errors/Errors.h"
#include "env/EnvVars.h"
#include "logging/Logger.h"

extern char** environ;

namespace dtmcp {
namespace browser {

namespace {

// SIGTERM grace period: 50 polls, 20 ms apart
constexpr int kTerminatePolls = 50;
constexpr std::chrono::milliseconds kTerminatePollInterval{20};

// Candidates searched when the stable channel has no official install
const char* const kFallbackExecutables[] = {
    "google-chrome",
    "google-chrome-stable",
    "chromium",
    "chromium-browser",
    "/snap/bin/chromium",
};

bool isExecutable(const std::string& path) {
    return ::access(path.c_str(), X_OK) == 0;
}

std::optional<std::string> findOnPath(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return isExecutable(name) ? std::optional<std::string>(name) : std::nullopt;
    }
    auto pathEnv = GetEnvOptional("PATH");
    if (!pathEnv.has_value()) {
        return std::nullopt;
    }
    std::istringstream dirs(*pathEnv);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        std::string candidate = dir + "/" + name;
        if (isExecutable(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::string readFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return std::string();
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

} // namespace

std::string ChannelExecutablePath(const std::optional<std::string>& channel) {
    const std::string ch = channel.value_or("stable");
    if (ch == "beta") return "/opt/google/chrome-beta/chrome";
    if (ch == "dev") return "/opt/google/chrome-unstable/chrome";
    if (ch == "canary") return "/opt/google/chrome-canary/chrome";
    return "/opt/google/chrome/chrome";
}

std::optional<std::string> ResolveChromeExecutable(const std::optional<std::string>& executablePath,
                                                   const std::optional<std::string>& channel) {
    if (executablePath.has_value()) {
        if (isExecutable(*executablePath)) {
            return executablePath;
        }
        return findOnPath(*executablePath);
    }
    std::string channelPath = ChannelExecutablePath(channel);
    if (isExecutable(channelPath)) {
        return channelPath;
    }
    if (channel.value_or("stable") != "stable") {
        return std::nullopt;
    }
    for (const char* candidate : kFallbackExecutables) {
        if (auto found = findOnPath(candidate)) {
            return found;
        }
    }
    return std::nullopt;
}

std::string DefaultUserDataDir(const std::optional<std::string>& channel) {
    std::string cacheRoot;
    if (auto xdg = GetEnvOptional("XDG_CACHE_HOME")) {
        cacheRoot = *xdg;
    } else {
        cacheRoot = GetEnvOrDefault("HOME", "/tmp") + "/.cache";
    }
    return fmt::format("{}/chrome-devtools-mcp/chrome-profile-{}", cacheRoot, channel.value_or("stable"));
}

std::string CreateTemporaryProfileDir() {
    std::string pattern = GetEnvOrDefault("TMPDIR", "/tmp") + "/dtmcp-profile-XXXXXX";
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (::mkdtemp(buffer.data()) == nullptr) {
        throw errors::BrowserConnectionError(
            fmt::format("Failed to create temporary profile directory: {}", std::strerror(errno)));
    }
    return std::string(buffer.data());
}

ChromeCommandLine BuildChromeCommandLine(const LaunchOptions& options, const std::string& executable,
                                         const std::string& userDataDir) {
    ChromeCommandLine cmd;
    cmd.executable = executable;
    cmd.userDataDir = userDataDir;
    cmd.args = {
        "--remote-debugging-port=0",
        "--user-data-dir=" + userDataDir,
        "--no-first-run",
        "--no-default-browser-check",
        "--hide-crash-restore-bubble",
    };
    if (::getuid() == 0) {
        cmd.args.push_back("--no-sandbox");
    }
    if (options.headless) {
        cmd.args.push_back("--headless=new");
    }
    if (options.viewport.has_value()) {
        cmd.args.push_back(fmt::format("--window-size={},{}", options.viewport->width, options.viewport->height));
    }
    if (options.acceptInsecureCerts) {
        cmd.args.push_back("--ignore-certificate-errors");
    }
    if (options.devtools) {
        cmd.args.push_back("--auto-open-devtools-for-tabs");
    }
    cmd.args.insert(cmd.args.end(), options.args.begin(), options.args.end());
    cmd.args.push_back("about:blank");
    return cmd;
}

std::optional<std::string> ParseDevToolsActivePort(const std::string& contents) {
    std::istringstream lines(contents);
    std::string portLine;
    std::string pathLine;
    if (!std::getline(lines, portLine) || !std::getline(lines, pathLine)) {
        return std::nullopt;
    }
    while (!pathLine.empty() && (pathLine.back() == '\r' || pathLine.back() == ' ')) {
        pathLine.pop_back();
    }
    int port = 0;
    try {
        port = std::stoi(portLine);
    } catch (const std::exception&) {
        return std::nullopt;
    }
    if (port <= 0 || port > 65535 || pathLine.empty()) {
        return std::nullopt;
    }
    if (pathLine.front() != '/') {
        pathLine.insert(pathLine.begin(), '/');
    }
    return fmt::format("ws://127.0.0.1:{}{}", port, pathLine);
}

//==========================================================================================================
// ChromeProcess
//==========================================================================================================
ChromeProcess::ChromeProcess(pid_t pid, std::string userDataDir, bool removeProfileOnExit)
    : pid_(pid), userDataDir_(std::move(userDataDir)), removeProfileOnExit_(removeProfileOnExit) {}

std::unique_ptr<ChromeProcess> ChromeProcess::Spawn(const ChromeCommandLine& commandLine,
                                                    const std::optional<std::string>& logFile,
                                                    bool removeProfileOnExit) {
    std::error_code fsErr;
    std::filesystem::create_directories(commandLine.userDataDir, fsErr);
    if (fsErr) {
        throw errors::BrowserConnectionError(
            fmt::format("Failed to create profile directory {}: {}", commandLine.userDataDir, fsErr.message()));
    }
    // A stale port file from a previous run would point at a dead endpoint
    std::filesystem::remove(commandLine.userDataDir + "/DevToolsActivePort", fsErr);

    std::vector<std::string> argvStrings;
    argvStrings.push_back(commandLine.executable);
    argvStrings.insert(argvStrings.end(), commandLine.args.begin(), commandLine.args.end());
    std::vector<char*> argv;
    for (auto& s : argvStrings) {
        argv.push_back(s.data());
    }
    argv.push_back(nullptr);

    const std::string outputPath = logFile.value_or("/dev/null");
    posix_spawn_file_actions_t actions;
    ::posix_spawn_file_actions_init(&actions);
    ::posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    ::posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, outputPath.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
    ::posix_spawn_file_actions_adddup2(&actions, STDOUT_FILENO, STDERR_FILENO);

    pid_t pid = 0;
    int rc = ::posix_spawn(&pid, commandLine.executable.c_str(), &actions, nullptr, argv.data(), environ);
    ::posix_spawn_file_actions_destroy(&actions);
    if (rc != 0) {
        throw errors::BrowserConnectionError(
            fmt::format("Failed to launch {}: {}", commandLine.executable, std::strerror(rc)));
    }
    LOG_INFO("Launched browser pid={} executable={} profile={}", pid, commandLine.executable, commandLine.userDataDir);
    return std::unique_ptr<ChromeProcess>(new ChromeProcess(pid, commandLine.userDataDir, removeProfileOnExit));
}

ChromeProcess::~ChromeProcess() {
    Terminate();
    if (removeProfileOnExit_) {
        std::error_code ec;
        std::filesystem::remove_all(userDataDir_, ec);
    }
}

bool ChromeProcess::HasExited() {
    if (reaped_) {
        return true;
    }
    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == pid_ || (r < 0 && errno == ECHILD)) {
        reaped_ = true;
    }
    return reaped_;
}

void ChromeProcess::Terminate() {
    if (HasExited()) {
        return;
    }
    ::kill(pid_, SIGTERM);
    for (int i = 0; i < kTerminatePolls; ++i) {
        if (HasExited()) {
            LOG_DEBUG("Browser pid={} exited", pid_);
            return;
        }
        std::this_thread::sleep_for(kTerminatePollInterval);
    }
    forceKill();
}

void ChromeProcess::forceKill() {
    LOG_WARN("Browser pid={} ignored SIGTERM, sending SIGKILL", pid_);
    ::kill(pid_, SIGKILL);
    int status = 0;
    (void)::waitpid(pid_, &status, 0);
    reaped_ = true;
}

net::awaitable<void> ChromeProcess::Stop(std::shared_ptr<ChromeProcess> process) {
    if (process->HasExited()) {
        co_return;
    }
    ::kill(process->pid_, SIGTERM);
    net::steady_timer poll(co_await net::this_coro::executor);
    for (int i = 0; i < kTerminatePolls; ++i) {
        poll.expires_after(kTerminatePollInterval);
        co_await poll.async_wait(net::use_awaitable);
        if (process->HasExited()) {
            LOG_DEBUG("Browser pid={} exited", process->pid_);
            co_return;
        }
    }
    process->forceKill();
}

net::awaitable<std::string> ChromeProcess::WaitForEndpoint(std::chrono::milliseconds timeout) {
    const std::string portFile = userDataDir_ + "/DevToolsActivePort";
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    net::steady_timer poll(co_await net::this_coro::executor);
    while (true) {
        if (auto endpoint = ParseDevToolsActivePort(readFile(portFile))) {
            co_return *endpoint;
        }
        if (HasExited()) {
            throw errors::BrowserConnectionError(
                fmt::format("Browser process {} exited before exposing a DevTools endpoint", pid_));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            throw errors::BrowserConnectionError(
                fmt::format("Timed out after {} ms waiting for {}", timeout.count(), portFile));
        }
        poll.expires_after(std::chrono::milliseconds(100));
        co_await poll.async_wait(net::use_awaitable);
    }
}

} // namespace browser
} // namespace dtmcp
