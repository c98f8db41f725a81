//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: McpContext.h
// Purpose: Automation context shared by the tool handlers of one server instance
//==========================================================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include "dtmcp/JSONRPCTypes.h"
#include "dtmcp/browser/Browser.h"

namespace dtmcp {

namespace net = boost::asio;

// Upper bound of console messages and network requests retained per page
constexpr std::size_t MAX_COLLECTED_ENTRIES = 1000;

struct PageInfo {
    std::string targetId;
    std::string url;
    std::string title;
    bool devToolsOpen{false};   // a devtools:// window inspects this page
};

struct ConsoleMessage {
    int64_t msgid{0};
    std::string type;   // log, warn, error, info, debug ...
    std::string text;
};

struct NetworkRequest {
    int64_t reqid{0};
    std::string requestId;   // protocol id
    std::string url;
    std::string method;
    std::string resourceType;
    std::optional<int64_t> status;
    std::string mimeType;
    bool failed{false};
    std::string errorText;
    std::vector<std::pair<std::string, std::string>> requestHeaders;
    std::vector<std::pair<std::string, std::string>> responseHeaders;
};

// Aggregate of a recorded performance trace
struct TraceSummary {
    std::size_t eventCount{0};
    double durationMs{0.0};
    std::vector<std::pair<std::string, std::size_t>> topEvents;   // most frequent event names
};

//==========================================================================================================
// McpContext
// Purpose: Wraps one IBrowser and the state derived from it: open pages, the selected page, lazily
//          attached per-page protocol sessions, console/network collectors, emulation settings and
//          trace recording.
// Notes:
//   - Not safe for concurrent use; the owning server instance serializes every access.
//   - Protocol events are delivered through an IBrowser subscription held for the context lifetime.
//==========================================================================================================
class McpContext : public std::enable_shared_from_this<McpContext> {
public:
    struct Options {
        bool experimentalDevToolsDebugging{false};
        bool experimentalIncludeAllPages{false};
    };

    //======================================================================================================
    // From
    // Purpose: Build a context, list the pages (opening about:blank when there is none) and attach to
    //          the first one.
    //======================================================================================================
    static net::awaitable<std::shared_ptr<McpContext>> From(std::shared_ptr<browser::IBrowser> browser,
                                                           Options options);

    ~McpContext();
    McpContext(const McpContext&) = delete;
    McpContext& operator=(const McpContext&) = delete;

    const std::shared_ptr<browser::IBrowser>& Browser() const { return browser_; }
    const Options& GetOptions() const { return options_; }

    ///////////////////////////////////////// Pages ///////////////////////////////////////////
    net::awaitable<void> RefreshPages();
    const std::vector<PageInfo>& Pages() const { return pages_; }

    bool HasSelectedPage() const;
    const std::string& SelectedTargetId() const { return selectedTargetId_; }
    // Throws std::runtime_error when the selected page has been closed.
    std::size_t SelectedPageIndex() const;
    const PageInfo& SelectedPage() const;

    // Throws errors::InvalidParamsError when index is out of range.
    net::awaitable<void> SelectPage(std::size_t index);
    net::awaitable<PageInfo> NewPage(const std::string& url);
    // Closing the last open page is refused with std::runtime_error.
    net::awaitable<void> ClosePage(std::size_t index);

    // DevTools protocol command addressed to the selected page's session.
    net::awaitable<JSONValue> SendToSelectedPage(const std::string& method, JSONValue params);

    // Marks pages inspected by an operator-opened devtools:// window.
    net::awaitable<void> DetectOpenDevToolsWindows();

    ///////////////////////////////////////// Collectors ///////////////////////////////////////////
    const std::deque<ConsoleMessage>& ConsoleMessages() const;
    const std::deque<NetworkRequest>& NetworkRequests() const;
    // Throws std::runtime_error when no request with that id was collected on the selected page.
    const NetworkRequest& GetNetworkRequest(int64_t reqid) const;

    ///////////////////////////////////////// Emulation ///////////////////////////////////////////
    void SetCpuThrottlingRate(double rate);
    double CpuThrottlingRate() const;
    void SetNetworkConditions(std::optional<std::string> conditions);
    std::optional<std::string> NetworkConditions() const;

    ///////////////////////////////////////// Tracing ///////////////////////////////////////////
    bool IsRunningTrace() const { return traceRunning_; }
    net::awaitable<void> StartTrace();
    net::awaitable<TraceSummary> StopTrace();

private:
    struct PageState {
        std::string sessionId;
        std::deque<ConsoleMessage> console;
        std::deque<NetworkRequest> network;
        std::map<std::string, int64_t> requestIds;   // protocol id -> reqid
        int64_t nextMsgId{1};
        int64_t nextReqId{1};
        double cpuThrottlingRate{1.0};
        std::optional<std::string> networkConditions;
    };

    McpContext(std::shared_ptr<browser::IBrowser> browser, Options options);

    net::awaitable<std::string> ensureSession(const std::string& targetId);
    PageState& selectedState();
    const PageState& selectedState() const;
    PageState* stateForSession(const std::string& sessionId);
    void onEvent(const std::string& method, const JSONValue& params, const std::string& sessionId);
    void onTraceData(const JSONValue& params);

    std::shared_ptr<browser::IBrowser> browser_;
    Options options_;
    browser::IBrowser::SubscriptionId subscription_{0};
    bool subscribed_{false};

    std::vector<PageInfo> pages_;
    std::string selectedTargetId_;
    std::map<std::string, PageState> states_;           // targetId -> state
    std::map<std::string, std::string> sessionTargets_; // sessionId -> targetId

    bool traceRunning_{false};
    bool traceComplete_{false};
    std::size_t traceEventCount_{0};
    double traceMinTs_{0.0};
    double traceMaxTs_{0.0};
    std::map<std::string, std::size_t> traceNames_;
};

} // namespace dtmcp
