//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: McpContext.cpp
// Purpose: Page bookkeeping, protocol sessions and event collectors of the automation context
//==========================================================================================================

#include "dtmcp/McpContext.h"

#include <algorithm>
#include <chrono>
#include <stdexcept>

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <fmt/format.h>

#include "dtmcp/errors/Errors.h"
#include "logging/Logger.h"

namespace dtmcp {

namespace {

constexpr const char* kClosedPageMessage =
    "The selected page has been closed. Call list_pages to see open pages.";

constexpr const char* kTraceCategories =
    "-*,blink.console,blink.user_timing,devtools.timeline,disabled-by-default-devtools.screenshot,"
    "disabled-by-default-devtools.timeline,disabled-by-default-devtools.timeline.frame,"
    "disabled-by-default-devtools.timeline.stack,latencyInfo,loading,v8.execute,v8";

constexpr std::chrono::milliseconds kTraceStopTimeout{30000};

const JSONValue::Array* arrayMember(const JSONValue& object, const std::string& key) {
    const JSONValue* v = json::Find(object, key);
    if (v == nullptr || !v->IsArray()) {
        return nullptr;
    }
    return &std::get<JSONValue::Array>(v->value);
}

std::vector<std::pair<std::string, std::string>> headersFrom(const JSONValue* headers) {
    std::vector<std::pair<std::string, std::string>> out;
    if (headers == nullptr || !headers->IsObject()) {
        return out;
    }
    for (const auto& [name, value] : std::get<JSONValue::Object>(headers->value)) {
        if (value && value->IsString()) {
            out.emplace_back(name, std::get<std::string>(value->value));
        } else if (value) {
            out.emplace_back(name, SerializeJSON(*value));
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

// Renders a Runtime.RemoteObject the way the console shows it
std::string formatRemoteObject(const JSONValue& arg) {
    if (const JSONValue* v = json::Find(arg, "value")) {
        if (v->IsString()) {
            return std::get<std::string>(v->value);
        }
        return SerializeJSON(*v);
    }
    if (auto s = json::GetString(arg, "unserializableValue")) {
        return *s;
    }
    if (auto s = json::GetString(arg, "description")) {
        return *s;
    }
    return json::GetString(arg, "type").value_or("undefined");
}

template <typename T>
void pushCapped(std::deque<T>& entries, T entry) {
    entries.push_back(std::move(entry));
    while (entries.size() > MAX_COLLECTED_ENTRIES) {
        entries.pop_front();
    }
}

} // namespace

McpContext::McpContext(std::shared_ptr<browser::IBrowser> browser, Options options)
    : browser_(std::move(browser)), options_(options) {}

McpContext::~McpContext() {
    if (subscribed_ && browser_) {
        browser_->Unsubscribe(subscription_);
    }
}

net::awaitable<std::shared_ptr<McpContext>> McpContext::From(std::shared_ptr<browser::IBrowser> browser,
                                                            Options options) {
    std::shared_ptr<McpContext> context(new McpContext(std::move(browser), options));
    std::weak_ptr<McpContext> weak = context;
    context->subscription_ = context->browser_->Subscribe(
        [weak](const std::string& method, const JSONValue& params, const std::string& sessionId) {
            if (auto self = weak.lock()) {
                self->onEvent(method, params, sessionId);
            }
        });
    context->subscribed_ = true;

    co_await context->RefreshPages();
    if (context->pages_.empty()) {
        co_await context->NewPage("about:blank");
    } else {
        co_await context->SelectPage(0);
    }
    LOG_DEBUG("Context ready with {} page(s) on {}", context->pages_.size(), context->browser_->Endpoint());
    co_return context;
}

///////////////////////////////////////// Pages ///////////////////////////////////////////

net::awaitable<void> McpContext::RefreshPages() {
    JSONValue result = co_await browser_->Send("Target.getTargets", JSONValue{JSONValue::Object{}}, "");
    std::vector<PageInfo> pages;
    std::vector<std::string> devToolsUrls;
    if (const JSONValue::Array* infos = arrayMember(result, "targetInfos")) {
        for (const auto& info : *infos) {
            if (!info || json::GetString(*info, "type").value_or("") != "page") {
                continue;
            }
            PageInfo page;
            page.targetId = json::GetString(*info, "targetId").value_or("");
            page.url = json::GetString(*info, "url").value_or("");
            page.title = json::GetString(*info, "title").value_or("");
            if (page.url.rfind("devtools://", 0) == 0) {
                devToolsUrls.push_back(page.url);
                if (!options_.experimentalIncludeAllPages) {
                    continue;
                }
            }
            pages.push_back(std::move(page));
        }
    }
    for (auto& page : pages) {
        for (const auto& url : devToolsUrls) {
            if (!page.targetId.empty() && url.find(page.targetId) != std::string::npos) {
                page.devToolsOpen = true;
            }
        }
    }

    // Forget state of pages that no longer exist
    for (auto it = states_.begin(); it != states_.end();) {
        bool alive = std::any_of(pages.begin(), pages.end(),
                                 [&](const PageInfo& p) { return p.targetId == it->first; });
        if (alive) {
            ++it;
            continue;
        }
        if (!it->second.sessionId.empty()) {
            sessionTargets_.erase(it->second.sessionId);
        }
        it = states_.erase(it);
    }

    pages_ = std::move(pages);
    if (selectedTargetId_.empty() && !pages_.empty()) {
        selectedTargetId_ = pages_.front().targetId;
    }
}

bool McpContext::HasSelectedPage() const {
    return std::any_of(pages_.begin(), pages_.end(),
                       [&](const PageInfo& p) { return p.targetId == selectedTargetId_; });
}

std::size_t McpContext::SelectedPageIndex() const {
    for (std::size_t i = 0; i < pages_.size(); ++i) {
        if (pages_[i].targetId == selectedTargetId_) {
            return i;
        }
    }
    throw std::runtime_error(kClosedPageMessage);
}

const PageInfo& McpContext::SelectedPage() const {
    return pages_[SelectedPageIndex()];
}

net::awaitable<void> McpContext::SelectPage(std::size_t index) {
    if (index >= pages_.size()) {
        throw errors::InvalidParamsError(
            fmt::format("No page found with index {}. Call list_pages to see open pages.", index));
    }
    const std::string targetId = pages_[index].targetId;
    selectedTargetId_ = targetId;
    co_await ensureSession(targetId);
    co_await browser_->Send("Target.activateTarget",
                            json::ObjectBuilder().Set("targetId", targetId).Build(), "");
}

net::awaitable<PageInfo> McpContext::NewPage(const std::string& url) {
    JSONValue created = co_await browser_->Send(
        "Target.createTarget", json::ObjectBuilder().Set("url", "about:blank").Build(), "");
    auto targetId = json::GetString(created, "targetId");
    if (!targetId.has_value()) {
        throw errors::CdpError("Target.createTarget returned no targetId");
    }
    selectedTargetId_ = *targetId;
    // Attach before navigating so the collectors see the first requests
    std::string sessionId = co_await ensureSession(*targetId);
    if (url != "about:blank") {
        co_await browser_->Send("Page.navigate", json::ObjectBuilder().Set("url", url).Build(), sessionId);
    }
    co_await RefreshPages();
    for (const auto& page : pages_) {
        if (page.targetId == *targetId) {
            co_return page;
        }
    }
    PageInfo info;
    info.targetId = *targetId;
    info.url = url;
    co_return info;
}

net::awaitable<void> McpContext::ClosePage(std::size_t index) {
    if (index >= pages_.size()) {
        throw errors::InvalidParamsError(
            fmt::format("No page found with index {}. Call list_pages to see open pages.", index));
    }
    if (pages_.size() <= 1) {
        throw std::runtime_error("The last open page cannot be closed. It is fine to keep it open.");
    }
    const std::string targetId = pages_[index].targetId;
    co_await browser_->Send("Target.closeTarget", json::ObjectBuilder().Set("targetId", targetId).Build(), "");
    if (selectedTargetId_ == targetId) {
        selectedTargetId_.clear();
    }
    co_await RefreshPages();
    if (!pages_.empty()) {
        co_await SelectPage(SelectedPageIndex());
    }
}

net::awaitable<JSONValue> McpContext::SendToSelectedPage(const std::string& method, JSONValue params) {
    const std::string targetId = SelectedPage().targetId;
    std::string sessionId = co_await ensureSession(targetId);
    co_return co_await browser_->Send(method, std::move(params), sessionId);
}

net::awaitable<void> McpContext::DetectOpenDevToolsWindows() {
    JSONValue result = co_await browser_->Send("Target.getTargets", JSONValue{JSONValue::Object{}}, "");
    std::vector<std::string> devToolsUrls;
    if (const JSONValue::Array* infos = arrayMember(result, "targetInfos")) {
        for (const auto& info : *infos) {
            std::string url = info ? json::GetString(*info, "url").value_or("") : std::string();
            if (url.rfind("devtools://", 0) == 0) {
                devToolsUrls.push_back(std::move(url));
            }
        }
    }
    for (std::size_t i = 0; i < pages_.size(); ++i) {
        auto& page = pages_[i];
        bool open = std::any_of(devToolsUrls.begin(), devToolsUrls.end(), [&](const std::string& url) {
            return !page.targetId.empty() && url.find(page.targetId) != std::string::npos;
        });
        if (open && !page.devToolsOpen) {
            LOG_INFO("DevTools window opened for page {} ({})", i, page.url);
        }
        page.devToolsOpen = open;
    }
}

net::awaitable<std::string> McpContext::ensureSession(const std::string& targetId) {
    auto existing = states_.find(targetId);
    if (existing != states_.end() && !existing->second.sessionId.empty()) {
        co_return existing->second.sessionId;
    }
    JSONValue attached = co_await browser_->Send(
        "Target.attachToTarget", json::ObjectBuilder().Set("targetId", targetId).Set("flatten", true).Build(), "");
    auto sessionId = json::GetString(attached, "sessionId");
    if (!sessionId.has_value()) {
        throw errors::CdpError("Target.attachToTarget returned no sessionId");
    }
    states_[targetId].sessionId = *sessionId;
    sessionTargets_[*sessionId] = targetId;
    for (const char* domain : {"Runtime.enable", "Network.enable", "Page.enable"}) {
        co_await browser_->Send(domain, JSONValue{JSONValue::Object{}}, *sessionId);
    }
    LOG_DEBUG("Attached to target {} with session {}", targetId, *sessionId);
    co_return *sessionId;
}

McpContext::PageState& McpContext::selectedState() {
    return states_[SelectedPage().targetId];
}

const McpContext::PageState& McpContext::selectedState() const {
    static const PageState empty;
    auto it = states_.find(SelectedPage().targetId);
    return it == states_.end() ? empty : it->second;
}

McpContext::PageState* McpContext::stateForSession(const std::string& sessionId) {
    auto target = sessionTargets_.find(sessionId);
    if (target == sessionTargets_.end()) {
        return nullptr;
    }
    auto state = states_.find(target->second);
    return state == states_.end() ? nullptr : &state->second;
}

///////////////////////////////////////// Collectors ///////////////////////////////////////////

const std::deque<ConsoleMessage>& McpContext::ConsoleMessages() const {
    return selectedState().console;
}

const std::deque<NetworkRequest>& McpContext::NetworkRequests() const {
    return selectedState().network;
}

const NetworkRequest& McpContext::GetNetworkRequest(int64_t reqid) const {
    for (const auto& request : selectedState().network) {
        if (request.reqid == reqid) {
            return request;
        }
    }
    throw std::runtime_error(fmt::format("Request with reqid {} not found for the selected page.", reqid));
}

void McpContext::onEvent(const std::string& method, const JSONValue& params, const std::string& sessionId) {
    if (method == "Tracing.dataCollected") {
        onTraceData(params);
        return;
    }
    if (method == "Tracing.tracingComplete") {
        traceComplete_ = true;
        return;
    }
    if (method == "Target.detachedFromTarget") {
        auto detached = json::GetString(params, "sessionId");
        if (!detached.has_value()) {
            return;
        }
        if (PageState* state = stateForSession(*detached)) {
            state->sessionId.clear();
        }
        sessionTargets_.erase(*detached);
        return;
    }

    PageState* state = stateForSession(sessionId);
    if (state == nullptr) {
        return;
    }

    if (method == "Runtime.consoleAPICalled") {
        ConsoleMessage msg;
        msg.msgid = state->nextMsgId++;
        msg.type = json::GetString(params, "type").value_or("log");
        if (const JSONValue::Array* args = arrayMember(params, "args")) {
            for (const auto& arg : *args) {
                if (!arg) {
                    continue;
                }
                if (!msg.text.empty()) {
                    msg.text += ' ';
                }
                msg.text += formatRemoteObject(*arg);
            }
        }
        pushCapped(state->console, std::move(msg));
    } else if (method == "Runtime.exceptionThrown") {
        ConsoleMessage msg;
        msg.msgid = state->nextMsgId++;
        msg.type = "error";
        if (const JSONValue* details = json::Find(params, "exceptionDetails")) {
            const JSONValue* exception = json::Find(*details, "exception");
            auto description = exception ? json::GetString(*exception, "description") : std::nullopt;
            msg.text = description.value_or(json::GetString(*details, "text").value_or("Uncaught exception"));
        }
        pushCapped(state->console, std::move(msg));
    } else if (method == "Network.requestWillBeSent") {
        NetworkRequest req;
        req.reqid = state->nextReqId++;
        req.requestId = json::GetString(params, "requestId").value_or("");
        req.resourceType = json::GetString(params, "type").value_or("Other");
        if (const JSONValue* request = json::Find(params, "request")) {
            req.url = json::GetString(*request, "url").value_or("");
            req.method = json::GetString(*request, "method").value_or("GET");
            req.requestHeaders = headersFrom(json::Find(*request, "headers"));
        }
        state->requestIds[req.requestId] = req.reqid;
        pushCapped(state->network, std::move(req));
    } else if (method == "Network.responseReceived" || method == "Network.loadingFailed") {
        auto requestId = json::GetString(params, "requestId");
        auto mapped = requestId ? state->requestIds.find(*requestId) : state->requestIds.end();
        if (mapped == state->requestIds.end()) {
            return;
        }
        auto entry = std::find_if(state->network.rbegin(), state->network.rend(),
                                  [&](const NetworkRequest& r) { return r.reqid == mapped->second; });
        if (entry == state->network.rend()) {
            return;
        }
        if (method == "Network.loadingFailed") {
            entry->failed = true;
            entry->errorText = json::GetString(params, "errorText").value_or("");
            return;
        }
        if (const JSONValue* response = json::Find(params, "response")) {
            entry->status = json::GetInt(*response, "status");
            entry->mimeType = json::GetString(*response, "mimeType").value_or("");
            entry->responseHeaders = headersFrom(json::Find(*response, "headers"));
        }
    } else if (method == "Page.frameNavigated") {
        const JSONValue* frame = json::Find(params, "frame");
        if (frame != nullptr && json::Find(*frame, "parentId") == nullptr) {
            state->console.clear();
            state->network.clear();
            state->requestIds.clear();
        }
    }
}

///////////////////////////////////////// Emulation ///////////////////////////////////////////

void McpContext::SetCpuThrottlingRate(double rate) {
    selectedState().cpuThrottlingRate = rate;
}

double McpContext::CpuThrottlingRate() const {
    return selectedState().cpuThrottlingRate;
}

void McpContext::SetNetworkConditions(std::optional<std::string> conditions) {
    selectedState().networkConditions = std::move(conditions);
}

std::optional<std::string> McpContext::NetworkConditions() const {
    return selectedState().networkConditions;
}

///////////////////////////////////////// Tracing ///////////////////////////////////////////

net::awaitable<void> McpContext::StartTrace() {
    if (traceRunning_) {
        throw std::runtime_error("A performance trace is already running.");
    }
    traceRunning_ = true;
    traceComplete_ = false;
    traceEventCount_ = 0;
    traceMinTs_ = 0.0;
    traceMaxTs_ = 0.0;
    traceNames_.clear();
    try {
        co_await SendToSelectedPage("Tracing.start", json::ObjectBuilder()
                                                         .Set("categories", kTraceCategories)
                                                         .Set("transferMode", "ReportEvents")
                                                         .Build());
    } catch (const std::exception&) {
        traceRunning_ = false;
        throw;
    }
}

net::awaitable<TraceSummary> McpContext::StopTrace() {
    if (!traceRunning_) {
        throw std::runtime_error("No performance trace is running.");
    }
    traceRunning_ = false;
    co_await SendToSelectedPage("Tracing.end", JSONValue{JSONValue::Object{}});

    const auto deadline = std::chrono::steady_clock::now() + kTraceStopTimeout;
    net::steady_timer poll(co_await net::this_coro::executor);
    while (!traceComplete_) {
        if (std::chrono::steady_clock::now() >= deadline) {
            throw errors::CdpError(fmt::format("Trace did not complete within {} ms", kTraceStopTimeout.count()));
        }
        poll.expires_after(std::chrono::milliseconds(50));
        co_await poll.async_wait(net::use_awaitable);
    }

    TraceSummary summary;
    summary.eventCount = traceEventCount_;
    summary.durationMs = (traceMaxTs_ - traceMinTs_) / 1000.0;
    summary.topEvents.assign(traceNames_.begin(), traceNames_.end());
    std::stable_sort(summary.topEvents.begin(), summary.topEvents.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (summary.topEvents.size() > 5) {
        summary.topEvents.resize(5);
    }
    co_return summary;
}

void McpContext::onTraceData(const JSONValue& params) {
    const JSONValue::Array* events = arrayMember(params, "value");
    if (events == nullptr) {
        return;
    }
    for (const auto& event : *events) {
        if (!event) {
            continue;
        }
        ++traceEventCount_;
        if (auto name = json::GetString(*event, "name")) {
            ++traceNames_[*name];
        }
        auto ts = json::GetNumber(*event, "ts");
        if (ts.has_value() && *ts > 0) {
            if (traceMinTs_ == 0.0 || *ts < traceMinTs_) {
                traceMinTs_ = *ts;
            }
            traceMaxTs_ = std::max(traceMaxTs_, *ts);
        }
    }
}

} // namespace dtmcp
