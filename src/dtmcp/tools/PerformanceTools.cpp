//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PerformanceTools.cpp
// Purpose: Performance trace recording of the selected page
//==========================================================================================================

#include <chrono>

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <fmt/format.h>

#include "dtmcp/McpContext.h"
#include "dtmcp/McpResponse.h"
#include "dtmcp/tools/ToolRegistry.h"

namespace dtmcp {
namespace tools {

namespace {

// Recording length when the trace is stopped automatically
constexpr std::chrono::seconds kAutoStopDelay{5};

void appendTraceSummary(McpResponse& response, const TraceSummary& summary) {
    response.AppendResponseLine("The performance trace has been stopped.");
    response.AppendResponseLine(fmt::format("Recorded {} trace events over {:.1f} ms.", summary.eventCount,
                                            summary.durationMs));
    if (!summary.topEvents.empty()) {
        response.AppendResponseLine("## Most frequent events");
        for (const auto& [name, count] : summary.topEvents) {
            response.AppendResponseLine(fmt::format("- {}: {}", name, count));
        }
    }
}

net::awaitable<void> startTrace(const ToolRequest& request, McpResponse& response, McpContext& context) {
    if (context.IsRunningTrace()) {
        response.AppendResponseLine(
            "Error: a performance trace is already running. Use performance_stop_trace to stop it. "
            "Only one trace can be running at any given time.");
        co_return;
    }
    const bool reload = request.GetBool("reload");
    const bool autoStop = request.GetBool("autoStop");

    co_await context.StartTrace();
    if (reload) {
        co_await context.SendToSelectedPage("Page.reload", JSONValue{JSONValue::Object{}});
    }
    if (!autoStop) {
        response.AppendResponseLine(
            "The performance trace is being recorded. Use performance_stop_trace to stop it.");
        co_return;
    }
    net::steady_timer delay(co_await net::this_coro::executor, kAutoStopDelay);
    co_await delay.async_wait(net::use_awaitable);
    TraceSummary summary = co_await context.StopTrace();
    appendTraceSummary(response, summary);
}

net::awaitable<void> stopTrace(const ToolRequest&, McpResponse& response, McpContext& context) {
    if (!context.IsRunningTrace()) {
        co_return;
    }
    TraceSummary summary = co_await context.StopTrace();
    appendTraceSummary(response, summary);
}

} // namespace

std::vector<ToolDescriptor> PerformanceTools() {
    return {
        {"performance_start_trace",
         "Starts a performance trace recording on the selected page. This can be used to look for performance "
         "problems on the page.",
         schema::Object({{"reload", schema::Boolean("Determines if, once tracing has started, the page should be "
                                                    "automatically reloaded.")},
                         {"autoStop", schema::Boolean("Determines if the trace recording should be automatically "
                                                      "stopped.")}},
                        {"reload", "autoStop"}),
         ToolCategory::Performance, true, startTrace},
        {"performance_stop_trace", "Stops the active performance trace recording on the selected page.",
         schema::Object({}), ToolCategory::Performance, true, stopTrace},
    };
}

} // namespace tools
} // namespace dtmcp
