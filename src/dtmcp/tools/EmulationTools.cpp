//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EmulationTools.cpp
// Purpose: CPU/network throttling and viewport resizing of the selected page
//==========================================================================================================

#include <fmt/format.h>

#include "dtmcp/McpContext.h"
#include "dtmcp/McpResponse.h"
#include "dtmcp/errors/Errors.h"
#include "dtmcp/tools/ToolRegistry.h"

namespace dtmcp {
namespace tools {

namespace {

struct NetworkPreset {
    const char* name;
    bool offline;
    double latencyMs;
    double downloadBytesPerSec;
    double uploadBytesPerSec;
};

// Throughput figures match the DevTools throttling presets
const NetworkPreset kNetworkPresets[] = {
    {"Offline", true, 0, 0, 0},
    {"Slow 3G", false, 2000, 50000, 50000},
    {"Fast 3G", false, 562.5, 180000, 84375},
    {"Slow 4G", false, 562.5, 180000, 84375},
    {"Fast 4G", false, 165, 1012500, 168750},
};

constexpr const char* kNoEmulation = "No emulation";

net::awaitable<void> emulateNetwork(const ToolRequest& request, McpResponse& response, McpContext& context) {
    const std::string option = request.GetString("throttlingOption");
    if (option == kNoEmulation) {
        co_await context.SendToSelectedPage("Network.emulateNetworkConditions", json::ObjectBuilder()
                                                                                    .Set("offline", false)
                                                                                    .Set("latency", 0)
                                                                                    .Set("downloadThroughput", -1)
                                                                                    .Set("uploadThroughput", -1)
                                                                                    .Build());
        context.SetNetworkConditions(std::nullopt);
        response.AppendResponseLine("Network emulation disabled.");
        co_return;
    }
    for (const auto& preset : kNetworkPresets) {
        if (option != preset.name) {
            continue;
        }
        co_await context.SendToSelectedPage("Network.emulateNetworkConditions",
                                            json::ObjectBuilder()
                                                .Set("offline", preset.offline)
                                                .Set("latency", preset.latencyMs)
                                                .Set("downloadThroughput", preset.downloadBytesPerSec)
                                                .Set("uploadThroughput", preset.uploadBytesPerSec)
                                                .Build());
        context.SetNetworkConditions(option);
        co_return;
    }
    throw errors::InvalidParamsError(fmt::format("Unknown throttlingOption '{}'", option));
}

net::awaitable<void> emulateCpu(const ToolRequest& request, McpResponse& response, McpContext& context) {
    const double rate = request.GetNumber("throttlingRate");
    if (rate < 1 || rate > 20) {
        throw errors::InvalidParamsError("Argument 'throttlingRate' must be between 1 and 20");
    }
    co_await context.SendToSelectedPage("Emulation.setCPUThrottlingRate",
                                        json::ObjectBuilder().Set("rate", rate).Build());
    context.SetCpuThrottlingRate(rate);
    if (rate == 1) {
        response.AppendResponseLine("CPU throttling disabled.");
    }
}

net::awaitable<void> resizePage(const ToolRequest& request, McpResponse& response, McpContext& context) {
    const int64_t width = request.GetInt("width");
    const int64_t height = request.GetInt("height");
    if (width <= 0 || height <= 0) {
        throw errors::InvalidParamsError("Page dimensions must be positive");
    }
    co_await context.SendToSelectedPage("Emulation.setDeviceMetricsOverride", json::ObjectBuilder()
                                                                                  .Set("width", width)
                                                                                  .Set("height", height)
                                                                                  .Set("deviceScaleFactor", 0)
                                                                                  .Set("mobile", false)
                                                                                  .Build());
    response.AppendResponseLine(fmt::format("The page has been resized to {}x{}.", width, height));
    response.SetIncludePages(true);
}

} // namespace

std::vector<ToolDescriptor> EmulationTools() {
    std::vector<std::string> options{kNoEmulation};
    for (const auto& preset : kNetworkPresets) {
        options.emplace_back(preset.name);
    }
    return {
        {"emulate_network", "Emulates network conditions such as throttling or offline mode on the selected page.",
         schema::Object({{"throttlingOption",
                          schema::Enum(options, "The network throttling option to emulate. Set to \"No emulation\" "
                                                "to disable network emulation.")}},
                        {"throttlingOption"}),
         ToolCategory::Emulation, false, emulateNetwork},
        {"emulate_cpu", "Emulates CPU throttling by slowing down the selected page's execution.",
         schema::Object({{"throttlingRate",
                          schema::Number("The CPU throttling rate representing the slowdown factor 1-20x. Set the "
                                         "rate to 1 to disable throttling.", 1.0, 20.0)}},
                        {"throttlingRate"}),
         ToolCategory::Emulation, false, emulateCpu},
        {"resize_page", "Resizes the selected page so that it has the specified dimensions.",
         schema::Object({{"width", schema::Integer("Page width", 1)}, {"height", schema::Integer("Page height", 1)}},
                        {"width", "height"}),
         ToolCategory::Emulation, false, resizePage},
    };
}

} // namespace tools
} // namespace dtmcp
