//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: NetworkTools.cpp
// Purpose: Inspection of network requests collected for the selected page
//==========================================================================================================

#include "dtmcp/McpContext.h"
#include "dtmcp/McpResponse.h"
#include "dtmcp/tools/ToolRegistry.h"

namespace dtmcp {
namespace tools {

namespace {

// Network.ResourceType values
const std::vector<std::string> kResourceTypes{
    "Document", "Stylesheet", "Image", "Media", "Font", "Script", "TextTrack", "XHR", "Fetch", "Prefetch",
    "EventSource", "WebSocket", "Manifest", "SignedExchange", "Ping", "CSPViolationReport", "Preflight", "Other",
};

net::awaitable<void> listNetworkRequests(const ToolRequest& request, McpResponse& response, McpContext&) {
    NetworkRequestsOptions options;
    options.pageSize = request.GetOptionalInt("pageSize");
    options.pageIdx = request.GetOptionalInt("pageIdx");
    options.resourceTypes = request.GetStringArray("resourceTypes");
    response.SetIncludeNetworkRequests(true, std::move(options));
    co_return;
}

net::awaitable<void> getNetworkRequest(const ToolRequest& request, McpResponse& response, McpContext&) {
    response.AttachNetworkRequest(request.GetInt("reqid"));
    co_return;
}

} // namespace

std::vector<ToolDescriptor> NetworkTools() {
    return {
        {"list_network_requests", "List all requests for the currently selected page since the last navigation.",
         schema::Object({
             {"pageSize", schema::Integer("Maximum number of requests to return. When omitted, returns all requests.", 1)},
             {"pageIdx", schema::Integer("Page number to return (0-based). When omitted, returns the first page.", 0)},
             {"resourceTypes", schema::EnumArray(kResourceTypes, "Filter requests to only return requests of the "
                                                                 "specified resource types. When omitted or empty, "
                                                                 "returns all requests.")},
         }),
         ToolCategory::Network, true, listNetworkRequests},
        {"get_network_request",
         "Gets a network request by reqid. You can get all requests by calling list_network_requests.",
         schema::Object({{"reqid", schema::Integer("The reqid of the network request.")}}, {"reqid"}),
         ToolCategory::Network, true, getNetworkRequest},
    };
}

} // namespace tools
} // namespace dtmcp
