//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: McpResponse.cpp
// Purpose: Rendering of accumulated handler output into tool result content
//==========================================================================================================

#include "dtmcp/McpResponse.h"

#include <algorithm>

#include <fmt/format.h>

#include "dtmcp/McpContext.h"
#include "dtmcp/Protocol.h"

namespace dtmcp {

namespace {

std::string requestStatus(const NetworkRequest& request) {
    if (request.failed) {
        return fmt::format("[failed - {}]", request.errorText);
    }
    if (!request.status.has_value()) {
        return "[pending]";
    }
    return fmt::format("[{} - {}]", *request.status < 400 ? "success" : "failed", *request.status);
}

std::string requestLine(const NetworkRequest& request) {
    return fmt::format("reqid={} {} {} {}", request.reqid, request.method, request.url, requestStatus(request));
}

void appendHeaders(std::vector<std::string>& out, const std::vector<std::pair<std::string, std::string>>& headers) {
    for (const auto& [name, value] : headers) {
        out.push_back(fmt::format("- {}:{}", name, value));
    }
}

void appendNetworkRequests(std::vector<std::string>& out, const McpContext& context,
                           const NetworkRequestsOptions& options) {
    std::vector<const NetworkRequest*> requests;
    for (const auto& request : context.NetworkRequests()) {
        if (options.resourceTypes.empty() ||
            std::find(options.resourceTypes.begin(), options.resourceTypes.end(), request.resourceType) !=
                options.resourceTypes.end()) {
            requests.push_back(&request);
        }
    }
    out.push_back("## Network requests");
    if (requests.empty()) {
        out.push_back("No requests found.");
        return;
    }
    const int64_t total = static_cast<int64_t>(requests.size());
    int64_t pageSize = total;
    if (options.pageSize.has_value() && *options.pageSize > 0) {
        pageSize = *options.pageSize;
    }
    const int64_t pageCount = (total + pageSize - 1) / pageSize;
    int64_t pageIdx = options.pageIdx.value_or(0);
    if (pageIdx < 0 || pageIdx >= pageCount) {
        out.push_back("Invalid page number provided. Showing first page.");
        pageIdx = 0;
    }
    const int64_t start = pageIdx * pageSize;
    const int64_t end = std::min(start + pageSize, total);
    out.push_back(fmt::format("Showing {}-{} of {} (Page {} of {}).", start + 1, end, total, pageIdx + 1, pageCount));
    if (pageIdx + 1 < pageCount) {
        out.push_back(fmt::format("Next page: {}", pageIdx + 1));
    }
    if (pageIdx > 0) {
        out.push_back(fmt::format("Previous page: {}", pageIdx - 1));
    }
    for (int64_t i = start; i < end; ++i) {
        out.push_back(requestLine(*requests[static_cast<std::size_t>(i)]));
    }
}

} // namespace

net::awaitable<std::vector<JSONValue>> McpResponse::Handle(const std::string& toolName, McpContext& context) {
    if (includePages_) {
        co_await context.RefreshPages();
    }
    co_return Format(toolName, context);
}

std::vector<JSONValue> McpResponse::Format(const std::string& toolName, const McpContext& context) const {
    std::vector<std::string> out;
    out.push_back(fmt::format("# {} response", toolName));
    out.insert(out.end(), lines_.begin(), lines_.end());

    if (includePages_) {
        out.push_back("## Pages");
        const auto& pages = context.Pages();
        for (std::size_t i = 0; i < pages.size(); ++i) {
            std::string line = fmt::format("{}: {}", i, pages[i].url);
            if (pages[i].targetId == context.SelectedTargetId()) {
                line += " [selected]";
            }
            if (pages[i].devToolsOpen) {
                line += " [devtools open]";
            }
            out.push_back(std::move(line));
        }
    }

    if (context.HasSelectedPage()) {
        if (auto conditions = context.NetworkConditions()) {
            out.push_back("## Network emulation");
            out.push_back(fmt::format("Emulating: {}", *conditions));
        }
        if (double rate = context.CpuThrottlingRate(); rate > 1.0) {
            out.push_back("## CPU emulation");
            out.push_back(fmt::format("Emulating: {}x slowdown", rate));
        }
    }

    if (attachedRequest_.has_value()) {
        const NetworkRequest& request = context.GetNetworkRequest(*attachedRequest_);
        out.push_back(fmt::format("## Request {}", request.url));
        out.push_back(fmt::format("Status:  {}", requestStatus(request)));
        if (!request.mimeType.empty()) {
            out.push_back(fmt::format("Content type: {}", request.mimeType));
        }
        out.push_back("### Request Headers");
        appendHeaders(out, request.requestHeaders);
        if (!request.responseHeaders.empty()) {
            out.push_back("### Response Headers");
            appendHeaders(out, request.responseHeaders);
        }
    }

    if (includeNetworkRequests_) {
        appendNetworkRequests(out, context, networkOptions_);
    }

    if (includeConsole_) {
        out.push_back("## Console messages");
        const auto& messages = context.ConsoleMessages();
        if (messages.empty()) {
            out.push_back("<no console messages found>");
        }
        for (const auto& msg : messages) {
            out.push_back(fmt::format("msgid={} [{}] {}", msg.msgid, msg.type, msg.text));
        }
    }

    std::string text;
    for (std::size_t i = 0; i < out.size(); ++i) {
        if (i > 0) {
            text += '\n';
        }
        text += out[i];
    }

    std::vector<JSONValue> content;
    content.push_back(MakeTextContent(text));
    for (const auto& image : images_) {
        content.push_back(MakeImageContent(image.data, image.mimeType));
    }
    return content;
}

} // namespace dtmcp
