//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: McpResponse.h
// Purpose: Response accumulator filled by tool handlers and finalized into protocol content
//==========================================================================================================

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <utility>

#include <boost/asio/awaitable.hpp>

#include "dtmcp/JSONRPCTypes.h"

namespace dtmcp {

namespace net = boost::asio;

class McpContext;

struct ImageContentData {
    std::string data;       // base64
    std::string mimeType;
};

struct NetworkRequestsOptions {
    std::optional<int64_t> pageSize;
    std::optional<int64_t> pageIdx;
    std::vector<std::string> resourceTypes;   // empty means all
};

//==========================================================================================================
// McpResponse
// Purpose: Collects what a handler wants to report. Sections that depend on browser state (pages,
//          network requests, console messages) are only requested by the handler and rendered
//          against the context when Handle() runs.
//==========================================================================================================
class McpResponse {
public:
    void AppendResponseLine(const std::string& line) { lines_.push_back(line); }
    void AttachImage(ImageContentData image) { images_.push_back(std::move(image)); }

    void SetIncludePages(bool value) { includePages_ = value; }
    void SetIncludeConsoleData(bool value) { includeConsole_ = value; }
    void SetIncludeNetworkRequests(bool value, NetworkRequestsOptions options = {}) {
        includeNetworkRequests_ = value;
        networkOptions_ = std::move(options);
    }
    void AttachNetworkRequest(int64_t reqid) { attachedRequest_ = reqid; }

    const std::vector<std::string>& ResponseLines() const { return lines_; }
    const std::vector<ImageContentData>& Images() const { return images_; }
    bool IncludePages() const { return includePages_; }
    bool IncludeConsoleData() const { return includeConsole_; }
    bool IncludeNetworkRequests() const { return includeNetworkRequests_; }

    //======================================================================================================
    // Handle
    // Purpose: Produce the content items of the tool result: one text item (header, lines, requested
    //          sections) followed by one image item per attached image.
    // Notes:
    //   Throws when a requested section cannot be resolved (for example the selected page is gone).
    //======================================================================================================
    net::awaitable<std::vector<JSONValue>> Handle(const std::string& toolName, McpContext& context);

    // Synchronous part of Handle() once the page list is current.
    std::vector<JSONValue> Format(const std::string& toolName, const McpContext& context) const;

private:
    std::vector<std::string> lines_;
    std::vector<ImageContentData> images_;
    bool includePages_{false};
    bool includeConsole_{false};
    bool includeNetworkRequests_{false};
    NetworkRequestsOptions networkOptions_;
    std::optional<int64_t> attachedRequest_;
};

} // namespace dtmcp
