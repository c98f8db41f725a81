//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PageTools.cpp
// Purpose: Page management tools (list, select, open, close, navigate)
//==========================================================================================================

#include <stdexcept>

#include <fmt/format.h>

#include "dtmcp/McpContext.h"
#include "dtmcp/McpResponse.h"
#include "dtmcp/errors/Errors.h"
#include "dtmcp/tools/ToolRegistry.h"

namespace dtmcp {
namespace tools {

namespace {

std::size_t pageIndexArgument(const ToolRequest& request) {
    int64_t index = request.GetInt("pageIdx");
    if (index < 0) {
        throw errors::InvalidParamsError("Argument 'pageIdx' must not be negative");
    }
    return static_cast<std::size_t>(index);
}

net::awaitable<void> listPages(const ToolRequest&, McpResponse& response, McpContext&) {
    response.SetIncludePages(true);
    co_return;
}

net::awaitable<void> selectPage(const ToolRequest& request, McpResponse& response, McpContext& context) {
    co_await context.RefreshPages();
    co_await context.SelectPage(pageIndexArgument(request));
    response.SetIncludePages(true);
}

net::awaitable<void> closePage(const ToolRequest& request, McpResponse& response, McpContext& context) {
    std::size_t index = pageIndexArgument(request);
    co_await context.RefreshPages();
    if (context.Pages().size() <= 1) {
        response.AppendResponseLine("The last open page cannot be closed. It is fine to keep it open.");
    } else {
        co_await context.ClosePage(index);
    }
    response.SetIncludePages(true);
}

net::awaitable<void> newPage(const ToolRequest& request, McpResponse& response, McpContext& context) {
    co_await context.NewPage(request.GetString("url"));
    response.SetIncludePages(true);
}

net::awaitable<void> navigatePage(const ToolRequest& request, McpResponse& response, McpContext& context) {
    const std::string url = request.GetString("url");
    JSONValue result = co_await context.SendToSelectedPage(
        "Page.navigate", json::ObjectBuilder().Set("url", url).Build());
    if (auto errorText = json::GetString(result, "errorText")) {
        throw std::runtime_error(fmt::format("Navigation to {} failed: {}", url, *errorText));
    }
    response.AppendResponseLine(fmt::format("Navigated to {}.", url));
    response.SetIncludePages(true);
}

} // namespace

std::vector<ToolDescriptor> PageTools() {
    const JSONValue pageIdx = schema::Integer(
        "The index of the page. Call list_pages to list pages.", 0);
    return {
        {"list_pages", "Get a list of pages open in the browser.",
         schema::Object({}), ToolCategory::Navigation, true, listPages},
        {"select_page", "Select a page as a context for future tool calls.",
         schema::Object({{"pageIdx", pageIdx}}, {"pageIdx"}), ToolCategory::Navigation, true, selectPage},
        {"close_page", "Closes the page by its index. The last open page cannot be closed.",
         schema::Object({{"pageIdx", pageIdx}}, {"pageIdx"}), ToolCategory::Navigation, false, closePage},
        {"new_page", "Creates a new page and selects it.",
         schema::Object({{"url", schema::String("URL to load in the new page.")}}, {"url"}),
         ToolCategory::Navigation, false, newPage},
        {"navigate_page", "Navigates the currently selected page to a URL.",
         schema::Object({{"url", schema::String("URL to navigate the page to.")}}, {"url"}),
         ToolCategory::Navigation, false, navigatePage},
    };
}

} // namespace tools
} // namespace dtmcp
