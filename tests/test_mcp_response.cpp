//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_mcp_response.cpp
// Purpose: Rendering of handler output into tool result content
//==========================================================================================================

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "dtmcp/McpContext.h"
#include "dtmcp/McpResponse.h"
#include "fakes/FakeBrowser.hpp"

using namespace dtmcp;
using dtmcp::fakes::FakeBrowser;
using dtmcp::fakes::RunSync;

namespace {

std::string textOf(const std::vector<JSONValue>& content) {
    if (content.empty()) {
        return {};
    }
    return json::GetString(content.front(), "text").value_or("");
}

bool hasLine(const std::string& text, const std::string& line) {
    return ("\n" + text + "\n").find("\n" + line + "\n") != std::string::npos;
}

void emitRequest(FakeBrowser& browser, const std::string& session, const std::string& id, const std::string& type) {
    JSONValue request = json::ObjectBuilder().Set("url", "https://a.example/" + id).Set("method", "GET").Build();
    browser.Emit("Network.requestWillBeSent",
                 json::ObjectBuilder().Set("requestId", id).Set("type", type).Set("request", std::move(request)).Build(),
                 session);
}

class McpResponseTest : public ::testing::Test {
protected:
    void SetUp() override {
        first = browser->AddPage("https://a.example/");
        browser->AddPage("https://b.example/");
        context = RunSync(ioc, McpContext::From(browser, McpContext::Options{}));
    }

    net::io_context ioc;
    std::shared_ptr<FakeBrowser> browser{std::make_shared<FakeBrowser>()};
    std::shared_ptr<McpContext> context;
    std::string first;
};

} // namespace

TEST_F(McpResponseTest, HeaderAndLinesComeFirst) {
    McpResponse response;
    response.AppendResponseLine("Done.");
    std::string text = textOf(response.Format("navigate_page", *context));
    EXPECT_EQ(text, "# navigate_page response\nDone.");
}

TEST_F(McpResponseTest, PagesSectionMarksSelection) {
    McpResponse response;
    response.SetIncludePages(true);
    std::string text = textOf(RunSync(ioc, response.Handle("list_pages", *context)));
    EXPECT_TRUE(hasLine(text, "## Pages"));
    EXPECT_TRUE(hasLine(text, "0: https://a.example/ [selected]"));
    EXPECT_TRUE(hasLine(text, "1: https://b.example/"));
}

TEST_F(McpResponseTest, EmptyConsoleIsStated) {
    McpResponse response;
    response.SetIncludeConsoleData(true);
    std::string text = textOf(response.Format("list_console_messages", *context));
    EXPECT_TRUE(hasLine(text, "## Console messages"));
    EXPECT_TRUE(hasLine(text, "<no console messages found>"));
}

TEST_F(McpResponseTest, NetworkRequestsArePaginatedAndFiltered) {
    const std::string session = FakeBrowser::SessionFor(first);
    emitRequest(*browser, session, "r1", "Script");
    emitRequest(*browser, session, "r2", "XHR");
    emitRequest(*browser, session, "r3", "XHR");
    emitRequest(*browser, session, "r4", "XHR");

    McpResponse paged;
    NetworkRequestsOptions options;
    options.pageSize = 2;
    options.pageIdx = 1;
    paged.SetIncludeNetworkRequests(true, options);
    std::string text = textOf(paged.Format("list_network_requests", *context));
    EXPECT_TRUE(hasLine(text, "Showing 3-4 of 4 (Page 2 of 2)."));
    EXPECT_TRUE(hasLine(text, "Previous page: 0"));
    EXPECT_TRUE(hasLine(text, "reqid=3 GET https://a.example/r3 [pending]"));
    EXPECT_FALSE(hasLine(text, "reqid=1 GET https://a.example/r1 [pending]"));

    McpResponse filtered;
    NetworkRequestsOptions scripts;
    scripts.resourceTypes = {"Script"};
    filtered.SetIncludeNetworkRequests(true, scripts);
    text = textOf(filtered.Format("list_network_requests", *context));
    EXPECT_TRUE(hasLine(text, "Showing 1-1 of 1 (Page 1 of 1)."));

    McpResponse outOfRange;
    NetworkRequestsOptions tooFar;
    tooFar.pageSize = 2;
    tooFar.pageIdx = 7;
    outOfRange.SetIncludeNetworkRequests(true, tooFar);
    text = textOf(outOfRange.Format("list_network_requests", *context));
    EXPECT_TRUE(hasLine(text, "Invalid page number provided. Showing first page."));
    EXPECT_TRUE(hasLine(text, "Next page: 1"));
}

TEST_F(McpResponseTest, UnknownAttachedRequestFails) {
    McpResponse response;
    response.AttachNetworkRequest(42);
    EXPECT_THROW(response.Format("get_network_request", *context), std::runtime_error);
}

TEST_F(McpResponseTest, EmulationStateIsReported) {
    context->SetCpuThrottlingRate(4.0);
    McpResponse response;
    std::string text = textOf(response.Format("emulate_cpu", *context));
    EXPECT_TRUE(hasLine(text, "## CPU emulation"));
    EXPECT_TRUE(hasLine(text, "Emulating: 4x slowdown"));
}

TEST_F(McpResponseTest, ImagesFollowTheTextItem) {
    McpResponse response;
    response.AppendResponseLine("Took a screenshot.");
    response.AttachImage(ImageContentData{"QUJD", "image/png"});
    auto content = response.Format("take_screenshot", *context);
    ASSERT_EQ(content.size(), 2u);
    EXPECT_EQ(json::GetString(content[0], "type").value_or(""), "text");
    EXPECT_EQ(json::GetString(content[1], "type").value_or(""), "image");
    EXPECT_EQ(json::GetString(content[1], "data").value_or(""), "QUJD");
}
