//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_tool_registry.cpp
// Purpose: Tool catalogue assembly, category filtering and argument accessor tests
//==========================================================================================================

#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <string>
#include <vector>

#include "dtmcp/Config.h"
#include "dtmcp/errors/Errors.h"
#include "dtmcp/tools/ToolRegistry.h"

using namespace dtmcp;
using namespace dtmcp::tools;

namespace {

std::vector<std::string> names(const std::vector<ToolDescriptor>& tools) {
    std::vector<std::string> out;
    for (const auto& t : tools) {
        out.push_back(t.name);
    }
    return out;
}

bool contains(const std::vector<std::string>& v, const std::string& name) {
    return std::find(v.begin(), v.end(), name) != v.end();
}

ToolDescriptor stub(const std::string& name, ToolCategory category) {
    ToolDescriptor d;
    d.name = name;
    d.category = category;
    d.schema = schema::Object({});
    return d;
}

} // namespace

TEST(ToolRegistry, FullCatalogueIsSortedByName) {
    Config config;
    auto assembled = names(AssembleTools(AllTools(), config));
    EXPECT_EQ(assembled.size(), AllTools().size());
    EXPECT_TRUE(std::is_sorted(assembled.begin(), assembled.end()));
    EXPECT_EQ(std::set<std::string>(assembled.begin(), assembled.end()).size(), assembled.size());

    for (const char* expected : {"list_pages", "select_page", "close_page", "new_page", "navigate_page",
                                 "evaluate_script", "take_screenshot", "list_console_messages",
                                 "emulate_network", "emulate_cpu", "resize_page", "performance_start_trace",
                                 "performance_stop_trace", "list_network_requests", "get_network_request"}) {
        EXPECT_TRUE(contains(assembled, expected)) << expected;
    }
}

TEST(ToolRegistry, DisabledCategoriesAreAbsent) {
    Config config;
    config.categoryNetwork = false;
    config.categoryPerformance = false;
    auto assembled = names(AssembleTools(AllTools(), config));
    EXPECT_FALSE(contains(assembled, "list_network_requests"));
    EXPECT_FALSE(contains(assembled, "get_network_request"));
    EXPECT_FALSE(contains(assembled, "performance_start_trace"));
    EXPECT_TRUE(contains(assembled, "emulate_cpu"));
    EXPECT_TRUE(contains(assembled, "list_pages"));
    EXPECT_TRUE(std::is_sorted(assembled.begin(), assembled.end()));
}

TEST(ToolRegistry, OnlyThreeCategoriesAreToggleable) {
    Config config;
    config.categoryEmulation = false;
    config.categoryPerformance = false;
    config.categoryNetwork = false;
    EXPECT_TRUE(IsCategoryEnabled(ToolCategory::Navigation, config));
    EXPECT_TRUE(IsCategoryEnabled(ToolCategory::Debugging, config));
    EXPECT_TRUE(IsCategoryEnabled(ToolCategory::Input, config));
    EXPECT_FALSE(IsCategoryEnabled(ToolCategory::Emulation, config));
    EXPECT_FALSE(IsCategoryEnabled(ToolCategory::Performance, config));
    EXPECT_FALSE(IsCategoryEnabled(ToolCategory::Network, config));
}

TEST(ToolRegistry, AssemblyIsDeterministicForAnyInputOrder) {
    std::vector<ToolDescriptor> forward{stub("b_tool", ToolCategory::Debugging), stub("a_tool", ToolCategory::Network),
                                        stub("c_tool", ToolCategory::Navigation)};
    std::vector<ToolDescriptor> backward(forward.rbegin(), forward.rend());
    Config config;
    EXPECT_EQ(names(AssembleTools(forward, config)), names(AssembleTools(backward, config)));
    EXPECT_EQ(names(AssembleTools(forward, config)), (std::vector<std::string>{"a_tool", "b_tool", "c_tool"}));
}

TEST(ToolRegistry, ProtocolToolCarriesCategoryAndReadOnlyHint) {
    auto assembled = AssembleTools(AllTools(), Config{});
    auto it = std::find_if(assembled.begin(), assembled.end(),
                           [](const ToolDescriptor& d) { return d.name == "list_pages"; });
    ASSERT_NE(it, assembled.end());
    Tool tool = ToProtocolTool(*it);
    EXPECT_EQ(tool.category, "Navigation automation");
    EXPECT_TRUE(tool.readOnlyHint);
    EXPECT_EQ(json::GetString(tool.inputSchema, "type").value_or(""), "object");
    EXPECT_EQ(json::GetBool(tool.inputSchema, "additionalProperties").value_or(true), false);
}

TEST(ToolRequest, TypedAccessorsReportMissingAndMistypedArguments) {
    ToolRequest request(ParseJSON(R"({"url":"https://a","count":3,"flag":true,"types":["xhr","fetch"],"bad":"x"})"));
    EXPECT_EQ(request.GetString("url"), "https://a");
    EXPECT_EQ(request.GetInt("count"), 3);
    EXPECT_TRUE(request.GetBool("flag"));
    EXPECT_EQ(request.GetStringArray("types"), (std::vector<std::string>{"xhr", "fetch"}));
    EXPECT_FALSE(request.GetOptionalString("absent").has_value());
    EXPECT_TRUE(request.GetStringArray("absent").empty());

    try {
        request.GetString("absent");
        FAIL() << "expected InvalidParamsError";
    } catch (const errors::InvalidParamsError& e) {
        EXPECT_EQ(std::string(e.what()), "Missing required argument 'absent'");
    }
    EXPECT_THROW(request.GetInt("bad"), errors::InvalidParamsError);
    EXPECT_THROW(request.GetBool("url"), errors::InvalidParamsError);
    EXPECT_THROW(request.GetStringArray("count"), errors::InvalidParamsError);
}
