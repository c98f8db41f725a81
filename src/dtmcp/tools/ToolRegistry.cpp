//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.cpp
// Purpose: Catalogue assembly and category filtering
//==========================================================================================================

#include "dtmcp/tools/ToolRegistry.h"

#include <algorithm>
#include <iterator>

namespace dtmcp {
namespace tools {

const std::vector<ToolDescriptor>& AllTools() {
    static const std::vector<ToolDescriptor> all = [] {
        std::vector<ToolDescriptor> tools;
        for (auto section : {ConsoleTools, EmulationTools, NetworkTools, PageTools, PerformanceTools,
                             ScreenshotTools, ScriptTools}) {
            auto part = section();
            std::move(part.begin(), part.end(), std::back_inserter(tools));
        }
        return tools;
    }();
    return all;
}

bool IsCategoryEnabled(ToolCategory category, const Config& config) {
    switch (category) {
        case ToolCategory::Emulation: return config.categoryEmulation;
        case ToolCategory::Performance: return config.categoryPerformance;
        case ToolCategory::Network: return config.categoryNetwork;
        default: return true;
    }
}

std::vector<ToolDescriptor> AssembleTools(const std::vector<ToolDescriptor>& all, const Config& config) {
    std::vector<ToolDescriptor> tools;
    std::copy_if(all.begin(), all.end(), std::back_inserter(tools),
                 [&](const ToolDescriptor& d) { return IsCategoryEnabled(d.category, config); });
    std::stable_sort(tools.begin(), tools.end(),
                     [](const ToolDescriptor& a, const ToolDescriptor& b) { return a.name < b.name; });
    return tools;
}

Tool ToProtocolTool(const ToolDescriptor& descriptor) {
    Tool tool;
    tool.name = descriptor.name;
    tool.description = descriptor.description;
    tool.inputSchema = descriptor.schema;
    tool.category = ToString(descriptor.category);
    tool.readOnlyHint = descriptor.readOnly;
    return tool;
}

} // namespace tools
} // namespace dtmcp
