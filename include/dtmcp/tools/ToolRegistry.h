//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.h
// Purpose: Static tool catalogue and category-based assembly of the exposed tool list
//==========================================================================================================

#pragma once

#include <vector>

#include "dtmcp/Config.h"
#include "dtmcp/Protocol.h"
#include "dtmcp/tools/ToolDefinition.h"

namespace dtmcp {
namespace tools {

// Every tool compiled into the server, in declaration order. Built once, read-only.
const std::vector<ToolDescriptor>& AllTools();

// Emulation, Performance and Network follow their configuration toggle; other categories are always on.
bool IsCategoryEnabled(ToolCategory category, const Config& config);

//==========================================================================================================
// AssembleTools
// Purpose: Drop descriptors of disabled categories and order the rest by name (byte-wise ascending).
// Notes:
//   Pure function of its inputs; the result is what a server instance registers and exposes.
//==========================================================================================================
std::vector<ToolDescriptor> AssembleTools(const std::vector<ToolDescriptor>& all, const Config& config);

// tools/list entry for a descriptor.
Tool ToProtocolTool(const ToolDescriptor& descriptor);

// Catalogue sections, one per tool family.
std::vector<ToolDescriptor> PageTools();
std::vector<ToolDescriptor> ScriptTools();
std::vector<ToolDescriptor> ScreenshotTools();
std::vector<ToolDescriptor> ConsoleTools();
std::vector<ToolDescriptor> EmulationTools();
std::vector<ToolDescriptor> PerformanceTools();
std::vector<ToolDescriptor> NetworkTools();

} // namespace tools
} // namespace dtmcp
