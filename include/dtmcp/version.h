//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Public version API for the DevTools MCP server (semantic version helpers).
//==========================================================================================================
#pragma once

#include <string>

namespace dtmcp {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

VersionInfo getVersion();

//==========================================================================================================
// getVersionString
// Purpose: Returns the semantic version string, formatted as "MAJOR.MINOR.PATCH". Reported in
//          serverInfo and by --version.
//==========================================================================================================
std::string getVersionString();

} // namespace dtmcp
