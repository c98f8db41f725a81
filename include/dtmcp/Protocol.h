//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol data structures and constants
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <string>
#include <vector>
#include <optional>

namespace dtmcp {
//==========================================================================================================
// MCP Protocol types and constants
// Purpose: Shared protocol structures and method names.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// Latest protocol version this server speaks
constexpr const char* PROTOCOL_VERSION = "2025-06-18";

// Versions accepted from clients during initialize; anything else is answered with PROTOCOL_VERSION
inline const std::vector<std::string>& SupportedProtocolVersions() {
    static const std::vector<std::string> versions{"2025-06-18", "2025-03-26", "2024-11-05"};
    return versions;
}

// Identity reported in serverInfo
namespace ServerIdentity {
    constexpr const char* Name = "chrome_devtools";
    constexpr const char* Title = "Chrome DevTools MCP server";
}

// HTTP header carrying the session id in the streamable HTTP transport
constexpr const char* SESSION_ID_HEADER = "mcp-session-id";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
struct Implementation {
    std::string name;
    std::string title;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string title, std::string version)
        : name(std::move(name)), title(std::move(title)), version(std::move(version)) {}
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
// Tool listing entry as exposed by tools/list
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;  // JSON Schema for tool parameters
    std::string category;   // reported as annotations.category
    bool readOnlyHint = false;
};

struct CallToolResult {
    std::vector<JSONValue> content;  // Array of content items
    bool isError = false;

    JSONValue ToJSON() const;
};

// Content item helpers
JSONValue MakeTextContent(const std::string& text);
JSONValue MakeImageContent(const std::string& base64Data, const std::string& mimeType);

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    // Client to server
    constexpr const char* Initialize = "initialize";
    constexpr const char* Ping = "ping";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* SetLogLevel = "logging/setLevel";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Cancelled = "notifications/cancelled";
}

} // namespace dtmcp
