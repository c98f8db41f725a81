//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolDefinition.h
// Purpose: Tool descriptor record, handler contract and argument access for tool handlers
//==========================================================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include "dtmcp/JSONRPCTypes.h"

namespace dtmcp {

class McpContext;
class McpResponse;

namespace tools {

namespace net = boost::asio;

enum class ToolCategory {
    Navigation,
    Debugging,
    Emulation,
    Performance,
    Network,
    Input
};

// Label reported to clients in annotations.category
const char* ToString(ToolCategory category);

//==========================================================================================================
// ToolRequest
// Purpose: Read-only view over a tools/call `arguments` object.
// Notes:
//   Required getters throw errors::InvalidParamsError when the argument is absent or mistyped;
//   optional getters only throw on a type mismatch.
//==========================================================================================================
class ToolRequest {
public:
    ToolRequest() : params_(JSONValue::Object{}) {}
    explicit ToolRequest(JSONValue params) : params_(std::move(params)) {}

    const JSONValue& Params() const { return params_; }

    std::string GetString(const std::string& key) const;
    std::optional<std::string> GetOptionalString(const std::string& key) const;
    int64_t GetInt(const std::string& key) const;
    std::optional<int64_t> GetOptionalInt(const std::string& key) const;
    double GetNumber(const std::string& key) const;
    std::optional<bool> GetOptionalBool(const std::string& key) const;
    bool GetBool(const std::string& key) const;
    std::vector<std::string> GetStringArray(const std::string& key) const;

private:
    JSONValue params_;
};

using ToolHandler = std::function<net::awaitable<void>(const ToolRequest&, McpResponse&, McpContext&)>;

//==========================================================================================================
// ToolDescriptor
// Purpose: Immutable catalogue entry. Names are unique across the catalogue.
//==========================================================================================================
struct ToolDescriptor {
    std::string name;
    std::string description;
    JSONValue schema;   // JSON Schema of the arguments object
    ToolCategory category{ToolCategory::Debugging};
    bool readOnly{false};
    ToolHandler handler;
};

//==========================================================================================================
// schema
// Purpose: Terse builders for the JSON Schema fragments used by the catalogue.
//==========================================================================================================
namespace schema {

using Properties = std::vector<std::pair<std::string, JSONValue>>;

JSONValue Object(const Properties& properties, const std::vector<std::string>& required = {});
JSONValue String(const std::string& description);
JSONValue Integer(const std::string& description, std::optional<int64_t> minimum = std::nullopt,
                  std::optional<int64_t> maximum = std::nullopt);
JSONValue Number(const std::string& description, std::optional<double> minimum = std::nullopt,
                 std::optional<double> maximum = std::nullopt);
JSONValue Boolean(const std::string& description);
JSONValue Enum(const std::vector<std::string>& values, const std::string& description);
JSONValue EnumArray(const std::vector<std::string>& values, const std::string& description);

} // namespace schema

} // namespace tools
} // namespace dtmcp
