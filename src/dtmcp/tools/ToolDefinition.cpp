//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolDefinition.cpp
// Purpose: Tool argument accessors and schema builders
//==========================================================================================================

#include "dtmcp/tools/ToolDefinition.h"

#include <cmath>

#include <fmt/format.h>

#include "dtmcp/errors/Errors.h"

namespace dtmcp {
namespace tools {

const char* ToString(ToolCategory category) {
    switch (category) {
        case ToolCategory::Navigation: return "Navigation automation";
        case ToolCategory::Debugging: return "Debugging";
        case ToolCategory::Emulation: return "Emulation";
        case ToolCategory::Performance: return "Performance";
        case ToolCategory::Network: return "Network";
        case ToolCategory::Input: return "Input automation";
    }
    return "Unknown";
}

namespace {

[[noreturn]] void throwMissing(const std::string& key) {
    throw errors::InvalidParamsError(fmt::format("Missing required argument '{}'", key));
}

[[noreturn]] void throwMistyped(const std::string& key, const char* expected) {
    throw errors::InvalidParamsError(fmt::format("Argument '{}' must be {}", key, expected));
}

} // namespace

std::optional<std::string> ToolRequest::GetOptionalString(const std::string& key) const {
    const JSONValue* v = json::Find(params_, key);
    if (v == nullptr || v->IsNull()) {
        return std::nullopt;
    }
    if (!v->IsString()) {
        throwMistyped(key, "a string");
    }
    return std::get<std::string>(v->value);
}

std::string ToolRequest::GetString(const std::string& key) const {
    auto v = GetOptionalString(key);
    if (!v.has_value()) {
        throwMissing(key);
    }
    return *v;
}

std::optional<int64_t> ToolRequest::GetOptionalInt(const std::string& key) const {
    const JSONValue* v = json::Find(params_, key);
    if (v == nullptr || v->IsNull()) {
        return std::nullopt;
    }
    auto n = json::GetInt(params_, key);
    if (!n.has_value()) {
        throwMistyped(key, "an integer");
    }
    return n;
}

int64_t ToolRequest::GetInt(const std::string& key) const {
    auto v = GetOptionalInt(key);
    if (!v.has_value()) {
        throwMissing(key);
    }
    return *v;
}

double ToolRequest::GetNumber(const std::string& key) const {
    const JSONValue* v = json::Find(params_, key);
    if (v == nullptr || v->IsNull()) {
        throwMissing(key);
    }
    auto n = json::GetNumber(params_, key);
    if (!n.has_value() || !std::isfinite(*n)) {
        throwMistyped(key, "a number");
    }
    return *n;
}

std::optional<bool> ToolRequest::GetOptionalBool(const std::string& key) const {
    const JSONValue* v = json::Find(params_, key);
    if (v == nullptr || v->IsNull()) {
        return std::nullopt;
    }
    auto b = json::GetBool(params_, key);
    if (!b.has_value()) {
        throwMistyped(key, "a boolean");
    }
    return b;
}

bool ToolRequest::GetBool(const std::string& key) const {
    auto v = GetOptionalBool(key);
    if (!v.has_value()) {
        throwMissing(key);
    }
    return *v;
}

std::vector<std::string> ToolRequest::GetStringArray(const std::string& key) const {
    std::vector<std::string> out;
    const JSONValue* v = json::Find(params_, key);
    if (v == nullptr || v->IsNull()) {
        return out;
    }
    if (!v->IsArray()) {
        throwMistyped(key, "an array of strings");
    }
    for (const auto& item : std::get<JSONValue::Array>(v->value)) {
        if (!item || !item->IsString()) {
            throwMistyped(key, "an array of strings");
        }
        out.push_back(std::get<std::string>(item->value));
    }
    return out;
}

namespace schema {

namespace {

JSONValue stringArray(const std::vector<std::string>& values) {
    JSONValue::Array arr;
    for (const auto& v : values) {
        arr.push_back(std::make_shared<JSONValue>(v));
    }
    return JSONValue{std::move(arr)};
}

} // namespace

JSONValue Object(const Properties& properties, const std::vector<std::string>& required) {
    JSONValue::Object props;
    for (const auto& [name, prop] : properties) {
        props[name] = std::make_shared<JSONValue>(prop);
    }
    json::ObjectBuilder b;
    b.Set("type", "object").Set("properties", JSONValue{std::move(props)});
    if (!required.empty()) {
        b.Set("required", stringArray(required));
    }
    b.Set("additionalProperties", false);
    return b.Build();
}

JSONValue String(const std::string& description) {
    return json::ObjectBuilder().Set("type", "string").Set("description", description).Build();
}

JSONValue Integer(const std::string& description, std::optional<int64_t> minimum, std::optional<int64_t> maximum) {
    json::ObjectBuilder b;
    b.Set("type", "integer").Set("description", description);
    if (minimum.has_value()) {
        b.Set("minimum", *minimum);
    }
    if (maximum.has_value()) {
        b.Set("maximum", *maximum);
    }
    return b.Build();
}

JSONValue Number(const std::string& description, std::optional<double> minimum, std::optional<double> maximum) {
    json::ObjectBuilder b;
    b.Set("type", "number").Set("description", description);
    if (minimum.has_value()) {
        b.Set("minimum", *minimum);
    }
    if (maximum.has_value()) {
        b.Set("maximum", *maximum);
    }
    return b.Build();
}

JSONValue Boolean(const std::string& description) {
    return json::ObjectBuilder().Set("type", "boolean").Set("description", description).Build();
}

JSONValue Enum(const std::vector<std::string>& values, const std::string& description) {
    return json::ObjectBuilder()
        .Set("type", "string")
        .Set("enum", stringArray(values))
        .Set("description", description)
        .Build();
}

JSONValue EnumArray(const std::vector<std::string>& values, const std::string& description) {
    return json::ObjectBuilder()
        .Set("type", "array")
        .Set("items", json::ObjectBuilder().Set("type", "string").Set("enum", stringArray(values)).Build())
        .Set("description", description)
        .Build();
}

} // namespace schema

} // namespace tools
} // namespace dtmcp
