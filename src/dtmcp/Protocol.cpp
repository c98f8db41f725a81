//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: Wire-shape builders for protocol result and content structures
//==========================================================================================================

#include "dtmcp/Protocol.h"

namespace dtmcp {

JSONValue CallToolResult::ToJSON() const {
    JSONValue::Array items;
    items.reserve(content.size());
    for (const auto& c : content) {
        items.push_back(std::make_shared<JSONValue>(c));
    }
    json::ObjectBuilder b;
    b.Set("content", JSONValue{std::move(items)});
    if (isError) {
        b.Set("isError", true);
    }
    return b.Build();
}

JSONValue MakeTextContent(const std::string& text) {
    return json::ObjectBuilder().Set("type", "text").Set("text", text).Build();
}

JSONValue MakeImageContent(const std::string& base64Data, const std::string& mimeType) {
    return json::ObjectBuilder()
        .Set("type", "image")
        .Set("data", base64Data)
        .Set("mimeType", mimeType)
        .Build();
}

} // namespace dtmcp
