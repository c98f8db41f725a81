//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_jsonrpc_types.cpp
// Purpose: JSON parsing, message classification and error mapping tests
//==========================================================================================================

#include <gtest/gtest.h>

#include <stdexcept>

#include "dtmcp/JSONRPCTypes.h"
#include "dtmcp/Protocol.h"
#include "dtmcp/errors/Errors.h"

using namespace dtmcp;

TEST(JSONParser, ParsesNestedDocument) {
    JSONValue v = ParseJSON(R"({"a":[1,2.5,"x",true,null],"b":{"c":"d\n\u00e9"}})");
    ASSERT_TRUE(v.IsObject());
    const JSONValue* a = json::Find(v, "a");
    ASSERT_NE(a, nullptr);
    ASSERT_TRUE(a->IsArray());
    const auto& arr = std::get<JSONValue::Array>(a->value);
    ASSERT_EQ(arr.size(), 5u);
    EXPECT_EQ(std::get<int64_t>(arr[0]->value), 1);
    EXPECT_DOUBLE_EQ(std::get<double>(arr[1]->value), 2.5);
    EXPECT_TRUE(arr[4]->IsNull());
    const JSONValue* b = json::Find(v, "b");
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(json::GetString(*b, "c").value_or(""), "d\n\xC3\xA9");
}

TEST(JSONParser, RejectsMalformedInputAndTrailingGarbage) {
    EXPECT_THROW(ParseJSON("{\"a\":"), std::runtime_error);
    EXPECT_THROW(ParseJSON("{} x"), std::runtime_error);
    EXPECT_THROW(ParseJSON(""), std::runtime_error);
}

TEST(JSONParser, SerializeEscapesControlCharacters) {
    JSONValue v = json::ObjectBuilder().Set("t", "a\"b\\c\n").Build();
    JSONValue back = ParseJSON(SerializeJSON(v));
    EXPECT_EQ(json::GetString(back, "t").value_or(""), "a\"b\\c\n");
}

TEST(JSONRPCMessages, ClassifiesByShape) {
    EXPECT_EQ(ClassifyMessage(ParseJSON(R"({"jsonrpc":"2.0","id":1,"method":"ping"})")), MessageKind::Request);
    EXPECT_EQ(ClassifyMessage(ParseJSON(R"({"jsonrpc":"2.0","method":"notifications/initialized"})")),
              MessageKind::Notification);
    EXPECT_EQ(ClassifyMessage(ParseJSON(R"({"jsonrpc":"2.0","id":"a","result":{}})")), MessageKind::Response);
    EXPECT_EQ(ClassifyMessage(ParseJSON(R"({"jsonrpc":"2.0","id":1,"method":5})")), MessageKind::Invalid);
    EXPECT_EQ(ClassifyMessage(ParseJSON(R"([1,2])")), MessageKind::Invalid);
    EXPECT_EQ(ClassifyMessage(ParseJSON(R"({"id":1})")), MessageKind::Invalid);
}

TEST(JSONRPCMessages, RequestKeepsStringAndIntegerIds) {
    JSONRPCRequest byString;
    ASSERT_TRUE(byString.Deserialize(R"({"jsonrpc":"2.0","id":"abc","method":"tools/list"})"));
    EXPECT_EQ(std::get<std::string>(byString.id), "abc");
    EXPECT_EQ(byString.method, "tools/list");
    EXPECT_FALSE(byString.params.has_value());

    JSONRPCRequest byInt;
    ASSERT_TRUE(byInt.Deserialize(R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"x"}})"));
    EXPECT_EQ(std::get<int64_t>(byInt.id), 7);
    ASSERT_TRUE(byInt.params.has_value());
    EXPECT_EQ(json::GetString(*byInt.params, "name").value_or(""), "x");
}

TEST(JSONRPCMessages, ErrorResponseCarriesCodeMessageAndData) {
    auto resp = CreateErrorResponse(int64_t{4}, JSONRPCErrorCodes::ToolNotFound, "Tool not found",
                                    json::ObjectBuilder().Set("name", "nope").Build());
    ASSERT_TRUE(resp->IsError());
    JSONRPCResponse parsed;
    ASSERT_TRUE(parsed.Deserialize(resp->Serialize()));
    auto err = errors::mcpErrorFromResponse(parsed);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, -32003);
    EXPECT_EQ(err->message, "Tool not found");
    EXPECT_EQ(err->category, errors::ErrorCategory::McpToolNotFound);
    ASSERT_TRUE(err->data.has_value());
    EXPECT_EQ(json::GetString(*err->data, "name").value_or(""), "nope");
}

TEST(JSONRPCMessages, ErrorCategoriesFollowCodes) {
    EXPECT_EQ(errors::errorCategoryFromCode(-32700), errors::ErrorCategory::JsonRpcParse);
    EXPECT_EQ(errors::errorCategoryFromCode(-32602), errors::ErrorCategory::JsonRpcInvalidParams);
    EXPECT_EQ(errors::errorCategoryFromCode(-32603), errors::ErrorCategory::JsonRpcInternal);
    EXPECT_EQ(errors::errorCategoryFromCode(1), errors::ErrorCategory::Unknown);
}

TEST(ProtocolContent, CallToolResultSerializesIsErrorAndItems) {
    CallToolResult result;
    result.content.push_back(MakeTextContent("hello"));
    result.content.push_back(MakeImageContent("AAAA", "image/png"));
    result.isError = true;
    JSONValue v = result.ToJSON();
    EXPECT_EQ(json::GetBool(v, "isError").value_or(false), true);
    const JSONValue* content = json::Find(v, "content");
    ASSERT_NE(content, nullptr);
    const auto& items = std::get<JSONValue::Array>(content->value);
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(json::GetString(*items[0], "type").value_or(""), "text");
    EXPECT_EQ(json::GetString(*items[0], "text").value_or(""), "hello");
    EXPECT_EQ(json::GetString(*items[1], "type").value_or(""), "image");
    EXPECT_EQ(json::GetString(*items[1], "mimeType").value_or(""), "image/png");
}
