//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DebuggingTools.cpp
// Purpose: Script evaluation, screenshots and console inspection
//==========================================================================================================

#include <stdexcept>

#include <fmt/format.h>

#include "dtmcp/McpContext.h"
#include "dtmcp/McpResponse.h"
#include "dtmcp/errors/Errors.h"
#include "dtmcp/tools/ToolRegistry.h"

namespace dtmcp {
namespace tools {

namespace {

net::awaitable<void> evaluateScript(const ToolRequest& request, McpResponse& response, McpContext& context) {
    const std::string function = request.GetString("function");
    JSONValue result = co_await context.SendToSelectedPage("Runtime.evaluate",
                                                          json::ObjectBuilder()
                                                              .Set("expression", fmt::format("({})()", function))
                                                              .Set("returnByValue", true)
                                                              .Set("awaitPromise", true)
                                                              .Build());
    if (const JSONValue* details = json::Find(result, "exceptionDetails")) {
        const JSONValue* exception = json::Find(*details, "exception");
        auto description = exception ? json::GetString(*exception, "description") : std::nullopt;
        throw std::runtime_error(fmt::format(
            "Script evaluation failed: {}", description.value_or(json::GetString(*details, "text").value_or(""))));
    }
    std::string rendered = "undefined";
    if (const JSONValue* remote = json::Find(result, "result")) {
        if (const JSONValue* value = json::Find(*remote, "value")) {
            rendered = SerializeJSON(*value);
        } else if (auto unserializable = json::GetString(*remote, "unserializableValue")) {
            rendered = *unserializable;
        }
    }
    response.AppendResponseLine("Script ran on page and returned:");
    response.AppendResponseLine("```json");
    response.AppendResponseLine(rendered);
    response.AppendResponseLine("```");
}

net::awaitable<void> takeScreenshot(const ToolRequest& request, McpResponse& response, McpContext& context) {
    const std::string format = request.GetOptionalString("format").value_or("png");
    if (format != "png" && format != "jpeg" && format != "webp") {
        throw errors::InvalidParamsError("Argument 'format' must be one of png, jpeg, webp");
    }
    const bool fullPage = request.GetOptionalBool("fullPage").value_or(false);
    auto quality = request.GetOptionalInt("quality");

    json::ObjectBuilder params;
    params.Set("format", format);
    if (quality.has_value() && format != "png") {
        params.Set("quality", *quality);
    }
    if (fullPage) {
        JSONValue metrics = co_await context.SendToSelectedPage("Page.getLayoutMetrics", JSONValue{JSONValue::Object{}});
        const JSONValue* size = json::Find(metrics, "cssContentSize");
        if (size == nullptr) {
            size = json::Find(metrics, "contentSize");
        }
        if (size != nullptr) {
            params.Set("clip", json::ObjectBuilder()
                                   .Set("x", 0)
                                   .Set("y", 0)
                                   .Set("width", json::GetNumber(*size, "width").value_or(0.0))
                                   .Set("height", json::GetNumber(*size, "height").value_or(0.0))
                                   .Set("scale", 1)
                                   .Build());
        }
        params.Set("captureBeyondViewport", true);
    }
    JSONValue shot = co_await context.SendToSelectedPage("Page.captureScreenshot", params.Build());
    auto data = json::GetString(shot, "data");
    if (!data.has_value()) {
        throw errors::CdpError("Page.captureScreenshot returned no image data");
    }
    response.AppendResponseLine(fullPage ? "Took a screenshot of the full current page."
                                         : "Took a screenshot of the current page's viewport.");
    response.AttachImage({*data, "image/" + format});
}

net::awaitable<void> listConsoleMessages(const ToolRequest&, McpResponse& response, McpContext&) {
    response.SetIncludeConsoleData(true);
    co_return;
}

} // namespace

std::vector<ToolDescriptor> ScriptTools() {
    return {
        {"evaluate_script",
         "Evaluate a JavaScript function inside the currently selected page. Returns the response as JSON, "
         "so returned values have to be JSON-serializable.",
         schema::Object({{"function", schema::String(
                              "A JavaScript function to run in the currently selected page. Example without "
                              "arguments: `() => { return document.title }` or `async () => { return await "
                              "fetch(\"example.com\") }`")}},
                        {"function"}),
         ToolCategory::Debugging, false, evaluateScript},
    };
}

std::vector<ToolDescriptor> ScreenshotTools() {
    return {
        {"take_screenshot", "Take a screenshot of the page.",
         schema::Object({
             {"format", schema::Enum({"png", "jpeg", "webp"}, "Type of format to save the screenshot as. Default is \"png\"")},
             {"quality", schema::Integer("Compression quality for JPEG and WebP formats (0-100). Ignored for PNG.", 0, 100)},
             {"fullPage", schema::Boolean("If set to true takes a screenshot of the full page instead of the visible viewport.")},
         }),
         ToolCategory::Debugging, true, takeScreenshot},
    };
}

std::vector<ToolDescriptor> ConsoleTools() {
    return {
        {"list_console_messages", "List all console messages for the currently selected page.",
         schema::Object({}), ToolCategory::Debugging, true, listConsoleMessages},
    };
}

} // namespace tools
} // namespace dtmcp
