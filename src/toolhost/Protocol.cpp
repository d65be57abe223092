//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: JSON shapes for capabilities and tool results
//==========================================================================================================

#include "toolhost/Protocol.h"

namespace toolhost {

JSONValue ServerCapabilities::ToJSON() const {
    JSONValue::Object caps;
    if (tools.has_value()) {
        caps["tools"] = std::make_shared<JSONValue>(MakeObject({{"listChanged", JSONValue(tools->listChanged)}}));
    }
    if (resources.has_value()) {
        caps["resources"] = std::make_shared<JSONValue>(MakeObject({
            {"subscribe", JSONValue(resources->subscribe)},
            {"listChanged", JSONValue(resources->listChanged)}}));
    }
    if (prompts.has_value()) {
        caps["prompts"] = std::make_shared<JSONValue>(MakeObject({{"listChanged", JSONValue(prompts->listChanged)}}));
    }
    if (logging.has_value()) {
        caps["logging"] = std::make_shared<JSONValue>(JSONValue::Object{});
    }
    if (!experimental.empty()) {
        JSONValue::Object exp;
        for (const auto& [k, v] : experimental) {
            exp[k] = std::make_shared<JSONValue>(v);
        }
        caps["experimental"] = std::make_shared<JSONValue>(exp);
    }
    return JSONValue{caps};
}

CallToolResult CallToolResult::Text(const std::string& text) {
    CallToolResult r;
    r.content.push_back(MakeObject({{"type", JSONValue("text")}, {"text", JSONValue(text)}}));
    return r;
}

CallToolResult CallToolResult::Error(errors::ErrorKind kind, const std::string& message) {
    CallToolResult r = Text(message);
    r.isError = true;
    r.errorKind = kind;
    return r;
}

std::string CallToolResult::TextContent() const {
    std::string out;
    for (const auto& item : content) {
        if (GetString(item, "type").value_or("") == "text") {
            out += GetString(item, "text").value_or("");
        }
    }
    return out;
}

JSONValue CallToolResult::ToJSON() const {
    JSONValue::Object obj;
    JSONValue::Array arr;
    for (const auto& c : content) {
        arr.push_back(std::make_shared<JSONValue>(c));
    }
    obj["content"] = std::make_shared<JSONValue>(arr);
    obj["isError"] = std::make_shared<JSONValue>(isError);
    if (structuredContent.has_value()) {
        obj["structuredContent"] = std::make_shared<JSONValue>(structuredContent.value());
    }
    if (errorKind.has_value()) {
        obj["_meta"] = std::make_shared<JSONValue>(
            MakeObject({{"errorKind", JSONValue(errors::toString(errorKind.value()))}}));
    }
    return JSONValue{obj};
}

} // namespace toolhost
