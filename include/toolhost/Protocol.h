//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: Protocol data structures, capability model and method names spoken by the tool host
//==========================================================================================================

#pragma once

#include "toolhost/JSONRPCTypes.h"
#include "toolhost/errors/Errors.h"
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>

namespace toolhost {

///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
constexpr const char* PROTOCOL_VERSION = "2025-06-18";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Capabilities ///////////////////////////////////////////
struct ToolsCapability {
    bool listChanged = false;
};

struct ResourcesCapability {
    bool subscribe = false;
    bool listChanged = false;
};

struct PromptsCapability {
    bool listChanged = false;
};

struct LoggingCapability {
    // Presence indicates logging notifications are supported
};

struct ServerCapabilities {
    std::optional<ToolsCapability> tools;
    std::optional<ResourcesCapability> resources;
    std::optional<PromptsCapability> prompts;
    std::optional<LoggingCapability> logging;
    std::unordered_map<std::string, JSONValue> experimental;

    JSONValue ToJSON() const;
};

///////////////////////////////////////// Tool results ///////////////////////////////////////////
//==========================================================================================================
// CallToolResult
// Purpose: Structured outcome of a tools/call. Failures carry isError=true, a text message and the
//          error kind under _meta.errorKind.
//==========================================================================================================
struct CallToolResult {
    std::vector<JSONValue> content;  // Array of content items
    bool isError = false;
    std::optional<JSONValue> structuredContent;
    std::optional<errors::ErrorKind> errorKind;

    static CallToolResult Text(const std::string& text);
    static CallToolResult Error(errors::ErrorKind kind, const std::string& message);

    // Concatenated text of all text content items.
    std::string TextContent() const;

    JSONValue ToJSON() const;
};

///////////////////////////////////////// Methods ///////////////////////////////////////////
namespace Methods {
    // Requests
    constexpr const char* Initialize = "initialize";
    constexpr const char* Ping = "ping";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ReadResource = "resources/read";
    constexpr const char* ListPrompts = "prompts/list";
    constexpr const char* GetPrompt = "prompts/get";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Progress = "notifications/progress";
    constexpr const char* ResourceListChanged = "notifications/resources/list_changed";
    constexpr const char* ToolListChanged = "notifications/tools/list_changed";
    constexpr const char* PromptListChanged = "notifications/prompts/list_changed";
    constexpr const char* Cancelled = "notifications/cancelled";
}

} // namespace toolhost
