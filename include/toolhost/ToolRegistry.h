//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.h
// Purpose: Tool definitions, safety flags and name-based dispatch
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "toolhost/Cancellation.h"
#include "toolhost/JSONRPCTypes.h"
#include "toolhost/Progress.h"

namespace toolhost {

// Handler receives the call arguments plus the call's token and notifier and yields the raw result.
using ToolHandler = std::function<std::future<JSONValue>(const JSONValue& arguments,
                                                         std::shared_ptr<CancellationToken> token,
                                                         std::shared_ptr<ProgressNotifier> progress)>;

// Safety flags advertised with each tool.
struct ToolFlags {
    bool readOnly = false;
    bool writesToDisk = false;
    bool requiresConfirmation = false;
    bool idempotent = false;
};

//==========================================================================================================
// ToolDefinition
// Purpose: Immutable description of one tool. An absent inputSchema is advertised as
//          {"type":"object"}; an outputSchema switches result conversion to structured content.
//==========================================================================================================
struct ToolDefinition {
    std::string name;
    std::string description;
    std::optional<JSONValue> inputSchema;
    std::optional<JSONValue> outputSchema;
    ToolFlags flags;
    ToolHandler handler;
};

// External-facing view of a ToolDefinition (no handler).
struct ToolMetadata {
    std::string name;
    std::string description;
    JSONValue inputSchema;
    std::optional<JSONValue> outputSchema;
    ToolFlags flags;

    JSONValue ToJSON() const;
};

//==========================================================================================================
// ToolRegistry
// Purpose: Thread-safe store of ToolDefinitions keyed by name; List preserves registration order.
//==========================================================================================================
class ToolRegistry {
public:
    // Last writer wins; an overwrite keeps the original registration position.
    // Throws std::invalid_argument for an empty name or missing handler.
    void Register(ToolDefinition definition);

    bool Unregister(const std::string& name);

    std::vector<ToolMetadata> List() const;

    //======================================================================================================
    // Call
    // Purpose: Invokes the named tool's handler.
    // Throws:
    //   errors::ToolNotFoundError when no tool has that name. Handler failures propagate unchanged.
    //======================================================================================================
    std::future<JSONValue> Call(const std::string& name, const JSONValue& arguments,
                                std::shared_ptr<CancellationToken> token,
                                std::shared_ptr<ProgressNotifier> progress) const;

    std::shared_ptr<const ToolDefinition> GetTool(const std::string& name) const;
    std::optional<ToolMetadata> GetMetadata(const std::string& name) const;
    bool Has(const std::string& name) const;
    size_t Size() const;

private:
    mutable std::mutex mutex;
    std::unordered_map<std::string, std::shared_ptr<const ToolDefinition>> tools;
    std::vector<std::string> order;
};

} // namespace toolhost
