//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.cpp
// Purpose: ToolRegistry implementation
//==========================================================================================================

#include <algorithm>
#include <stdexcept>
#include "toolhost/ToolRegistry.h"
#include "toolhost/errors/Errors.h"
#include "logging/Logger.h"

namespace toolhost {

namespace {
ToolMetadata toMetadata(const ToolDefinition& def) {
    ToolMetadata m;
    m.name = def.name;
    m.description = def.description;
    m.inputSchema = def.inputSchema.has_value() ? def.inputSchema.value()
                                                : MakeObject({{"type", JSONValue("object")}});
    m.outputSchema = def.outputSchema;
    m.flags = def.flags;
    return m;
}
} // namespace

JSONValue ToolMetadata::ToJSON() const {
    JSONValue::Object to;
    to["name"] = std::make_shared<JSONValue>(name);
    to["description"] = std::make_shared<JSONValue>(description);
    to["inputSchema"] = std::make_shared<JSONValue>(inputSchema);
    if (outputSchema.has_value()) {
        to["outputSchema"] = std::make_shared<JSONValue>(outputSchema.value());
    }
    // Flags are advertised only when set
    if (flags.readOnly) to["readOnly"] = std::make_shared<JSONValue>(true);
    if (flags.writesToDisk) to["writesToDisk"] = std::make_shared<JSONValue>(true);
    if (flags.requiresConfirmation) to["requiresConfirmation"] = std::make_shared<JSONValue>(true);
    if (flags.idempotent) to["idempotent"] = std::make_shared<JSONValue>(true);
    return JSONValue{to};
}

void ToolRegistry::Register(ToolDefinition definition) {
    if (definition.name.empty()) {
        throw std::invalid_argument("ToolDefinition.name must not be empty");
    }
    if (!definition.handler) {
        throw std::invalid_argument("ToolDefinition.handler must be set for tool: " + definition.name);
    }
    const std::string name = definition.name;
    auto def = std::make_shared<const ToolDefinition>(std::move(definition));
    std::lock_guard<std::mutex> lk(mutex);
    if (tools.find(name) == tools.end()) {
        order.push_back(name);
    } else {
        LOG_DEBUG("Tool overwritten: {}", name);
    }
    tools[name] = std::move(def);
    LOG_DEBUG("Tool registered: {}", name);
}

bool ToolRegistry::Unregister(const std::string& name) {
    std::lock_guard<std::mutex> lk(mutex);
    if (tools.erase(name) == 0) {
        return false;
    }
    order.erase(std::remove(order.begin(), order.end(), name), order.end());
    return true;
}

std::vector<ToolMetadata> ToolRegistry::List() const {
    std::lock_guard<std::mutex> lk(mutex);
    std::vector<ToolMetadata> out;
    out.reserve(order.size());
    for (const auto& name : order) {
        out.push_back(toMetadata(*tools.at(name)));
    }
    return out;
}

std::future<JSONValue> ToolRegistry::Call(const std::string& name, const JSONValue& arguments,
                                          std::shared_ptr<CancellationToken> token,
                                          std::shared_ptr<ProgressNotifier> progress) const {
    auto def = GetTool(name);
    if (!def) {
        throw errors::ToolNotFoundError(name);
    }
    return def->handler(arguments, std::move(token), std::move(progress));
}

std::shared_ptr<const ToolDefinition> ToolRegistry::GetTool(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mutex);
    auto it = tools.find(name);
    return it == tools.end() ? nullptr : it->second;
}

std::optional<ToolMetadata> ToolRegistry::GetMetadata(const std::string& name) const {
    auto def = GetTool(name);
    if (!def) {
        return std::nullopt;
    }
    return toMetadata(*def);
}

bool ToolRegistry::Has(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mutex);
    return tools.find(name) != tools.end();
}

size_t ToolRegistry::Size() const {
    std::lock_guard<std::mutex> lk(mutex);
    return tools.size();
}

} // namespace toolhost
