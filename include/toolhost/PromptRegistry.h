//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PromptRegistry.h
// Purpose: Parameterized prompt templates and their resolution by identifier
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "toolhost/JSONRPCTypes.h"

namespace toolhost {

struct PromptVariable {
    std::string name;
    std::string description;
    bool required = false;
    std::optional<std::string> defaultValue;
};

// Variable bindings after defaults have been applied.
using PromptBindings = std::unordered_map<std::string, std::string>;

//==========================================================================================================
// PromptDefinition
// Purpose: One prompt. The message text is produced by `resolver` when set, otherwise by substituting
//          {{variable}} placeholders in `messageTemplate`.
//==========================================================================================================
struct PromptDefinition {
    std::string id;
    std::string title;
    std::string description;
    std::vector<PromptVariable> variables;
    std::string messageTemplate;
    std::function<std::string(const PromptBindings&)> resolver;

    JSONValue ToListEntry() const;
};

//==========================================================================================================
// PromptResult
// Purpose: Outcome of resolving a prompt. When required variables are missing, `text` is empty and
//          `variablesNeeded` names them in declaration order.
//==========================================================================================================
struct PromptResult {
    std::string id;
    std::string description;
    std::optional<std::string> text;
    std::vector<std::string> variablesNeeded;

    bool IsComplete() const { return text.has_value(); }
    JSONValue ToJSON() const;
};

class PromptRegistry {
public:
    // Overwrites on duplicate id. Throws std::invalid_argument for an empty id.
    void Register(PromptDefinition definition);

    std::vector<PromptDefinition> List() const;

    //======================================================================================================
    // GetPrompt
    // Purpose: Resolves a prompt with the supplied variables (a JSON object; other shapes count as empty).
    //          String, number and boolean values are accepted and rendered as text.
    // Throws:
    //   errors::PromptNotFoundError for an unknown id.
    //======================================================================================================
    PromptResult GetPrompt(const std::string& id, const JSONValue& variables) const;

    bool Has(const std::string& id) const;

    // Replaces each {{name}} with its binding; unknown placeholders are left untouched.
    static std::string RenderTemplate(const std::string& templ, const PromptBindings& bindings);

private:
    mutable std::mutex mutex;
    std::unordered_map<std::string, std::shared_ptr<const PromptDefinition>> prompts;
    std::vector<std::string> order;
};

} // namespace toolhost
