//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PromptRegistry.cpp
// Purpose: PromptRegistry implementation
//==========================================================================================================

#include <stdexcept>
#include <fmt/format.h>
#include "toolhost/PromptRegistry.h"
#include "toolhost/errors/Errors.h"
#include "logging/Logger.h"

namespace toolhost {

namespace {
std::optional<std::string> scalarToText(const JSONValue& v) {
    if (auto* s = std::get_if<std::string>(&v.value)) return *s;
    if (auto* b = std::get_if<bool>(&v.value)) return std::string(*b ? "true" : "false");
    if (auto* i = std::get_if<int64_t>(&v.value)) return std::to_string(*i);
    if (auto* d = std::get_if<double>(&v.value)) return fmt::format("{}", *d);
    return std::nullopt;
}
} // namespace

JSONValue PromptDefinition::ToListEntry() const {
    JSONValue::Array vars;
    for (const auto& v : variables) {
        JSONValue::Object o;
        o["name"] = std::make_shared<JSONValue>(v.name);
        o["type"] = std::make_shared<JSONValue>("string");
        o["required"] = std::make_shared<JSONValue>(v.required);
        if (!v.description.empty()) {
            o["description"] = std::make_shared<JSONValue>(v.description);
        }
        if (v.defaultValue.has_value()) {
            o["default"] = std::make_shared<JSONValue>(v.defaultValue.value());
        }
        vars.push_back(std::make_shared<JSONValue>(std::move(o)));
    }
    // "name" mirrors the id for clients that key prompts by name
    return MakeObject({{"id", JSONValue(id)},
                       {"name", JSONValue(id)},
                       {"title", JSONValue(title)},
                       {"description", JSONValue(description)},
                       {"variables", JSONValue(std::move(vars))}});
}

JSONValue PromptResult::ToJSON() const {
    JSONValue::Object o;
    o["id"] = std::make_shared<JSONValue>(id);
    if (!description.empty()) {
        o["description"] = std::make_shared<JSONValue>(description);
    }
    if (!text.has_value()) {
        JSONValue::Array needed;
        for (const auto& n : variablesNeeded) needed.push_back(std::make_shared<JSONValue>(n));
        o["variablesNeeded"] = std::make_shared<JSONValue>(std::move(needed));
        o["messages"] = std::make_shared<JSONValue>(JSONValue::Array{});
        return JSONValue{o};
    }
    o["text"] = std::make_shared<JSONValue>(text.value());
    JSONValue message = MakeObject({
        {"role", JSONValue("user")},
        {"content", MakeObject({{"type", JSONValue("text")}, {"text", JSONValue(text.value())}})}
    });
    o["messages"] = std::make_shared<JSONValue>(JSONValue::Array{std::make_shared<JSONValue>(std::move(message))});
    return JSONValue{o};
}

void PromptRegistry::Register(PromptDefinition definition) {
    if (definition.id.empty()) {
        throw std::invalid_argument("PromptDefinition.id must not be empty");
    }
    const std::string id = definition.id;
    auto def = std::make_shared<const PromptDefinition>(std::move(definition));
    std::lock_guard<std::mutex> lk(mutex);
    if (prompts.find(id) == prompts.end()) {
        order.push_back(id);
    }
    prompts[id] = std::move(def);
    LOG_DEBUG("Prompt registered: {}", id);
}

std::vector<PromptDefinition> PromptRegistry::List() const {
    std::lock_guard<std::mutex> lk(mutex);
    std::vector<PromptDefinition> out;
    out.reserve(order.size());
    for (const auto& id : order) {
        out.push_back(*prompts.at(id));
    }
    return out;
}

PromptResult PromptRegistry::GetPrompt(const std::string& id, const JSONValue& variables) const {
    std::shared_ptr<const PromptDefinition> def;
    {
        std::lock_guard<std::mutex> lk(mutex);
        auto it = prompts.find(id);
        if (it == prompts.end()) {
            throw errors::PromptNotFoundError(id);
        }
        def = it->second;
    }

    PromptResult result;
    result.id = def->id;
    result.description = def->description;

    PromptBindings bindings;
    for (const auto& var : def->variables) {
        std::optional<std::string> value;
        if (const JSONValue* supplied = FindMember(variables, var.name)) {
            value = scalarToText(*supplied);
        }
        if (value.has_value() && !value->empty()) {
            bindings[var.name] = *value;
        } else if (var.defaultValue.has_value()) {
            bindings[var.name] = var.defaultValue.value();
        } else if (var.required) {
            result.variablesNeeded.push_back(var.name);
        }
    }
    if (!result.variablesNeeded.empty()) {
        LOG_DEBUG("Prompt {} is missing {} required variable(s)", id, result.variablesNeeded.size());
        return result;
    }

    result.text = def->resolver ? def->resolver(bindings) : RenderTemplate(def->messageTemplate, bindings);
    return result;
}

bool PromptRegistry::Has(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mutex);
    return prompts.find(id) != prompts.end();
}

std::string PromptRegistry::RenderTemplate(const std::string& templ, const PromptBindings& bindings) {
    std::string out;
    out.reserve(templ.size());
    size_t pos = 0;
    while (pos < templ.size()) {
        size_t open = templ.find("{{", pos);
        if (open == std::string::npos) {
            out.append(templ, pos, std::string::npos);
            break;
        }
        size_t close = templ.find("}}", open + 2);
        if (close == std::string::npos) {
            out.append(templ, pos, std::string::npos);
            break;
        }
        out.append(templ, pos, open - pos);
        std::string key = templ.substr(open + 2, close - open - 2);
        auto it = bindings.find(key);
        if (it != bindings.end()) {
            out += it->second;
        } else {
            out.append(templ, open, close + 2 - open);
        }
        pos = close + 2;
    }
    return out;
}

} // namespace toolhost
