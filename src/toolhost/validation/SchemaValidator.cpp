//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SchemaValidator.cpp
// Purpose: Recursive schema checks producing path-prefixed violations
//==========================================================================================================

#include <algorithm>
#include "toolhost/validation/SchemaValidator.h"

namespace toolhost {
namespace validation {

const char* jsonTypeName(const JSONValue& value) {
    return std::visit([](const auto& v) -> const char* {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) return "null";
        else if constexpr (std::is_same_v<T, bool>) return "boolean";
        else if constexpr (std::is_same_v<T, int64_t>) return "integer";
        else if constexpr (std::is_same_v<T, double>) return "number";
        else if constexpr (std::is_same_v<T, std::string>) return "string";
        else if constexpr (std::is_same_v<T, JSONValue::Array>) return "array";
        else return "object";
    }, value.value);
}

namespace {

void prefixAll(std::vector<std::string>& out, const std::vector<std::string>& inner, const std::string& prefix) {
    for (const auto& e : inner) {
        out.push_back(prefix + e);
    }
}

void validateObject(const JSONValue& value, const JSONValue& schema, std::vector<std::string>& errors) {
    const auto* obj = std::get_if<JSONValue::Object>(&value.value);
    if (!obj) {
        errors.push_back(std::string("Expected object, got ") + jsonTypeName(value));
        return;
    }
    if (const JSONValue* req = FindMember(schema, "required")) {
        if (const auto* arr = std::get_if<JSONValue::Array>(&req->value)) {
            for (const auto& item : *arr) {
                if (!item) continue;
                if (const auto* field = std::get_if<std::string>(&item->value)) {
                    if (obj->find(*field) == obj->end()) {
                        errors.push_back("Missing required field: " + *field);
                    }
                }
            }
        }
    }
    const JSONValue* props = FindMember(schema, "properties");
    if (!props || !props->IsObject()) {
        return;
    }
    const bool additionalAllowed = GetBool(schema, "additionalProperties").value_or(true);

    // Sorted so violation order does not depend on hash order
    std::vector<std::string> keys;
    keys.reserve(obj->size());
    for (const auto& [k, _] : *obj) keys.push_back(k);
    std::sort(keys.begin(), keys.end());

    for (const auto& key : keys) {
        const JSONValue* fieldSchema = FindMember(*props, key);
        if (fieldSchema) {
            const auto& fieldValue = obj->at(key);
            prefixAll(errors, SchemaValidator::Validate(fieldValue ? *fieldValue : JSONValue(), *fieldSchema),
                      "$." + key + ": ");
        } else if (!additionalAllowed) {
            errors.push_back("Additional property not allowed: " + key);
        }
    }
}

void validateArray(const JSONValue& value, const JSONValue& schema, std::vector<std::string>& errors) {
    const auto* arr = std::get_if<JSONValue::Array>(&value.value);
    if (!arr) {
        errors.push_back(std::string("Expected array, got ") + jsonTypeName(value));
        return;
    }
    const JSONValue* items = FindMember(schema, "items");
    if (!items || !items->IsObject()) {
        return;
    }
    for (size_t i = 0; i < arr->size(); ++i) {
        const auto& item = (*arr)[i];
        prefixAll(errors, SchemaValidator::Validate(item ? *item : JSONValue(), *items),
                  "[" + std::to_string(i) + "]: ");
    }
}

void validateEnum(const JSONValue& value, const JSONValue& schema, std::vector<std::string>& errors) {
    const JSONValue* en = FindMember(schema, "enum");
    if (!en) return;
    const auto* options = std::get_if<JSONValue::Array>(&en->value);
    const auto* s = std::get_if<std::string>(&value.value);
    if (!options || !s) return;
    for (const auto& opt : *options) {
        if (opt) {
            if (const auto* os = std::get_if<std::string>(&opt->value); os && *os == *s) {
                return;
            }
        }
    }
    errors.push_back("Value not in enum: " + *s);
}

} // namespace

std::vector<std::string> SchemaValidator::Validate(const JSONValue& value, const JSONValue& schema) {
    std::vector<std::string> errors;
    const auto type = GetString(schema, "type");
    if (!type.has_value()) {
        return errors;
    }
    const std::string& t = *type;
    if (t == "object") {
        validateObject(value, schema, errors);
    } else if (t == "array") {
        validateArray(value, schema, errors);
    } else if (t == "string") {
        if (!value.IsString()) {
            errors.push_back(std::string("Expected string, got ") + jsonTypeName(value));
        } else {
            validateEnum(value, schema, errors);
        }
    } else if (t == "integer") {
        if (!std::holds_alternative<int64_t>(value.value)) {
            errors.push_back(std::string("Expected integer, got ") + jsonTypeName(value));
        }
    } else if (t == "number") {
        if (!std::holds_alternative<int64_t>(value.value) && !std::holds_alternative<double>(value.value)) {
            errors.push_back(std::string("Expected number, got ") + jsonTypeName(value));
        }
    } else if (t == "boolean") {
        if (!std::holds_alternative<bool>(value.value)) {
            errors.push_back(std::string("Expected boolean, got ") + jsonTypeName(value));
        }
    }
    return errors;
}

} // namespace validation
} // namespace toolhost
