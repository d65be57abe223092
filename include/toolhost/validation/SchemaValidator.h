//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SchemaValidator.h
// Purpose: Minimal JSON-Schema subset checker used for tool input and output schemas
//==========================================================================================================

#pragma once

#include <string>
#include <vector>
#include "toolhost/JSONRPCTypes.h"

namespace toolhost {
namespace validation {

//==========================================================================================================
// SchemaValidator
// Purpose: Validates a value against a schema supporting "type" in {object, string, integer, number,
//          boolean, array} with properties/required/additionalProperties, items and string enum.
//          Unknown or missing types are accepted.
// Returns:
//   List of human-readable violations; empty when the value conforms.
//==========================================================================================================
class SchemaValidator {
public:
    static std::vector<std::string> Validate(const JSONValue& value, const JSONValue& schema);
};

// Name of the JSON type held by a value, as used in violation messages.
const char* jsonTypeName(const JSONValue& value);

} // namespace validation
} // namespace toolhost
