//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SizeValidator.h
// Purpose: Serialized-size checks for tool parameters, results, resources and whole messages
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>
#include "toolhost/JSONRPCTypes.h"
#include "toolhost/config/ServerConfig.h"

namespace toolhost {
namespace validation {

//==========================================================================================================
// SizeValidator
// Purpose: Measures the UTF-8 byte length of a value's compact JSON serialization and compares it
//          to the configured limit.
// Throws:
//   errors::SizeLimitExceededError carrying the measured size and the limit.
//==========================================================================================================
class SizeValidator {
public:
    explicit SizeValidator(config::SizeLimits limits);

    void ValidateParameters(const JSONValue& args) const;
    void ValidateResult(const JSONValue& result) const;
    void ValidateMessage(const JSONValue& message) const;

    // Raw text (resource content) is measured as-is, not as a JSON string literal.
    void ValidateResourceContent(const std::string& content) const;
    // Checks a byte count before the content is loaded.
    void ValidateResourceSize(int64_t bytes) const;

    static int64_t MeasureSize(const JSONValue& value);

    const config::SizeLimits& Limits() const { return limits; }

private:
    void validateValueSize(const JSONValue& value, int64_t limit, const std::string& name) const;

    config::SizeLimits limits;
};

} // namespace validation
} // namespace toolhost
