//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SizeValidator.cpp
// Purpose: SizeValidator implementation
//==========================================================================================================

#include "toolhost/validation/SizeValidator.h"
#include "toolhost/errors/Errors.h"
#include "logging/Logger.h"

namespace toolhost {
namespace validation {

SizeValidator::SizeValidator(config::SizeLimits l) : limits(l) {
    limits.Validate();
}

int64_t SizeValidator::MeasureSize(const JSONValue& value) {
    return static_cast<int64_t>(SerializeJSON(value).size());
}

void SizeValidator::validateValueSize(const JSONValue& value, int64_t limit, const std::string& name) const {
    const int64_t size = MeasureSize(value);
    if (size > limit) {
        LOG_WARN("{} rejected: {} bytes > {} bytes", name, size, limit);
        throw errors::SizeLimitExceededError(name, size, limit);
    }
}

void SizeValidator::ValidateParameters(const JSONValue& args) const {
    validateValueSize(args, limits.maxParameterSize, "parameters");
}

void SizeValidator::ValidateResult(const JSONValue& result) const {
    validateValueSize(result, limits.maxResultSize, "result");
}

void SizeValidator::ValidateMessage(const JSONValue& message) const {
    validateValueSize(message, limits.maxMessageSize, "message");
}

void SizeValidator::ValidateResourceContent(const std::string& content) const {
    ValidateResourceSize(static_cast<int64_t>(content.size()));
}

void SizeValidator::ValidateResourceSize(int64_t bytes) const {
    if (bytes > limits.maxResourceSize) {
        throw errors::SizeLimitExceededError("Resource content", bytes, limits.maxResourceSize);
    }
}

} // namespace validation
} // namespace toolhost
