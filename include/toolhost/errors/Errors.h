//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Tool host error taxonomy, typed exceptions and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "toolhost/JSONRPCTypes.h"

namespace toolhost {
namespace errors {

//==========================================================================================================
// ErrorKind
// Purpose: Closed set of failure kinds surfaced by the tool-call pipeline, registries and strategies.
//          Every consumer switches over it exhaustively.
//==========================================================================================================
enum class ErrorKind {
    ToolNotFound,
    ConfirmationRequired,
    ConcurrencyLimitExceeded,
    TimeoutExceeded,
    CancellationRequested,
    SizeLimitExceeded,
    SchemaValidationFailed,
    ResourceNotFound,
    OutOfSandbox,
    PromptNotFound,
    Unknown
};

inline const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ToolNotFound: return "ToolNotFound";
        case ErrorKind::ConfirmationRequired: return "ConfirmationRequired";
        case ErrorKind::ConcurrencyLimitExceeded: return "ConcurrencyLimitExceeded";
        case ErrorKind::TimeoutExceeded: return "TimeoutExceeded";
        case ErrorKind::CancellationRequested: return "CancellationRequested";
        case ErrorKind::SizeLimitExceeded: return "SizeLimitExceeded";
        case ErrorKind::SchemaValidationFailed: return "SchemaValidationFailed";
        case ErrorKind::ResourceNotFound: return "ResourceNotFound";
        case ErrorKind::OutOfSandbox: return "OutOfSandbox";
        case ErrorKind::PromptNotFound: return "PromptNotFound";
        case ErrorKind::Unknown: return "Unknown";
    }
    return "Unknown";
}

// Map an ErrorKind to the JSON-RPC code used when the failure crosses the protocol boundary.
inline int rpcCodeFor(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ToolNotFound: return JSONRPCErrorCodes::ToolNotFound;
        case ErrorKind::ConfirmationRequired: return JSONRPCErrorCodes::PermissionDenied;
        case ErrorKind::ConcurrencyLimitExceeded: return JSONRPCErrorCodes::ResourceExhausted;
        case ErrorKind::TimeoutExceeded: return JSONRPCErrorCodes::RequestTimeout;
        case ErrorKind::CancellationRequested: return JSONRPCErrorCodes::RequestCancelled;
        case ErrorKind::SizeLimitExceeded: return JSONRPCErrorCodes::InvalidParams;
        case ErrorKind::SchemaValidationFailed: return JSONRPCErrorCodes::InvalidParams;
        case ErrorKind::ResourceNotFound: return JSONRPCErrorCodes::ResourceNotFound;
        case ErrorKind::OutOfSandbox: return JSONRPCErrorCodes::PermissionDenied;
        case ErrorKind::PromptNotFound: return JSONRPCErrorCodes::PromptNotFound;
        case ErrorKind::Unknown: return JSONRPCErrorCodes::InternalError;
    }
    return JSONRPCErrorCodes::InternalError;
}

////////////////////////////////////////// Exceptions //////////////////////////////////////////

//==========================================================================================================
// ToolHostError
// Purpose: Base for every typed failure. Carries its kind and a structured details object that is
//          forwarded as JSON-RPC error data.
//==========================================================================================================
class ToolHostError : public std::runtime_error {
public:
    ToolHostError(ErrorKind kind, const std::string& message, JSONValue details = JSONValue(JSONValue::Object{}))
        : std::runtime_error(message), kind_(kind), details_(std::move(details)) {}

    ErrorKind Kind() const noexcept { return kind_; }
    const JSONValue& Details() const noexcept { return details_; }

private:
    ErrorKind kind_;
    JSONValue details_;
};

class ToolNotFoundError : public ToolHostError {
public:
    explicit ToolNotFoundError(const std::string& toolName)
        : ToolHostError(ErrorKind::ToolNotFound, "Tool not found: " + toolName,
                        MakeObject({{"tool", JSONValue(toolName)}})),
          toolName_(toolName) {}
    const std::string& ToolName() const { return toolName_; }
private:
    std::string toolName_;
};

class ConfirmationRequiredError : public ToolHostError {
public:
    explicit ConfirmationRequiredError(const std::string& toolName)
        : ToolHostError(ErrorKind::ConfirmationRequired, "Confirmation required for tool: " + toolName,
                        MakeObject({{"tool", JSONValue(toolName)}})),
          toolName_(toolName) {}
    const std::string& ToolName() const { return toolName_; }
private:
    std::string toolName_;
};

class ConcurrencyLimitExceededError : public ToolHostError {
public:
    ConcurrencyLimitExceededError(const std::string& toolName, int64_t current, int64_t limit)
        : ToolHostError(ErrorKind::ConcurrencyLimitExceeded,
                        "Maximum concurrency reached for tool: " + toolName +
                            " (current: " + std::to_string(current) + ", limit: " + std::to_string(limit) + ")",
                        MakeObject({{"tool", JSONValue(toolName)},
                                    {"current", JSONValue(current)},
                                    {"limit", JSONValue(limit)}})),
          toolName_(toolName), current_(current), limit_(limit) {}
    const std::string& ToolName() const { return toolName_; }
    int64_t Current() const { return current_; }
    int64_t Limit() const { return limit_; }
private:
    std::string toolName_;
    int64_t current_;
    int64_t limit_;
};

class TimeoutExceededError : public ToolHostError {
public:
    TimeoutExceededError(const std::string& operation, std::chrono::milliseconds timeout)
        : ToolHostError(ErrorKind::TimeoutExceeded,
                        (operation.empty() ? std::string("Operation") : "Operation (" + operation + ")") +
                            " timed out after " + std::to_string(timeout.count()) + "ms",
                        MakeObject({{"operation", JSONValue(operation)},
                                    {"timeoutMs", JSONValue(static_cast<int64_t>(timeout.count()))}})),
          operation_(operation), timeout_(timeout) {}
    const std::string& Operation() const { return operation_; }
    std::chrono::milliseconds Timeout() const { return timeout_; }
private:
    std::string operation_;
    std::chrono::milliseconds timeout_;
};

class CancellationRequestedError : public ToolHostError {
public:
    explicit CancellationRequestedError(const std::string& reason = "Operation cancelled")
        : ToolHostError(ErrorKind::CancellationRequested, reason) {}
};

class SizeLimitExceededError : public ToolHostError {
public:
    SizeLimitExceededError(const std::string& what, int64_t size, int64_t limit)
        : ToolHostError(ErrorKind::SizeLimitExceeded,
                        what + " exceeds maximum size: " + std::to_string(size) + " bytes > " +
                            std::to_string(limit) + " bytes",
                        MakeObject({{"subject", JSONValue(what)},
                                    {"size", JSONValue(size)},
                                    {"limit", JSONValue(limit)}})),
          size_(size), limit_(limit) {}
    int64_t Size() const { return size_; }
    int64_t Limit() const { return limit_; }
private:
    int64_t size_;
    int64_t limit_;
};

class SchemaValidationFailedError : public ToolHostError {
public:
    SchemaValidationFailedError(const std::string& what, std::vector<std::string> violations)
        : ToolHostError(ErrorKind::SchemaValidationFailed, buildMessage(what, violations),
                        MakeObject({{"violations", toArray(violations)}})),
          violations_(std::move(violations)) {}
    const std::vector<std::string>& Violations() const { return violations_; }
private:
    static std::string buildMessage(const std::string& what, const std::vector<std::string>& violations) {
        std::string msg = what + " failed schema validation";
        for (size_t i = 0; i < violations.size(); ++i) {
            msg += (i == 0) ? ": " : "; ";
            msg += violations[i];
        }
        return msg;
    }
    static JSONValue toArray(const std::vector<std::string>& violations) {
        JSONValue::Array arr;
        for (const auto& v : violations) arr.push_back(std::make_shared<JSONValue>(v));
        return JSONValue(std::move(arr));
    }
    std::vector<std::string> violations_;
};

class ResourceNotFoundError : public ToolHostError {
public:
    explicit ResourceNotFoundError(const std::string& uri)
        : ToolHostError(ErrorKind::ResourceNotFound, "Resource not found: " + uri,
                        MakeObject({{"uri", JSONValue(uri)}})) {}
};

class OutOfSandboxError : public ToolHostError {
public:
    explicit OutOfSandboxError(const std::string& path, const std::string& reason = "Path outside workspace")
        : ToolHostError(ErrorKind::OutOfSandbox, reason + ": " + path,
                        MakeObject({{"path", JSONValue(path)}})) {}
};

class PromptNotFoundError : public ToolHostError {
public:
    explicit PromptNotFoundError(const std::string& promptId)
        : ToolHostError(ErrorKind::PromptNotFound, "Prompt not found: " + promptId,
                        MakeObject({{"prompt", JSONValue(promptId)}})) {}
};

////////////////////////////////////////// JSON-RPC mapping //////////////////////////////////////////

// Categorization of common JSON-RPC and host error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    HostResourceNotFound,
    HostToolNotFound,
    HostPromptNotFound,
    HostCancelled,
    HostTimeout,
    HostResourceExhausted,
    HostPermissionDenied,
    Unknown
};

// Typed JSON-RPC error representation.
struct RpcError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code (JSON-RPC standard or host-specific).
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::ResourceNotFound: return ErrorCategory::HostResourceNotFound;
        case JSONRPCErrorCodes::ToolNotFound: return ErrorCategory::HostToolNotFound;
        case JSONRPCErrorCodes::PromptNotFound: return ErrorCategory::HostPromptNotFound;
        case JSONRPCErrorCodes::RequestCancelled: return ErrorCategory::HostCancelled;
        case JSONRPCErrorCodes::RequestTimeout: return ErrorCategory::HostTimeout;
        case JSONRPCErrorCodes::ResourceExhausted: return ErrorCategory::HostResourceExhausted;
        case JSONRPCErrorCodes::PermissionDenied: return ErrorCategory::HostPermissionDenied;
        default: return ErrorCategory::Unknown;
    }
}

// Convert a typed failure into its wire representation; data carries { kind, ...details }.
inline RpcError toRpcError(const ToolHostError& err) {
    JSONValue data = err.Details();
    if (auto* obj = std::get_if<JSONValue::Object>(&data.value)) {
        (*obj)["kind"] = std::make_shared<JSONValue>(toString(err.Kind()));
    }
    RpcError e;
    e.code = rpcCodeFor(err.Kind());
    e.message = err.what();
    e.data = std::move(data);
    e.category = errorCategoryFromCode(e.code);
    return e;
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to RpcError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<RpcError> rpcErrorFromErrorValue(const JSONValue& errVal) {
    auto code = GetInt(errVal, "code");
    auto message = GetString(errVal, "message");
    if (!code.has_value() || !message.has_value()) {
        return std::nullopt;
    }
    RpcError e;
    e.code = static_cast<int>(*code);
    e.message = *message;
    if (const JSONValue* d = FindMember(errVal, "data")) {
        e.data = *d;
    }
    e.category = errorCategoryFromCode(e.code);
    return e;
}

// Extract RpcError from a JSONRPCResponse if it carries an error.
inline std::optional<RpcError> rpcErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return rpcErrorFromErrorValue(response.error.value());
}

// Create a JSONValue error object from a typed RpcError.
inline JSONValue makeErrorValue(const RpcError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

// Convenience: Create a JSONRPCResponse error from RpcError and id.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const RpcError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

} // namespace errors
} // namespace toolhost
