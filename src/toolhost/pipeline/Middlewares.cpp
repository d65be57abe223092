//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Middlewares.cpp
// Purpose: Built-in tool-call pipeline stages
//==========================================================================================================

#include <future>
#include <stdexcept>
#include "toolhost/pipeline/Middlewares.h"
#include "toolhost/TimeoutManager.h"
#include "toolhost/errors/Errors.h"
#include "toolhost/validation/SchemaValidator.h"
#include "logging/Logger.h"

namespace toolhost {
namespace pipeline {

namespace {

// Error result carrying the failure's details as structured content.
CallToolResult errorResult(const errors::ToolHostError& e, const std::string& prefix) {
    CallToolResult r = CallToolResult::Error(e.Kind(), prefix + e.what());
    const JSONValue& details = e.Details();
    if (auto* obj = std::get_if<JSONValue::Object>(&details.value); obj && !obj->empty()) {
        r.structuredContent = details;
    }
    return r;
}

const char* prefixFor(errors::ErrorKind kind) {
    switch (kind) {
        case errors::ErrorKind::ConcurrencyLimitExceeded: return "Concurrency limit reached: ";
        case errors::ErrorKind::TimeoutExceeded: return "Timeout: ";
        case errors::ErrorKind::CancellationRequested: return "Cancelled: ";
        case errors::ErrorKind::ToolNotFound:
        case errors::ErrorKind::ConfirmationRequired:
        case errors::ErrorKind::SizeLimitExceeded:
        case errors::ErrorKind::SchemaValidationFailed:
        case errors::ErrorKind::ResourceNotFound:
        case errors::ErrorKind::OutOfSandbox:
        case errors::ErrorKind::PromptNotFound:
        case errors::ErrorKind::Unknown:
            return "Error: ";
    }
    return "Error: ";
}

} // namespace

////////////////////////////////////////// Validation //////////////////////////////////////////

ValidationMiddleware::ValidationMiddleware(std::shared_ptr<ToolRegistry> tools,
                                           std::shared_ptr<validation::SizeValidator> sizeValidator,
                                           validation::ValidationMode mode)
    : tools(std::move(tools)), sizeValidator(std::move(sizeValidator)), mode(mode) {
    if (!this->tools || !this->sizeValidator) {
        throw std::invalid_argument("ValidationMiddleware requires a ToolRegistry and a SizeValidator");
    }
}

CallToolResult ValidationMiddleware::Handle(const ToolCallContext& context, const NextHandler& next) {
    sizeValidator->ValidateParameters(context.Request().arguments);

    auto tool = tools->GetTool(context.ToolName());
    if (!tool) {
        LOG_DEBUG("Tool not found: {} [{}]", context.ToolName(), context.CorrelationId());
        return errorResult(errors::ToolNotFoundError(context.ToolName()), "");
    }

    if (mode == validation::ValidationMode::Strict && tool->inputSchema.has_value()) {
        auto violations = validation::SchemaValidator::Validate(context.Request().arguments,
                                                                tool->inputSchema.value());
        if (!violations.empty()) {
            throw errors::SchemaValidationFailedError("Arguments for tool " + tool->name, std::move(violations));
        }
    }
    return next(context.WithTool(std::move(tool)));
}

////////////////////////////////////////// Confirmation //////////////////////////////////////////

CallToolResult ConfirmationMiddleware::Handle(const ToolCallContext& context, const NextHandler& next) {
    const auto& tool = context.Tool();
    if (tool && tool->flags.requiresConfirmation) {
        auto confirmed = GetBool(context.Request().arguments, "confirm");
        if (!confirmed.value_or(false)) {
            return errorResult(errors::ConfirmationRequiredError(context.ToolName()), "");
        }
    }
    return next(context);
}

////////////////////////////////////////// Setup //////////////////////////////////////////

SetupMiddleware::SetupMiddleware(config::TimeoutConfig timeouts,
                                 ProgressSink progressSink,
                                 std::shared_ptr<CancellationRegistry> cancellations)
    : timeouts(std::move(timeouts)), progressSink(std::move(progressSink)), cancellations(std::move(cancellations)) {}

CallToolResult SetupMiddleware::Handle(const ToolCallContext& context, const NextHandler& next) {
    const auto& request = context.Request();

    std::shared_ptr<CancellationToken> token;
    const bool tracked = cancellations && request.requestId.has_value();
    if (tracked) {
        token = cancellations->Register(request.requestId.value());
    } else {
        token = std::make_shared<CancellationToken>();
    }

    auto progress = std::make_shared<ProgressNotifier>(request.progressToken, progressSink);

    auto timeout = timeouts.defaultTimeout;
    auto it = timeouts.perToolTimeouts.find(context.ToolName());
    if (it != timeouts.perToolTimeouts.end()) {
        timeout = it->second;
    }

    // Unregisters the token on every exit path
    struct Registration {
        std::shared_ptr<CancellationRegistry> registry;
        std::optional<std::string> id;
        ~Registration() {
            if (registry && id) registry->Remove(*id);
        }
    } registration{tracked ? cancellations : nullptr, request.requestId};

    return next(context.WithCallResources(std::move(token), std::move(progress), timeout));
}

////////////////////////////////////////// Concurrency //////////////////////////////////////////

ConcurrencyMiddleware::ConcurrencyMiddleware(std::shared_ptr<ConcurrencyLimiter> limiter)
    : limiter(std::move(limiter)) {
    if (!this->limiter) {
        throw std::invalid_argument("ConcurrencyMiddleware requires a ConcurrencyLimiter");
    }
}

CallToolResult ConcurrencyMiddleware::Handle(const ToolCallContext& context, const NextHandler& next) {
    try {
        return limiter->Execute(context.ToolName(), [&]() { return next(context); });
    } catch (const errors::ConcurrencyLimitExceededError& e) {
        LOG_WARN("Concurrency limit reached for tool {} ({}/{}) [{}]",
                 e.ToolName(), e.Current(), e.Limit(), context.CorrelationId());
        return errorResult(e, prefixFor(e.Kind()));
    }
}

////////////////////////////////////////// Timeout //////////////////////////////////////////

CallToolResult TimeoutMiddleware::Handle(const ToolCallContext& context, const NextHandler& next) {
    if (!context.Timeout().has_value()) {
        return next(context);
    }
    // The worker may outlive this frame, so it gets its own copies of the context and continuation
    try {
        return TimeoutManager::WithTimeout([next, context]() { return next(context); },
                                           context.Timeout().value(), context.ToolName());
    } catch (const errors::TimeoutExceededError& e) {
        if (context.Token()) {
            context.Token()->Cancel();
        }
        return errorResult(e, prefixFor(e.Kind()));
    }
}

////////////////////////////////////////// Execution //////////////////////////////////////////

ExecutionMiddleware::ExecutionMiddleware(std::shared_ptr<ToolRegistry> tools,
                                         std::shared_ptr<validation::SizeValidator> sizeValidator,
                                         std::chrono::milliseconds pollInterval)
    : tools(std::move(tools)), sizeValidator(std::move(sizeValidator)), pollInterval(pollInterval) {
    if (!this->tools || !this->sizeValidator) {
        throw std::invalid_argument("ExecutionMiddleware requires a ToolRegistry and a SizeValidator");
    }
}

CallToolResult ExecutionMiddleware::Handle(const ToolCallContext& context, const NextHandler& next) {
    if (!context.Tool()) {
        throw std::logic_error("Tool must be resolved before execution");
    }
    const auto& token = context.Token();
    auto progress = context.Progress() ? context.Progress() : std::make_shared<ProgressNotifier>();

    std::future<JSONValue> pending = tools->Call(context.ToolName(), context.Request().arguments, token, progress);
    if (!pending.valid()) {
        throw std::logic_error("Tool handler returned an empty future: " + context.ToolName());
    }
    for (;;) {
        auto status = pending.wait_for(pollInterval);
        if (status != std::future_status::timeout) {
            break; // ready or deferred; get() below runs a deferred handler inline
        }
        if (token && token->IsCancelled()) {
            throw errors::CancellationRequestedError("Tool call cancelled: " + context.ToolName());
        }
    }
    JSONValue raw = pending.get();

    sizeValidator->ValidateResult(raw);
    return next(context.WithRawResult(std::move(raw)));
}

////////////////////////////////////////// Result conversion //////////////////////////////////////////

CallToolResult ResultConversionMiddleware::Handle(const ToolCallContext& context, const NextHandler& /*next*/) {
    if (!context.RawResult().has_value()) {
        throw std::logic_error("Raw result must be set before result conversion");
    }
    if (!context.Tool()) {
        throw std::logic_error("Tool must be resolved before result conversion");
    }
    const JSONValue& raw = context.RawResult().value();
    const auto& outputSchema = context.Tool()->outputSchema;

    if (!outputSchema.has_value()) {
        return CallToolResult::Text(SerializeJSON(raw));
    }

    JSONValue structured = raw.IsObject() ? raw : MakeObject({{"result", raw}});
    auto violations = validation::SchemaValidator::Validate(structured, outputSchema.value());
    if (!violations.empty()) {
        throw errors::SchemaValidationFailedError("Result of tool " + context.ToolName(), std::move(violations));
    }
    CallToolResult result = CallToolResult::Text(SerializeJSON(raw));
    result.structuredContent = std::move(structured);
    return result;
}

////////////////////////////////////////// Logging //////////////////////////////////////////

CallToolResult LoggingMiddleware::Handle(const ToolCallContext& context, const NextHandler& next) {
    LOG_INFO("Tool call started [tool={}, correlation_id={}]", context.ToolName(), context.CorrelationId());
    try {
        CallToolResult result = next(context);
        LOG_INFO("Tool call completed [tool={}, correlation_id={}, elapsed_ms={}, is_error={}]",
                 context.ToolName(), context.CorrelationId(), context.Elapsed().count(), result.isError);
        return result;
    } catch (const std::exception& e) {
        LOG_ERROR("Tool call failed [tool={}, correlation_id={}, elapsed_ms={}]: {}",
                  context.ToolName(), context.CorrelationId(), context.Elapsed().count(), e.what());
        throw;
    } catch (...) {
        LOG_ERROR("Tool call failed [tool={}, correlation_id={}, elapsed_ms={}]: unknown exception",
                  context.ToolName(), context.CorrelationId(), context.Elapsed().count());
        throw;
    }
}

////////////////////////////////////////// Error handling //////////////////////////////////////////

CallToolResult ErrorHandlingMiddleware::Handle(const ToolCallContext& context, const NextHandler& next) {
    try {
        return next(context);
    } catch (const errors::ToolHostError& e) {
        if (e.Kind() == errors::ErrorKind::ConcurrencyLimitExceeded) {
            LOG_WARN("Operation failed [tool={}, correlation_id={}, elapsed_ms={}, kind={}]: {}",
                     context.ToolName(), context.CorrelationId(), context.Elapsed().count(),
                     errors::toString(e.Kind()), e.what());
        } else {
            LOG_ERROR("Operation failed [tool={}, correlation_id={}, elapsed_ms={}, kind={}]: {}",
                      context.ToolName(), context.CorrelationId(), context.Elapsed().count(),
                      errors::toString(e.Kind()), e.what());
        }
        return errorResult(e, prefixFor(e.Kind()));
    } catch (const std::exception& e) {
        LOG_ERROR("Operation failed [tool={}, correlation_id={}, elapsed_ms={}, kind=Unknown]: {}",
                  context.ToolName(), context.CorrelationId(), context.Elapsed().count(), e.what());
        return CallToolResult::Error(errors::ErrorKind::Unknown, std::string("Error: ") + e.what());
    } catch (...) {
        LOG_ERROR("Operation failed [tool={}, correlation_id={}, elapsed_ms={}, kind=Unknown]: unknown exception",
                  context.ToolName(), context.CorrelationId(), context.Elapsed().count());
        return CallToolResult::Error(errors::ErrorKind::Unknown, "Error: unknown exception");
    }
}

} // namespace pipeline
} // namespace toolhost
