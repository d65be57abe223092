//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Middlewares.h
// Purpose: Built-in tool-call pipeline stages
//==========================================================================================================

#pragma once

#include <chrono>
#include <memory>

#include "toolhost/Cancellation.h"
#include "toolhost/ConcurrencyLimiter.h"
#include "toolhost/Progress.h"
#include "toolhost/ToolRegistry.h"
#include "toolhost/config/ServerConfig.h"
#include "toolhost/pipeline/ToolCallMiddleware.h"
#include "toolhost/validation/SizeValidator.h"
#include "toolhost/validation/Validation.h"

namespace toolhost {
namespace pipeline {

//==========================================================================================================
// ValidationMiddleware (10)
// Purpose: Size-checks the arguments, resolves the tool and, in strict mode, checks the arguments
//          against the tool's input schema. An unknown tool short-circuits with ToolNotFound.
//==========================================================================================================
class ValidationMiddleware : public ToolCallMiddleware {
public:
    ValidationMiddleware(std::shared_ptr<ToolRegistry> tools,
                         std::shared_ptr<validation::SizeValidator> sizeValidator,
                         validation::ValidationMode mode = validation::ValidationMode::Off);

    int Priority() const override { return 10; }
    const char* Name() const override { return "validation"; }
    CallToolResult Handle(const ToolCallContext& context, const NextHandler& next) override;

private:
    std::shared_ptr<ToolRegistry> tools;
    std::shared_ptr<validation::SizeValidator> sizeValidator;
    validation::ValidationMode mode;
};

// (20) Tools flagged requiresConfirmation need `"confirm": true` in their arguments.
class ConfirmationMiddleware : public ToolCallMiddleware {
public:
    int Priority() const override { return 20; }
    const char* Name() const override { return "confirmation"; }
    CallToolResult Handle(const ToolCallContext& context, const NextHandler& next) override;
};

//==========================================================================================================
// SetupMiddleware (30)
// Purpose: Attaches the cancellation token, progress notifier and effective timeout.
// Notes:
//   With a CancellationRegistry and a request id, the token is registered under that id for the
//   lifetime of the call so notifications/cancelled can reach it.
//==========================================================================================================
class SetupMiddleware : public ToolCallMiddleware {
public:
    SetupMiddleware(config::TimeoutConfig timeouts,
                    ProgressSink progressSink = nullptr,
                    std::shared_ptr<CancellationRegistry> cancellations = nullptr);

    int Priority() const override { return 30; }
    const char* Name() const override { return "setup"; }
    CallToolResult Handle(const ToolCallContext& context, const NextHandler& next) override;

private:
    config::TimeoutConfig timeouts;
    ProgressSink progressSink;
    std::shared_ptr<CancellationRegistry> cancellations;
};

// (40) Runs the rest of the chain inside a concurrency slot for the tool.
class ConcurrencyMiddleware : public ToolCallMiddleware {
public:
    explicit ConcurrencyMiddleware(std::shared_ptr<ConcurrencyLimiter> limiter);

    int Priority() const override { return 40; }
    const char* Name() const override { return "concurrency"; }
    CallToolResult Handle(const ToolCallContext& context, const NextHandler& next) override;

private:
    std::shared_ptr<ConcurrencyLimiter> limiter;
};

//==========================================================================================================
// TimeoutMiddleware (50)
// Purpose: Bounds the rest of the chain by the context's timeout. On expiry the call's token is
//          cancelled and a TimeoutExceeded result is returned while the worker winds down on its own.
//==========================================================================================================
class TimeoutMiddleware : public ToolCallMiddleware {
public:
    int Priority() const override { return 50; }
    const char* Name() const override { return "timeout"; }
    CallToolResult Handle(const ToolCallContext& context, const NextHandler& next) override;
};

//==========================================================================================================
// ExecutionMiddleware (60)
// Purpose: Invokes the handler, waits for it while watching the cancellation token, size-checks the
//          raw result and hands it on.
//==========================================================================================================
class ExecutionMiddleware : public ToolCallMiddleware {
public:
    ExecutionMiddleware(std::shared_ptr<ToolRegistry> tools,
                        std::shared_ptr<validation::SizeValidator> sizeValidator,
                        std::chrono::milliseconds pollInterval = std::chrono::milliseconds(20));

    int Priority() const override { return 60; }
    const char* Name() const override { return "execution"; }
    CallToolResult Handle(const ToolCallContext& context, const NextHandler& next) override;

private:
    std::shared_ptr<ToolRegistry> tools;
    std::shared_ptr<validation::SizeValidator> sizeValidator;
    std::chrono::milliseconds pollInterval;
};

//==========================================================================================================
// ResultConversionMiddleware (70)
// Purpose: Innermost stage. Tools with an output schema get their result validated and returned as
//          structuredContent (non-object results are wrapped as {"result": value}); other results are
//          returned as serialized JSON text.
//==========================================================================================================
class ResultConversionMiddleware : public ToolCallMiddleware {
public:
    int Priority() const override { return 70; }
    const char* Name() const override { return "result_conversion"; }
    CallToolResult Handle(const ToolCallContext& context, const NextHandler& next) override;
};

// (80) Logs start, completion with elapsed time, or failure; failures are rethrown unchanged.
class LoggingMiddleware : public ToolCallMiddleware {
public:
    int Priority() const override { return 80; }
    const char* Name() const override { return "logging"; }
    bool WrapsChain() const override { return true; }
    CallToolResult Handle(const ToolCallContext& context, const NextHandler& next) override;
};

//==========================================================================================================
// ErrorHandlingMiddleware (90)
// Purpose: Outermost safety net. Converts any exception into an error result tagged with its kind and
//          logs it with the correlation id and elapsed time.
//==========================================================================================================
class ErrorHandlingMiddleware : public ToolCallMiddleware {
public:
    int Priority() const override { return 90; }
    const char* Name() const override { return "error_handling"; }
    bool WrapsChain() const override { return true; }
    CallToolResult Handle(const ToolCallContext& context, const NextHandler& next) override;
};

} // namespace pipeline
} // namespace toolhost
