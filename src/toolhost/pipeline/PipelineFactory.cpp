//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PipelineFactory.cpp
// Purpose: Stock pipeline layouts
//==========================================================================================================

#include <stdexcept>
#include "toolhost/pipeline/PipelineFactory.h"

namespace toolhost {
namespace pipeline {

namespace {
void requireCore(const PipelineDependencies& deps) {
    if (!deps.toolRegistry) {
        throw std::invalid_argument("PipelineDependencies.toolRegistry is required");
    }
    if (!deps.sizeValidator) {
        throw std::invalid_argument("PipelineDependencies.sizeValidator is required");
    }
}
} // namespace

ToolCallPipeline DefaultPipelineFactory::Create(const PipelineDependencies& deps) {
    requireCore(deps);
    if (!deps.concurrencyLimiter) {
        throw std::invalid_argument("PipelineDependencies.concurrencyLimiter is required");
    }
    ToolCallPipeline p;
    p.Add(std::make_shared<ValidationMiddleware>(deps.toolRegistry, deps.sizeValidator, deps.validationMode));
    p.Add(std::make_shared<ConfirmationMiddleware>());
    p.Add(std::make_shared<SetupMiddleware>(deps.timeouts, deps.progressSink, deps.cancellationRegistry));
    p.Add(std::make_shared<ConcurrencyMiddleware>(deps.concurrencyLimiter));
    p.Add(std::make_shared<TimeoutMiddleware>());
    p.Add(std::make_shared<ExecutionMiddleware>(deps.toolRegistry, deps.sizeValidator));
    p.Add(std::make_shared<ResultConversionMiddleware>());
    p.Add(std::make_shared<LoggingMiddleware>());
    p.Add(std::make_shared<ErrorHandlingMiddleware>());
    return p;
}

ToolCallPipeline MinimalPipelineFactory::Create(const PipelineDependencies& deps) {
    requireCore(deps);
    ToolCallPipeline p;
    p.Add(std::make_shared<ValidationMiddleware>(deps.toolRegistry, deps.sizeValidator, deps.validationMode));
    p.Add(std::make_shared<ExecutionMiddleware>(deps.toolRegistry, deps.sizeValidator));
    p.Add(std::make_shared<ResultConversionMiddleware>());
    p.Add(std::make_shared<ErrorHandlingMiddleware>());
    return p;
}

} // namespace pipeline
} // namespace toolhost
