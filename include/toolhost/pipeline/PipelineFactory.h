//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PipelineFactory.h
// Purpose: Stock pipeline layouts and a fluent builder for customizing them
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>

#include "toolhost/Cancellation.h"
#include "toolhost/ConcurrencyLimiter.h"
#include "toolhost/Progress.h"
#include "toolhost/ToolRegistry.h"
#include "toolhost/config/ServerConfig.h"
#include "toolhost/pipeline/Middlewares.h"
#include "toolhost/pipeline/ToolCallPipeline.h"
#include "toolhost/validation/SizeValidator.h"

namespace toolhost {
namespace pipeline {

//==========================================================================================================
// PipelineDependencies
// Purpose: Collaborators injected into the stock stages.
// Fields:
//   toolRegistry, sizeValidator: required by every layout.
//   concurrencyLimiter: required by the default layout.
//   cancellationRegistry, progressSink: optional; without them tokens are private to the call and
//                                       progress is dropped.
//==========================================================================================================
struct PipelineDependencies {
    std::shared_ptr<ToolRegistry> toolRegistry;
    std::shared_ptr<validation::SizeValidator> sizeValidator;
    std::shared_ptr<ConcurrencyLimiter> concurrencyLimiter;
    std::shared_ptr<CancellationRegistry> cancellationRegistry;
    ProgressSink progressSink;
    config::TimeoutConfig timeouts;
    validation::ValidationMode validationMode = validation::ValidationMode::Off;
};

// Validation, Confirmation, Setup, Concurrency, Timeout, Execution, ResultConversion, Logging, ErrorHandling.
class DefaultPipelineFactory {
public:
    static ToolCallPipeline Create(const PipelineDependencies& deps);
};

// Validation, Execution, ResultConversion, ErrorHandling.
class MinimalPipelineFactory {
public:
    static ToolCallPipeline Create(const PipelineDependencies& deps);
};

//==========================================================================================================
// CustomPipelineFactory
// Purpose: Starts from the default layout and edits it by stage type. Matching uses dynamic_cast, so
//          a subclass of T also matches.
// Notes:
//   AddBefore/AddAfter append when no stage of type T exists. Replace removes every T and appends
//   the replacement; execution order still follows priority.
//==========================================================================================================
class CustomPipelineFactory {
public:
    explicit CustomPipelineFactory(const PipelineDependencies& deps)
        : pipeline(DefaultPipelineFactory::Create(deps)) {}

    template <typename T>
    CustomPipelineFactory& AddBefore(std::shared_ptr<ToolCallMiddleware> middleware) {
        auto index = pipeline.FindFirstIndex(isA<T>());
        if (index) {
            pipeline.InsertAt(*index, std::move(middleware));
        } else {
            pipeline.Add(std::move(middleware));
        }
        return *this;
    }

    template <typename T>
    CustomPipelineFactory& AddAfter(std::shared_ptr<ToolCallMiddleware> middleware) {
        auto index = pipeline.FindFirstIndex(isA<T>());
        if (index) {
            pipeline.InsertAt(*index + 1, std::move(middleware));
        } else {
            pipeline.Add(std::move(middleware));
        }
        return *this;
    }

    template <typename T>
    CustomPipelineFactory& Replace(std::shared_ptr<ToolCallMiddleware> middleware) {
        pipeline.RemoveIf(isA<T>());
        pipeline.Add(std::move(middleware));
        return *this;
    }

    template <typename T>
    CustomPipelineFactory& Remove() {
        pipeline.RemoveIf(isA<T>());
        return *this;
    }

    CustomPipelineFactory& Add(std::shared_ptr<ToolCallMiddleware> middleware) {
        pipeline.Add(std::move(middleware));
        return *this;
    }

    ToolCallPipeline Build() const { return pipeline; }

private:
    template <typename T>
    static std::function<bool(const ToolCallMiddleware&)> isA() {
        return [](const ToolCallMiddleware& m) { return dynamic_cast<const T*>(&m) != nullptr; };
    }

    ToolCallPipeline pipeline;
};

} // namespace pipeline
} // namespace toolhost
