//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolCallPipeline.cpp
// Purpose: ToolCallPipeline composition
//==========================================================================================================

#include <algorithm>
#include <stdexcept>
#include "toolhost/pipeline/ToolCallPipeline.h"
#include "logging/Logger.h"

namespace toolhost {
namespace pipeline {

void ToolCallPipeline::Add(std::shared_ptr<ToolCallMiddleware> middleware) {
    if (!middleware) {
        throw std::invalid_argument("ToolCallPipeline::Add: null middleware");
    }
    middlewares.push_back(std::move(middleware));
}

void ToolCallPipeline::InsertAt(size_t index, std::shared_ptr<ToolCallMiddleware> middleware) {
    if (!middleware) {
        throw std::invalid_argument("ToolCallPipeline::InsertAt: null middleware");
    }
    if (index > middlewares.size()) {
        throw std::out_of_range("Index " + std::to_string(index) + " out of range (0-" +
                                std::to_string(middlewares.size()) + ")");
    }
    middlewares.insert(middlewares.begin() + static_cast<std::ptrdiff_t>(index), std::move(middleware));
}

void ToolCallPipeline::RemoveAt(size_t index) {
    if (index >= middlewares.size()) {
        throw std::out_of_range("Index " + std::to_string(index) + " out of range (size " +
                                std::to_string(middlewares.size()) + ")");
    }
    middlewares.erase(middlewares.begin() + static_cast<std::ptrdiff_t>(index));
}

std::optional<size_t> ToolCallPipeline::FindFirstIndex(
    const std::function<bool(const ToolCallMiddleware&)>& predicate) const {
    for (size_t i = 0; i < middlewares.size(); ++i) {
        if (predicate(*middlewares[i])) {
            return i;
        }
    }
    return std::nullopt;
}

size_t ToolCallPipeline::RemoveIf(const std::function<bool(const ToolCallMiddleware&)>& predicate) {
    const size_t before = middlewares.size();
    middlewares.erase(std::remove_if(middlewares.begin(), middlewares.end(),
                                     [&](const std::shared_ptr<ToolCallMiddleware>& m) { return predicate(*m); }),
                      middlewares.end());
    return before - middlewares.size();
}

std::vector<std::shared_ptr<ToolCallMiddleware>> ToolCallPipeline::ExecutionOrder() const {
    std::vector<std::shared_ptr<ToolCallMiddleware>> wrappers;
    std::vector<std::shared_ptr<ToolCallMiddleware>> stages;
    for (const auto& m : middlewares) {
        (m->WrapsChain() ? wrappers : stages).push_back(m);
    }
    std::stable_sort(wrappers.begin(), wrappers.end(),
                     [](const auto& a, const auto& b) { return a->Priority() > b->Priority(); });
    std::stable_sort(stages.begin(), stages.end(),
                     [](const auto& a, const auto& b) { return a->Priority() < b->Priority(); });
    wrappers.insert(wrappers.end(), stages.begin(), stages.end());
    return wrappers;
}

CallToolResult ToolCallPipeline::Execute(const ToolCallContext& context) const {
    auto ordered = ExecutionOrder();

    NextHandler next = [](const ToolCallContext&) -> CallToolResult {
        throw std::logic_error("No middleware to execute");
    };
    // Build from the innermost stage outwards; each closure owns its stage and continuation.
    for (auto it = ordered.rbegin(); it != ordered.rend(); ++it) {
        std::shared_ptr<ToolCallMiddleware> stage = *it;
        NextHandler inner = std::move(next);
        next = [stage, inner](const ToolCallContext& ctx) { return stage->Handle(ctx, inner); };
    }
    LOG_DEBUG("Executing pipeline with {} stage(s) for {}", ordered.size(), context.CorrelationId());
    return next(context);
}

} // namespace pipeline
} // namespace toolhost
