//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolCallPipeline.h
// Purpose: Ordered, editable list of middleware composed into a call chain
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "toolhost/pipeline/ToolCallMiddleware.h"

namespace toolhost {
namespace pipeline {

class ToolCallPipeline {
public:
    void Add(std::shared_ptr<ToolCallMiddleware> middleware);

    // Throws std::out_of_range when index > Size().
    void InsertAt(size_t index, std::shared_ptr<ToolCallMiddleware> middleware);

    // Throws std::out_of_range when index >= Size().
    void RemoveAt(size_t index);

    std::optional<size_t> FindFirstIndex(const std::function<bool(const ToolCallMiddleware&)>& predicate) const;

    // Returns the number of removed stages.
    size_t RemoveIf(const std::function<bool(const ToolCallMiddleware&)>& predicate);

    size_t Size() const { return middlewares.size(); }
    const std::vector<std::shared_ptr<ToolCallMiddleware>>& Middlewares() const { return middlewares; }

    // Insertion-order list rearranged into execution order (outermost first).
    std::vector<std::shared_ptr<ToolCallMiddleware>> ExecutionOrder() const;

    //======================================================================================================
    // Execute
    // Purpose: Runs the context through the chain in ExecutionOrder().
    // Throws:
    //   std::logic_error when the innermost stage delegates past the end of the chain. Anything a stage
    //   throws propagates unless a wrapping stage converts it.
    //======================================================================================================
    CallToolResult Execute(const ToolCallContext& context) const;

private:
    std::vector<std::shared_ptr<ToolCallMiddleware>> middlewares;
};

} // namespace pipeline
} // namespace toolhost
