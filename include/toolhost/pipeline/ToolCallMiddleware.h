//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolCallMiddleware.h
// Purpose: Stage contract for the tool-call pipeline
//==========================================================================================================

#pragma once

#include <functional>

#include "toolhost/Protocol.h"
#include "toolhost/pipeline/ToolCallContext.h"

namespace toolhost {
namespace pipeline {

// Continuation for the remainder of the chain.
using NextHandler = std::function<CallToolResult(const ToolCallContext&)>;

//==========================================================================================================
// ToolCallMiddleware
// Purpose: One pipeline stage. Handle either returns a result without calling next (short-circuit) or
//          calls next at most once, optionally with a derived context.
// Notes:
//   Lower Priority() runs earlier. Stages reporting WrapsChain() are hoisted outside all others,
//   highest priority outermost, so a catch-all stage encloses everything regardless of its number.
//==========================================================================================================
class ToolCallMiddleware {
public:
    virtual ~ToolCallMiddleware() = default;

    virtual int Priority() const = 0;
    virtual const char* Name() const = 0;
    virtual bool WrapsChain() const { return false; }

    virtual CallToolResult Handle(const ToolCallContext& context, const NextHandler& next) = 0;
};

} // namespace pipeline
} // namespace toolhost
