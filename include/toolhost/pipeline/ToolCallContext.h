//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolCallContext.h
// Purpose: Per-invocation request and immutable context threaded through the tool-call pipeline
//==========================================================================================================

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "toolhost/Cancellation.h"
#include "toolhost/JSONRPCTypes.h"
#include "toolhost/Progress.h"
#include "toolhost/ToolRegistry.h"

namespace toolhost {
namespace pipeline {

// Inbound tool invocation. `requestId` links the call to notifications/cancelled.
struct ToolCallRequest {
    std::string name;
    JSONValue arguments{JSONValue::Object{}};
    std::optional<JSONValue> progressToken;
    std::optional<std::string> requestId;
};

//==========================================================================================================
// ToolCallContext
// Purpose: Copy-on-write record for one tool call. Stages never modify a context they received; the
//          With* helpers return a new value with the named fields replaced.
// Fields:
//   request:        original request
//   correlationId:  opaque id tying together every log line of the call
//   startTime:      steady clock time at creation
//   tool:           resolved definition (set by validation)
//   token/progress/timeout: call resources (set by setup)
//   rawResult:      handler return value (set by execution)
//==========================================================================================================
class ToolCallContext {
public:
    using Clock = std::chrono::steady_clock;

    ToolCallContext(ToolCallRequest request, std::string correlationId, Clock::time_point startTime);

    // New context with a generated correlation id and the current time.
    static ToolCallContext Create(ToolCallRequest request);

    const ToolCallRequest& Request() const { return request; }
    const std::string& ToolName() const { return request.name; }
    const std::string& CorrelationId() const { return correlationId; }
    Clock::time_point StartTime() const { return startTime; }
    std::chrono::milliseconds Elapsed() const;

    const std::shared_ptr<const ToolDefinition>& Tool() const { return tool; }
    const std::shared_ptr<CancellationToken>& Token() const { return token; }
    const std::shared_ptr<ProgressNotifier>& Progress() const { return progress; }
    const std::optional<std::chrono::milliseconds>& Timeout() const { return timeout; }
    const std::optional<JSONValue>& RawResult() const { return rawResult; }

    ToolCallContext WithTool(std::shared_ptr<const ToolDefinition> definition) const;
    ToolCallContext WithCallResources(std::shared_ptr<CancellationToken> cancelToken,
                                      std::shared_ptr<ProgressNotifier> notifier,
                                      std::chrono::milliseconds effectiveTimeout) const;
    ToolCallContext WithRawResult(JSONValue result) const;

private:
    ToolCallRequest request;
    std::string correlationId;
    Clock::time_point startTime;
    std::shared_ptr<const ToolDefinition> tool;
    std::shared_ptr<CancellationToken> token;
    std::shared_ptr<ProgressNotifier> progress;
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<JSONValue> rawResult;
};

} // namespace pipeline
} // namespace toolhost
