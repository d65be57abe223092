//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolCallContext.cpp
// Purpose: ToolCallContext construction and copy helpers
//==========================================================================================================

#include <atomic>
#include <fmt/format.h>
#include "toolhost/pipeline/ToolCallContext.h"

namespace toolhost {
namespace pipeline {

namespace {
std::atomic<uint64_t> gCorrelationSeq{0};
} // namespace

ToolCallContext::ToolCallContext(ToolCallRequest request, std::string correlationId, Clock::time_point startTime)
    : request(std::move(request)), correlationId(std::move(correlationId)), startTime(startTime) {}

ToolCallContext ToolCallContext::Create(ToolCallRequest request) {
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    // Sequence suffix keeps ids unique within the same microsecond
    std::string id = fmt::format("req_{}_{}_{}", request.name, micros, gCorrelationSeq.fetch_add(1));
    return ToolCallContext(std::move(request), std::move(id), Clock::now());
}

std::chrono::milliseconds ToolCallContext::Elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - startTime);
}

ToolCallContext ToolCallContext::WithTool(std::shared_ptr<const ToolDefinition> definition) const {
    ToolCallContext next(*this);
    next.tool = std::move(definition);
    return next;
}

ToolCallContext ToolCallContext::WithCallResources(std::shared_ptr<CancellationToken> cancelToken,
                                                   std::shared_ptr<ProgressNotifier> notifier,
                                                   std::chrono::milliseconds effectiveTimeout) const {
    ToolCallContext next(*this);
    next.token = std::move(cancelToken);
    next.progress = std::move(notifier);
    next.timeout = effectiveTimeout;
    return next;
}

ToolCallContext ToolCallContext::WithRawResult(JSONValue result) const {
    ToolCallContext next(*this);
    next.rawResult = std::move(result);
    return next;
}

} // namespace pipeline
} // namespace toolhost
