//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Progress.cpp
// Purpose: ProgressNotifier implementation
//==========================================================================================================

#include <algorithm>
#include "toolhost/Progress.h"
#include "logging/Logger.h"

namespace toolhost {

ProgressNotifier::ProgressNotifier(std::optional<JSONValue> progressToken, ProgressSink s)
    : token(std::move(progressToken)), sink(std::move(s)) {}

void ProgressNotifier::Notify(const std::string& message, std::optional<double> fraction) const {
    if (!IsActive()) {
        return;
    }
    JSONValue::Object paramsObj;
    paramsObj["progressToken"] = std::make_shared<JSONValue>(token.value());
    paramsObj["message"] = std::make_shared<JSONValue>(message);
    if (fraction.has_value()) {
        const double clamped = std::clamp(fraction.value(), 0.0, 1.0);
        paramsObj["progress"] = std::make_shared<JSONValue>(clamped * 100.0);
        paramsObj["total"] = std::make_shared<JSONValue>(100.0);
    } else {
        paramsObj["progress"] = std::make_shared<JSONValue>(0.0);
    }
    try {
        sink(JSONValue{paramsObj});
    } catch (const std::exception& e) {
        LOG_WARN("Progress notification dropped: {}", e.what());
    }
}

} // namespace toolhost
