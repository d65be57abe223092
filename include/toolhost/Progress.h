//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Progress.h
// Purpose: Out-of-band progress emitter bound to a client-supplied progress token
//==========================================================================================================

#pragma once

#include <functional>
#include <optional>
#include <string>

#include "toolhost/JSONRPCTypes.h"

namespace toolhost {

// Delivers a notifications/progress params object to the client. Supplied by the server.
using ProgressSink = std::function<void(const JSONValue& params)>;

//==========================================================================================================
// ProgressNotifier
// Purpose: Emits { progressToken, progress, total?, message } through the sink.
// Notes:
//   Without a progress token or sink it is a silent no-op. Notify never throws; sink failures are
//   logged and dropped.
//==========================================================================================================
class ProgressNotifier {
public:
    ProgressNotifier() = default;
    ProgressNotifier(std::optional<JSONValue> progressToken, ProgressSink sink);

    // fraction is clamped to [0, 1] and reported as a percentage with total 100.
    void Notify(const std::string& message, std::optional<double> fraction = std::nullopt) const;

    bool IsActive() const { return token.has_value() && static_cast<bool>(sink); }

private:
    std::optional<JSONValue> token;
    ProgressSink sink;
};

} // namespace toolhost
