//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcMessageRouter.h
// Purpose: Classification and dispatch of inbound JSON-RPC payloads
//========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "toolhost/JSONRPCTypes.h"
#include "toolhost/Transport.h"

namespace toolhost {

struct RouterHandlers {
    ITransport::RequestHandler requestHandler;
    ITransport::NotificationHandler notificationHandler;
    ITransport::ErrorHandler errorHandler;
};

// Receives responses to requests this side sent.
using ResponseResolver = std::function<void(JSONRPCResponse&&)>;

class IJsonRpcMessageRouter {
public:
    virtual ~IJsonRpcMessageRouter() = default;

    enum class MessageKind {
        Request,
        Response,
        Notification,
        Unknown
    };

    // Classification looks only at top-level members.
    virtual MessageKind classify(const std::string& json) = 0;

    //========================================================================================================
    // route
    // Purpose: Dispatches one payload. Returns the serialized response to write back for requests and for
    //          payloads that cannot be parsed (ParseError / InvalidRequest with a null id); nullopt otherwise.
    //          A throwing request handler yields an InternalError response.
    //========================================================================================================
    virtual std::optional<std::string> route(const std::string& json,
                                             RouterHandlers& handlers,
                                             const ResponseResolver& resolve) = 0;
};

std::unique_ptr<IJsonRpcMessageRouter> MakeDefaultJsonRpcMessageRouter();

} // namespace toolhost
