//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcMessageRouter.cpp
// Purpose: Default JSON-RPC message router
//========================================================================================================

#include "logging/Logger.h"
#include "toolhost/JsonRpcMessageRouter.h"

namespace toolhost {

namespace {

IJsonRpcMessageRouter::MessageKind classifyValue(const JSONValue& v) {
    using Kind = IJsonRpcMessageRouter::MessageKind;
    if (!v.IsObject()) {
        return Kind::Unknown;
    }
    const bool hasMethod = GetString(v, "method").has_value();
    if (hasMethod) {
        return FindMember(v, "id") ? Kind::Request : Kind::Notification;
    }
    if (FindMember(v, "result") || FindMember(v, "error")) {
        return Kind::Response;
    }
    return Kind::Unknown;
}

std::string errorPayload(const JSONRPCId& id, int code, const std::string& message) {
    return CreateErrorResponse(id, code, message, std::nullopt)->Serialize();
}

class JsonRpcMessageRouter : public IJsonRpcMessageRouter {
public:
    MessageKind classify(const std::string& json) override {
        try {
            return classifyValue(ParseJSON(json));
        } catch (const std::exception&) {
            return MessageKind::Unknown;
        }
    }

    std::optional<std::string> route(const std::string& json,
                                     RouterHandlers& handlers,
                                     const ResponseResolver& resolve) override {
        MessageKind kind = MessageKind::Unknown;
        try {
            kind = classifyValue(ParseJSON(json));
        } catch (const std::exception& e) {
            LOG_WARN("Router: parse error: {}", e.what());
            if (handlers.errorHandler) handlers.errorHandler(std::string("Parse error: ") + e.what());
            return errorPayload(nullptr, JSONRPCErrorCodes::ParseError, "Parse error");
        }

        switch (kind) {
            case MessageKind::Response: {
                JSONRPCResponse response;
                if (response.Deserialize(json)) {
                    resolve(std::move(response));
                    return std::nullopt;
                }
                break;
            }
            case MessageKind::Request: {
                JSONRPCRequest request;
                if (!request.Deserialize(json)) {
                    break;
                }
                if (!handlers.requestHandler) {
                    return errorPayload(request.id, JSONRPCErrorCodes::MethodNotFound,
                                        "No request handler: " + request.method);
                }
                try {
                    auto resp = handlers.requestHandler(request);
                    if (!resp) {
                        return errorPayload(request.id, JSONRPCErrorCodes::InternalError, "Null response from handler");
                    }
                    resp->id = request.id;
                    return resp->Serialize();
                } catch (const std::exception& e) {
                    LOG_ERROR("Request handler exception for {}: {}", request.method, e.what());
                    return errorPayload(request.id, JSONRPCErrorCodes::InternalError, e.what());
                }
            }
            case MessageKind::Notification: {
                JSONRPCNotification notification;
                if (notification.Deserialize(json)) {
                    if (handlers.notificationHandler) {
                        handlers.notificationHandler(std::make_unique<JSONRPCNotification>(std::move(notification)));
                    }
                    return std::nullopt;
                }
                break;
            }
            case MessageKind::Unknown:
                break;
        }

        LOG_WARN("Router: unrecognized JSON-RPC message: {}", json);
        if (handlers.errorHandler) {
            handlers.errorHandler("Unrecognized JSON-RPC message");
        }
        return errorPayload(nullptr, JSONRPCErrorCodes::InvalidRequest, "Invalid Request");
    }
};

} // namespace

std::unique_ptr<IJsonRpcMessageRouter> MakeDefaultJsonRpcMessageRouter() {
    return std::make_unique<JsonRpcMessageRouter>();
}

} // namespace toolhost
