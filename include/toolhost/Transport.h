//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Duplex JSON-RPC channel abstraction the tool host is served over
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <string>

namespace toolhost {

class JSONRPCRequest;
class JSONRPCResponse;
class JSONRPCNotification;

//==========================================================================================================
// ITransport
// Purpose: One persistent session with a single peer. Implementations own framing and threading.
// Notes:
//   The request handler runs once per inbound request and its response is written back by the
//   transport. Requests may be handled concurrently, so inbound notifications (cancellation in
//   particular) are not blocked by a long-running request.
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////

    // Completes once the transport is processing inbound messages.
    virtual std::future<void> Start() = 0;

    // Completes once the transport has stopped; pending outbound requests fail with InternalError.
    virtual std::future<void> Close() = 0;

    virtual bool IsConnected() const = 0;
    virtual std::string GetSessionId() const = 0;

    /////////////////////////////////////////// Message sending ///////////////////////////////////////////

    //==========================================================================================================
    // Sends a request and resolves with the peer's response. A request without an id is assigned one.
    // Transport failures resolve with an error response rather than a broken future.
    //==========================================================================================================
    virtual std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(std::unique_ptr<JSONRPCRequest> request) = 0;

    virtual std::future<void> SendNotification(std::unique_ptr<JSONRPCNotification> notification) = 0;

    /////////////////////////////////////////// Handlers ///////////////////////////////////////////

    using NotificationHandler = std::function<void(std::unique_ptr<JSONRPCNotification>)>;
    using RequestHandler = std::function<std::unique_ptr<JSONRPCResponse>(const JSONRPCRequest&)>;
    using ErrorHandler = std::function<void(const std::string& error)>;

    virtual void SetNotificationHandler(NotificationHandler handler) = 0;
    virtual void SetRequestHandler(RequestHandler handler) = 0;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
};

class ITransportFactory {
public:
    virtual ~ITransportFactory() = default;
    virtual std::unique_ptr<ITransport> CreateTransport(const std::string& config) = 0;
};

} // namespace toolhost
