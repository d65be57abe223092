//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.hpp
// Purpose: Linked pair of in-process transports for tests and embedding
//==========================================================================================================

#pragma once

#include <memory>
#include <utility>

#include "toolhost/Transport.h"

namespace toolhost {

//==========================================================================================================
// InMemoryTransport
// Purpose: Each side owns an inbound queue drained by one worker thread. Requests are handed to the
//          request handler on their own thread so notifications keep flowing while a call runs.
// Notes:
//   Destroying a transport waits for its in-flight request handlers.
//==========================================================================================================
class InMemoryTransport : public ITransport {
public:
    InMemoryTransport();
    ~InMemoryTransport() override;

    // Two transports wired to each other; neither processes messages until Start().
    static std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>> CreatePair();

    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;

    std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(std::unique_ptr<JSONRPCRequest> request) override;
    std::future<void> SendNotification(std::unique_ptr<JSONRPCNotification> notification) override;

    void SetNotificationHandler(NotificationHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;
    void SetRequestHandler(RequestHandler handler) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

class InMemoryTransportFactory : public ITransportFactory {
public:
    std::unique_ptr<ITransport> CreateTransport(const std::string& config) override;
};

} // namespace toolhost
