//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.hpp
// Purpose: Content-Length framed JSON-RPC over a pair of file descriptors (stdin/stdout by default)
//==========================================================================================================

#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "toolhost/Transport.h"

namespace toolhost {

//==========================================================================================================
// StdioTransport
// Purpose: A reader thread polls the input descriptor, decodes frames and routes them; requests are
//          handled on their own threads. Writes are serialized under a mutex.
// Notes:
//   End of input disconnects the transport and fails pending outbound requests. Oversized frames are
//   skipped and reported through the error handler.
//==========================================================================================================
class StdioTransport : public ITransport {
public:
    StdioTransport();
    StdioTransport(int inputFd, int outputFd, std::size_t maxContentLength = 2 * 1024 * 1024);
    ~StdioTransport() override;

    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;

    std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(std::unique_ptr<JSONRPCRequest> request) override;
    std::future<void> SendNotification(std::unique_ptr<JSONRPCNotification> notification) override;

    void SetNotificationHandler(NotificationHandler handler) override;
    void SetRequestHandler(RequestHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
    friend struct StdioTransportTestHooks;
};

class StdioTransportFactory : public ITransportFactory {
public:
    std::unique_ptr<ITransport> CreateTransport(const std::string& config) override;
};

// Test access to frame draining without a reader thread.
struct StdioTransportTestHooks {
    static void drainFrames(StdioTransport& t, std::string& buffer);
};

} // namespace toolhost
