//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.cpp
// Purpose: Stdio transport implementation
//==========================================================================================================

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <mutex>
#include <stop_token>
#include <thread>
#include <unordered_map>

#include <poll.h>
#include <unistd.h>

#include "logging/Logger.h"
#include "toolhost/ContentFramer.h"
#include "toolhost/JSONRPCTypes.h"
#include "toolhost/JsonRpcMessageRouter.h"
#include "toolhost/StdioTransport.hpp"

namespace toolhost {

namespace {
constexpr int kPollIntervalMs = 100;

std::future<void> readyFuture() {
    std::promise<void> p;
    p.set_value();
    return p.get_future();
}
} // namespace

class StdioTransport::Impl {
public:
    int inFd;
    int outFd;
    std::unique_ptr<IContentFramer> framer;
    std::unique_ptr<IJsonRpcMessageRouter> router = MakeDefaultJsonRpcMessageRouter();
    std::string sessionId = "stdio-" + std::to_string(::getpid());

    std::atomic<bool> connected{false};
    std::jthread reader;
    std::size_t pendingDiscard = 0;

    std::mutex handlerMutex;
    RouterHandlers handlers;

    std::mutex writeMutex;

    std::mutex requestMutex;
    std::unordered_map<std::string, std::promise<std::unique_ptr<JSONRPCResponse>>> pending;
    std::atomic<unsigned int> requestCounter{0u};

    std::mutex inflightMutex;
    std::condition_variable inflightCv;
    int inflight = 0;

    Impl(int in, int out, std::size_t maxContentLength)
        : inFd(in), outFd(out), framer(MakeContentLengthFramer(maxContentLength)) {}

    ~Impl() {
        stop();
        std::unique_lock<std::mutex> lk(inflightMutex);
        inflightCv.wait(lk, [this] { return inflight == 0; });
    }

    void stop() {
        connected = false;
        if (reader.joinable()) {
            reader.request_stop();
            if (reader.get_id() != std::this_thread::get_id()) {
                reader.join();
            }
        }
        failPending("Transport closed");
    }

    void reportError(const std::string& error) {
        LOG_ERROR("StdioTransport: {}", error);
        ErrorHandler cb;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            cb = handlers.errorHandler;
        }
        if (cb) cb(error);
    }

    void readLoop(std::stop_token st) {
        std::string buffer;
        std::array<char, 4096> chunk{};
        while (!st.stop_requested()) {
            pollfd pfd{inFd, POLLIN, 0};
            int rc = ::poll(&pfd, 1, kPollIntervalMs);
            if (rc < 0) {
                if (errno == EINTR) continue;
                reportError(std::string("poll failed: ") + std::strerror(errno));
                break;
            }
            if (rc == 0) continue;
            ssize_t n = ::read(inFd, chunk.data(), chunk.size());
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) continue;
                reportError(std::string("read failed: ") + std::strerror(errno));
                break;
            }
            if (n == 0) {
                LOG_INFO("StdioTransport: input closed");
                connected = false;
                reportError("EOF on input");
                break;
            }
            buffer.append(chunk.data(), static_cast<std::size_t>(n));
            drainFrames(buffer);
        }
        connected = false;
        failPending("Transport closed");
    }

    void drainFrames(std::string& buffer) {
        for (;;) {
            if (pendingDiscard > 0) {
                const std::size_t drop = std::min(pendingDiscard, buffer.size());
                buffer.erase(0, drop);
                pendingDiscard -= drop;
                if (pendingDiscard > 0) return;
            }
            auto r = framer->tryDecodeEx(buffer);
            switch (r.status) {
                case IContentFramer::DecodeStatus::Incomplete:
                    return;
                case IContentFramer::DecodeStatus::Ok:
                    buffer.erase(0, r.bytesConsumed);
                    dispatch(*r.payload);
                    break;
                case IContentFramer::DecodeStatus::InvalidHeader:
                case IContentFramer::DecodeStatus::BodyTooLarge:
                    reportError(r.status == IContentFramer::DecodeStatus::BodyTooLarge ? "Frame exceeds maximum size"
                                                                                        : "Invalid frame header");
                    if (r.bytesConsumed > buffer.size()) {
                        pendingDiscard = r.bytesConsumed - buffer.size();
                        buffer.clear();
                    } else {
                        buffer.erase(0, r.bytesConsumed);
                    }
                    break;
            }
        }
    }

    void dispatch(const std::string& payload) {
        if (router->classify(payload) != IJsonRpcMessageRouter::MessageKind::Request) {
            routeAndReply(payload);
            return;
        }
        {
            std::lock_guard<std::mutex> lk(inflightMutex);
            ++inflight;
        }
        std::thread([this, payload]() {
            routeAndReply(payload);
            std::lock_guard<std::mutex> lk(inflightMutex);
            --inflight;
            inflightCv.notify_all();
        }).detach();
    }

    void routeAndReply(const std::string& payload) {
        RouterHandlers snapshot;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            snapshot = handlers;
        }
        auto reply = router->route(payload, snapshot, [this](JSONRPCResponse&& r) { resolve(std::move(r)); });
        if (reply && !writeFrame(*reply)) {
            reportError("Failed to write response");
        }
    }

    void resolve(JSONRPCResponse&& response) {
        const std::string key = IdToString(response.id);
        std::lock_guard<std::mutex> lk(requestMutex);
        auto it = pending.find(key);
        if (it == pending.end()) {
            LOG_DEBUG("StdioTransport: no pending request for id {}", key);
            return;
        }
        it->second.set_value(std::make_unique<JSONRPCResponse>(std::move(response)));
        pending.erase(it);
    }

    void failPending(const std::string& reason) {
        std::lock_guard<std::mutex> lk(requestMutex);
        for (auto& [id, promise] : pending) {
            promise.set_value(CreateErrorResponse(JSONRPCId{id}, JSONRPCErrorCodes::InternalError, reason));
        }
        pending.clear();
    }

    bool writeFrame(const std::string& payload) {
        const std::string frame = framer->encode(payload);
        std::lock_guard<std::mutex> lk(writeMutex);
        std::size_t off = 0;
        while (off < frame.size()) {
            ssize_t n = ::write(outFd, frame.data() + off, frame.size() - off);
            if (n < 0) {
                if (errno == EINTR) continue;
                return false;
            }
            off += static_cast<std::size_t>(n);
        }
        return true;
    }
};

StdioTransport::StdioTransport() : StdioTransport(STDIN_FILENO, STDOUT_FILENO) {}

StdioTransport::StdioTransport(int inputFd, int outputFd, std::size_t maxContentLength)
    : pImpl(std::make_unique<Impl>(inputFd, outputFd, maxContentLength)) {}

StdioTransport::~StdioTransport() = default;

std::future<void> StdioTransport::Start() {
    if (!pImpl->connected.exchange(true)) {
        LOG_INFO("Starting StdioTransport {}", pImpl->sessionId);
        pImpl->reader = std::jthread([impl = pImpl.get()](std::stop_token st) { impl->readLoop(st); });
    }
    return readyFuture();
}

std::future<void> StdioTransport::Close() {
    LOG_INFO("Closing StdioTransport {}", pImpl->sessionId);
    pImpl->stop();
    return readyFuture();
}

bool StdioTransport::IsConnected() const { return pImpl->connected; }
std::string StdioTransport::GetSessionId() const { return pImpl->sessionId; }

std::future<std::unique_ptr<JSONRPCResponse>> StdioTransport::SendRequest(std::unique_ptr<JSONRPCRequest> request) {
    if (std::holds_alternative<std::nullptr_t>(request->id) ||
        (std::holds_alternative<std::string>(request->id) && std::get<std::string>(request->id).empty())) {
        request->id = "stdio-req-" + std::to_string(++pImpl->requestCounter);
    }
    const std::string key = IdToString(request->id);
    std::promise<std::unique_ptr<JSONRPCResponse>> promise;
    auto future = promise.get_future();
    {
        std::lock_guard<std::mutex> lk(pImpl->requestMutex);
        pImpl->pending[key] = std::move(promise);
    }
    if (!pImpl->connected || !pImpl->writeFrame(request->Serialize())) {
        std::lock_guard<std::mutex> lk(pImpl->requestMutex);
        auto it = pImpl->pending.find(key);
        if (it != pImpl->pending.end()) {
            it->second.set_value(CreateErrorResponse(request->id, JSONRPCErrorCodes::InternalError, "Write failed"));
            pImpl->pending.erase(it);
        }
    }
    return future;
}

std::future<void> StdioTransport::SendNotification(std::unique_ptr<JSONRPCNotification> notification) {
    if (!pImpl->writeFrame(notification->Serialize())) {
        pImpl->reportError("Failed to write notification " + notification->method);
    }
    return readyFuture();
}

void StdioTransport::SetNotificationHandler(NotificationHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->handlers.notificationHandler = std::move(handler);
}

void StdioTransport::SetRequestHandler(RequestHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->handlers.requestHandler = std::move(handler);
}

void StdioTransport::SetErrorHandler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->handlers.errorHandler = std::move(handler);
}

std::unique_ptr<ITransport> StdioTransportFactory::CreateTransport(const std::string& /*config*/) {
    return std::make_unique<StdioTransport>();
}

void StdioTransportTestHooks::drainFrames(StdioTransport& t, std::string& buffer) {
    t.pImpl->drainFrames(buffer);
}

} // namespace toolhost
