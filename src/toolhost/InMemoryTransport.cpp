//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.cpp
// Purpose: In-memory transport implementation
//==========================================================================================================

#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>

#include "logging/Logger.h"
#include "toolhost/InMemoryTransport.hpp"
#include "toolhost/JSONRPCTypes.h"
#include "toolhost/JsonRpcMessageRouter.h"

namespace toolhost {

namespace {
std::future<void> readyFuture() {
    std::promise<void> p;
    p.set_value();
    return p.get_future();
}

std::atomic<unsigned int> gSessionCounter{0u};
} // namespace

class InMemoryTransport::Impl {
public:
    std::atomic<bool> connected{false};
    std::string sessionId = "memory-" + std::to_string(++gSessionCounter);

    std::mutex handlerMutex;
    RouterHandlers handlers;

    Impl* peer = nullptr;
    std::mutex peerMutex;

    std::deque<std::string> inbox;
    std::mutex inboxMutex;
    std::condition_variable inboxCv;
    std::jthread worker;

    std::mutex requestMutex;
    std::unordered_map<std::string, std::promise<std::unique_ptr<JSONRPCResponse>>> pending;
    std::atomic<unsigned int> requestCounter{0u};

    std::mutex inflightMutex;
    std::condition_variable inflightCv;
    int inflight = 0;

    std::unique_ptr<IJsonRpcMessageRouter> router = MakeDefaultJsonRpcMessageRouter();

    ~Impl() {
        stop();
        {
            std::unique_lock<std::mutex> lk(inflightMutex);
            inflightCv.wait(lk, [this] { return inflight == 0; });
        }
        std::lock_guard<std::mutex> lk(peerMutex);
        if (peer) {
            std::lock_guard<std::mutex> peerLk(peer->peerMutex);
            peer->peer = nullptr;
        }
    }

    void start() {
        connected = true;
        worker = std::jthread([this](std::stop_token st) { drain(st); });
    }

    void stop() {
        connected = false;
        if (worker.joinable()) {
            worker.request_stop();
            inboxCv.notify_all();
            worker.join();
        }
        failPending("Transport closed");
    }

    void drain(std::stop_token st) {
        std::unique_lock<std::mutex> lk(inboxMutex);
        while (!st.stop_requested()) {
            inboxCv.wait(lk, [&] { return !inbox.empty() || st.stop_requested(); });
            while (!inbox.empty() && !st.stop_requested()) {
                std::string message = std::move(inbox.front());
                inbox.pop_front();
                lk.unlock();
                process(message);
                lk.lock();
            }
        }
    }

    void process(const std::string& message) {
        LOG_DEBUG("InMemoryTransport {} received: {}", sessionId, message);
        if (router->classify(message) == IJsonRpcMessageRouter::MessageKind::Request) {
            {
                std::lock_guard<std::mutex> lk(inflightMutex);
                ++inflight;
            }
            std::thread([this, message]() {
                routeAndReply(message);
                std::lock_guard<std::mutex> lk(inflightMutex);
                --inflight;
                inflightCv.notify_all();
            }).detach();
            return;
        }
        routeAndReply(message);
    }

    void routeAndReply(const std::string& message) {
        RouterHandlers snapshot;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            snapshot = handlers;
        }
        auto reply = router->route(message, snapshot, [this](JSONRPCResponse&& r) { resolve(std::move(r)); });
        if (reply) {
            sendToPeer(*reply);
        }
    }

    void resolve(JSONRPCResponse&& response) {
        const std::string key = IdToString(response.id);
        std::lock_guard<std::mutex> lk(requestMutex);
        auto it = pending.find(key);
        if (it == pending.end()) {
            LOG_DEBUG("InMemoryTransport: no pending request for id {}", key);
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

    void enqueue(std::string message) {
        {
            std::lock_guard<std::mutex> lk(inboxMutex);
            inbox.push_back(std::move(message));
        }
        inboxCv.notify_one();
    }

    bool sendToPeer(const std::string& message) {
        std::lock_guard<std::mutex> lk(peerMutex);
        if (!peer || !peer->connected.load()) {
            LOG_WARN("InMemoryTransport {}: peer not connected; dropping message", sessionId);
            return false;
        }
        peer->enqueue(message);
        return true;
    }
};

InMemoryTransport::InMemoryTransport() : pImpl(std::make_unique<Impl>()) {}
InMemoryTransport::~InMemoryTransport() = default;

std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>> InMemoryTransport::CreatePair() {
    auto a = std::make_unique<InMemoryTransport>();
    auto b = std::make_unique<InMemoryTransport>();
    a->pImpl->peer = b->pImpl.get();
    b->pImpl->peer = a->pImpl.get();
    return {std::move(a), std::move(b)};
}

std::future<void> InMemoryTransport::Start() {
    LOG_INFO("Starting InMemoryTransport {}", pImpl->sessionId);
    if (!pImpl->connected) {
        pImpl->start();
    }
    return readyFuture();
}

std::future<void> InMemoryTransport::Close() {
    LOG_INFO("Closing InMemoryTransport {}", pImpl->sessionId);
    pImpl->stop();
    return readyFuture();
}

bool InMemoryTransport::IsConnected() const { return pImpl->connected; }
std::string InMemoryTransport::GetSessionId() const { return pImpl->sessionId; }

std::future<std::unique_ptr<JSONRPCResponse>> InMemoryTransport::SendRequest(std::unique_ptr<JSONRPCRequest> request) {
    std::string key;
    if (auto* s = std::get_if<std::string>(&request->id); s && !s->empty()) {
        key = *s;
    } else if (auto* i = std::get_if<int64_t>(&request->id)) {
        key = std::to_string(*i);
    } else {
        key = "mem-req-" + std::to_string(++pImpl->requestCounter);
        request->id = key;
    }

    std::promise<std::unique_ptr<JSONRPCResponse>> promise;
    auto future = promise.get_future();
    {
        std::lock_guard<std::mutex> lk(pImpl->requestMutex);
        pImpl->pending[key] = std::move(promise);
    }
    if (!pImpl->sendToPeer(request->Serialize())) {
        std::lock_guard<std::mutex> lk(pImpl->requestMutex);
        auto it = pImpl->pending.find(key);
        if (it != pImpl->pending.end()) {
            it->second.set_value(CreateErrorResponse(request->id, JSONRPCErrorCodes::InternalError, "Peer not connected"));
            pImpl->pending.erase(it);
        }
    }
    return future;
}

std::future<void> InMemoryTransport::SendNotification(std::unique_ptr<JSONRPCNotification> notification) {
    if (!pImpl->sendToPeer(notification->Serialize())) {
        ErrorHandler onError;
        {
            std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
            onError = pImpl->handlers.errorHandler;
        }
        if (onError) onError("Peer not connected");
    }
    return readyFuture();
}

void InMemoryTransport::SetNotificationHandler(NotificationHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->handlers.notificationHandler = std::move(handler);
}

void InMemoryTransport::SetErrorHandler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->handlers.errorHandler = std::move(handler);
}

void InMemoryTransport::SetRequestHandler(RequestHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->handlers.requestHandler = std::move(handler);
}

std::unique_ptr<ITransport> InMemoryTransportFactory::CreateTransport(const std::string& /*config*/) {
    return std::make_unique<InMemoryTransport>();
}

} // namespace toolhost
