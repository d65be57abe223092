//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.cpp
// Purpose: Tool host server implementation
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "logging/Logger.h"
#include "toolhost/JSONRPCTypes.h"
#include "toolhost/Server.h"
#include "toolhost/async/FutureAwaitable.h"
#include "toolhost/async/Task.h"
#include "toolhost/errors/Errors.h"

namespace toolhost {

namespace {

std::future<void> readyFuture() {
    std::promise<void> p;
    p.set_value();
    return p.get_future();
}

// Thrown by param parsing; turned into an InvalidParams response by the dispatcher.
class InvalidParams : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

const JSONValue& paramsOf(const JSONRPCRequest& req) {
    static const JSONValue empty{JSONValue::Object{}};
    if (!req.params.has_value()) {
        return empty;
    }
    if (!req.params->IsObject()) {
        throw InvalidParams("params must be an object");
    }
    return req.params.value();
}

std::string requireString(const JSONValue& params, const std::string& key) {
    auto v = GetString(params, key);
    if (!v.has_value() || v->empty()) {
        throw InvalidParams("Missing required string parameter: " + key);
    }
    return *v;
}

std::optional<size_t> optionalCount(const JSONValue& params, const std::string& key) {
    const JSONValue* member = FindMember(params, key);
    if (!member || member->IsNull()) {
        return std::nullopt;
    }
    if (auto* s = std::get_if<std::string>(&member->value)) {
        // Cursors travel as strings
        try {
            long long n = std::stoll(*s);
            if (n >= 0) return static_cast<size_t>(n);
        } catch (const std::exception&) {
        }
        throw InvalidParams("Invalid " + key + ": " + *s);
    }
    auto n = GetInt(params, key);
    if (!n.has_value() || *n < 0) {
        throw InvalidParams("Parameter " + key + " must be a non-negative integer");
    }
    return static_cast<size_t>(*n);
}

// Request ids, progress tokens and cancellation targets may be strings or integers.
std::optional<std::string> idLikeToString(const JSONValue* v) {
    if (!v) return std::nullopt;
    if (auto* s = std::get_if<std::string>(&v->value)) return *s;
    if (auto* i = std::get_if<int64_t>(&v->value)) return std::to_string(*i);
    return std::nullopt;
}

struct Paging {
    size_t start{0};
    std::optional<size_t> limit;
};

Paging parsePaging(const JSONValue& params) {
    Paging p;
    p.start = optionalCount(params, "cursor").value_or(0);
    auto limit = optionalCount(params, "limit");
    if (limit && *limit > 0) p.limit = limit;
    return p;
}

template <typename T, typename ToJson>
JSONValue pagedList(const std::vector<T>& all, const Paging& paging, const std::string& key, ToJson toJson) {
    JSONValue::Array arr;
    size_t end = all.size();
    if (paging.limit && paging.start < all.size()) {
        end = std::min(all.size(), paging.start + std::min(*paging.limit, all.size() - paging.start));
    }
    for (size_t i = paging.start; i < end; ++i) {
        arr.push_back(std::make_shared<JSONValue>(toJson(all[i])));
    }
    JSONValue::Object obj;
    obj[key] = std::make_shared<JSONValue>(std::move(arr));
    if (paging.limit && end < all.size()) {
        obj["nextCursor"] = std::make_shared<JSONValue>(std::to_string(end));
    }
    return JSONValue{obj};
}

} // namespace

class Server::Impl {
public:
    Implementation serverInfo;
    config::ServerConfig config;
    ServerComponents components;
    pipeline::ToolCallPipeline pipeline;
    ServerCapabilities capabilities;

    mutable std::mutex transportMutex;
    std::unique_ptr<ITransport> transport;
    std::atomic<bool> running{false};
    std::atomic<bool> initialized{false};

    std::mutex errorMutex;
    ErrorHandler errorCallback;

    std::mutex backgroundMutex;
    std::vector<std::jthread> background;

    Impl(Implementation info, config::ServerConfig cfg, ServerComponents comps, const PipelineFactoryFn& factory)
        : serverInfo(std::move(info)), config(std::move(cfg)), components(std::move(comps)) {
        if (!components.tools || !components.resources || !components.prompts || !components.logStore ||
            !components.sizeValidator || !components.concurrencyLimiter || !components.cancellations) {
            throw std::invalid_argument("ServerComponents must be fully populated");
        }
        if (!factory) {
            throw std::invalid_argument("Pipeline factory must be set");
        }
        pipeline::PipelineDependencies deps;
        deps.toolRegistry = components.tools;
        deps.sizeValidator = components.sizeValidator;
        deps.concurrencyLimiter = components.concurrencyLimiter;
        deps.cancellationRegistry = components.cancellations;
        deps.progressSink = [this](const JSONValue& params) { sendNow(Methods::Progress, params); };
        deps.timeouts = config.timeouts;
        deps.validationMode = config.validationMode;
        pipeline = factory(deps);

        capabilities.tools = ToolsCapability{true};
        capabilities.resources = ResourcesCapability{false, true};
        capabilities.prompts = PromptsCapability{true};
        capabilities.logging = LoggingCapability{};
    }

    ~Impl() {
        std::lock_guard<std::mutex> lk(backgroundMutex);
        background.clear(); // joins
    }

    async::Task<void> coStart(std::unique_ptr<ITransport> t);
    async::Task<void> coStop();
    async::Task<CallToolResult> coCallTool(pipeline::ToolCallRequest request);
    async::Task<void> coSendNotification(std::string method, JSONValue params);

    std::unique_ptr<JSONRPCResponse> dispatchRequest(const JSONRPCRequest& req);
    void handleNotification(const JSONRPCNotification& notification);

    std::unique_ptr<JSONRPCResponse> handleInitialize(const JSONRPCRequest& req);
    std::unique_ptr<JSONRPCResponse> handleToolsList(const JSONRPCRequest& req);
    std::unique_ptr<JSONRPCResponse> handleToolsCall(const JSONRPCRequest& req);
    std::unique_ptr<JSONRPCResponse> handleResourcesList(const JSONRPCRequest& req);
    std::unique_ptr<JSONRPCResponse> handleResourcesRead(const JSONRPCRequest& req);
    std::unique_ptr<JSONRPCResponse> handlePromptsList(const JSONRPCRequest& req);
    std::unique_ptr<JSONRPCResponse> handlePromptsGet(const JSONRPCRequest& req);

    void sendListChangedAsync();
    std::future<void> sendNow(const std::string& method, const JSONValue& params);
    void reportError(const std::string& error);
};

//============================ Impl coroutine helper definitions ============================
async::Task<void> Server::Impl::coStart(std::unique_ptr<ITransport> t) {
    FUNC_SCOPE();
    ITransport* raw = nullptr;
    {
        std::lock_guard<std::mutex> lk(transportMutex);
        transport = std::move(t);
        raw = transport.get();
    }
    raw->SetNotificationHandler([this](std::unique_ptr<JSONRPCNotification> n) {
        if (n) handleNotification(*n);
    });
    raw->SetErrorHandler([this](const std::string& err) { reportError(err); });
    raw->SetRequestHandler([this](const JSONRPCRequest& req) { return dispatchRequest(req); });

    co_await async::makeFutureAwaitable(raw->Start());
    running = true;
    LOG_INFO("Server {} {} started on session {}", serverInfo.name, serverInfo.version, raw->GetSessionId());
    co_return;
}

async::Task<void> Server::Impl::coStop() {
    FUNC_SCOPE();
    running = false;
    initialized = false;
    std::future<void> closed;
    {
        std::lock_guard<std::mutex> lk(transportMutex);
        if (!transport) {
            co_return;
        }
        closed = transport->Close();
    }
    co_await async::makeFutureAwaitable(std::move(closed));
    LOG_INFO("Server {} stopped", serverInfo.name);
    co_return;
}

async::Task<CallToolResult> Server::Impl::coCallTool(pipeline::ToolCallRequest request) {
    auto run = std::async(std::launch::async, [this, request]() {
        return pipeline.Execute(pipeline::ToolCallContext::Create(request));
    });
    CallToolResult result = co_await async::makeFutureAwaitable(std::move(run));
    co_return result;
}

async::Task<void> Server::Impl::coSendNotification(std::string method, JSONValue params) {
    co_await async::makeFutureAwaitable(sendNow(method, params));
    co_return;
}

//================================ Helper method definitions =================================
std::future<void> Server::Impl::sendNow(const std::string& method, const JSONValue& params) {
    std::lock_guard<std::mutex> lk(transportMutex);
    if (!transport || !transport->IsConnected()) {
        LOG_DEBUG("Dropping {} notification; transport not connected", method);
        return readyFuture();
    }
    return transport->SendNotification(std::make_unique<JSONRPCNotification>(method, params));
}

void Server::Impl::reportError(const std::string& error) {
    LOG_ERROR("Transport error: {}", error);
    ErrorHandler cb;
    {
        std::lock_guard<std::mutex> lk(errorMutex);
        cb = errorCallback;
    }
    if (cb) {
        try {
            cb(error);
        } catch (const std::exception& e) {
            LOG_ERROR("Server error callback exception: {}", e.what());
        }
    }
}

void Server::Impl::sendListChangedAsync() {
    std::lock_guard<std::mutex> lk(backgroundMutex);
    background.emplace_back([this]() {
        const JSONValue empty{JSONValue::Object{}};
        for (const char* method : {Methods::ToolListChanged, Methods::ResourceListChanged, Methods::PromptListChanged}) {
            try {
                sendNow(method, empty).get();
            } catch (const std::exception& e) {
                LOG_ERROR("Sending {} failed: {}", method, e.what());
            }
        }
    });
}

std::unique_ptr<JSONRPCResponse> Server::Impl::dispatchRequest(const JSONRPCRequest& req) {
    LOG_DEBUG("Dispatching {} (id={})", req.method, IdToString(req.id));
    try {
        if (req.method == Methods::Initialize) {
            auto resp = handleInitialize(req);
            sendListChangedAsync();
            return resp;
        } else if (req.method == Methods::Ping) {
            return std::make_unique<JSONRPCResponse>(req.id, JSONValue{JSONValue::Object{}});
        } else if (req.method == Methods::ListTools) {
            return handleToolsList(req);
        } else if (req.method == Methods::CallTool) {
            return handleToolsCall(req);
        } else if (req.method == Methods::ListResources) {
            return handleResourcesList(req);
        } else if (req.method == Methods::ReadResource) {
            return handleResourcesRead(req);
        } else if (req.method == Methods::ListPrompts) {
            return handlePromptsList(req);
        } else if (req.method == Methods::GetPrompt) {
            return handlePromptsGet(req);
        }
        return CreateErrorResponse(req.id, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + req.method);
    } catch (const InvalidParams& e) {
        LOG_WARN("Invalid params for {}: {}", req.method, e.what());
        return CreateErrorResponse(req.id, JSONRPCErrorCodes::InvalidParams, e.what());
    } catch (const errors::ToolHostError& e) {
        LOG_WARN("{} failed ({}): {}", req.method, errors::toString(e.Kind()), e.what());
        return errors::makeErrorResponse(req.id, errors::toRpcError(e));
    } catch (const std::exception& e) {
        LOG_ERROR("{} failed: {}", req.method, e.what());
        return CreateErrorResponse(req.id, JSONRPCErrorCodes::InternalError, e.what());
    } catch (...) {
        LOG_ERROR("{} failed: unknown exception", req.method);
        return CreateErrorResponse(req.id, JSONRPCErrorCodes::InternalError, "Internal error");
    }
}

void Server::Impl::handleNotification(const JSONRPCNotification& notification) {
    LOG_DEBUG("Received notification: {}", notification.method);
    if (notification.method == Methods::Initialized) {
        initialized = true;
        LOG_INFO("Client completed initialization");
    } else if (notification.method == Methods::Cancelled) {
        std::optional<std::string> id;
        if (notification.params.has_value()) {
            id = idLikeToString(FindMember(notification.params.value(), "requestId"));
        }
        if (!id) {
            LOG_WARN("Cancellation notification missing requestId");
            return;
        }
        components.cancellations->Cancel(*id);
        LOG_INFO("Cancellation received for id={}", *id);
    } else {
        LOG_DEBUG("Ignoring notification: {}", notification.method);
    }
}

std::unique_ptr<JSONRPCResponse> Server::Impl::handleInitialize(const JSONRPCRequest& req) {
    const JSONValue& params = paramsOf(req);
    std::string requested = GetString(params, "protocolVersion").value_or(PROTOCOL_VERSION);
    if (requested != PROTOCOL_VERSION) {
        LOG_INFO("Client requested protocol {}; answering with {}", requested, PROTOCOL_VERSION);
    }
    JSONValue result = MakeObject({
        {"protocolVersion", JSONValue(PROTOCOL_VERSION)},
        {"capabilities", capabilities.ToJSON()},
        {"serverInfo", MakeObject({{"name", JSONValue(serverInfo.name)}, {"version", JSONValue(serverInfo.version)}})}
    });
    return std::make_unique<JSONRPCResponse>(req.id, std::move(result));
}

std::unique_ptr<JSONRPCResponse> Server::Impl::handleToolsList(const JSONRPCRequest& req) {
    auto tools = components.tools->List();
    JSONValue result = pagedList(tools, parsePaging(paramsOf(req)), "tools",
                                 [](const ToolMetadata& m) { return m.ToJSON(); });
    return std::make_unique<JSONRPCResponse>(req.id, std::move(result));
}

std::unique_ptr<JSONRPCResponse> Server::Impl::handleToolsCall(const JSONRPCRequest& req) {
    const JSONValue& params = paramsOf(req);
    pipeline::ToolCallRequest call;
    call.name = requireString(params, "name");
    if (const JSONValue* args = FindMember(params, "arguments"); args && !args->IsNull()) {
        if (!args->IsObject()) {
            throw InvalidParams("arguments must be an object");
        }
        call.arguments = *args;
    }
    if (const JSONValue* meta = FindMember(params, "_meta")) {
        if (const JSONValue* token = FindMember(*meta, "progressToken"); token && !token->IsNull()) {
            call.progressToken = *token;
        }
    }
    call.requestId = IdToString(req.id);

    CallToolResult result = coCallTool(std::move(call)).toFuture().get();
    return std::make_unique<JSONRPCResponse>(req.id, result.ToJSON());
}

std::unique_ptr<JSONRPCResponse> Server::Impl::handleResourcesList(const JSONRPCRequest& req) {
    const JSONValue& params = paramsOf(req);
    resources::ResourceListParams lp;
    lp.uri = GetString(params, "uri");
    lp.directory = GetString(params, "directory");
    lp.prefix = GetString(params, "prefix");
    // page/pageSize, or cursor/limit where the cursor is a page index
    lp.page = optionalCount(params, "page").value_or(optionalCount(params, "cursor").value_or(0));
    lp.pageSize = optionalCount(params, "pageSize").value_or(optionalCount(params, "limit").value_or(resources::kDefaultPageSize));

    auto listed = components.resources->List(lp);
    JSONValue result = listed.ToJSON();
    auto& obj = std::get<JSONValue::Object>(result.value);

    JSONValue::Array described;
    for (const auto& d : components.resources->Describe(listed)) {
        described.push_back(std::make_shared<JSONValue>(MakeObject({
            {"uri", JSONValue(d.uri)},
            {"name", JSONValue(d.name)},
            {"mimeType", JSONValue(d.mimeType)},
            {"size", JSONValue(d.size)}})));
    }
    obj["resources"] = std::make_shared<JSONValue>(std::move(described));
    if ((listed.page + 1) * listed.pageSize < listed.total) {
        obj["nextCursor"] = std::make_shared<JSONValue>(std::to_string(listed.page + 1));
    }
    return std::make_unique<JSONRPCResponse>(req.id, std::move(result));
}

std::unique_ptr<JSONRPCResponse> Server::Impl::handleResourcesRead(const JSONRPCRequest& req) {
    const JSONValue& params = paramsOf(req);
    resources::ResourceReadParams rp;
    rp.uri = requireString(params, "uri");
    rp.start = GetInt(params, "start");
    rp.length = GetInt(params, "length");

    auto read = components.resources->Read(rp);
    JSONValue result = read.ToJSON();
    auto& obj = std::get<JSONValue::Object>(result.value);
    JSONValue item = MakeObject({
        {"uri", JSONValue(rp.uri)},
        {"mimeType", JSONValue(read.mimeType.value_or("text/plain"))},
        {"text", JSONValue(read.content)}});
    obj["contents"] = std::make_shared<JSONValue>(JSONValue::Array{std::make_shared<JSONValue>(std::move(item))});
    return std::make_unique<JSONRPCResponse>(req.id, std::move(result));
}

std::unique_ptr<JSONRPCResponse> Server::Impl::handlePromptsList(const JSONRPCRequest& req) {
    auto prompts = components.prompts->List();
    JSONValue result = pagedList(prompts, parsePaging(paramsOf(req)), "prompts",
                                 [](const PromptDefinition& p) { return p.ToListEntry(); });
    return std::make_unique<JSONRPCResponse>(req.id, std::move(result));
}

std::unique_ptr<JSONRPCResponse> Server::Impl::handlePromptsGet(const JSONRPCRequest& req) {
    const JSONValue& params = paramsOf(req);
    std::string id = GetString(params, "name").value_or(GetString(params, "id").value_or(""));
    if (id.empty()) {
        throw InvalidParams("Missing required string parameter: name");
    }
    const JSONValue* vars = FindMember(params, "arguments");
    if (!vars) vars = FindMember(params, "variables");
    static const JSONValue noVars{JSONValue::Object{}};
    auto resolved = components.prompts->GetPrompt(id, vars ? *vars : noVars);
    return std::make_unique<JSONRPCResponse>(req.id, resolved.ToJSON());
}

//==================================== Server public API ====================================
Server::Server(Implementation serverInfo, config::ServerConfig config, ServerComponents components,
               PipelineFactoryFn pipelineFactory)
    : pImpl(std::make_unique<Impl>(std::move(serverInfo), std::move(config), std::move(components), pipelineFactory)) {}

Server::~Server() {
    if (pImpl->running) {
        try {
            Stop().get();
        } catch (const std::exception& e) {
            LOG_ERROR("Server shutdown failed: {}", e.what());
        }
    }
}

std::future<void> Server::Start(std::unique_ptr<ITransport> transport) {
    if (!transport) {
        throw std::invalid_argument("Server::Start requires a transport");
    }
    return pImpl->coStart(std::move(transport)).toFuture();
}

std::future<void> Server::Stop() { return pImpl->coStop().toFuture(); }

bool Server::IsRunning() const { return pImpl->running; }

std::unique_ptr<JSONRPCResponse> Server::HandleRequest(const JSONRPCRequest& request) {
    return pImpl->dispatchRequest(request);
}

void Server::HandleNotification(const JSONRPCNotification& notification) {
    pImpl->handleNotification(notification);
}

std::future<CallToolResult> Server::CallTool(pipeline::ToolCallRequest request) {
    return pImpl->coCallTool(std::move(request)).toFuture();
}

std::future<void> Server::SendNotification(const std::string& method, const JSONValue& params) {
    return pImpl->coSendNotification(method, params).toFuture();
}

std::future<void> Server::NotifyToolsListChanged() {
    return SendNotification(Methods::ToolListChanged, JSONValue{JSONValue::Object{}});
}

std::future<void> Server::NotifyResourcesListChanged() {
    return SendNotification(Methods::ResourceListChanged, JSONValue{JSONValue::Object{}});
}

std::future<void> Server::NotifyPromptsListChanged() {
    return SendNotification(Methods::PromptListChanged, JSONValue{JSONValue::Object{}});
}

void Server::SetErrorHandler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->errorMutex);
    pImpl->errorCallback = std::move(handler);
}

ServerCapabilities Server::GetCapabilities() const { return pImpl->capabilities; }
const Implementation& Server::GetServerInfo() const { return pImpl->serverInfo; }
const config::ServerConfig& Server::GetConfig() const { return pImpl->config; }
const ServerComponents& Server::GetComponents() const { return pImpl->components; }
const pipeline::ToolCallPipeline& Server::GetPipeline() const { return pImpl->pipeline; }

} // namespace toolhost
