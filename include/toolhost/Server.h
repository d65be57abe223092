//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.h
// Purpose: Protocol lifecycle and request dispatch for the tool host
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <string>

#include "toolhost/Cancellation.h"
#include "toolhost/ConcurrencyLimiter.h"
#include "toolhost/PromptRegistry.h"
#include "toolhost/Protocol.h"
#include "toolhost/ToolRegistry.h"
#include "toolhost/Transport.h"
#include "toolhost/config/ServerConfig.h"
#include "toolhost/pipeline/PipelineFactory.h"
#include "toolhost/resources/LogStore.h"
#include "toolhost/resources/ResourceRegistry.h"
#include "toolhost/validation/SizeValidator.h"

namespace toolhost {

//==========================================================================================================
// ServerComponents
// Purpose: Explicitly constructed collaborators shared by the server and its pipeline. Every member
//          is required; ServerBuilder fills in defaults.
//==========================================================================================================
struct ServerComponents {
    std::shared_ptr<ToolRegistry> tools;
    std::shared_ptr<resources::ResourceRegistry> resources;
    std::shared_ptr<PromptRegistry> prompts;
    std::shared_ptr<resources::LogStore> logStore;
    std::shared_ptr<validation::SizeValidator> sizeValidator;
    std::shared_ptr<ConcurrencyLimiter> concurrencyLimiter;
    std::shared_ptr<CancellationRegistry> cancellations;
};

using PipelineFactoryFn = std::function<pipeline::ToolCallPipeline(const pipeline::PipelineDependencies&)>;

//==========================================================================================================
// Server
// Purpose: Serves tools/*, resources/* and prompts/* over one transport. tools/call goes through the
//          tool-call pipeline; registry failures become JSON-RPC errors tagged with their kind.
// Notes:
//   The pipeline is built once at construction from the components, the config and the factory.
//==========================================================================================================
class Server {
public:
    Server(Implementation serverInfo,
           config::ServerConfig config,
           ServerComponents components,
           PipelineFactoryFn pipelineFactory = &pipeline::DefaultPipelineFactory::Create);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /////////////////////////////////////////// Lifecycle ///////////////////////////////////////////

    // Takes ownership of the transport, wires its handlers and starts it.
    std::future<void> Start(std::unique_ptr<ITransport> transport);
    std::future<void> Stop();
    bool IsRunning() const;

    /////////////////////////////////////////// Dispatch ///////////////////////////////////////////

    //==========================================================================================================
    // HandleRequest
    // Purpose: Dispatches one request and returns its response. Never throws; unknown methods yield
    //          MethodNotFound and malformed params InvalidParams.
    //==========================================================================================================
    std::unique_ptr<JSONRPCResponse> HandleRequest(const JSONRPCRequest& request);

    void HandleNotification(const JSONRPCNotification& notification);

    // Runs a call through the pipeline on a worker thread.
    std::future<CallToolResult> CallTool(pipeline::ToolCallRequest request);

    /////////////////////////////////////////// Outbound ///////////////////////////////////////////

    std::future<void> SendNotification(const std::string& method, const JSONValue& params);
    std::future<void> NotifyToolsListChanged();
    std::future<void> NotifyResourcesListChanged();
    std::future<void> NotifyPromptsListChanged();

    using ErrorHandler = std::function<void(const std::string& error)>;
    void SetErrorHandler(ErrorHandler handler);

    /////////////////////////////////////////// Accessors ///////////////////////////////////////////

    ServerCapabilities GetCapabilities() const;
    const Implementation& GetServerInfo() const;
    const config::ServerConfig& GetConfig() const;
    const ServerComponents& GetComponents() const;
    const pipeline::ToolCallPipeline& GetPipeline() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolhost
