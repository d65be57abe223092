//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerBuilder.cpp
// Purpose: ServerBuilder implementation
//==========================================================================================================

#include "logging/Logger.h"
#include "toolhost/PathSandbox.h"
#include "toolhost/ServerBuilder.h"
#include "toolhost/resources/LogResourceStrategy.h"
#include "toolhost/resources/WorkspaceResourceStrategy.h"

namespace toolhost {

ServerBuilder& ServerBuilder::WithServerInfo(std::string name, std::string version) {
    serverInfo = Implementation(std::move(name), std::move(version));
    return *this;
}

ServerBuilder& ServerBuilder::WithConfig(config::ServerConfig cfg) {
    config = std::move(cfg);
    return *this;
}

ServerBuilder& ServerBuilder::WithToolRegistry(std::shared_ptr<ToolRegistry> tools) {
    components.tools = std::move(tools);
    return *this;
}

ServerBuilder& ServerBuilder::WithPromptRegistry(std::shared_ptr<PromptRegistry> prompts) {
    components.prompts = std::move(prompts);
    return *this;
}

ServerBuilder& ServerBuilder::WithResourceRegistry(std::shared_ptr<resources::ResourceRegistry> resources) {
    components.resources = std::move(resources);
    return *this;
}

ServerBuilder& ServerBuilder::WithLogStore(std::shared_ptr<resources::LogStore> logStore) {
    components.logStore = std::move(logStore);
    return *this;
}

ServerBuilder& ServerBuilder::WithPipelineFactory(PipelineFactoryFn factory) {
    pipelineFactory = std::move(factory);
    return *this;
}

std::unique_ptr<Server> ServerBuilder::Build() {
    config.Validate();

    ServerComponents c = components;
    if (!c.tools) c.tools = std::make_shared<ToolRegistry>();
    if (!c.prompts) c.prompts = std::make_shared<PromptRegistry>();
    if (!c.logStore) c.logStore = std::make_shared<resources::LogStore>();
    if (!c.sizeValidator) c.sizeValidator = std::make_shared<validation::SizeValidator>(config.sizeLimits);
    if (!c.concurrencyLimiter) {
        c.concurrencyLimiter = std::make_shared<ConcurrencyLimiter>(config.concurrency.maxConcurrency,
                                                                    config.concurrency.perToolLimits);
    }
    if (!c.cancellations) c.cancellations = std::make_shared<CancellationRegistry>();
    if (!c.resources) {
        auto sandbox = std::make_shared<PathSandbox>(config.workspaceRoot, config.security);
        c.resources = std::make_shared<resources::ResourceRegistry>(c.sizeValidator);
        c.resources->Register(std::make_shared<resources::WorkspaceResourceStrategy>(sandbox, c.sizeValidator));
        c.resources->Register(std::make_shared<resources::LogResourceStrategy>(resources::LogKind::Run, c.logStore));
        c.resources->Register(std::make_shared<resources::LogResourceStrategy>(resources::LogKind::Build, c.logStore));
        LOG_DEBUG("Default resource strategies registered for workspace {}", sandbox->Root().string());
    }

    PipelineFactoryFn factory = pipelineFactory ? pipelineFactory : PipelineFactoryFn(&pipeline::DefaultPipelineFactory::Create);
    return std::make_unique<Server>(serverInfo, config, std::move(c), std::move(factory));
}

} // namespace toolhost
