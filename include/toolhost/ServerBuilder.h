//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerBuilder.h
// Purpose: Assembles a Server and its default collaborators from configuration
//==========================================================================================================

#pragma once

#include <memory>
#include <string>

#include "toolhost/Server.h"

namespace toolhost {

//==========================================================================================================
// ServerBuilder
// Purpose: Fluent construction. Anything not supplied is created from the config:
//   - SizeValidator from sizeLimits, ConcurrencyLimiter from concurrency
//   - a ResourceRegistry with workspace://, logs://run/ and logs://build/ strategies, the workspace
//     strategy sandboxed to workspaceRoot with the security rules
//   - empty Tool and Prompt registries and a fresh LogStore
// Build() validates the config and throws std::invalid_argument on a bad value.
//==========================================================================================================
class ServerBuilder {
public:
    ServerBuilder& WithServerInfo(std::string name, std::string version);
    ServerBuilder& WithConfig(config::ServerConfig config);
    ServerBuilder& WithToolRegistry(std::shared_ptr<ToolRegistry> tools);
    ServerBuilder& WithPromptRegistry(std::shared_ptr<PromptRegistry> prompts);
    ServerBuilder& WithResourceRegistry(std::shared_ptr<resources::ResourceRegistry> resources);
    ServerBuilder& WithLogStore(std::shared_ptr<resources::LogStore> logStore);
    ServerBuilder& WithPipelineFactory(PipelineFactoryFn factory);

    std::unique_ptr<Server> Build();

private:
    Implementation serverInfo{"toolhost", "1.0.0"};
    config::ServerConfig config = config::ServerConfig::Defaults();
    ServerComponents components;
    PipelineFactoryFn pipelineFactory;
};

} // namespace toolhost
