//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Demo tool host served over stdio
//==========================================================================================================

#include "logging/Logger.h"
#include "env/EnvVars.h"
#include "toolhost/Server.h"
#include "toolhost/ServerBuilder.h"
#include "toolhost/StdioTransport.hpp"
#include "toolhost/ToolRegistry.h"
#include "toolhost/PromptRegistry.h"
#include "toolhost/resources/LogStore.h"
#include <chrono>
#include <future>
#include <sstream>
#include <thread>

using namespace toolhost;

namespace {

JSONValue stringProperty(const std::string& description) {
    return MakeObject({{"type", JSONValue("string")}, {"description", JSONValue(description)}});
}

void registerTools(ToolRegistry& tools, const std::shared_ptr<resources::LogStore>& logs) {
    ToolDefinition echo;
    echo.name = "echo";
    echo.description = "Echo a message";
    echo.inputSchema = MakeObject({
        {"type", JSONValue("object")},
        {"properties", MakeObject({{"message", stringProperty("Text to echo")}})},
        {"required", MakeArray({JSONValue("message")})}});
    echo.flags.readOnly = true;
    echo.flags.idempotent = true;
    echo.handler = [](const JSONValue& args, std::shared_ptr<CancellationToken>, std::shared_ptr<ProgressNotifier>) {
        return std::async(std::launch::async, [args]() {
            return JSONValue(GetString(args, "message").value_or(""));
        });
    };
    tools.Register(std::move(echo));

    // Destructive: wipes captured logs, so the caller must pass confirm=true
    ToolDefinition clearLogs;
    clearLogs.name = "clear_logs";
    clearLogs.description = "Discard all captured run and build logs";
    clearLogs.flags.writesToDisk = false;
    clearLogs.flags.requiresConfirmation = true;
    clearLogs.handler = [logs](const JSONValue&, std::shared_ptr<CancellationToken>, std::shared_ptr<ProgressNotifier>) {
        return std::async(std::launch::async, [logs]() {
            logs->Clear();
            return MakeObject({{"cleared", JSONValue(true)}});
        });
    };
    tools.Register(std::move(clearLogs));

    // Long-running: honours the token and reports progress, recording each step as a run log
    ToolDefinition countdown;
    countdown.name = "countdown";
    countdown.description = "Count down from n, one step every 100ms";
    countdown.inputSchema = MakeObject({
        {"type", JSONValue("object")},
        {"properties", MakeObject({{"n", MakeObject({{"type", JSONValue("integer")}})}})}});
    countdown.handler = [logs](const JSONValue& args, std::shared_ptr<CancellationToken> token,
                               std::shared_ptr<ProgressNotifier> progress) {
        const int64_t n = GetInt(args, "n").value_or(10);
        return std::async(std::launch::async, [n, token, progress, logs]() {
            static std::atomic<int> runs{0};
            const std::string runId = "countdown-" + std::to_string(++runs);
            for (int64_t i = n; i > 0; --i) {
                token->ThrowIfCancelled();
                logs->StoreRunLog(runId, "tick " + std::to_string(i));
                progress->Notify("tick " + std::to_string(i), static_cast<double>(n - i + 1) / static_cast<double>(n));
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            return MakeObject({{"runId", JSONValue(runId)}, {"steps", JSONValue(n)}});
        });
    };
    tools.Register(std::move(countdown));

    ToolDefinition wordStats;
    wordStats.name = "word_stats";
    wordStats.description = "Count words and characters in a text";
    wordStats.inputSchema = MakeObject({
        {"type", JSONValue("object")},
        {"properties", MakeObject({{"text", stringProperty("Input text")}})},
        {"required", MakeArray({JSONValue("text")})}});
    wordStats.outputSchema = MakeObject({
        {"type", JSONValue("object")},
        {"properties", MakeObject({{"words", MakeObject({{"type", JSONValue("integer")}})},
                                   {"characters", MakeObject({{"type", JSONValue("integer")}})}})},
        {"required", MakeArray({JSONValue("words"), JSONValue("characters")})}});
    wordStats.flags.readOnly = true;
    wordStats.flags.idempotent = true;
    wordStats.handler = [](const JSONValue& args, std::shared_ptr<CancellationToken>, std::shared_ptr<ProgressNotifier>) {
        const std::string text = GetString(args, "text").value_or("");
        return std::async(std::launch::deferred, [text]() {
            std::istringstream in(text);
            int64_t words = 0;
            for (std::string w; in >> w;) ++words;
            return MakeObject({{"words", JSONValue(words)},
                               {"characters", JSONValue(static_cast<int64_t>(text.size()))}});
        });
    };
    tools.Register(std::move(wordStats));
}

void registerPrompts(PromptRegistry& prompts) {
    PromptDefinition scaffold;
    scaffold.id = "scaffold_component";
    scaffold.title = "Scaffold a component";
    scaffold.description = "Ask for a new component with the given name and kind";
    scaffold.variables = {
        PromptVariable{"name", "Component name", true, std::nullopt},
        PromptVariable{"kind", "Component kind", false, std::string("library")}};
    scaffold.messageTemplate = "Create a {{kind}} named {{name}} with a header, a source file and a unit test.";
    prompts.Register(std::move(scaffold));
}

} // namespace

int main() {
    FUNC_SCOPE();
    config::ServerConfig cfg;
    try {
        cfg = config::ServerConfig::FromEnvironment();
    } catch (const std::exception& e) {
        LOG_ERROR("Invalid configuration: {}", e.what());
        return 2;
    }
    Logger::setLogLevelFromString(cfg.logging.level);

    auto tools = std::make_shared<ToolRegistry>();
    auto prompts = std::make_shared<PromptRegistry>();
    auto logs = std::make_shared<resources::LogStore>();
    registerTools(*tools, logs);
    registerPrompts(*prompts);
    logs->StoreBuildLog("startup", "toolhost demo configured with " + std::to_string(tools->Size()) + " tools");

    std::unique_ptr<Server> server;
    try {
        server = ServerBuilder()
                     .WithServerInfo("toolhost-demo", "1.0.0")
                     .WithConfig(cfg)
                     .WithToolRegistry(tools)
                     .WithPromptRegistry(prompts)
                     .WithLogStore(logs)
                     .Build();
    } catch (const std::exception& e) {
        LOG_ERROR("Server construction failed: {}", e.what());
        return 2;
    }

    std::promise<void> stopped;
    std::once_flag stopOnce;
    server->SetErrorHandler([&](const std::string& err) {
        LOG_INFO("Server stopping: {}", err);
        std::call_once(stopOnce, [&]() { stopped.set_value(); });
    });

    try {
        server->Start(std::make_unique<StdioTransport>()).get();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start stdio transport: {}", e.what());
        return 1;
    }
    LOG_INFO("toolhost demo serving on stdio (workspace={})", cfg.workspaceRoot);

    stopped.get_future().wait();
    try {
        server->Stop().get();
    } catch (const std::exception& e) {
        LOG_ERROR("Shutdown failed: {}", e.what());
        return 1;
    }
    return 0;
}
