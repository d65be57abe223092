//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_server.cpp
// Purpose: Server request dispatch, parameter checking and lifecycle notifications
//==========================================================================================================

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <future>
#include <mutex>
#include <string>
#include <vector>

#include "toolhost/InMemoryTransport.hpp"
#include "toolhost/Protocol.h"
#include "toolhost/Server.h"
#include "toolhost/ServerBuilder.h"
#include "toolhost/errors/Errors.h"

using namespace toolhost;
namespace fs = std::filesystem;

namespace {

std::future<JSONValue> ready(JSONValue v) {
    std::promise<JSONValue> p;
    p.set_value(std::move(v));
    return p.get_future();
}

ToolDefinition echoTool(const std::string& name) {
    ToolDefinition def;
    def.name = name;
    def.description = "Echoes its message";
    def.inputSchema = ParseJSON(R"({"type":"object","properties":{"message":{"type":"string"}}})");
    def.flags.readOnly = true;
    def.handler = [](const JSONValue& args, std::shared_ptr<CancellationToken>, std::shared_ptr<ProgressNotifier>) {
        return ready(JSONValue(GetString(args, "message").value_or("")));
    };
    return def;
}

class ServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = fs::temp_directory_path() / "toolhost_server_test";
        fs::remove_all(root);
        fs::create_directories(root / "docs");
        std::ofstream(root / "README.md") << "# toolhost\n";
        std::ofstream(root / "docs" / "guide.txt") << "guide";

        tools = std::make_shared<ToolRegistry>();
        tools->Register(echoTool("alpha"));
        tools->Register(echoTool("beta"));
        tools->Register(echoTool("gamma"));

        prompts = std::make_shared<PromptRegistry>();
        PromptDefinition greet;
        greet.id = "greet";
        greet.title = "Greeting";
        greet.description = "Greets someone";
        greet.variables = {PromptVariable{"who", "Name to greet", true, std::nullopt}};
        greet.messageTemplate = "Hello {{who}}";
        prompts->Register(greet);

        logs = std::make_shared<resources::LogStore>();
        logs->StoreBuildLog("b1", "compiling");

        config::ServerConfig cfg = config::ServerConfig::Defaults();
        cfg.workspaceRoot = root.string();
        server = ServerBuilder()
                     .WithServerInfo("test-host", "0.1.0")
                     .WithConfig(cfg)
                     .WithToolRegistry(tools)
                     .WithPromptRegistry(prompts)
                     .WithLogStore(logs)
                     .Build();
    }

    void TearDown() override {
        server.reset();
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    std::unique_ptr<JSONRPCResponse> call(const std::string& method, std::optional<JSONValue> params = std::nullopt) {
        JSONRPCRequest req(JSONRPCId{static_cast<int64_t>(++nextId)}, method, std::move(params));
        return server->HandleRequest(req);
    }

    static int64_t errorCode(const JSONRPCResponse& resp) {
        return GetInt(resp.error.value(), "code").value_or(0);
    }

    fs::path root;
    std::shared_ptr<ToolRegistry> tools;
    std::shared_ptr<PromptRegistry> prompts;
    std::shared_ptr<resources::LogStore> logs;
    std::unique_ptr<Server> server;
    int64_t nextId{0};
};

size_t arraySize(const JSONValue& obj, const std::string& key) {
    const JSONValue* v = FindMember(obj, key);
    if (!v || !v->IsArray()) return 0;
    return std::get<JSONValue::Array>(v->value).size();
}

const JSONValue& arrayAt(const JSONValue& obj, const std::string& key, size_t i) {
    return *std::get<JSONValue::Array>(FindMember(obj, key)->value).at(i);
}

} // namespace

TEST_F(ServerTest, InitializeReportsInfoAndCapabilities) {
    auto resp = call(Methods::Initialize, MakeObject({{"protocolVersion", JSONValue("2024-11-05")}}));
    ASSERT_FALSE(resp->IsError());
    const JSONValue& result = resp->result.value();
    EXPECT_EQ(GetString(result, "protocolVersion").value_or(""), PROTOCOL_VERSION);
    const JSONValue* info = FindMember(result, "serverInfo");
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(GetString(*info, "name").value_or(""), "test-host");
    EXPECT_EQ(GetString(*info, "version").value_or(""), "0.1.0");
    const JSONValue* caps = FindMember(result, "capabilities");
    ASSERT_NE(caps, nullptr);
    EXPECT_NE(FindMember(*caps, "tools"), nullptr);
    EXPECT_NE(FindMember(*caps, "resources"), nullptr);
    EXPECT_NE(FindMember(*caps, "prompts"), nullptr);
}

TEST_F(ServerTest, PingAndUnknownMethod) {
    auto pong = call(Methods::Ping);
    ASSERT_FALSE(pong->IsError());
    EXPECT_TRUE(pong->result->IsObject());

    auto missing = call("tools/frobnicate");
    ASSERT_TRUE(missing->IsError());
    EXPECT_EQ(errorCode(*missing), JSONRPCErrorCodes::MethodNotFound);
}

TEST_F(ServerTest, ToolsListKeepsRegistrationOrderAndPages) {
    auto all = call(Methods::ListTools);
    ASSERT_FALSE(all->IsError());
    ASSERT_EQ(arraySize(all->result.value(), "tools"), 3u);
    EXPECT_EQ(GetString(arrayAt(all->result.value(), "tools", 0), "name").value_or(""), "alpha");
    EXPECT_EQ(GetBool(arrayAt(all->result.value(), "tools", 0), "readOnly").value_or(false), true);
    EXPECT_EQ(FindMember(all->result.value(), "nextCursor"), nullptr);

    auto first = call(Methods::ListTools, MakeObject({{"limit", JSONValue(static_cast<int64_t>(2))}}));
    ASSERT_EQ(arraySize(first->result.value(), "tools"), 2u);
    auto cursor = GetString(first->result.value(), "nextCursor");
    ASSERT_TRUE(cursor.has_value());

    auto second = call(Methods::ListTools, MakeObject({{"cursor", JSONValue(*cursor)},
                                                       {"limit", JSONValue(static_cast<int64_t>(2))}}));
    ASSERT_EQ(arraySize(second->result.value(), "tools"), 1u);
    EXPECT_EQ(GetString(arrayAt(second->result.value(), "tools", 0), "name").value_or(""), "gamma");
    EXPECT_EQ(FindMember(second->result.value(), "nextCursor"), nullptr);

    auto bad = call(Methods::ListTools, MakeObject({{"cursor", JSONValue("abc")}}));
    ASSERT_TRUE(bad->IsError());
    EXPECT_EQ(errorCode(*bad), JSONRPCErrorCodes::InvalidParams);
}

TEST_F(ServerTest, ToolsCallReturnsContent) {
    auto resp = call(Methods::CallTool, MakeObject({{"name", JSONValue("beta")},
                                                    {"arguments", MakeObject({{"message", JSONValue("hi")}})}}));
    ASSERT_FALSE(resp->IsError());
    EXPECT_FALSE(GetBool(resp->result.value(), "isError").value_or(true));
    ASSERT_EQ(arraySize(resp->result.value(), "content"), 1u);
    const JSONValue& item = arrayAt(resp->result.value(), "content", 0);
    EXPECT_EQ(GetString(item, "type").value_or(""), "text");
    EXPECT_EQ(GetString(item, "text").value_or(""), "\"hi\"");
}

TEST_F(ServerTest, ToolsCallUnknownToolIsToolError) {
    auto resp = call(Methods::CallTool, MakeObject({{"name", JSONValue("nope")}}));
    ASSERT_FALSE(resp->IsError());
    EXPECT_TRUE(GetBool(resp->result.value(), "isError").value_or(false));
    const JSONValue* meta = FindMember(resp->result.value(), "_meta");
    ASSERT_NE(meta, nullptr);
    EXPECT_EQ(GetString(*meta, "errorKind").value_or(""), "ToolNotFound");
}

TEST_F(ServerTest, ToolsCallRejectsMalformedParams) {
    auto noName = call(Methods::CallTool, MakeObject({{"arguments", JSONValue(JSONValue::Object{})}}));
    ASSERT_TRUE(noName->IsError());
    EXPECT_EQ(errorCode(*noName), JSONRPCErrorCodes::InvalidParams);

    auto badArgs = call(Methods::CallTool, MakeObject({{"name", JSONValue("alpha")},
                                                       {"arguments", JSONValue("not-an-object")}}));
    ASSERT_TRUE(badArgs->IsError());
    EXPECT_EQ(errorCode(*badArgs), JSONRPCErrorCodes::InvalidParams);

    auto badParams = call(Methods::CallTool, JSONValue("string params"));
    ASSERT_TRUE(badParams->IsError());
    EXPECT_EQ(errorCode(*badParams), JSONRPCErrorCodes::InvalidParams);
}

TEST_F(ServerTest, ResourcesListAndRead) {
    auto listed = call(Methods::ListResources);
    ASSERT_FALSE(listed->IsError());
    const JSONValue& result = listed->result.value();
    ASSERT_GE(arraySize(result, "resources"), 3u);
    std::vector<std::string> uris;
    for (size_t i = 0; i < arraySize(result, "resources"); ++i) {
        uris.push_back(GetString(arrayAt(result, "resources", i), "uri").value_or(""));
    }
    EXPECT_NE(std::find(uris.begin(), uris.end(), "workspace://README.md"), uris.end());
    EXPECT_NE(std::find(uris.begin(), uris.end(), "logs://build/b1"), uris.end());

    auto read = call(Methods::ReadResource, MakeObject({{"uri", JSONValue("workspace://README.md")}}));
    ASSERT_FALSE(read->IsError());
    ASSERT_EQ(arraySize(read->result.value(), "contents"), 1u);
    const JSONValue& content = arrayAt(read->result.value(), "contents", 0);
    EXPECT_EQ(GetString(content, "text").value_or(""), "# toolhost\n");
    EXPECT_EQ(GetString(content, "mimeType").value_or(""), "text/markdown");

    auto ranged = call(Methods::ReadResource, MakeObject({{"uri", JSONValue("logs://build/b1")},
                                                          {"start", JSONValue(static_cast<int64_t>(3))},
                                                          {"length", JSONValue(static_cast<int64_t>(4))}}));
    ASSERT_FALSE(ranged->IsError());
    EXPECT_EQ(GetString(ranged->result.value(), "content").value_or(""), "pili");
    EXPECT_EQ(GetInt(ranged->result.value(), "total").value_or(0), 9);
}

TEST_F(ServerTest, ResourceErrorsCarryKind) {
    auto missing = call(Methods::ReadResource, MakeObject({{"uri", JSONValue("workspace://absent.txt")}}));
    ASSERT_TRUE(missing->IsError());
    auto err = errors::rpcErrorFromResponse(*missing);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, JSONRPCErrorCodes::ResourceNotFound);
    EXPECT_EQ(GetString(err->data.value(), "kind").value_or(""), "ResourceNotFound");

    auto noUri = call(Methods::ReadResource, JSONValue(JSONValue::Object{}));
    ASSERT_TRUE(noUri->IsError());
    EXPECT_EQ(errorCode(*noUri), JSONRPCErrorCodes::InvalidParams);
}

TEST_F(ServerTest, PromptsListAndGet) {
    auto listed = call(Methods::ListPrompts);
    ASSERT_FALSE(listed->IsError());
    ASSERT_EQ(arraySize(listed->result.value(), "prompts"), 1u);
    EXPECT_EQ(GetString(arrayAt(listed->result.value(), "prompts", 0), "name").value_or(""), "greet");

    auto incomplete = call(Methods::GetPrompt, MakeObject({{"name", JSONValue("greet")}}));
    ASSERT_FALSE(incomplete->IsError());
    EXPECT_EQ(arraySize(incomplete->result.value(), "variablesNeeded"), 1u);
    EXPECT_EQ(arraySize(incomplete->result.value(), "messages"), 0u);

    auto full = call(Methods::GetPrompt, MakeObject({{"name", JSONValue("greet")},
                                                     {"arguments", MakeObject({{"who", JSONValue("Ada")}})}}));
    ASSERT_FALSE(full->IsError());
    EXPECT_EQ(GetString(full->result.value(), "text").value_or(""), "Hello Ada");

    auto unknown = call(Methods::GetPrompt, MakeObject({{"name", JSONValue("missing")}}));
    ASSERT_TRUE(unknown->IsError());
    EXPECT_EQ(errorCode(*unknown), JSONRPCErrorCodes::PromptNotFound);
}

TEST(ServerConstruction, RequiresEveryComponent) {
    ServerComponents partial;
    partial.tools = std::make_shared<ToolRegistry>();
    EXPECT_THROW(Server(Implementation("x", "1"), config::ServerConfig::Defaults(), partial), std::invalid_argument);
}

TEST(ServerConstruction, BuilderRejectsInvalidConfig) {
    config::ServerConfig cfg = config::ServerConfig::Defaults();
    cfg.concurrency.maxConcurrency = 0;
    EXPECT_THROW(ServerBuilder().WithConfig(cfg).Build(), std::invalid_argument);
}

TEST(ServerConstruction, BuilderUsesCustomPipeline) {
    auto server = ServerBuilder().WithPipelineFactory(&pipeline::MinimalPipelineFactory::Create).Build();
    EXPECT_EQ(server->GetPipeline().Size(), 4u);
    EXPECT_EQ(server->GetServerInfo().name, "toolhost");
}

TEST(ServerLifecycle, InitializeAnnouncesListChanges) {
    auto pair = InMemoryTransport::CreatePair();
    auto client = std::move(pair.first);
    auto serverTrans = std::move(pair.second);

    std::mutex mtx;
    std::condition_variable cv;
    std::vector<std::string> received;
    client->SetNotificationHandler([&](std::unique_ptr<JSONRPCNotification> n) {
        std::lock_guard<std::mutex> lk(mtx);
        received.push_back(n->method);
        cv.notify_all();
    });

    auto server = ServerBuilder().Build();
    server->Start(std::move(serverTrans)).get();
    EXPECT_TRUE(server->IsRunning());
    client->Start().get();

    auto req = std::make_unique<JSONRPCRequest>(JSONRPCId{std::string("init")}, Methods::Initialize,
                                                JSONValue(JSONValue::Object{}));
    auto resp = client->SendRequest(std::move(req)).get();
    ASSERT_TRUE(resp != nullptr);
    ASSERT_FALSE(resp->IsError());

    {
        std::unique_lock<std::mutex> lk(mtx);
        ASSERT_TRUE(cv.wait_for(lk, std::chrono::seconds(2), [&] { return received.size() >= 3; }));
        EXPECT_NE(std::find(received.begin(), received.end(), Methods::ToolListChanged), received.end());
        EXPECT_NE(std::find(received.begin(), received.end(), Methods::ResourceListChanged), received.end());
        EXPECT_NE(std::find(received.begin(), received.end(), Methods::PromptListChanged), received.end());
    }

    client->Close().get();
    server->Stop().get();
    EXPECT_FALSE(server->IsRunning());
}
