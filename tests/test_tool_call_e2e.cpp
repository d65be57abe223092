//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_tool_call_e2e.cpp
// Purpose: End-to-end tool calls through a built server: confirmation, per-tool concurrency limits,
//          sandboxed resource reads and per-tool timeouts
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include "toolhost/Protocol.h"
#include "toolhost/Server.h"
#include "toolhost/ServerBuilder.h"
#include "toolhost/errors/Errors.h"

using namespace toolhost;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

std::future<JSONValue> ready(JSONValue v) {
    std::promise<JSONValue> p;
    p.set_value(std::move(v));
    return p.get_future();
}

pipeline::ToolCallRequest callOf(const std::string& name, JSONValue args = JSONValue(JSONValue::Object{})) {
    pipeline::ToolCallRequest req;
    req.name = name;
    req.arguments = std::move(args);
    return req;
}

class ToolCallE2E : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        base = fs::temp_directory_path() / (std::string("toolhost_e2e_") + info->name());
        fs::remove_all(base);
        fs::create_directories(base / "ws" / "src");
        std::ofstream(base / "ws" / "src" / "main.cpp") << "int main() { return 0; }\n";
        cfg.workspaceRoot = (base / "ws").string();
        tools = std::make_shared<ToolRegistry>();
    }

    void TearDown() override {
        server.reset();
        std::error_code ec;
        fs::remove_all(base, ec);
    }

    Server& build() {
        server = ServerBuilder().WithConfig(cfg).WithToolRegistry(tools).Build();
        return *server;
    }

    fs::path base;
    config::ServerConfig cfg = config::ServerConfig::Defaults();
    std::shared_ptr<ToolRegistry> tools;
    std::unique_ptr<Server> server;
};

} // namespace

TEST_F(ToolCallE2E, ConfirmationGatesDestructiveTool) {
    auto deleted = std::make_shared<std::atomic<int>>(0);
    ToolDefinition def;
    def.name = "wipe";
    def.description = "Deletes build outputs";
    def.flags.requiresConfirmation = true;
    def.handler = [deleted](const JSONValue&, std::shared_ptr<CancellationToken>, std::shared_ptr<ProgressNotifier>) {
        deleted->fetch_add(1);
        return ready(JSONValue("wiped"));
    };
    tools->Register(def);
    auto& srv = build();

    JSONRPCRequest first(JSONRPCId{static_cast<int64_t>(1)}, Methods::CallTool,
                         MakeObject({{"name", JSONValue("wipe")}, {"arguments", JSONValue(JSONValue::Object{})}}));
    auto denied = srv.HandleRequest(first);
    ASSERT_FALSE(denied->IsError());
    EXPECT_TRUE(GetBool(denied->result.value(), "isError").value_or(false));
    const JSONValue* meta = FindMember(denied->result.value(), "_meta");
    ASSERT_NE(meta, nullptr);
    EXPECT_EQ(GetString(*meta, "errorKind").value_or(""), "ConfirmationRequired");
    EXPECT_EQ(deleted->load(), 0);

    JSONRPCRequest second(JSONRPCId{static_cast<int64_t>(2)}, Methods::CallTool,
                          MakeObject({{"name", JSONValue("wipe")},
                                      {"arguments", MakeObject({{"confirm", JSONValue(true)}})}}));
    auto allowed = srv.HandleRequest(second);
    ASSERT_FALSE(allowed->IsError());
    EXPECT_FALSE(GetBool(allowed->result.value(), "isError").value_or(true));
    EXPECT_EQ(deleted->load(), 1);
}

TEST_F(ToolCallE2E, PerToolConcurrencyLimit) {
    cfg.concurrency.perToolLimits["build"] = 1;
    auto started = std::make_shared<std::promise<void>>();
    auto gate = std::make_shared<std::promise<void>>();
    auto opened = gate->get_future().share();
    auto calls = std::make_shared<std::atomic<int>>(0);

    ToolDefinition def;
    def.name = "build";
    def.handler = [started, opened, calls](const JSONValue&, std::shared_ptr<CancellationToken>,
                                           std::shared_ptr<ProgressNotifier>) {
        auto out = std::make_shared<std::promise<JSONValue>>();
        if (calls->fetch_add(1) == 0) {
            started->set_value();
        }
        std::thread([out, opened]() {
            opened.wait();
            out->set_value(JSONValue("built"));
        }).detach();
        return out->get_future();
    };
    tools->Register(def);
    auto& srv = build();

    auto firstCall = srv.CallTool(callOf("build"));
    ASSERT_EQ(started->get_future().wait_for(2s), std::future_status::ready);

    auto rejected = srv.CallTool(callOf("build")).get();
    EXPECT_TRUE(rejected.isError);
    EXPECT_EQ(rejected.errorKind, errors::ErrorKind::ConcurrencyLimitExceeded);
    EXPECT_EQ(calls->load(), 1);

    gate->set_value();
    ASSERT_EQ(firstCall.wait_for(2s), std::future_status::ready);
    EXPECT_FALSE(firstCall.get().isError);

    auto again = srv.CallTool(callOf("build")).get();
    EXPECT_FALSE(again.isError);
    EXPECT_EQ(again.TextContent(), "\"built\"");
    EXPECT_EQ(srv.GetComponents().concurrencyLimiter->GetCurrentCount("build"), 0);
}

TEST_F(ToolCallE2E, WorkspaceReadOutsideSandboxIsRejected) {
    auto& srv = build();

    for (const char* uri : {"workspace://../../etc/passwd", "workspace://src/../../../etc/passwd",
                            "workspace://../../../../../../../../etc/passwd", "../../etc/passwd"}) {
        JSONRPCRequest req(JSONRPCId{std::string("read")}, Methods::ReadResource,
                           MakeObject({{"uri", JSONValue(uri)}}));
        auto resp = srv.HandleRequest(req);
        ASSERT_TRUE(resp->IsError()) << uri;
        auto err = errors::rpcErrorFromResponse(*resp);
        ASSERT_TRUE(err.has_value()) << uri;
        EXPECT_EQ(err->code, JSONRPCErrorCodes::PermissionDenied) << uri;
        ASSERT_TRUE(err->data.has_value()) << uri;
        EXPECT_EQ(GetString(err->data.value(), "kind").value_or(""), "OutOfSandbox") << uri;
    }

    JSONRPCRequest inside(JSONRPCId{std::string("ok")}, Methods::ReadResource,
                          MakeObject({{"uri", JSONValue("workspace://src/main.cpp")}}));
    auto ok = srv.HandleRequest(inside);
    ASSERT_FALSE(ok->IsError());
    EXPECT_EQ(GetString(ok->result.value(), "content").value_or(""), "int main() { return 0; }\n");
}

TEST_F(ToolCallE2E, PerToolTimeoutStopsHungHandler) {
    cfg.timeouts.perToolTimeouts["hang"] = 100ms;
    auto never = std::make_shared<std::promise<JSONValue>>();
    auto seenToken = std::make_shared<std::promise<std::shared_ptr<CancellationToken>>>();

    ToolDefinition def;
    def.name = "hang";
    def.handler = [never, seenToken](const JSONValue&, std::shared_ptr<CancellationToken> token,
                                     std::shared_ptr<ProgressNotifier>) {
        seenToken->set_value(token);
        return never->get_future();
    };
    tools->Register(def);
    auto& srv = build();

    const auto begin = std::chrono::steady_clock::now();
    auto result = srv.CallTool(callOf("hang")).get();
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - begin);

    EXPECT_TRUE(result.isError);
    EXPECT_EQ(result.errorKind, errors::ErrorKind::TimeoutExceeded);
    EXPECT_EQ(result.TextContent(), "Timeout: Operation (hang) timed out after 100ms");
    EXPECT_GE(elapsed.count(), 90);
    EXPECT_LT(elapsed.count(), 1000);

    auto token = seenToken->get_future().get();
    ASSERT_NE(token, nullptr);
    EXPECT_TRUE(token->IsCancelled());
}
