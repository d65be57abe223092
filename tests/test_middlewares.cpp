//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_middlewares.cpp
// Purpose: Behaviour of each built-in tool-call stage in isolation
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include "toolhost/errors/Errors.h"
#include "toolhost/pipeline/Middlewares.h"
#include "toolhost/Server.h"
#include "toolhost/ServerBuilder.h"

using namespace toolhost;
using namespace toolhost::pipeline;
using namespace std::chrono_literals;

namespace {

std::future<JSONValue> ready(JSONValue v) {
    std::promise<JSONValue> p;
    p.set_value(std::move(v));
    return p.get_future();
}

ToolDefinition makeTool(const std::string& name, JSONValue value = JSONValue("ok")) {
    ToolDefinition def;
    def.name = name;
    def.description = name;
    def.handler = [value](const JSONValue&, std::shared_ptr<CancellationToken>, std::shared_ptr<ProgressNotifier>) {
        return ready(value);
    };
    return def;
}

ToolCallContext makeContext(const std::string& tool, JSONValue args = JSONValue(JSONValue::Object{})) {
    ToolCallRequest req;
    req.name = tool;
    req.arguments = std::move(args);
    return ToolCallContext::Create(std::move(req));
}

std::shared_ptr<validation::SizeValidator> defaultSizes() {
    return std::make_shared<validation::SizeValidator>(config::SizeLimits{});
}

// Terminal continuation that records the context it received.
struct Capture {
    std::optional<ToolCallContext> seen;
    NextHandler Next() {
        return [this](const ToolCallContext& ctx) {
            seen.emplace(ctx);
            return CallToolResult::Text("next");
        };
    }
};

JSONValue strictSchema() {
    return ParseJSON(R"({"type":"object","properties":{"path":{"type":"string"}},"required":["path"]})");
}

} // namespace

TEST(ValidationMiddleware, UnknownToolShortCircuits) {
    auto tools = std::make_shared<ToolRegistry>();
    ValidationMiddleware stage(tools, defaultSizes());
    Capture cap;
    auto result = stage.Handle(makeContext("ghost"), cap.Next());
    EXPECT_FALSE(cap.seen.has_value());
    EXPECT_TRUE(result.isError);
    EXPECT_EQ(result.errorKind, errors::ErrorKind::ToolNotFound);
    EXPECT_EQ(result.TextContent(), "Tool not found: ghost");
}

TEST(ValidationMiddleware, ResolvesToolIntoContext) {
    auto tools = std::make_shared<ToolRegistry>();
    tools->Register(makeTool("echo"));
    ValidationMiddleware stage(tools, defaultSizes());
    Capture cap;
    auto result = stage.Handle(makeContext("echo"), cap.Next());
    EXPECT_FALSE(result.isError);
    ASSERT_TRUE(cap.seen.has_value());
    ASSERT_NE(cap.seen->Tool(), nullptr);
    EXPECT_EQ(cap.seen->Tool()->name, "echo");
}

TEST(ValidationMiddleware, StrictModeChecksInputSchema) {
    auto tools = std::make_shared<ToolRegistry>();
    auto def = makeTool("read");
    def.inputSchema = strictSchema();
    tools->Register(def);

    ValidationMiddleware lax(tools, defaultSizes());
    Capture cap;
    EXPECT_FALSE(lax.Handle(makeContext("read"), cap.Next()).isError);

    ValidationMiddleware strict(tools, defaultSizes(), validation::ValidationMode::Strict);
    EXPECT_THROW(strict.Handle(makeContext("read"), cap.Next()), errors::SchemaValidationFailedError);
    EXPECT_NO_THROW(strict.Handle(makeContext("read", MakeObject({{"path", JSONValue("a.txt")}})), cap.Next()));
}

TEST(ValidationMiddleware, OversizedArgumentsRejected) {
    auto tools = std::make_shared<ToolRegistry>();
    tools->Register(makeTool("echo"));
    config::SizeLimits limits;
    limits.maxParameterSize = 16;
    ValidationMiddleware stage(tools, std::make_shared<validation::SizeValidator>(limits));
    Capture cap;
    auto args = MakeObject({{"message", JSONValue(std::string(64, 'x'))}});
    EXPECT_THROW(stage.Handle(makeContext("echo", args), cap.Next()), errors::SizeLimitExceededError);
}

TEST(ConfirmationMiddleware, RequiresExplicitConfirm) {
    auto def = makeTool("delete");
    def.flags.requiresConfirmation = true;
    auto tool = std::make_shared<const ToolDefinition>(def);
    ConfirmationMiddleware stage;
    Capture cap;

    auto denied = stage.Handle(makeContext("delete").WithTool(tool), cap.Next());
    EXPECT_TRUE(denied.isError);
    EXPECT_EQ(denied.errorKind, errors::ErrorKind::ConfirmationRequired);
    EXPECT_EQ(denied.TextContent(), "Confirmation required for tool: delete");

    auto notTrue = stage.Handle(makeContext("delete", MakeObject({{"confirm", JSONValue("yes")}})).WithTool(tool),
                                cap.Next());
    EXPECT_TRUE(notTrue.isError);
    EXPECT_FALSE(cap.seen.has_value());

    auto ok = stage.Handle(makeContext("delete", MakeObject({{"confirm", JSONValue(true)}})).WithTool(tool),
                           cap.Next());
    EXPECT_FALSE(ok.isError);
    EXPECT_TRUE(cap.seen.has_value());
}

TEST(ConfirmationMiddleware, UnflaggedToolPassesThrough) {
    auto tool = std::make_shared<const ToolDefinition>(makeTool("echo"));
    ConfirmationMiddleware stage;
    Capture cap;
    EXPECT_FALSE(stage.Handle(makeContext("echo").WithTool(tool), cap.Next()).isError);
}

TEST(SetupMiddleware, AppliesPerToolTimeoutAndRegistersToken) {
    config::TimeoutConfig timeouts;
    timeouts.defaultTimeout = 1000ms;
    timeouts.perToolTimeouts["build"] = 250ms;
    auto registry = std::make_shared<CancellationRegistry>();
    SetupMiddleware stage(timeouts, nullptr, registry);

    ToolCallRequest req;
    req.name = "build";
    req.requestId = "42";
    auto ctx = ToolCallContext::Create(req);

    std::shared_ptr<CancellationToken> seenToken;
    auto result = stage.Handle(ctx, [&](const ToolCallContext& c) {
        EXPECT_EQ(c.Timeout().value(), 250ms);
        seenToken = c.Token();
        EXPECT_EQ(registry->GetToken("42"), c.Token());
        EXPECT_NE(c.Progress(), nullptr);
        return CallToolResult::Text("done");
    });
    EXPECT_FALSE(result.isError);
    ASSERT_NE(seenToken, nullptr);
    EXPECT_EQ(registry->Size(), 0u);

    Capture cap;
    stage.Handle(makeContext("other"), cap.Next());
    ASSERT_TRUE(cap.seen.has_value());
    EXPECT_EQ(cap.seen->Timeout().value(), 1000ms);
}

TEST(SetupMiddleware, RemovesRegistrationWhenChainThrows) {
    auto registry = std::make_shared<CancellationRegistry>();
    SetupMiddleware stage(config::TimeoutConfig{}, nullptr, registry);
    ToolCallRequest req;
    req.name = "boom";
    req.requestId = "r-9";
    EXPECT_THROW(stage.Handle(ToolCallContext::Create(req),
                              [](const ToolCallContext&) -> CallToolResult { throw std::runtime_error("x"); }),
                 std::runtime_error);
    EXPECT_EQ(registry->Size(), 0u);
}

TEST(SetupMiddleware, ProgressGoesToSink) {
    std::vector<JSONValue> sent;
    SetupMiddleware stage(config::TimeoutConfig{}, [&](const JSONValue& p) { sent.push_back(p); });
    ToolCallRequest req;
    req.name = "steps";
    req.progressToken = JSONValue("tok");
    stage.Handle(ToolCallContext::Create(req), [](const ToolCallContext& c) {
        c.Progress()->Notify("half", 0.5);
        return CallToolResult::Text("");
    });
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(GetString(sent[0], "progressToken").value_or(""), "tok");
}

TEST(ConcurrencyMiddleware, RejectsWhenToolIsSaturated) {
    auto limiter = std::make_shared<ConcurrencyLimiter>(10, std::unordered_map<std::string, int>{{"build", 1}});
    ConcurrencyMiddleware stage(limiter);

    limiter->Start("build");
    Capture cap;
    auto rejected = stage.Handle(makeContext("build"), cap.Next());
    EXPECT_TRUE(rejected.isError);
    EXPECT_EQ(rejected.errorKind, errors::ErrorKind::ConcurrencyLimitExceeded);
    EXPECT_EQ(rejected.TextContent().rfind("Concurrency limit reached: ", 0), 0u);
    EXPECT_FALSE(cap.seen.has_value());
    limiter->Complete("build");

    EXPECT_FALSE(stage.Handle(makeContext("build"), cap.Next()).isError);
    EXPECT_EQ(limiter->GetCurrentCount("build"), 0);
}

TEST(ConcurrencyMiddleware, HoldsSlotWhileChainRuns) {
    auto limiter = std::make_shared<ConcurrencyLimiter>(4);
    ConcurrencyMiddleware stage(limiter);
    stage.Handle(makeContext("t"), [&](const ToolCallContext&) {
        EXPECT_EQ(limiter->GetCurrentCount("t"), 1);
        return CallToolResult::Text("");
    });
    EXPECT_EQ(limiter->GetTotalCount(), 0);
}

TEST(TimeoutMiddleware, ExpiryCancelsTokenAndReturnsError) {
    TimeoutMiddleware stage;
    auto token = std::make_shared<CancellationToken>();
    auto ctx = makeContext("slow").WithCallResources(token, std::make_shared<ProgressNotifier>(), 50ms);

    auto release = std::make_shared<std::promise<void>>();
    auto released = release->get_future().share();
    auto result = stage.Handle(ctx, [released](const ToolCallContext&) {
        released.wait_for(2s);
        return CallToolResult::Text("late");
    });
    EXPECT_TRUE(result.isError);
    EXPECT_EQ(result.errorKind, errors::ErrorKind::TimeoutExceeded);
    EXPECT_EQ(result.TextContent(), "Timeout: Operation (slow) timed out after 50ms");
    EXPECT_TRUE(token->IsCancelled());
    release->set_value();
}

TEST(TimeoutMiddleware, FastChainUnaffected) {
    TimeoutMiddleware stage;
    auto token = std::make_shared<CancellationToken>();
    auto ctx = makeContext("fast").WithCallResources(token, std::make_shared<ProgressNotifier>(), 1000ms);
    Capture cap;
    auto result = stage.Handle(ctx, cap.Next());
    EXPECT_EQ(result.TextContent(), "next");
    EXPECT_FALSE(token->IsCancelled());
}

TEST(ExecutionMiddleware, PassesRawResultOn) {
    auto tools = std::make_shared<ToolRegistry>();
    tools->Register(makeTool("answer", JSONValue(static_cast<int64_t>(42))));
    ExecutionMiddleware stage(tools, defaultSizes());
    Capture cap;
    auto ctx = makeContext("answer").WithTool(tools->GetTool("answer"));
    stage.Handle(ctx, cap.Next());
    ASSERT_TRUE(cap.seen.has_value());
    ASSERT_TRUE(cap.seen->RawResult().has_value());
    EXPECT_EQ(SerializeJSON(cap.seen->RawResult().value()), "42");
}

TEST(ExecutionMiddleware, CancelledTokenAbandonsPendingHandler) {
    auto tools = std::make_shared<ToolRegistry>();
    auto gate = std::make_shared<std::promise<JSONValue>>();
    auto shared = gate->get_future().share();
    ToolDefinition def;
    def.name = "hang";
    def.handler = [shared](const JSONValue&, std::shared_ptr<CancellationToken>, std::shared_ptr<ProgressNotifier>) {
        auto out = std::make_shared<std::promise<JSONValue>>();
        std::thread([shared, out]() { out->set_value(shared.get()); }).detach();
        return out->get_future();
    };
    tools->Register(def);

    ExecutionMiddleware stage(tools, defaultSizes(), 5ms);
    auto token = std::make_shared<CancellationToken>();
    auto ctx = makeContext("hang").WithTool(tools->GetTool("hang"))
                   .WithCallResources(token, std::make_shared<ProgressNotifier>(), 1000ms);

    std::thread canceller([token]() {
        std::this_thread::sleep_for(30ms);
        token->Cancel();
    });
    Capture cap;
    EXPECT_THROW(stage.Handle(ctx, cap.Next()), errors::CancellationRequestedError);
    canceller.join();
    gate->set_value(JSONValue(nullptr));
}

TEST(ExecutionMiddleware, OversizedResultRejected) {
    auto tools = std::make_shared<ToolRegistry>();
    tools->Register(makeTool("big", JSONValue(std::string(100, 'y'))));
    config::SizeLimits limits;
    limits.maxResultSize = 10;
    ExecutionMiddleware stage(tools, std::make_shared<validation::SizeValidator>(limits));
    Capture cap;
    EXPECT_THROW(stage.Handle(makeContext("big").WithTool(tools->GetTool("big")), cap.Next()),
                 errors::SizeLimitExceededError);
}

TEST(ExecutionMiddleware, RequiresResolvedTool) {
    ExecutionMiddleware stage(std::make_shared<ToolRegistry>(), defaultSizes());
    Capture cap;
    EXPECT_THROW(stage.Handle(makeContext("x"), cap.Next()), std::logic_error);
}

TEST(ResultConversionMiddleware, PlainResultBecomesJsonText) {
    auto tool = std::make_shared<const ToolDefinition>(makeTool("t"));
    ResultConversionMiddleware stage;
    Capture cap;
    auto result = stage.Handle(makeContext("t").WithTool(tool).WithRawResult(JSONValue("hi")), cap.Next());
    EXPECT_FALSE(result.isError);
    EXPECT_EQ(result.TextContent(), "\"hi\"");
    EXPECT_FALSE(result.structuredContent.has_value());
    EXPECT_FALSE(cap.seen.has_value());
}

TEST(ResultConversionMiddleware, OutputSchemaProducesStructuredContent) {
    auto def = makeTool("count");
    def.outputSchema = ParseJSON(R"({"type":"object","properties":{"result":{"type":"integer"}},"required":["result"]})");
    auto tool = std::make_shared<const ToolDefinition>(def);
    ResultConversionMiddleware stage;
    Capture cap;

    auto result = stage.Handle(
        makeContext("count").WithTool(tool).WithRawResult(JSONValue(static_cast<int64_t>(3))), cap.Next());
    ASSERT_TRUE(result.structuredContent.has_value());
    EXPECT_EQ(GetInt(result.structuredContent.value(), "result").value_or(0), 3);
    EXPECT_EQ(result.TextContent(), "3");

    EXPECT_THROW(stage.Handle(makeContext("count").WithTool(tool).WithRawResult(JSONValue("three")), cap.Next()),
                 errors::SchemaValidationFailedError);
}

TEST(ErrorHandlingMiddleware, ConvertsExceptionsToResults) {
    ErrorHandlingMiddleware stage;
    auto typed = stage.Handle(makeContext("c"), [](const ToolCallContext&) -> CallToolResult {
        throw errors::CancellationRequestedError("Tool call cancelled: c");
    });
    EXPECT_TRUE(typed.isError);
    EXPECT_EQ(typed.errorKind, errors::ErrorKind::CancellationRequested);
    EXPECT_EQ(typed.TextContent(), "Cancelled: Tool call cancelled: c");

    auto plain = stage.Handle(makeContext("c"), [](const ToolCallContext&) -> CallToolResult {
        throw std::out_of_range("index 3");
    });
    EXPECT_EQ(plain.errorKind, errors::ErrorKind::Unknown);
    EXPECT_EQ(plain.TextContent(), "Error: index 3");

    auto ok = stage.Handle(makeContext("c"), [](const ToolCallContext&) { return CallToolResult::Text("fine"); });
    EXPECT_FALSE(ok.isError);
}

TEST(ErrorHandlingMiddleware, ConvertsNonStandardThrows) {
    ErrorHandlingMiddleware stage;
    CallToolResult result;
    EXPECT_NO_THROW(result = stage.Handle(makeContext("odd"), [](const ToolCallContext&) -> CallToolResult {
        throw 42;
    }));
    EXPECT_TRUE(result.isError);
    EXPECT_EQ(result.errorKind, errors::ErrorKind::Unknown);
    EXPECT_EQ(result.TextContent(), "Error: unknown exception");
}

TEST(ErrorHandlingMiddleware, NonStandardThrowFromHandlerBecomesToolError) {
    auto tools = std::make_shared<ToolRegistry>();
    tools->Register(ToolDefinition{"odd", "Throws an int", std::nullopt, std::nullopt, {},
        [](const JSONValue&, std::shared_ptr<CancellationToken>, std::shared_ptr<ProgressNotifier>)
            -> std::future<JSONValue> {
            throw 42;
        }});
    auto server = ServerBuilder().WithToolRegistry(tools).Build();

    pipeline::ToolCallRequest req;
    req.name = "odd";
    req.requestId = "odd-1";
    auto fut = server->CallTool(req);
    CallToolResult result;
    EXPECT_NO_THROW(result = fut.get());
    EXPECT_TRUE(result.isError);
    EXPECT_EQ(result.errorKind, errors::ErrorKind::Unknown);
    EXPECT_EQ(result.TextContent(), "Error: unknown exception");
}

TEST(LoggingMiddleware, RethrowsFailures) {
    LoggingMiddleware stage;
    EXPECT_THROW(stage.Handle(makeContext("l"),
                              [](const ToolCallContext&) -> CallToolResult { throw std::runtime_error("x"); }),
                 std::runtime_error);
    EXPECT_EQ(stage.Handle(makeContext("l"), [](const ToolCallContext&) { return CallToolResult::Text("y"); })
                  .TextContent(),
              "y");
}
