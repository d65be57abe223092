//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_prompt_registry.cpp
// Purpose: Prompt listing, variable binding and template rendering
//==========================================================================================================

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "toolhost/PromptRegistry.h"
#include "toolhost/errors/Errors.h"

using namespace toolhost;

namespace {
PromptDefinition reviewPrompt() {
    PromptDefinition p;
    p.id = "review";
    p.title = "Code review";
    p.description = "Review a file";
    p.variables = {PromptVariable{"file", "File to review", true, std::nullopt},
                   PromptVariable{"focus", "Review focus", false, std::string("correctness")}};
    p.messageTemplate = "Review {{file}} with a focus on {{focus}}.";
    return p;
}
} // namespace

TEST(PromptRegistry, RendersSuppliedAndDefaultVariables) {
    PromptRegistry registry;
    registry.Register(reviewPrompt());
    auto r = registry.GetPrompt("review", MakeObject({{"file", JSONValue("main.cpp")}}));
    ASSERT_TRUE(r.IsComplete());
    EXPECT_EQ(r.text.value(), "Review main.cpp with a focus on correctness.");

    r = registry.GetPrompt("review", MakeObject({{"file", JSONValue("a.h")}, {"focus", JSONValue("style")}}));
    EXPECT_EQ(r.text.value(), "Review a.h with a focus on style.");
}

TEST(PromptRegistry, MissingRequiredVariableIsReported) {
    PromptRegistry registry;
    registry.Register(reviewPrompt());
    auto r = registry.GetPrompt("review", JSONValue(JSONValue::Object{}));
    EXPECT_FALSE(r.IsComplete());
    ASSERT_EQ(r.variablesNeeded.size(), 1u);
    EXPECT_EQ(r.variablesNeeded[0], "file");

    JSONValue j = r.ToJSON();
    const JSONValue* messages = FindMember(j, "messages");
    ASSERT_NE(messages, nullptr);
    EXPECT_TRUE(std::get<JSONValue::Array>(messages->value).empty());
    EXPECT_NE(FindMember(j, "variablesNeeded"), nullptr);
}

TEST(PromptRegistry, EmptyValueCountsAsMissing) {
    PromptRegistry registry;
    registry.Register(reviewPrompt());
    auto r = registry.GetPrompt("review", MakeObject({{"file", JSONValue("")}, {"focus", JSONValue("")}}));
    ASSERT_EQ(r.variablesNeeded.size(), 1u);
}

TEST(PromptRegistry, ScalarValuesRenderAsText) {
    PromptRegistry registry;
    PromptDefinition p;
    p.id = "count";
    p.variables = {PromptVariable{"n", "", true, std::nullopt}, PromptVariable{"flag", "", true, std::nullopt}};
    p.messageTemplate = "{{n}}/{{flag}}";
    registry.Register(p);
    auto r = registry.GetPrompt("count", MakeObject({{"n", JSONValue(static_cast<int64_t>(3))}, {"flag", JSONValue(true)}}));
    EXPECT_EQ(r.text.value_or(""), "3/true");
}

TEST(PromptRegistry, UnknownPromptThrows) {
    PromptRegistry registry;
    EXPECT_THROW(registry.GetPrompt("nope", JSONValue(JSONValue::Object{})), errors::PromptNotFoundError);
}

TEST(PromptRegistry, ResolverTakesPrecedenceOverTemplate) {
    PromptRegistry registry;
    PromptDefinition p = reviewPrompt();
    p.resolver = [](const PromptBindings& b) { return "custom:" + b.at("file") + ":" + b.at("focus"); };
    registry.Register(p);
    auto r = registry.GetPrompt("review", MakeObject({{"file", JSONValue("x")}}));
    EXPECT_EQ(r.text.value_or(""), "custom:x:correctness");

    JSONValue j = r.ToJSON();
    const auto& messages = std::get<JSONValue::Array>(FindMember(j, "messages")->value);
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(GetString(*messages[0], "role").value_or(""), "user");
    const JSONValue* content = FindMember(*messages[0], "content");
    ASSERT_NE(content, nullptr);
    EXPECT_EQ(GetString(*content, "text").value_or(""), "custom:x:correctness");
}

TEST(PromptRegistry, ListEntryDescribesVariables) {
    PromptRegistry registry;
    registry.Register(reviewPrompt());
    auto listed = registry.List();
    ASSERT_EQ(listed.size(), 1u);
    JSONValue entry = listed[0].ToListEntry();
    EXPECT_EQ(GetString(entry, "id").value_or(""), "review");
    EXPECT_EQ(GetString(entry, "name").value_or(""), "review");
    const auto& vars = std::get<JSONValue::Array>(FindMember(entry, "variables")->value);
    ASSERT_EQ(vars.size(), 2u);
    EXPECT_TRUE(GetBool(*vars[0], "required").value_or(false));
    EXPECT_EQ(GetString(*vars[1], "default").value_or(""), "correctness");
}

TEST(PromptRegistry, RenderTemplateLeavesUnknownPlaceholders) {
    EXPECT_EQ(PromptRegistry::RenderTemplate("{{a}} and {{b}}", {{"a", "1"}}), "1 and {{b}}");
    EXPECT_EQ(PromptRegistry::RenderTemplate("open {{ never closed", {}), "open {{ never closed");
}

TEST(PromptRegistry, OverwriteKeepsOrderAndRejectsEmptyId) {
    PromptRegistry registry;
    registry.Register(reviewPrompt());
    PromptDefinition other;
    other.id = "other";
    registry.Register(other);
    PromptDefinition replaced = reviewPrompt();
    replaced.title = "Replaced";
    registry.Register(replaced);
    auto listed = registry.List();
    ASSERT_EQ(listed.size(), 2u);
    EXPECT_EQ(listed[0].title, "Replaced");
    EXPECT_TRUE(registry.Has("other"));
    EXPECT_THROW(registry.Register(PromptDefinition{}), std::invalid_argument);
}
