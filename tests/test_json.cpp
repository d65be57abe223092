//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_json.cpp
// Purpose: JSON value parsing, helpers and JSON-RPC message serialization
//==========================================================================================================

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "toolhost/JSONRPCTypes.h"

using namespace toolhost;

TEST(Json, ParsesScalarsAndNesting) {
    JSONValue v = ParseJSON(R"({"a":1,"b":2.5,"c":"x\ny","d":[true,null],"e":{"f":-3}})");
    ASSERT_TRUE(v.IsObject());
    EXPECT_EQ(GetInt(v, "a").value_or(0), 1);
    const JSONValue* b = FindMember(v, "b");
    ASSERT_NE(b, nullptr);
    EXPECT_DOUBLE_EQ(std::get<double>(b->value), 2.5);
    EXPECT_EQ(GetString(v, "c").value_or(""), "x\ny");
    const JSONValue* d = FindMember(v, "d");
    ASSERT_NE(d, nullptr);
    ASSERT_TRUE(d->IsArray());
    const auto& arr = std::get<JSONValue::Array>(d->value);
    ASSERT_EQ(arr.size(), 2u);
    EXPECT_TRUE(std::get<bool>(arr[0]->value));
    EXPECT_TRUE(arr[1]->IsNull());
    const JSONValue* e = FindMember(v, "e");
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(GetInt(*e, "f").value_or(0), -3);
}

TEST(Json, RejectsMalformedInput) {
    EXPECT_THROW(ParseJSON("{"), std::runtime_error);
    EXPECT_THROW(ParseJSON("\"unterminated"), std::runtime_error);
}

TEST(Json, SerializeEscapesStrings) {
    EXPECT_EQ(SerializeJSON(JSONValue("a\"b\\c")), "\"a\\\"b\\\\c\"");
    EXPECT_EQ(SerializeJSON(MakeArray({JSONValue(static_cast<int64_t>(1)), JSONValue(false), JSONValue(nullptr)})),
              "[1,false,null]");
}

TEST(Json, TypedGettersIgnoreWrongTypes) {
    JSONValue v = MakeObject({{"s", JSONValue("text")}, {"n", JSONValue(static_cast<int64_t>(4))},
                              {"whole", JSONValue(3.0)}, {"frac", JSONValue(3.5)}});
    EXPECT_FALSE(GetInt(v, "s").has_value());
    EXPECT_FALSE(GetString(v, "n").has_value());
    EXPECT_FALSE(GetBool(v, "n").has_value());
    EXPECT_EQ(GetInt(v, "whole").value_or(0), 3);
    EXPECT_FALSE(GetInt(v, "frac").has_value());
    EXPECT_EQ(FindMember(JSONValue("not an object"), "s"), nullptr);
}

TEST(Json, RequestRoundTripKeepsIdType) {
    JSONRPCRequest req(JSONRPCId{static_cast<int64_t>(42)}, "tools/call",
                       MakeObject({{"name", JSONValue("echo")}}));
    JSONRPCRequest back;
    ASSERT_TRUE(back.Deserialize(req.Serialize()));
    ASSERT_TRUE(std::holds_alternative<int64_t>(back.id));
    EXPECT_EQ(std::get<int64_t>(back.id), 42);
    EXPECT_EQ(back.method, "tools/call");
    ASSERT_TRUE(back.params.has_value());
    EXPECT_EQ(GetString(back.params.value(), "name").value_or(""), "echo");
    EXPECT_EQ(IdToString(back.id), "42");
}

TEST(Json, ErrorResponseCarriesCodeAndData) {
    auto resp = CreateErrorResponse(JSONRPCId{std::string("r1")}, JSONRPCErrorCodes::InvalidParams, "bad",
                                    MakeObject({{"field", JSONValue("uri")}}));
    JSONRPCResponse back;
    ASSERT_TRUE(back.Deserialize(resp->Serialize()));
    ASSERT_TRUE(back.IsError());
    EXPECT_EQ(GetInt(back.error.value(), "code").value_or(0), JSONRPCErrorCodes::InvalidParams);
    const JSONValue* data = FindMember(back.error.value(), "data");
    ASSERT_NE(data, nullptr);
    EXPECT_EQ(GetString(*data, "field").value_or(""), "uri");
}

TEST(Json, NotificationWithoutParams) {
    JSONRPCNotification n("notifications/initialized");
    JSONRPCNotification back;
    ASSERT_TRUE(back.Deserialize(n.Serialize()));
    EXPECT_EQ(back.method, "notifications/initialized");
    EXPECT_FALSE(back.params.has_value());
}
