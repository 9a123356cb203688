//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_json.cpp
// Purpose: JSON value parsing/serialization, JSON-RPC message classification and error envelopes
//==========================================================================================================

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "mcpgw/JSONRPCTypes.h"
#include "mcpgw/errors/Errors.h"

using namespace mcpgw;

TEST(JSONValueParse, ScalarsAndNesting) {
    JSONValue v = ParseJSON("{\"a\":1,\"b\":2.5,\"c\":\"x\\ny\",\"d\":[true,false,null],\"e\":{\"f\":-7}}");
    ASSERT_TRUE(v.IsObject());
    EXPECT_TRUE(std::holds_alternative<int64_t>(FindMember(v, "a")->value));
    EXPECT_DOUBLE_EQ(GetNumberMember(v, "b").value_or(0), 2.5);
    EXPECT_EQ(GetStringMember(v, "c").value_or(""), std::string("x\ny"));
    const JSONValue* d = FindMember(v, "d");
    ASSERT_NE(d, nullptr);
    ASSERT_TRUE(d->IsArray());
    EXPECT_EQ(std::get<JSONValue::Array>(d->value).size(), 3u);
    const JSONValue* e = FindMember(v, "e");
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(GetNumberMember(*e, "f").value_or(0), -7);
}

TEST(JSONValueParse, UnicodeEscape) {
    JSONValue v = ParseJSON("\"caf\\u00e9\"");
    EXPECT_EQ(std::get<std::string>(v.value), std::string("caf\xC3\xA9"));
}

TEST(JSONValueParse, MalformedInputThrows) {
    EXPECT_THROW(ParseJSON(""), std::runtime_error);
    EXPECT_THROW(ParseJSON("{\"a\":}"), std::runtime_error);
    EXPECT_THROW(ParseJSON("[1,2"), std::runtime_error);
    EXPECT_THROW(ParseJSON("{} trailing"), std::runtime_error);
    EXPECT_THROW(ParseJSON("\"unterminated"), std::runtime_error);
    EXPECT_THROW(ParseJSON("tru"), std::runtime_error);
}

TEST(JSONValueParse, DeepNestingRejected) {
    std::string deep(200, '[');
    deep += std::string(200, ']');
    EXPECT_THROW(ParseJSON(deep), std::runtime_error);
}

TEST(JSONValueSerialize, EscapesControlCharacters) {
    JSONValue v{std::string("a\"b\\c\td\x01")};
    EXPECT_EQ(SerializeJSON(v), std::string("\"a\\\"b\\\\c\\td\\u0001\""));
}

TEST(JSONValueSerialize, ReparsesToSameMembers) {
    JSONValue::Object o;
    o["n"] = std::make_shared<JSONValue>(static_cast<int64_t>(42));
    o["s"] = std::make_shared<JSONValue>("hi");
    o["z"] = std::make_shared<JSONValue>(nullptr);
    JSONValue back = ParseJSON(SerializeJSON(JSONValue{o}));
    EXPECT_EQ(GetNumberMember(back, "n").value_or(0), 42);
    EXPECT_EQ(GetStringMember(back, "s").value_or(""), std::string("hi"));
    ASSERT_NE(FindMember(back, "z"), nullptr);
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(FindMember(back, "z")->value));
}

TEST(MemberHelpers, WrongTypesAreEmpty) {
    JSONValue v = ParseJSON("{\"s\":1,\"n\":\"one\"}");
    EXPECT_FALSE(GetStringMember(v, "s").has_value());
    EXPECT_FALSE(GetNumberMember(v, "n").has_value());
    EXPECT_FALSE(GetStringMember(v, "missing").has_value());
    EXPECT_EQ(FindMember(ParseJSON("[1]"), "s"), nullptr);
}

TEST(ClassifyMessage, Shapes) {
    EXPECT_EQ(ClassifyMessage(ParseJSON("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}")), JSONRPCMessageKind::Request);
    EXPECT_EQ(ClassifyMessage(ParseJSON("{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}")),
              JSONRPCMessageKind::Notification);
    EXPECT_EQ(ClassifyMessage(ParseJSON("{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{}}")), JSONRPCMessageKind::Response);
    EXPECT_EQ(ClassifyMessage(ParseJSON("{\"jsonrpc\":\"2.0\",\"id\":1}")), JSONRPCMessageKind::Invalid);
    EXPECT_EQ(ClassifyMessage(ParseJSON("{\"id\":1,\"method\":7}")), JSONRPCMessageKind::Invalid);
    EXPECT_EQ(ClassifyMessage(ParseJSON("42")), JSONRPCMessageKind::Invalid);
}

TEST(IsInitializeRequest, OnlySingleInitializeRequests) {
    EXPECT_TRUE(IsInitializeRequest("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"initialize\",\"params\":{}}"));
    EXPECT_FALSE(IsInitializeRequest("{\"jsonrpc\":\"2.0\",\"method\":\"initialize\"}"));
    EXPECT_FALSE(IsInitializeRequest("[{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"initialize\"}]"));
    EXPECT_FALSE(IsInitializeRequest("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}"));
    EXPECT_FALSE(IsInitializeRequest("not json"));
    EXPECT_FALSE(IsInitializeRequest(""));
}

TEST(JSONRPCRequest, FromJSONReadsIdVariants) {
    JSONRPCRequest r;
    ASSERT_TRUE(r.FromJSON(ParseJSON("{\"jsonrpc\":\"2.0\",\"id\":\"abc\",\"method\":\"tools/list\"}")));
    EXPECT_EQ(std::get<std::string>(r.id), std::string("abc"));
    EXPECT_FALSE(r.params.has_value());

    ASSERT_TRUE(r.FromJSON(ParseJSON("{\"jsonrpc\":\"2.0\",\"id\":3.0,\"method\":\"ping\",\"params\":{\"x\":1}}")));
    EXPECT_EQ(std::get<int64_t>(r.id), 3);
    EXPECT_TRUE(r.params.has_value());

    EXPECT_FALSE(r.FromJSON(ParseJSON("{\"jsonrpc\":\"2.0\",\"id\":1.5,\"method\":\"ping\"}")));
    EXPECT_FALSE(r.FromJSON(ParseJSON("{\"jsonrpc\":\"2.0\",\"id\":[1],\"method\":\"ping\"}")));
}

TEST(JSONRPCResponse, SerializeCarriesIdAndResult) {
    JSONValue::Object result;
    result["ok"] = std::make_shared<JSONValue>(true);
    JSONRPCResponse r(static_cast<int64_t>(9), JSONValue{result});
    JSONValue back = ParseJSON(r.Serialize());
    EXPECT_EQ(GetStringMember(back, "jsonrpc").value_or(""), std::string("2.0"));
    EXPECT_EQ(GetNumberMember(back, "id").value_or(0), 9);
    EXPECT_NE(FindMember(back, "result"), nullptr);
    EXPECT_EQ(FindMember(back, "error"), nullptr);
}

TEST(CreateErrorResponse, ShapeWithOptionalData) {
    auto plain = CreateErrorResponse(std::string("req-1"), JSONRPCErrorCodes::MethodNotFound, "Method not found");
    EXPECT_TRUE(plain->IsError());
    JSONValue p = ParseJSON(plain->Serialize());
    EXPECT_EQ(GetStringMember(p, "id").value_or(""), std::string("req-1"));
    const JSONValue* err = FindMember(p, "error");
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(GetNumberMember(*err, "code").value_or(0), -32601);
    EXPECT_EQ(GetStringMember(*err, "message").value_or(""), std::string("Method not found"));
    EXPECT_EQ(FindMember(*err, "data"), nullptr);

    auto withData = CreateErrorResponse(nullptr, JSONRPCErrorCodes::InvalidParams, "bad", JSONValue{std::string("detail")});
    JSONValue w = ParseJSON(withData->Serialize());
    EXPECT_EQ(GetStringMember(*FindMember(w, "error"), "data").value_or(""), std::string("detail"));
}

TEST(GatewayErrors, EnvelopesAndStatuses) {
    const std::string env = errors::makeErrorEnvelope(errors::sessionFailure("Bad Request: No valid session ID provided"));
    JSONValue v = ParseJSON(env);
    const JSONValue* id = FindMember(v, "id");
    ASSERT_NE(id, nullptr);
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(id->value));
    EXPECT_EQ(GetNumberMember(*FindMember(v, "error"), "code").value_or(0), -32000);

    EXPECT_EQ(errors::httpStatusForCategory(errors::ErrorCategory::SessionFailure), 400);
    EXPECT_EQ(errors::httpStatusForCategory(errors::ErrorCategory::AuthenticationFailure), 401);
    EXPECT_EQ(errors::httpStatusForCategory(errors::ErrorCategory::ConfigurationFault), 500);
    EXPECT_EQ(errors::internalFault("x").rpcCode, -32603);
    EXPECT_STREQ(errors::categoryName(errors::ErrorCategory::InternalFault), "InternalFault");
}
