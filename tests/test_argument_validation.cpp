//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_argument_validation.cpp
// Purpose: Argument checks against input schemas and decoding of tool results
//==========================================================================================================

#include <gtest/gtest.h>

#include "toolclient/JSONRPCTypes.h"
#include "toolclient/Protocol.h"
#include "toolclient/validation/Validation.h"
#include "toolclient/validation/Validators.h"

using namespace toolclient;
using namespace toolclient::validation;
using errors::ErrorKind;

namespace {
const char* kSchema = R"({"type":"object",
  "properties":{"path":{"type":"string"},"max_length":{"type":"integer"},"ratio":{"type":["number","null"]}},
  "required":["path"]})";
} // namespace

TEST(ArgumentValidation, AcceptsWellTypedArguments) {
    const JSONValue schema = parseJSON(kSchema);
    EXPECT_FALSE(checkToolArguments(schema, parseJSON(R"({"path":"a.txt"})")).has_value());
    EXPECT_FALSE(checkToolArguments(schema, parseJSON(R"({"path":"a.txt","max_length":10,"ratio":null})")).has_value());
    EXPECT_FALSE(checkToolArguments(schema, parseJSON(R"({"path":"a.txt","max_length":10.0,"extra":1})")).has_value());
}

TEST(ArgumentValidation, ReportsMissingRequired) {
    const JSONValue schema = parseJSON(kSchema);
    auto problem = checkToolArguments(schema, parseJSON("{}"));
    ASSERT_TRUE(problem.has_value());
    EXPECT_EQ(*problem, "missing required argument 'path'");
    EXPECT_TRUE(checkToolArguments(schema, JSONValue{}).has_value());
}

TEST(ArgumentValidation, ReportsWrongTypes) {
    const JSONValue schema = parseJSON(kSchema);
    auto problem = checkToolArguments(schema, parseJSON(R"({"path":3})"));
    ASSERT_TRUE(problem.has_value());
    EXPECT_EQ(*problem, "argument 'path' must be string, got integer");
    EXPECT_TRUE(checkToolArguments(schema, parseJSON(R"({"path":"a","max_length":1.5})")).has_value());
    EXPECT_TRUE(checkToolArguments(schema, parseJSON(R"({"path":"a","ratio":"x"})")).has_value());
}

TEST(ArgumentValidation, ArgumentsMustBeAnObject) {
    auto problem = checkToolArguments(parseJSON(R"({"type":"object"})"), parseJSON("[1]"));
    ASSERT_TRUE(problem.has_value());
    EXPECT_EQ(*problem, "arguments must be a JSON object, got array");
    EXPECT_FALSE(checkToolArguments(parseJSON(R"({"type":"object"})"), JSONValue{}).has_value());
}

TEST(ArgumentValidation, ModeParsing) {
    EXPECT_EQ(parseMode("strict"), ValidationMode::Strict);
    EXPECT_EQ(parseMode("off"), ValidationMode::Off);
    EXPECT_EQ(parseMode("anything"), ValidationMode::Off);
    EXPECT_STREQ(toString(ValidationMode::Strict), "Strict");
}

TEST(ToolResultDecoding, SuccessKeepsContentOrder) {
    auto r = ParseToolCallResult(parseJSON(R"({"content":[{"type":"text","text":"a"},
        {"type":"image","data":"AAAA","mimeType":"image/png"},{"type":"text","text":"b"}]})"), ValidationMode::Off);
    ASSERT_TRUE(r.IsSuccess());
    ASSERT_EQ(r.content.size(), 3u);
    EXPECT_EQ(r.content[1].type, "image");
    EXPECT_FALSE(r.content[1].Text().has_value());
    EXPECT_EQ(r.JoinedText(), "a\nb");
}

TEST(ToolResultDecoding, IsErrorBecomesServerError) {
    auto r = ParseToolCallResult(parseJSON(R"({"content":[{"type":"text","text":"disk full"}],"isError":true})"),
                                 ValidationMode::Off);
    ASSERT_FALSE(r.IsSuccess());
    EXPECT_EQ(r.failure->kind, ErrorKind::ServerError);
    EXPECT_EQ(r.failure->message, "disk full");
    EXPECT_EQ(r.content.size(), 1u);
    EXPECT_EQ(serializeJSONValue(r.ToJSON()), R"({"content":[{"text":"disk full","type":"text"}],"isError":true})");
}

TEST(ToolResultDecoding, StrictModeRejectsMalformedResults) {
    const JSONValue loose = parseJSON(R"({"content":[{"type":"text"}]})");
    EXPECT_TRUE(ParseToolCallResult(loose, ValidationMode::Off).IsSuccess());
    auto strict = ParseToolCallResult(loose, ValidationMode::Strict);
    ASSERT_FALSE(strict.IsSuccess());
    EXPECT_EQ(strict.failure->message, "malformed tool result");
    EXPECT_FALSE(ParseToolCallResult(parseJSON("{}"), ValidationMode::Strict).IsSuccess());
}

TEST(ProtocolDecoding, InitializeResultNeedsProtocolVersion) {
    auto init = ParseInitializeResult(parseJSON(R"({"protocolVersion":"2025-11-25",
        "serverInfo":{"name":"files","version":"2.1"},"capabilities":{"tools":{"listChanged":true},"logging":{}}})"));
    EXPECT_EQ(init.serverInfo.name, "files");
    ASSERT_TRUE(init.capabilities.tools.has_value());
    EXPECT_TRUE(init.capabilities.tools->listChanged);
    EXPECT_FALSE(init.capabilities.resources.has_value());
    EXPECT_TRUE(init.capabilities.logging);

    try {
        ParseInitializeResult(parseJSON(R"({"serverInfo":{}})"));
        FAIL() << "expected ConnectError";
    } catch (const errors::ToolClientError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ConnectError);
    }
}

TEST(ProtocolDecoding, ToolsPageSkipsNamelessEntriesAndDefaultsSchema) {
    auto page = ParseToolsListPage(parseJSON(R"({"tools":[{"name":"b"},{"description":"x"},{"name":"a",
        "inputSchema":{"type":"object","properties":{}}}],"nextCursor":"2"})"));
    ASSERT_EQ(page.tools.size(), 2u);
    EXPECT_EQ(page.tools[0].name, "b");
    EXPECT_EQ(getStringField(page.tools[0].inputSchema, "type").value(), "object");
    EXPECT_EQ(page.tools[1].name, "a");
    EXPECT_EQ(page.nextCursor.value(), "2");
    EXPECT_THROW(ParseToolsListPage(parseJSON("{}")), errors::ToolClientError);
}

TEST(ProtocolEncoding, CallParamsReplaceNullArguments) {
    JSONValue params = MakeCallToolParams("repeat", JSONValue{});
    EXPECT_EQ(serializeJSONValue(params), R"({"arguments":{},"name":"repeat"})");
}
