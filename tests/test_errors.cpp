//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: GoogleTests for the error taxonomy, Result values and JSON-RPC error mapping helpers
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "toolclient/JSONRPCTypes.h"
#include "toolclient/errors/Errors.h"

using namespace toolclient;
using namespace toolclient::errors;

TEST(Errors, KindNames) {
    EXPECT_STREQ(toString(ErrorKind::UnknownServer), "UnknownServer");
    EXPECT_STREQ(toString(ErrorKind::NotConnected), "NotConnected");
    EXPECT_STREQ(toString(ErrorKind::ConfigError), "ConfigError");
}

TEST(Errors, ExceptionCarriesKind) {
    try {
        throw ToolClientError(ErrorKind::Timeout, "no response within 10 ms");
    } catch (const std::runtime_error& e) {
        const auto* typed = dynamic_cast<const ToolClientError*>(&e);
        ASSERT_NE(typed, nullptr);
        EXPECT_EQ(typed->kind(), ErrorKind::Timeout);
        Failure f = typed->toFailure();
        EXPECT_EQ(f.message, "no response within 10 ms");
        EXPECT_EQ(f.describe(), "Timeout: no response within 10 ms");
    }
}

TEST(Errors, ResultHoldsValueOrFailure) {
    Result<int> ok(42);
    EXPECT_TRUE(ok.IsOk());
    EXPECT_TRUE(static_cast<bool>(ok));
    EXPECT_EQ(ok.Value(), 42);
    EXPECT_THROW(ok.Error(), std::logic_error);

    auto bad = Result<std::vector<int>>::Fail(ErrorKind::UnknownTool, "server 'x' has no tool 'y'");
    EXPECT_FALSE(bad.IsOk());
    EXPECT_EQ(bad.Error().kind, ErrorKind::UnknownTool);
    try {
        bad.Value();
        FAIL() << "Value() on a failure must throw";
    } catch (const ToolClientError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnknownTool);
    }

    Status done = Ok();
    EXPECT_TRUE(done.IsOk());
}

TEST(Errors, RpcErrorFromResponse) {
    JSONRPCResponse resp(int64_t{1}, CreateErrorObject(JSONRPCErrorCodes::InvalidParams, "Unknown tool: nope",
                                                       JSONValue(std::string("detail"))), true);
    auto parsed = rpcErrorFromResponse(resp);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->code, JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(parsed->message, "Unknown tool: nope");
    ASSERT_TRUE(parsed->data.has_value());
    EXPECT_EQ(describeRpcError(resp), "Unknown tool: nope (code -32602)");
}

TEST(Errors, MalformedErrorObjectIsDescribed) {
    JSONRPCResponse resp(int64_t{1}, JSONValue(std::string("oops")), true);
    EXPECT_FALSE(rpcErrorFromResponse(resp).has_value());
    EXPECT_NE(describeRpcError(resp).find("malformed error object"), std::string::npos);

    JSONRPCResponse success(int64_t{2}, JSONValue(JSONValue::Object{}));
    EXPECT_FALSE(rpcErrorFromResponse(success).has_value());
}
