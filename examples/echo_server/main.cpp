//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: examples/echo_server/main.cpp
// Purpose: Minimal stdio tool server (repeat, add, sleep, fail, read) for demos and integration tests
//==========================================================================================================

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

#include "logging/Logger.h"
#include "toolclient/JSONRPCTypes.h"
#include "toolclient/JsonRpcMessageRouter.h"
#include "toolclient/Protocol.h"

using namespace toolclient;

namespace {

// Catalog served by tools/list, in this order.
const char* kToolCatalog = R"JSON({"tools":[
  {"name":"repeat","description":"Returns the given text unchanged",
   "inputSchema":{"type":"object","properties":{"text":{"type":"string","description":"Text to echo"}},"required":["text"]}},
  {"name":"add","description":"Adds two numbers",
   "inputSchema":{"type":"object","properties":{"a":{"type":"number"},"b":{"type":"number"}},"required":["a","b"]}},
  {"name":"sleep","description":"Waits the given number of milliseconds before answering",
   "inputSchema":{"type":"object","properties":{"ms":{"type":"integer","default":100}},"required":["ms"]}},
  {"name":"fail","description":"Always reports a tool error",
   "inputSchema":{"type":"object","properties":{"message":{"type":"string","default":"requested failure"}}}},
  {"name":"read","description":"Reads a text file",
   "inputSchema":{"type":"object","properties":{"path":{"type":"string","description":"File to read"},
   "max_length":{"type":"integer","description":"Truncate the text to this many bytes"}},"required":["path"]}}
]})JSON";

const char* kResourceCatalog = R"JSON({"resources":[
  {"uri":"echo://about","name":"about","description":"What this server does","mimeType":"text/plain"}
]})JSON";

struct ServerFlags {
    bool silentAfterHandshake{false};
    bool exitOnCall{false};
};

JSONValue textResult(const std::string& text, bool isError = false) {
    JSONValue::Object result;
    JSONValue::Array content;
    content.push_back(std::make_shared<JSONValue>(ContentBlock::MakeText(text).raw));
    result["content"] = std::make_shared<JSONValue>(std::move(content));
    if (isError) {
        result["isError"] = std::make_shared<JSONValue>(true);
    }
    return JSONValue(std::move(result));
}

std::optional<double> numberField(const JSONValue& args, const std::string& key) {
    const JSONValue* v = findField(args, key);
    if (v == nullptr) {
        return std::nullopt;
    }
    if (const auto* i = std::get_if<int64_t>(&v->value)) {
        return static_cast<double>(*i);
    }
    if (const auto* d = std::get_if<double>(&v->value)) {
        return *d;
    }
    return std::nullopt;
}

std::string formatNumber(double v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

//==========================================================================================================
// callTool
// Purpose: Executes one tool. Bad arguments and unknown tools come back as JSON-RPC errors, tool-level
//          failures as isError results.
//==========================================================================================================
std::unique_ptr<JSONRPCResponse> callTool(const JSONRPCRequest& req) {
    const JSONValue params = req.params.value_or(JSONValue{});
    const std::string name = getStringField(params, "name").value_or("");
    const JSONValue* argsField = findField(params, "arguments");
    const JSONValue args = argsField != nullptr ? *argsField : JSONValue(JSONValue::Object{});

    if (name == "repeat") {
        auto text = getStringField(args, "text");
        if (!text.has_value()) {
            return CreateErrorResponse(req.id, JSONRPCErrorCodes::InvalidParams, "repeat requires 'text'");
        }
        return std::make_unique<JSONRPCResponse>(req.id, textResult(*text));
    }
    if (name == "add") {
        auto a = numberField(args, "a");
        auto b = numberField(args, "b");
        if (!a.has_value() || !b.has_value()) {
            return CreateErrorResponse(req.id, JSONRPCErrorCodes::InvalidParams, "add requires numbers 'a' and 'b'");
        }
        JSONValue result = textResult(formatNumber(*a + *b));
        JSONValue::Object structured;
        structured["sum"] = std::make_shared<JSONValue>(*a + *b);
        std::get<JSONValue::Object>(result.value)["structuredContent"] =
            std::make_shared<JSONValue>(std::move(structured));
        return std::make_unique<JSONRPCResponse>(req.id, std::move(result));
    }
    if (name == "sleep") {
        const auto ms = getIntField(args, "ms").value_or(100);
        std::this_thread::sleep_for(std::chrono::milliseconds(ms < 0 ? 0 : ms));
        return std::make_unique<JSONRPCResponse>(req.id, textResult("slept " + std::to_string(ms) + " ms"));
    }
    if (name == "fail") {
        return std::make_unique<JSONRPCResponse>(
            req.id, textResult(getStringField(args, "message").value_or("requested failure"), true));
    }
    if (name == "read") {
        auto path = getStringField(args, "path");
        if (!path.has_value()) {
            return CreateErrorResponse(req.id, JSONRPCErrorCodes::InvalidParams, "read requires 'path'");
        }
        std::ifstream file(*path, std::ios::binary);
        if (!file) {
            return std::make_unique<JSONRPCResponse>(req.id, textResult("cannot open " + *path, true));
        }
        std::ostringstream buffer;
        buffer << file.rdbuf();
        std::string text = buffer.str();
        if (auto max = getIntField(args, "max_length"); max.has_value() && *max >= 0 &&
                                                         text.size() > static_cast<std::size_t>(*max)) {
            text.resize(static_cast<std::size_t>(*max));
        }
        return std::make_unique<JSONRPCResponse>(req.id, textResult(text));
    }
    return CreateErrorResponse(req.id, JSONRPCErrorCodes::InvalidParams, "Unknown tool: " + name);
}

JSONValue initializeResult() {
    return parseJSON(std::string(R"JSON({"protocolVersion":")JSON") + PROTOCOL_VERSION +
                     R"JSON(","serverInfo":{"name":"toolclient-echo-server","version":"0.1.0"},
                        "capabilities":{"tools":{"listChanged":false},"resources":{},"logging":{}},
                        "instructions":"Echo server for toolclient demos"})JSON");
}

bool isToolCall(const std::string& line) {
    try {
        return getStringField(parseJSON(line), "method").value_or("") == Methods::CallTool;
    } catch (const JSONParseError&) {
        return false;
    }
}

void writeLine(const std::string& payload) {
    std::cout << payload << "\n" << std::flush;
}

} // namespace

int main(int argc, char** argv) {
    // stdout carries the protocol; logs go to stderr only.
    Logger::configureFromEnvironment(LogLevel::LOG_WARN_LEVEL);

    ServerFlags flags;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--silent-after-handshake") {
            flags.silentAfterHandshake = true;
        } else if (a == "--exit-on-call") {
            flags.exitOnCall = true;
        } else {
            LOG_ERROR("Unknown option: {}", a);
            return 2;
        }
    }

    auto router = MakeDefaultJsonRpcMessageRouter();
    const JSONValue tools = parseJSON(kToolCatalog);
    const JSONValue resources = parseJSON(kResourceCatalog);

    RouterHandlers handlers;
    handlers.requestHandler = [&](const JSONRPCRequest& req) -> std::unique_ptr<JSONRPCResponse> {
        if (req.method == Methods::Initialize) {
            return std::make_unique<JSONRPCResponse>(req.id, initializeResult());
        }
        if (req.method == Methods::Ping) {
            return std::make_unique<JSONRPCResponse>(req.id, JSONValue(JSONValue::Object{}));
        }
        if (req.method == Methods::ListTools) {
            return std::make_unique<JSONRPCResponse>(req.id, tools);
        }
        if (req.method == Methods::ListResources) {
            return std::make_unique<JSONRPCResponse>(req.id, resources);
        }
        if (req.method == Methods::CallTool) {
            if (flags.exitOnCall) {
                LOG_WARN("Exiting on tool call as requested");
                std::exit(3);
            }
            return callTool(req);
        }
        return nullptr;
    };
    handlers.notificationHandler = [](const JSONRPCNotification& n) {
        if (n.method == Methods::Initialized) {
            JSONValue::Object params;
            params["level"] = std::make_shared<JSONValue>("info");
            params["data"] = std::make_shared<JSONValue>("echo server ready");
            writeLine(JSONRPCNotification(Methods::Log, JSONValue(std::move(params))).Serialize());
        }
    };
    handlers.errorHandler = [](const std::string& err) { LOG_WARN("Bad input: {}", err); };

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        if (flags.silentAfterHandshake && isToolCall(line)) {
            LOG_DEBUG("Leaving tool call unanswered");
            continue;
        }
        auto reply = router->route(line, handlers, [](JSONRPCResponse&&) {});
        if (reply.has_value()) {
            writeLine(*reply);
        }
    }
    return 0;
}
