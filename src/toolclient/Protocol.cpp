//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: Encoding of client requests and decoding of server results
//==========================================================================================================

#include <string>
#include <vector>

#include "logging/Logger.h"
#include "toolclient/Protocol.h"
#include "toolclient/validation/Validators.h"

namespace toolclient {

using errors::ErrorKind;
using errors::ToolClientError;

namespace {
std::shared_ptr<JSONValue> str(const std::string& s) {
    return std::make_shared<JSONValue>(s);
}

std::optional<std::string> readCursor(const JSONValue& result) {
    const JSONValue* nc = findField(result, "nextCursor");
    if (nc == nullptr) {
        return std::nullopt;
    }
    if (const auto* s = std::get_if<std::string>(&nc->value)) {
        if (s->empty()) return std::nullopt;
        return *s;
    }
    if (const auto* i = std::get_if<int64_t>(&nc->value)) {
        return std::to_string(*i);
    }
    return std::nullopt;
}

const JSONValue::Array& requireArray(const JSONValue& result, const char* key, const char* method) {
    const JSONValue* arr = findField(result, key);
    if (arr == nullptr || !arr->isArray()) {
        throw ToolClientError(ErrorKind::ServerError,
                              std::string("malformed ") + method + " result: missing '" + key + "' array");
    }
    return std::get<JSONValue::Array>(arr->value);
}

std::vector<ContentBlock> readContent(const JSONValue& result) {
    std::vector<ContentBlock> out;
    const JSONValue* content = findField(result, "content");
    if (content == nullptr || !content->isArray()) {
        return out;
    }
    for (const auto& item : std::get<JSONValue::Array>(content->value)) {
        if (!item) continue;
        ContentBlock block;
        block.type = getStringField(*item, "type").value_or("");
        block.raw = *item;
        out.push_back(std::move(block));
    }
    return out;
}
} // namespace

///////////////////////////////////////// Value helpers ///////////////////////////////////////////
JSONValue ToolDescriptor::ToJSON() const {
    JSONValue::Object o;
    o["name"] = str(name);
    o["description"] = str(description);
    o["inputSchema"] = std::make_shared<JSONValue>(inputSchema);
    if (title.has_value()) o["title"] = str(*title);
    if (outputSchema.has_value()) o["outputSchema"] = std::make_shared<JSONValue>(*outputSchema);
    return JSONValue(std::move(o));
}

ContentBlock ContentBlock::MakeText(const std::string& text) {
    JSONValue::Object o;
    o["type"] = str("text");
    o["text"] = str(text);
    return ContentBlock{"text", JSONValue(std::move(o))};
}

std::optional<std::string> ContentBlock::Text() const {
    if (type != "text") {
        return std::nullopt;
    }
    return getStringField(raw, "text");
}

ToolCallResult ToolCallResult::Success(std::vector<ContentBlock> content, std::optional<JSONValue> structured) {
    ToolCallResult r;
    r.content = std::move(content);
    r.structuredContent = std::move(structured);
    return r;
}

ToolCallResult ToolCallResult::Fail(ErrorKind kind, std::string message, std::vector<ContentBlock> content) {
    ToolCallResult r;
    r.content = std::move(content);
    r.failure = errors::Failure{kind, std::move(message)};
    return r;
}

std::string ToolCallResult::JoinedText() const {
    std::string out;
    for (const auto& block : content) {
        if (auto t = block.Text()) {
            if (!out.empty()) out.push_back('\n');
            out += *t;
        }
    }
    return out;
}

JSONValue ToolCallResult::ToJSON() const {
    JSONValue::Object o;
    JSONValue::Array arr;
    for (const auto& block : content) {
        arr.push_back(std::make_shared<JSONValue>(block.raw));
    }
    o["content"] = std::make_shared<JSONValue>(std::move(arr));
    if (structuredContent.has_value()) {
        o["structuredContent"] = std::make_shared<JSONValue>(*structuredContent);
    }
    if (failure.has_value()) {
        o["isError"] = std::make_shared<JSONValue>(true);
    }
    return JSONValue(std::move(o));
}

///////////////////////////////////////// Requests ///////////////////////////////////////////
JSONValue MakeInitializeParams(const Implementation& clientInfo) {
    JSONValue::Object params;
    params["protocolVersion"] = str(PROTOCOL_VERSION);
    // The client offers no optional capabilities (no roots, no sampling).
    params["capabilities"] = std::make_shared<JSONValue>(JSONValue::Object{});
    JSONValue::Object info;
    info["name"] = str(clientInfo.name);
    info["version"] = str(clientInfo.version);
    params["clientInfo"] = std::make_shared<JSONValue>(std::move(info));
    return JSONValue(std::move(params));
}

JSONValue MakeCallToolParams(const std::string& name, const JSONValue& arguments) {
    JSONValue::Object params;
    params["name"] = str(name);
    params["arguments"] = std::make_shared<JSONValue>(arguments.isNull() ? JSONValue(JSONValue::Object{}) : arguments);
    return JSONValue(std::move(params));
}

JSONValue MakeListParams(const std::optional<std::string>& cursor) {
    JSONValue::Object params;
    if (cursor.has_value()) {
        params["cursor"] = str(*cursor);
    }
    return JSONValue(std::move(params));
}

///////////////////////////////////////// Results ///////////////////////////////////////////
InitializeResult ParseInitializeResult(const JSONValue& result) {
    FUNC_SCOPE();
    if (!result.isObject()) {
        throw ToolClientError(ErrorKind::ConnectError, "initialize result is not an object");
    }
    auto version = getStringField(result, "protocolVersion");
    if (!version.has_value() || version->empty()) {
        throw ToolClientError(ErrorKind::ConnectError, "initialize result lacks protocolVersion");
    }
    InitializeResult out;
    out.protocolVersion = *version;
    if (const JSONValue* info = findField(result, "serverInfo")) {
        out.serverInfo.name = getStringField(*info, "name").value_or("");
        out.serverInfo.version = getStringField(*info, "version").value_or("");
    }
    if (const JSONValue* caps = findField(result, "capabilities")) {
        if (const JSONValue* tools = findField(*caps, "tools")) {
            out.capabilities.tools = ToolsCapability{getBoolField(*tools, "listChanged").value_or(false)};
        }
        if (const JSONValue* res = findField(*caps, "resources")) {
            out.capabilities.resources = ResourcesCapability{getBoolField(*res, "subscribe").value_or(false),
                                                             getBoolField(*res, "listChanged").value_or(false)};
        }
        out.capabilities.prompts = findField(*caps, "prompts") != nullptr;
        out.capabilities.logging = findField(*caps, "logging") != nullptr;
    }
    out.instructions = getStringField(result, "instructions");
    return out;
}

ToolsListPage ParseToolsListPage(const JSONValue& result) {
    FUNC_SCOPE();
    ToolsListPage page;
    for (const auto& item : requireArray(result, "tools", Methods::ListTools)) {
        if (!item) continue;
        auto name = getStringField(*item, "name");
        if (!name.has_value() || name->empty()) {
            LOG_WARN("Skipping tool entry without a name: {}", serializeJSONValue(*item));
            continue;
        }
        ToolDescriptor tool;
        tool.name = *name;
        tool.title = getStringField(*item, "title");
        tool.description = getStringField(*item, "description").value_or("");
        if (const JSONValue* schema = findField(*item, "inputSchema")) {
            tool.inputSchema = *schema;
        } else {
            JSONValue::Object empty;
            empty["type"] = str("object");
            tool.inputSchema = JSONValue(std::move(empty));
        }
        if (const JSONValue* out = findField(*item, "outputSchema")) {
            tool.outputSchema = *out;
        }
        page.tools.push_back(std::move(tool));
    }
    page.nextCursor = readCursor(result);
    return page;
}

ResourcesListPage ParseResourcesListPage(const JSONValue& result) {
    FUNC_SCOPE();
    ResourcesListPage page;
    for (const auto& item : requireArray(result, "resources", Methods::ListResources)) {
        if (!item) continue;
        auto uri = getStringField(*item, "uri");
        if (!uri.has_value()) continue;
        ResourceDescriptor r;
        r.uri = *uri;
        r.name = getStringField(*item, "name").value_or(*uri);
        r.description = getStringField(*item, "description");
        r.mimeType = getStringField(*item, "mimeType");
        page.resources.push_back(std::move(r));
    }
    page.nextCursor = readCursor(result);
    return page;
}

ToolCallResult ParseToolCallResult(const JSONValue& result, validation::ValidationMode mode) {
    FUNC_SCOPE();
    if (mode == validation::ValidationMode::Strict && !validation::validateCallToolResultJson(result)) {
        LOG_ERROR("Validation failed (Strict): {} result invalid", Methods::CallTool);
        return ToolCallResult::Fail(ErrorKind::ServerError, "malformed tool result");
    }
    std::vector<ContentBlock> content = readContent(result);
    std::optional<JSONValue> structured;
    if (const JSONValue* sc = findField(result, "structuredContent")) {
        structured = *sc;
    }
    if (getBoolField(result, "isError").value_or(false)) {
        ToolCallResult failed = ToolCallResult::Fail(ErrorKind::ServerError, "", std::move(content));
        std::string text = failed.JoinedText();
        failed.failure->message = text.empty() ? "tool reported an error" : text;
        failed.structuredContent = std::move(structured);
        return failed;
    }
    return ToolCallResult::Success(std::move(content), std::move(structured));
}

} // namespace toolclient
