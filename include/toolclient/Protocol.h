//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: Tool-server protocol data structures, constants and result decoding
//==========================================================================================================

#pragma once

#include "toolclient/JSONRPCTypes.h"
#include "toolclient/errors/Errors.h"
#include "toolclient/validation/Validation.h"
#include <string>
#include <vector>
#include <optional>

namespace toolclient {
//==========================================================================================================
// Protocol types and constants
// Purpose: Shared protocol structures, capabilities, and method names.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// Protocol version offered in initialize
constexpr const char* PROTOCOL_VERSION = "2025-11-25";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information (clientInfo / serverInfo)
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Capabilities ///////////////////////////////////////////
struct ToolsCapability {
    bool listChanged = false;
};

struct ResourcesCapability {
    bool subscribe = false;
    bool listChanged = false;
};

struct ServerCapabilities {
    std::optional<ToolsCapability> tools;
    std::optional<ResourcesCapability> resources;
    bool prompts = false;
    bool logging = false;
};

//==========================================================================================================
// InitializeResult
// Purpose: Decoded response to the initialize request.
//==========================================================================================================
struct InitializeResult {
    std::string protocolVersion;
    Implementation serverInfo;
    ServerCapabilities capabilities;
    std::optional<std::string> instructions;
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
// One entry of a server's tool catalog
struct ToolDescriptor {
    std::string name;
    std::optional<std::string> title;
    std::string description;
    JSONValue inputSchema;                  // JSON Schema object for the arguments
    std::optional<JSONValue> outputSchema;  // advisory only

    ToolDescriptor() = default;
    ToolDescriptor(std::string name, std::string description, JSONValue inputSchema = JSONValue{})
        : name(std::move(name)), description(std::move(description)), inputSchema(std::move(inputSchema)) {}

    JSONValue ToJSON() const;
};

///////////////////////////////////////// Resources ///////////////////////////////////////////
struct ResourceDescriptor {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mimeType;
};

//==========================================================================================================
// ContentBlock
// Purpose: One typed item of a tool result. The raw object is kept untouched; only the type tag and
//          text payload are interpreted.
//==========================================================================================================
struct ContentBlock {
    std::string type;
    JSONValue raw;

    static ContentBlock MakeText(const std::string& text);

    // Text payload for "text" blocks, std::nullopt otherwise.
    std::optional<std::string> Text() const;
};

//==========================================================================================================
// ToolCallResult
// Purpose: Outcome of a tool call: success with ordered content, or a Failure of a given kind.
//          Failures reported by the tool itself (isError) keep their content.
// Methods:
//   IsSuccess(): True when no failure is set.
//   JoinedText(): Text blocks joined with newlines.
//   ToJSON(): { "content": [...], "structuredContent"?, "isError"? } as seen on the wire.
//==========================================================================================================
struct ToolCallResult {
    std::vector<ContentBlock> content;
    std::optional<JSONValue> structuredContent;
    std::optional<errors::Failure> failure;

    bool IsSuccess() const { return !failure.has_value(); }

    static ToolCallResult Success(std::vector<ContentBlock> content,
                                  std::optional<JSONValue> structured = std::nullopt);
    static ToolCallResult Fail(errors::ErrorKind kind, std::string message,
                               std::vector<ContentBlock> content = {});

    std::string JoinedText() const;
    JSONValue ToJSON() const;
};

/////////////////////////////////////// Paged list results /////////////////////////////////////////
struct ToolsListPage {
    std::vector<ToolDescriptor> tools;
    std::optional<std::string> nextCursor;
};

struct ResourcesListPage {
    std::vector<ResourceDescriptor> resources;
    std::optional<std::string> nextCursor;
};

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    // Requests
    constexpr const char* Initialize = "initialize";
    constexpr const char* Ping = "ping";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListResources = "resources/list";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Log = "notifications/message";
    constexpr const char* ToolListChanged = "notifications/tools/list_changed";
    constexpr const char* ResourceListChanged = "notifications/resources/list_changed";
    constexpr const char* Cancelled = "notifications/cancelled";
}

///////////////////////////////////////// Encoding / decoding ///////////////////////////////////////////
// Params of the initialize request.
JSONValue MakeInitializeParams(const Implementation& clientInfo);

// Params of tools/call.
JSONValue MakeCallToolParams(const std::string& name, const JSONValue& arguments);

// Params of a paged list request; empty object when no cursor.
JSONValue MakeListParams(const std::optional<std::string>& cursor);

// Throws ToolClientError(ConnectError) when the result lacks protocolVersion or is not an object.
InitializeResult ParseInitializeResult(const JSONValue& result);

// Throws ToolClientError(ServerError) when the page is not { tools: [...] }. Entries without a name are skipped.
ToolsListPage ParseToolsListPage(const JSONValue& result);

// Throws ToolClientError(ServerError) when the page is not { resources: [...] }.
ResourcesListPage ParseResourcesListPage(const JSONValue& result);

//==========================================================================================================
// ParseToolCallResult
// Purpose: Decodes a tools/call result.
// Args:
//   result: The "result" member of the response.
//   mode: Strict rejects a missing/invalid content array as ServerError; Off treats it as empty.
// Returns:
//   Success, or Fail(ServerError) with content kept when isError is true.
//==========================================================================================================
ToolCallResult ParseToolCallResult(const JSONValue& result, validation::ValidationMode mode);

} // namespace toolclient
