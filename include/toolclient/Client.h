//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.h
// Purpose: Invocation facade: every tool-server operation as a Result value over a ConnectionRegistry
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "toolclient/ConnectionRegistry.h"
#include "toolclient/JSONRPCTypes.h"
#include "toolclient/Protocol.h"
#include "toolclient/errors/Errors.h"

namespace toolclient {

// One row of ListServers().
struct ServerStatus {
    std::string name;
    std::string commandLine;
    bool connected{false};
};

// Returned by Connect().
struct ConnectSummary {
    std::string server;
    Implementation serverInfo;
    std::string protocolVersion;
    std::size_t toolCount{0};
    std::size_t resourceCount{0};
    std::optional<std::string> instructions;
};

//==========================================================================================================
// Client
// Purpose: Stateless facade used by the operator console and by embedding applications. Holds only a
//          reference to the registry; nothing here throws, failures come back as errors::Failure.
//==========================================================================================================
class Client {
public:
    explicit Client(ConnectionRegistry& registry) : registry(registry) {}

    ////////////////////////////////////////// Servers ///////////////////////////////////////////
    // Pure read of the catalog and the registry; launches nothing.
    std::vector<ServerStatus> ListServers() const;

    //==========================================================================================================
    // Connect
    // Purpose: Ensures a Ready session (idempotent; a second call does not relaunch).
    // Returns:
    //   Summary of the handshake, or UnknownServer / ConnectError.
    //==========================================================================================================
    errors::Result<ConnectSummary> Connect(const std::string& server);

    errors::Status Disconnect(const std::string& server);

    ////////////////////////////////////////// Catalogs ///////////////////////////////////////////
    // Catalog in the order the server listed it. Connects on demand.
    errors::Result<std::vector<ToolDescriptor>> ListTools(const std::string& server);

    //==========================================================================================================
    // DescribeTool
    // Args:
    //   server: Configured server name.
    //   tool: A tool name, or std::nullopt for the whole catalog.
    // Returns:
    //   Matching descriptors; UnknownTool when a named tool is absent.
    //==========================================================================================================
    errors::Result<std::vector<ToolDescriptor>> DescribeTool(const std::string& server,
                                                             const std::optional<std::string>& tool);

    errors::Result<std::vector<ResourceDescriptor>> ListResources(const std::string& server);

    // Re-fetches the tool catalog from a connected server.
    errors::Result<std::vector<ToolDescriptor>> RefreshTools(const std::string& server);

    ////////////////////////////////////////// Calls ///////////////////////////////////////////
    //==========================================================================================================
    // CallTool
    // Purpose: Connects on demand and invokes one tool, blocking until the call settles.
    // Args:
    //   server: Configured server name.
    //   tool: Tool name from the server's catalog.
    //   arguments: Argument object; null is sent as {}.
    // Returns:
    //   ToolCallResult; failures carry UnknownServer, ConnectError, UnknownTool, InvalidArguments, Timeout,
    //   NotConnected, TransportError or ServerError.
    //==========================================================================================================
    ToolCallResult CallTool(const std::string& server, const std::string& tool, const JSONValue& arguments);

private:
    ConnectionRegistry& registry;
};

} // namespace toolclient
