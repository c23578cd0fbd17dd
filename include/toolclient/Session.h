//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.h
// Purpose: One logical connection to one tool server: handshake, catalog cache and serialized calls
//==========================================================================================================

#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "toolclient/JSONRPCTypes.h"
#include "toolclient/Protocol.h"
#include "toolclient/ServerSpec.h"
#include "toolclient/Transport.h"
#include "toolclient/validation/Validation.h"

namespace toolclient {

//==========================================================================================================
// SessionState
// Purpose: Connection state of a session. Closed and Failed are terminal for calls; Failed can be
//          reconnected, Closed cannot.
//==========================================================================================================
enum class SessionState {
    Disconnected,
    Connecting,
    Ready,
    Closing,
    Closed,
    Failed
};

const char* toString(SessionState state);

//==========================================================================================================
// SessionOptions
// Fields:
//   handshakeTimeout: Deadline for each exchange of the handshake (initialize, catalog pages).
//   callTimeout: Deadline for one tool call or catalog refresh.
//   timeoutEscalationWindow: A second call timeout within this window closes the session.
//   validationMode: Strict rejects tool results without a typed content array.
//   clientInfo: Sent as clientInfo in initialize.
//==========================================================================================================
struct SessionOptions {
    std::chrono::milliseconds handshakeTimeout{30000};
    std::chrono::milliseconds callTimeout{60000};
    std::chrono::milliseconds timeoutEscalationWindow{60000};
    validation::ValidationMode validationMode{validation::ValidationMode::Off};
    Implementation clientInfo{"toolclient", "0.1.0"};

    // Defaults overridden by TOOLCLIENT_HANDSHAKE_TIMEOUT_MS / TOOLCLIENT_CALL_TIMEOUT_MS / TOOLCLIENT_VALIDATION.
    static SessionOptions FromEnvironment();
};

//==========================================================================================================
// Session
// Purpose: Owns the transport of one server. Calls are queued and issued one at a time by a per-session
//          worker thread; responses are matched by request id. Owned by the ConnectionRegistry.
//==========================================================================================================
class Session {
public:
    Session(ServerSpec spec, std::shared_ptr<ITransportFactory> factory, SessionOptions options = SessionOptions{});
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::string& Name() const;
    const ServerSpec& Spec() const;
    SessionState State() const;

    //==========================================================================================================
    // Connect
    // Purpose: Launches the server and performs initialize, notifications/initialized and catalog discovery.
    //          No-op when already Ready. Concurrent callers are serialized.
    // Throws:
    //   errors::ToolClientError(ConnectError) on launch failure, handshake timeout, transport failure or a
    //   malformed handshake response (session becomes Failed); NotConnected when the session is Closed.
    //==========================================================================================================
    void Connect();

    // Cached catalogs; throw ToolClientError(NotConnected) unless Ready.
    std::vector<ToolDescriptor> ListTools() const;
    std::optional<ToolDescriptor> FindTool(const std::string& name) const;
    std::vector<ResourceDescriptor> ListResources() const;
    InitializeResult ServerInfo() const;

    //==========================================================================================================
    // CallTool
    // Purpose: Queues a tools/call request behind earlier requests.
    // Args:
    //   name: Tool name; must be in the cached catalog.
    //   arguments: Argument object (null is sent as {}).
    // Returns:
    //   Future that always resolves to a value (never an exception): success, or a failure of kind
    //   NotConnected, UnknownTool, InvalidArguments, Timeout, TransportError or ServerError.
    //==========================================================================================================
    std::future<ToolCallResult> CallTool(const std::string& name, const JSONValue& arguments);

    //==========================================================================================================
    // RefreshTools
    // Purpose: Re-runs tools/list through the request queue and replaces the cached catalog.
    // Returns:
    //   The new catalog. Throws ToolClientError (NotConnected, Timeout, TransportError, ServerError).
    //==========================================================================================================
    std::vector<ToolDescriptor> RefreshTools();

    //==========================================================================================================
    // Disconnect
    // Purpose: Fails queued and in-flight calls with NotConnected, closes the transport and moves to Closed.
    //          Idempotent; waits for a teardown already running on another thread.
    //==========================================================================================================
    void Disconnect();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolclient
