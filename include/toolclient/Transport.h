//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Transport layer interfaces connecting a session to one tool-server process
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <functional>
#include <future>
#include <cstdint>

namespace toolclient {

struct ServerSpec;

//==========================================================================================================
// TransportCloseInfo
// Purpose: Why the peer side of a transport ended.
// Fields:
//   error: True for I/O or framing failures; false for a clean end of stream.
//   reason: Human-readable detail.
//   exitStatus: Child exit code when the process has been reaped, or 128+signal when killed.
//==========================================================================================================
struct TransportCloseInfo {
    bool error{false};
    std::string reason;
    std::optional<int> exitStatus;
};

//==========================================================================================================
// Transport interface
// Purpose: Moves framed JSON payloads between the client and one tool server. Correlation of requests
//          and responses is the session's job; the transport only carries text.
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Starts the transport (launches the server and its reader loop).
    // Args:
    //   (none)
    // Returns:
    //   A future that completes when the transport is running. Holds errors::ToolClientError(LaunchError)
    //   when the server cannot be started.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Closes the transport and releases every resource it owns. Idempotent; safe to call from a handler.
    // Args:
    //   (none)
    // Returns:
    //   A future that completes when the transport has closed.
    //==========================================================================================================
    virtual std::future<void> Close() = 0;

    //==========================================================================================================
    // Indicates whether the transport is currently connected.
    // Returns:
    //   true between a successful Start() and the end of the stream or Close().
    //==========================================================================================================
    virtual bool IsConnected() const = 0;

    /////////////////////////////////////////// Message sending ///////////////////////////////////////////
    //==========================================================================================================
    // Writes one message as a single frame. Thread-safe; concurrent calls never interleave frames.
    // Args:
    //   payload: Serialized JSON document.
    // Returns:
    //   (none) Throws errors::ToolClientError(TransportError) on I/O failure, closed pipe or write timeout.
    //==========================================================================================================
    virtual void Send(const std::string& payload) = 0;

    /////////////////////////////////////////// Handlers ///////////////////////////////////////////
    // Handlers run on the transport's reader thread and must be registered before Start().

    // Invoked once per inbound frame, in arrival order.
    using MessageHandler = std::function<void(const std::string& payload)>;
    virtual void SetMessageHandler(MessageHandler handler) = 0;

    // Invoked for errors that do not end the stream on their own (oversized frames) and before close on I/O errors.
    using ErrorHandler = std::function<void(const std::string& error)>;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;

    // Invoked once when the peer ends the stream or an I/O error ends it. Not invoked for Close().
    using CloseHandler = std::function<void(const TransportCloseInfo& info)>;
    virtual void SetCloseHandler(CloseHandler handler) = 0;
};

//==========================================================================================================
// Transport factory interface
// Purpose: Creates one transport per connection attempt; sessions never reuse a transport.
//==========================================================================================================
class ITransportFactory {
public:
    virtual ~ITransportFactory() = default;

    //==========================================================================================================
    // Creates a transport instance for the given server.
    // Args:
    //   spec: Launch description of the server.
    // Returns:
    //   A unique_ptr to a newly created, not yet started ITransport.
    //==========================================================================================================
    virtual std::unique_ptr<ITransport> CreateTransport(const ServerSpec& spec) = 0;
};

} // namespace toolclient
