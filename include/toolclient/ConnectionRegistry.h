//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConnectionRegistry.h
// Purpose: Owns at most one Session per configured server and shares in-progress connects
//==========================================================================================================

#pragma once

#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "toolclient/ServerSpec.h"
#include "toolclient/Session.h"
#include "toolclient/Transport.h"

namespace toolclient {

//==========================================================================================================
// ConnectionRegistry
// Purpose: Name -> Session table. Sessions are created lazily by GetOrConnect; a Session found Closed or
//          Failed is replaced by a fresh one. The table is guarded by a single mutex; connects run
//          outside of it and are published as a shared future so concurrent callers wait on one attempt.
//==========================================================================================================
class ConnectionRegistry {
public:
    ConnectionRegistry(ServerCatalog catalog,
                       std::shared_ptr<ITransportFactory> factory,
                       SessionOptions options = SessionOptions{});
    ~ConnectionRegistry();

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    const ServerCatalog& Catalog() const { return catalog; }

    // Configured server names, sorted.
    std::vector<std::string> Servers() const;

    //==========================================================================================================
    // GetOrConnect
    // Purpose: Returns the Ready session for a server, launching and handshaking it when needed.
    // Args:
    //   name: Configured server name.
    // Returns:
    //   Shared session in state Ready.
    // Throws:
    //   errors::ToolClientError(UnknownServer) without launching anything when the name is not configured;
    //   ToolClientError(ConnectError) when the connect attempt (possibly another caller's) fails.
    //==========================================================================================================
    std::shared_ptr<Session> GetOrConnect(const std::string& name);

    // Existing live session (not Closed/Failed), never launches.
    std::shared_ptr<Session> Find(const std::string& name) const;

    bool IsConnected(const std::string& name) const;

    // Closes and removes one session. Returns false when there was none.
    bool Disconnect(const std::string& name);

    //==========================================================================================================
    // DisconnectAll
    // Purpose: Closes every session, best effort.
    // Returns:
    //   One message per session that failed to close cleanly; never throws.
    //==========================================================================================================
    std::vector<std::string> DisconnectAll();

private:
    struct Entry {
        std::shared_ptr<Session> session;
        std::shared_future<void> ready;
    };

    ServerCatalog catalog;
    std::shared_ptr<ITransportFactory> factory;
    SessionOptions options;

    mutable std::mutex mutex;
    std::map<std::string, Entry> sessions;
};

} // namespace toolclient
