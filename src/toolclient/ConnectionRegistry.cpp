//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConnectionRegistry.cpp
// Purpose: Session table with lazy connect, replacement of dead sessions and best-effort shutdown
//==========================================================================================================

#include "toolclient/ConnectionRegistry.h"

#include "logging/Logger.h"
#include "toolclient/errors/Errors.h"

namespace toolclient {

using errors::ErrorKind;
using errors::ToolClientError;

namespace {
bool isLive(const Session& session) {
    const SessionState s = session.State();
    return s != SessionState::Closed && s != SessionState::Failed && s != SessionState::Closing;
}
} // namespace

ConnectionRegistry::ConnectionRegistry(ServerCatalog catalog,
                                       std::shared_ptr<ITransportFactory> factory,
                                       SessionOptions options)
    : catalog(std::move(catalog)), factory(std::move(factory)), options(std::move(options)) {
    FUNC_SCOPE();
}

ConnectionRegistry::~ConnectionRegistry() {
    FUNC_SCOPE();
    for (const auto& message : DisconnectAll()) {
        LOG_WARN("Shutdown: {}", message);
    }
}

std::vector<std::string> ConnectionRegistry::Servers() const {
    std::vector<std::string> names;
    names.reserve(catalog.size());
    for (const auto& [name, spec] : catalog) {
        names.push_back(name);
    }
    return names;
}

std::shared_ptr<Session> ConnectionRegistry::GetOrConnect(const std::string& name) {
    FUNC_SCOPE();
    auto specIt = catalog.find(name);
    if (specIt == catalog.end()) {
        throw ToolClientError(ErrorKind::UnknownServer, "unknown server '" + name + "'");
    }

    std::shared_ptr<Session> session;
    // A replaced session is released after the table lock; its teardown may block on a slow close.
    std::shared_ptr<Session> retired;
    std::shared_future<void> ready;
    std::promise<void> connectDone;
    bool owner = false;
    {
        std::lock_guard<std::mutex> lk(mutex);
        auto it = sessions.find(name);
        if (it != sessions.end() && isLive(*it->second.session)) {
            session = it->second.session;
            ready = it->second.ready;
        } else {
            if (it != sessions.end()) {
                LOG_INFO("Replacing {} session for server '{}'", toString(it->second.session->State()), name);
                retired = std::move(it->second.session);
            }
            session = std::make_shared<Session>(specIt->second, factory, options);
            ready = connectDone.get_future().share();
            sessions[name] = Entry{session, ready};
            owner = true;
        }
    }
    retired.reset();

    if (owner) {
        try {
            session->Connect();
            connectDone.set_value();
        } catch (const std::exception&) {
            connectDone.set_exception(std::current_exception());
            std::lock_guard<std::mutex> lk(mutex);
            auto it = sessions.find(name);
            if (it != sessions.end() && it->second.session == session) {
                sessions.erase(it);
            }
            throw;
        }
    }
    // Rethrows the owner's ConnectError to every waiter.
    ready.get();
    return session;
}

std::shared_ptr<Session> ConnectionRegistry::Find(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mutex);
    auto it = sessions.find(name);
    if (it == sessions.end() || !isLive(*it->second.session)) {
        return nullptr;
    }
    return it->second.session;
}

bool ConnectionRegistry::IsConnected(const std::string& name) const {
    auto session = Find(name);
    return session && session->State() == SessionState::Ready;
}

bool ConnectionRegistry::Disconnect(const std::string& name) {
    FUNC_SCOPE();
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lk(mutex);
        auto it = sessions.find(name);
        if (it == sessions.end()) {
            return false;
        }
        session = std::move(it->second.session);
        sessions.erase(it);
    }
    session->Disconnect();
    return true;
}

std::vector<std::string> ConnectionRegistry::DisconnectAll() {
    FUNC_SCOPE();
    std::map<std::string, Entry> drained;
    {
        std::lock_guard<std::mutex> lk(mutex);
        drained.swap(sessions);
    }
    std::vector<std::string> failures;
    for (auto& [name, entry] : drained) {
        try {
            entry.session->Disconnect();
        } catch (const std::exception& e) {
            failures.push_back("server '" + name + "': " + e.what());
        }
    }
    if (!drained.empty()) {
        LOG_INFO("Disconnected {} session(s)", drained.size());
    }
    return failures;
}

} // namespace toolclient
