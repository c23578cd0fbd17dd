//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.cpp
// Purpose: Invocation facade implementation (exception to Result conversion)
//==========================================================================================================

#include "toolclient/Client.h"

#include "logging/Logger.h"

namespace toolclient {

using errors::ErrorKind;
using errors::Failure;
using errors::Result;
using errors::ToolClientError;

namespace {
// Runs op and converts a ToolClientError into a Failure.
template <typename T, typename Fn>
Result<T> capture(Fn&& op) {
    try {
        return Result<T>(op());
    } catch (const ToolClientError& e) {
        return e.toFailure();
    } catch (const std::future_error& e) {
        return Failure{ErrorKind::NotConnected, e.what()};
    }
}
} // namespace

std::vector<ServerStatus> Client::ListServers() const {
    std::vector<ServerStatus> out;
    for (const auto& [name, spec] : registry.Catalog()) {
        out.push_back(ServerStatus{name, spec.CommandLine(), registry.IsConnected(name)});
    }
    return out;
}

Result<ConnectSummary> Client::Connect(const std::string& server) {
    FUNC_SCOPE();
    return capture<ConnectSummary>([&]() {
        auto session = registry.GetOrConnect(server);
        const InitializeResult info = session->ServerInfo();
        ConnectSummary summary;
        summary.server = server;
        summary.serverInfo = info.serverInfo;
        summary.protocolVersion = info.protocolVersion;
        summary.toolCount = session->ListTools().size();
        summary.resourceCount = session->ListResources().size();
        summary.instructions = info.instructions;
        return summary;
    });
}

errors::Status Client::Disconnect(const std::string& server) {
    if (registry.Catalog().count(server) == 0) {
        return errors::Status::Fail(ErrorKind::UnknownServer, "unknown server '" + server + "'");
    }
    if (!registry.Disconnect(server)) {
        return errors::Status::Fail(ErrorKind::NotConnected, "server '" + server + "' is not connected");
    }
    return errors::Ok();
}

Result<std::vector<ToolDescriptor>> Client::ListTools(const std::string& server) {
    return capture<std::vector<ToolDescriptor>>([&]() {
        return registry.GetOrConnect(server)->ListTools();
    });
}

Result<std::vector<ToolDescriptor>> Client::DescribeTool(const std::string& server,
                                                         const std::optional<std::string>& tool) {
    return capture<std::vector<ToolDescriptor>>([&]() {
        auto session = registry.GetOrConnect(server);
        if (!tool.has_value()) {
            return session->ListTools();
        }
        auto found = session->FindTool(*tool);
        if (!found.has_value()) {
            throw ToolClientError(ErrorKind::UnknownTool, "server '" + server + "' has no tool '" + *tool + "'");
        }
        return std::vector<ToolDescriptor>{std::move(*found)};
    });
}

Result<std::vector<ResourceDescriptor>> Client::ListResources(const std::string& server) {
    return capture<std::vector<ResourceDescriptor>>([&]() {
        return registry.GetOrConnect(server)->ListResources();
    });
}

Result<std::vector<ToolDescriptor>> Client::RefreshTools(const std::string& server) {
    FUNC_SCOPE();
    return capture<std::vector<ToolDescriptor>>([&]() {
        return registry.GetOrConnect(server)->RefreshTools();
    });
}

ToolCallResult Client::CallTool(const std::string& server, const std::string& tool, const JSONValue& arguments) {
    FUNC_SCOPE();
    std::shared_ptr<Session> session;
    try {
        session = registry.GetOrConnect(server);
    } catch (const ToolClientError& e) {
        return ToolCallResult::Fail(e.kind(), e.what());
    }
    LOG_DEBUG("Calling {}/{}", server, tool);
    return session->CallTool(tool, arguments).get();
}

} // namespace toolclient
