//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerSpec.h
// Purpose: Launch descriptions of configured tool servers and the configuration loader
//==========================================================================================================

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "toolclient/JSONRPCTypes.h"

namespace toolclient {

//==========================================================================================================
// ServerSpec
// Purpose: How to launch one tool server. Immutable once loaded.
// Fields:
//   name: Unique key in the catalog.
//   command: Executable, resolved through PATH when it has no slash.
//   args: Launch arguments (argv[1..]).
//   env: Overrides applied on top of the parent environment.
//   cwd: Working directory of the child; inherits the parent's when unset.
//==========================================================================================================
struct ServerSpec {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::optional<std::string> cwd;

    // "command arg1 arg2" for display.
    std::string CommandLine() const;
};

// Ordered by server name.
using ServerCatalog = std::map<std::string, ServerSpec>;

//==========================================================================================================
// ParseServerCatalog
// Purpose: Builds a catalog from a parsed configuration document.
// Args:
//   doc: Either { "mcpServers": { name: entry } } or a bare { name: entry } mapping.
// Returns:
//   ServerCatalog. Throws errors::ToolClientError(ConfigError) naming the server and field on bad shape.
//==========================================================================================================
ServerCatalog ParseServerCatalog(const JSONValue& doc);

// Reads and parses a configuration file; ConfigError when unreadable or not valid JSON.
ServerCatalog LoadServerCatalog(const std::string& path);

} // namespace toolclient
