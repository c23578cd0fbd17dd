//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: examples/console/main.cpp
// Purpose: Interactive operator console for the tool servers listed in a configuration file
//==========================================================================================================

#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "logging/Logger.h"
#include "toolclient/Client.h"
#include "toolclient/ConnectionRegistry.h"
#include "toolclient/ProcessTransport.hpp"
#include "toolclient/ServerSpec.h"
#include "toolclient/cli/CommandShell.h"
#include "toolclient/errors/Errors.h"

using namespace toolclient;

//==========================================================================================================
// getArgValue
// Purpose: Parses key=value style CLI options.
// Args:
//   argc: Argument count
//   argv: Argument vector
//   key: Key string including leading dashes (e.g., "--config")
// Returns:
//   Optional string containing the value when present
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

static bool hasFlag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (flag == argv[i]) {
            return true;
        }
    }
    return false;
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    Logger::configureFromEnvironment(LogLevel::LOG_WARN_LEVEL);
    if (auto level = getArgValue(argc, argv, "--log-level")) {
        Logger::setLogLevel(Logger::levelFromString(*level, LogLevel::LOG_WARN_LEVEL));
    }
    const bool color = !hasFlag(argc, argv, "--no-color");
    if (!color) {
        Logger::setColorEnabled(false);
    }

    const std::string configPath = getArgValue(argc, argv, "--config").value_or("config.json");
    ServerCatalog catalog;
    try {
        catalog = LoadServerCatalog(configPath);
    } catch (const errors::ToolClientError& e) {
        std::cerr << "Cannot load configuration: " << e.what() << std::endl;
        return 1;
    }

    ConnectionRegistry registry(std::move(catalog), std::make_shared<ProcessTransportFactory>(),
                                SessionOptions::FromEnvironment());
    Client client(registry);

    cli::ShellOptions options;
    options.confirmCalls = hasFlag(argc, argv, "--confirm");
    options.color = color;
    cli::CommandShell shell(client, std::cin, std::cout, options);

    if (!hasFlag(argc, argv, "--no-autoconnect")) {
        shell.ConnectAll();
    }
    const int rc = shell.Run();

    for (const auto& failure : registry.DisconnectAll()) {
        LOG_WARN("Shutdown: {}", failure);
    }
    std::cout << "Goodbye" << std::endl;
    return rc;
}
