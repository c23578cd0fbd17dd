//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CommandShell.h
// Purpose: Operator console: line-oriented commands mapped onto the invocation facade
//==========================================================================================================

#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "toolclient/Client.h"

namespace toolclient {
namespace cli {

//==========================================================================================================
// ShellOptions
// Fields:
//   confirmCalls: Echo each call and require y/yes before sending it.
//   color: ANSI colours in prompts and messages.
//   promptForArguments: `call` without JSON arguments asks for each schema property.
//==========================================================================================================
struct ShellOptions {
    bool confirmCalls{false};
    bool color{true};
    bool promptForArguments{true};
};

//==========================================================================================================
// CommandShell
// Purpose: Reads commands from `in`, prints results to `out`. Every command maps to one Client operation;
//          failures are printed and the loop keeps running.
//==========================================================================================================
class CommandShell {
public:
    CommandShell(Client& client, std::istream& in, std::ostream& out, ShellOptions options = ShellOptions{});

    // Read-eval loop until exit/quit or end of input. Returns the process exit code.
    int Run();

    //==========================================================================================================
    // Execute
    // Purpose: Runs one command line.
    // Args:
    //   line: Raw input, e.g. `call files read {"path":"a.txt"}`.
    // Returns:
    //   false when the shell should stop (exit/quit), true otherwise.
    //==========================================================================================================
    bool Execute(const std::string& line);

    // Connects every configured server, printing one line per server.
    void ConnectAll();

private:
    void printHelp();
    void cmdServers();
    void cmdConnect(const std::string& server);
    void cmdDisconnect(const std::string& server);
    void cmdTools(const std::string& server);
    void cmdInfo(const std::string& server, const std::optional<std::string>& tool);
    void cmdCall(const std::string& server, const std::string& tool, const std::string& rawArgs);
    void cmdResources(const std::string& server);
    void cmdRefresh(const std::string& server);

    std::optional<JSONValue> promptArguments(const ToolDescriptor& tool);
    bool confirm(const std::string& server, const std::string& tool, const JSONValue& arguments);
    std::optional<std::string> readLine(const std::string& prompt);

    void printFailure(const errors::Failure& failure);
    std::string paint(const char* colour, const std::string& text) const;

    Client& client;
    std::istream& in;
    std::ostream& out;
    ShellOptions options;
};

// Splits a command line into at most maxTokens whitespace-separated tokens; the last token keeps the rest
// of the line verbatim (trimmed).
std::vector<std::string> splitCommand(const std::string& line, std::size_t maxTokens);

//==========================================================================================================
// convertArgument
// Purpose: Converts operator text into a JSON value of a schema type.
// Args:
//   text: Raw input (non-empty).
//   type: integer, number, boolean, array, object or anything else for string.
// Returns:
//   The converted value, or std::nullopt with `error` set.
//==========================================================================================================
std::optional<JSONValue> convertArgument(const std::string& text, const std::string& type, std::string& error);

} // namespace cli
} // namespace toolclient
