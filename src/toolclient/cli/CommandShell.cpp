//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CommandShell.cpp
// Purpose: Operator console command parsing, argument prompting and result printing
//==========================================================================================================

#include "toolclient/cli/CommandShell.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <istream>
#include <ostream>

#include <fmt/format.h>

#include "logging/Logger.h"
#include "toolclient/version.h"

namespace toolclient {
namespace cli {

namespace {
constexpr const char* kInfo = "\033[36m";
constexpr const char* kHighlight = "\033[1;35m";
constexpr const char* kOk = "\033[32m";
constexpr const char* kWarn = "\033[33m";
constexpr const char* kError = "\033[31m";
constexpr const char* kReset = "\033[0m";

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return std::string();
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// First entry of a "type" that may be a string or an array of strings.
std::string schemaType(const JSONValue& property) {
    const JSONValue* type = findField(property, "type");
    if (type == nullptr) {
        return "string";
    }
    if (type->isString()) {
        return std::get<std::string>(type->value);
    }
    if (type->isArray()) {
        for (const auto& entry : std::get<JSONValue::Array>(type->value)) {
            if (entry && entry->isString() && std::get<std::string>(entry->value) != "null") {
                return std::get<std::string>(entry->value);
            }
        }
    }
    return "string";
}

std::vector<std::string> requiredNames(const JSONValue& schema) {
    std::vector<std::string> names;
    const JSONValue* required = findField(schema, "required");
    if (required != nullptr && required->isArray()) {
        for (const auto& entry : std::get<JSONValue::Array>(required->value)) {
            if (entry && entry->isString()) {
                names.push_back(std::get<std::string>(entry->value));
            }
        }
    }
    return names;
}
} // namespace

std::vector<std::string> splitCommand(const std::string& line, std::size_t maxTokens) {
    std::vector<std::string> tokens;
    std::size_t pos = 0;
    const std::string trimmed = trim(line);
    while (pos < trimmed.size() && tokens.size() + 1 < maxTokens) {
        const auto end = trimmed.find_first_of(" \t", pos);
        tokens.push_back(trimmed.substr(pos, end == std::string::npos ? std::string::npos : end - pos));
        if (end == std::string::npos) {
            return tokens;
        }
        pos = trimmed.find_first_not_of(" \t", end);
        if (pos == std::string::npos) {
            return tokens;
        }
    }
    if (pos < trimmed.size()) {
        tokens.push_back(trimmed.substr(pos));
    }
    return tokens;
}

std::optional<JSONValue> convertArgument(const std::string& text, const std::string& type, std::string& error) {
    try {
        if (type == "integer") {
            std::size_t used = 0;
            const long long v = std::stoll(text, &used);
            if (used != text.size()) {
                error = "'" + text + "' is not an integer";
                return std::nullopt;
            }
            return JSONValue(static_cast<int64_t>(v));
        }
        if (type == "number") {
            std::size_t used = 0;
            const double v = std::stod(text, &used);
            if (used != text.size()) {
                error = "'" + text + "' is not a number";
                return std::nullopt;
            }
            return JSONValue(v);
        }
    } catch (const std::logic_error&) {
        // std::invalid_argument / std::out_of_range from the numeric conversions
        error = "'" + text + "' is not a valid " + type;
        return std::nullopt;
    }
    if (type == "boolean") {
        const std::string v = lower(text);
        return JSONValue(v == "true" || v == "yes" || v == "y" || v == "1");
    }
    if (type == "array" || type == "object") {
        try {
            JSONValue parsed = parseJSON(text);
            if ((type == "array" && !parsed.isArray()) || (type == "object" && !parsed.isObject())) {
                error = "expected a JSON " + type;
                return std::nullopt;
            }
            return parsed;
        } catch (const JSONParseError& e) {
            error = e.what();
            return std::nullopt;
        }
    }
    return JSONValue(text);
}

CommandShell::CommandShell(Client& client, std::istream& in, std::ostream& out, ShellOptions options)
    : client(client), in(in), out(out), options(options) {}

std::string CommandShell::paint(const char* colour, const std::string& text) const {
    if (!options.color) {
        return text;
    }
    return std::string(colour) + text + kReset;
}

std::optional<std::string> CommandShell::readLine(const std::string& prompt) {
    out << prompt << std::flush;
    std::string line;
    if (!std::getline(in, line)) {
        return std::nullopt;
    }
    return trim(line);
}

void CommandShell::printFailure(const errors::Failure& failure) {
    out << paint(kError, fmt::format("Error [{}]: {}", errors::toString(failure.kind), failure.message)) << "\n";
}

int CommandShell::Run() {
    FUNC_SCOPE();
    out << paint(kHighlight, fmt::format("toolclient {}", getVersionString())) << "\n";
    out << "Type 'help' for available commands\n";
    while (true) {
        auto line = readLine("\n" + paint(kHighlight, "toolclient>") + " ");
        if (!line.has_value()) {
            out << "\n";
            break;
        }
        if (!Execute(*line)) {
            break;
        }
    }
    return 0;
}

void CommandShell::ConnectAll() {
    for (const auto& server : client.ListServers()) {
        out << "Connecting to " << server.name << "...\n";
        cmdConnect(server.name);
    }
}

bool CommandShell::Execute(const std::string& line) {
    const auto head = splitCommand(line, 2);
    if (head.empty()) {
        return true;
    }
    const std::string command = lower(head[0]);
    LOG_DEBUG("Command: {}", line);

    if (command == "exit" || command == "quit") {
        return false;
    }
    if (command == "help") {
        printHelp();
        return true;
    }
    if (command == "servers") {
        cmdServers();
        return true;
    }

    if (command == "call") {
        const auto parts = splitCommand(line, 4);
        if (parts.size() < 3) {
            out << paint(kWarn, "Usage: call <server> <tool> [json-arguments]") << "\n";
            return true;
        }
        cmdCall(parts[1], parts[2], parts.size() > 3 ? parts[3] : std::string());
        return true;
    }
    if (command == "info") {
        const auto parts = splitCommand(line, 3);
        if (parts.size() < 2) {
            out << paint(kWarn, "Usage: info <server> [tool]") << "\n";
            return true;
        }
        cmdInfo(parts[1], parts.size() > 2 ? std::optional<std::string>(parts[2]) : std::nullopt);
        return true;
    }

    using Handler = void (CommandShell::*)(const std::string&);
    static const std::vector<std::pair<std::string, Handler>> serverCommands = {
        {"connect", &CommandShell::cmdConnect},
        {"disconnect", &CommandShell::cmdDisconnect},
        {"tools", &CommandShell::cmdTools},
        {"resources", &CommandShell::cmdResources},
        {"refresh", &CommandShell::cmdRefresh},
    };
    for (const auto& [name, handler] : serverCommands) {
        if (command != name) {
            continue;
        }
        const auto parts = splitCommand(line, 2);
        if (parts.size() < 2 || parts[1].find_first_of(" \t") != std::string::npos) {
            out << paint(kWarn, "Usage: " + name + " <server>") << "\n";
            return true;
        }
        (this->*handler)(parts[1]);
        return true;
    }

    out << paint(kWarn, "Unknown command: " + head[0]) << "\n";
    out << "Type 'help' for available commands\n";
    return true;
}

void CommandShell::printHelp() {
    out << paint(kInfo, fmt::format("toolclient {} commands:", getVersionString())) << "\n"
        << "  servers                              List configured servers\n"
        << "  connect <server>                     Launch and handshake a server\n"
        << "  disconnect <server>                  Close a server session\n"
        << "  tools <server>                       List the tools of a server\n"
        << "  info <server> [tool]                 Show tool descriptions and schemas\n"
        << "  call <server> <tool> [json-args]     Call a tool (prompts for arguments when omitted)\n"
        << "  resources <server>                   List the resources of a server\n"
        << "  refresh <server>                     Reload the tool catalog of a server\n"
        << "  help                                 Show this help\n"
        << "  exit | quit                          Leave the console\n";
}

void CommandShell::cmdServers() {
    const auto servers = client.ListServers();
    if (servers.empty()) {
        out << paint(kWarn, "No servers configured") << "\n";
        return;
    }
    for (const auto& s : servers) {
        const std::string status = s.connected ? paint(kOk, "connected") : paint(kWarn, "not connected");
        out << fmt::format("  {:<20} {:<16} {}", s.name, status, s.commandLine) << "\n";
    }
}

void CommandShell::cmdConnect(const std::string& server) {
    auto result = client.Connect(server);
    if (!result) {
        printFailure(result.Error());
        return;
    }
    const auto& summary = result.Value();
    out << paint(kOk, fmt::format("Connected to {}", server))
        << fmt::format(" ({} {}, protocol {}, {} tool(s), {} resource(s))", summary.serverInfo.name,
                       summary.serverInfo.version, summary.protocolVersion, summary.toolCount,
                       summary.resourceCount)
        << "\n";
    if (summary.instructions.has_value() && !summary.instructions->empty()) {
        out << "  " << *summary.instructions << "\n";
    }
}

void CommandShell::cmdDisconnect(const std::string& server) {
    auto status = client.Disconnect(server);
    if (!status) {
        printFailure(status.Error());
        return;
    }
    out << paint(kOk, "Disconnected from " + server) << "\n";
}

void CommandShell::cmdTools(const std::string& server) {
    auto result = client.ListTools(server);
    if (!result) {
        printFailure(result.Error());
        return;
    }
    const auto& tools = result.Value();
    if (tools.empty()) {
        out << paint(kWarn, server + " exposes no tools") << "\n";
        return;
    }
    out << paint(kInfo, fmt::format("Tools of {}:", server)) << "\n";
    for (const auto& tool : tools) {
        out << "  " << paint(kHighlight, tool.name);
        if (!tool.description.empty()) {
            out << " - " << tool.description;
        }
        out << "\n";
    }
}

void CommandShell::cmdInfo(const std::string& server, const std::optional<std::string>& tool) {
    auto result = client.DescribeTool(server, tool);
    if (!result) {
        printFailure(result.Error());
        return;
    }
    for (const auto& t : result.Value()) {
        out << paint(kHighlight, t.name);
        if (t.title.has_value()) {
            out << " (" << *t.title << ")";
        }
        out << "\n";
        if (!t.description.empty()) {
            out << "  " << t.description << "\n";
        }
        out << "  input schema: " << prettyPrintJSONValue(t.inputSchema) << "\n";
        if (t.outputSchema.has_value()) {
            out << "  output schema: " << prettyPrintJSONValue(*t.outputSchema) << "\n";
        }
    }
}

void CommandShell::cmdResources(const std::string& server) {
    auto result = client.ListResources(server);
    if (!result) {
        printFailure(result.Error());
        return;
    }
    const auto& resources = result.Value();
    if (resources.empty()) {
        out << paint(kWarn, server + " exposes no resources") << "\n";
        return;
    }
    for (const auto& r : resources) {
        out << "  " << paint(kHighlight, r.uri) << "  " << r.name;
        if (r.mimeType.has_value()) {
            out << " [" << *r.mimeType << "]";
        }
        if (r.description.has_value()) {
            out << " - " << *r.description;
        }
        out << "\n";
    }
}

void CommandShell::cmdRefresh(const std::string& server) {
    auto result = client.RefreshTools(server);
    if (!result) {
        printFailure(result.Error());
        return;
    }
    out << paint(kOk, fmt::format("{} now lists {} tool(s)", server, result.Value().size())) << "\n";
}

//==========================================================================================================
// promptArguments
// Purpose: Asks for each property of the tool's input schema, required ones first.
// Returns:
//   Argument object, or std::nullopt when the operator left a required value empty, entered a value that
//   does not convert, or input ended.
//==========================================================================================================
std::optional<JSONValue> CommandShell::promptArguments(const ToolDescriptor& tool) {
    JSONValue::Object arguments;
    const JSONValue* properties = findField(tool.inputSchema, "properties");
    if (properties == nullptr || !properties->isObject()) {
        return JSONValue(arguments);
    }
    const auto& props = std::get<JSONValue::Object>(properties->value);
    const auto required = requiredNames(tool.inputSchema);

    std::vector<std::string> order;
    for (const auto& name : required) {
        if (props.count(name) != 0) {
            order.push_back(name);
        }
    }
    std::vector<std::string> optional;
    for (const auto& [name, schema] : props) {
        if (std::find(required.begin(), required.end(), name) == required.end()) {
            optional.push_back(name);
        }
    }
    std::sort(optional.begin(), optional.end());
    order.insert(order.end(), optional.begin(), optional.end());

    out << paint(kInfo, "Enter arguments for ") << paint(kHighlight, tool.name) << ":\n";
    for (const auto& name : order) {
        const JSONValue& property = *props.at(name);
        const bool isRequired = std::find(required.begin(), required.end(), name) != required.end();
        const std::string type = schemaType(property);
        const JSONValue* defaultValue = findField(property, "default");

        if (auto description = getStringField(property, "description")) {
            out << "  " << paint(kInfo, *description) << "\n";
        }
        std::string prompt = "  " + paint(kHighlight, name) + " (" + type;
        if (isRequired) {
            prompt += ", " + paint(kError, "required");
        }
        if (defaultValue != nullptr) {
            prompt += ", default: " + serializeJSONValue(*defaultValue);
        }
        prompt += "): ";

        auto value = readLine(prompt);
        if (!value.has_value()) {
            out << "\n" << paint(kWarn, "Input ended; tool call aborted.") << "\n";
            return std::nullopt;
        }
        if (value->empty()) {
            if (isRequired) {
                out << paint(kError, "Error: " + name + " is required.") << "\n"
                    << paint(kWarn, "Tool call aborted.") << "\n";
                return std::nullopt;
            }
            if (defaultValue != nullptr) {
                arguments[name] = std::make_shared<JSONValue>(*defaultValue);
            }
            continue;
        }
        std::string error;
        auto converted = convertArgument(*value, type, error);
        if (!converted.has_value()) {
            out << paint(kError, "Invalid value for " + name + ": " + error) << "\n"
                << paint(kWarn, "Tool call aborted.") << "\n";
            return std::nullopt;
        }
        arguments[name] = std::make_shared<JSONValue>(std::move(*converted));
    }
    return JSONValue(std::move(arguments));
}

bool CommandShell::confirm(const std::string& server, const std::string& tool, const JSONValue& arguments) {
    out << paint(kInfo, fmt::format("About to call {} on {} with:", tool, server)) << "\n"
        << prettyPrintJSONValue(arguments) << "\n";
    auto answer = readLine(paint(kWarn, "Execute this tool? (y/n): "));
    if (!answer.has_value()) {
        return false;
    }
    const std::string v = lower(*answer);
    return v == "y" || v == "yes";
}

void CommandShell::cmdCall(const std::string& server, const std::string& tool, const std::string& rawArgs) {
    FUNC_SCOPE();
    JSONValue arguments{JSONValue::Object{}};
    if (!rawArgs.empty()) {
        try {
            arguments = parseJSON(rawArgs);
        } catch (const JSONParseError& e) {
            out << paint(kError, fmt::format("Invalid JSON arguments: {}", e.what())) << "\n";
            return;
        }
        if (!arguments.isObject()) {
            out << paint(kError, "Arguments must be a JSON object") << "\n";
            return;
        }
    } else if (options.promptForArguments) {
        auto described = client.DescribeTool(server, tool);
        if (!described) {
            printFailure(described.Error());
            return;
        }
        auto prompted = promptArguments(described.Value().front());
        if (!prompted.has_value()) {
            return;
        }
        arguments = std::move(*prompted);
    }

    if (options.confirmCalls && !confirm(server, tool, arguments)) {
        out << paint(kWarn, "Tool execution cancelled.") << "\n";
        return;
    }

    const auto started = std::chrono::steady_clock::now();
    ToolCallResult result = client.CallTool(server, tool, arguments);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (result.IsSuccess()) {
        out << paint(kHighlight, "Result:") << "\n";
    } else {
        printFailure(*result.failure);
    }
    if (result.IsSuccess() || !result.content.empty()) {
        out << prettyPrintJSONValue(result.ToJSON()) << "\n";
    }
    out << paint(kInfo, fmt::format("({} ms)", elapsed.count())) << "\n";
}

} // namespace cli
} // namespace toolclient
