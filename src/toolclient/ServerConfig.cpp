//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.cpp
// Purpose: Loading of the tool-server configuration document
//==========================================================================================================

#include <fstream>
#include <sstream>

#include "logging/Logger.h"
#include "toolclient/ServerSpec.h"
#include "toolclient/errors/Errors.h"

namespace toolclient {

using errors::ErrorKind;
using errors::ToolClientError;

namespace {
[[noreturn]] void configError(const std::string& server, const std::string& detail) {
    throw ToolClientError(ErrorKind::ConfigError, "server '" + server + "': " + detail);
}

ServerSpec parseEntry(const std::string& name, const JSONValue& entry) {
    if (!entry.isObject()) {
        configError(name, "entry must be an object");
    }
    ServerSpec spec;
    spec.name = name;

    const JSONValue* command = findField(entry, "command");
    if (command == nullptr || !command->isString() || std::get<std::string>(command->value).empty()) {
        configError(name, "'command' must be a non-empty string");
    }
    spec.command = std::get<std::string>(command->value);

    if (const JSONValue* args = findField(entry, "args")) {
        if (!args->isArray()) {
            configError(name, "'args' must be an array of strings");
        }
        for (const auto& a : std::get<JSONValue::Array>(args->value)) {
            if (!a || !a->isString()) {
                configError(name, "'args' must be an array of strings");
            }
            spec.args.push_back(std::get<std::string>(a->value));
        }
    }

    if (const JSONValue* env = findField(entry, "env")) {
        if (env->isNull()) {
            // "env": null means no overrides
        } else if (!env->isObject()) {
            configError(name, "'env' must be an object of strings");
        } else {
            for (const auto& [key, value] : std::get<JSONValue::Object>(env->value)) {
                if (!value || !value->isString()) {
                    configError(name, "'env." + key + "' must be a string");
                }
                spec.env[key] = std::get<std::string>(value->value);
            }
        }
    }

    if (const JSONValue* cwd = findField(entry, "cwd")) {
        if (!cwd->isString()) {
            configError(name, "'cwd' must be a string");
        }
        spec.cwd = std::get<std::string>(cwd->value);
    }
    return spec;
}
} // namespace

std::string ServerSpec::CommandLine() const {
    std::string out = command;
    for (const auto& a : args) {
        out.push_back(' ');
        out += a;
    }
    return out;
}

ServerCatalog ParseServerCatalog(const JSONValue& doc) {
    FUNC_SCOPE();
    if (!doc.isObject()) {
        throw ToolClientError(ErrorKind::ConfigError, "configuration must be a JSON object");
    }
    const JSONValue* servers = findField(doc, "mcpServers");
    if (servers == nullptr) {
        servers = &doc;
    } else if (!servers->isObject()) {
        throw ToolClientError(ErrorKind::ConfigError, "'mcpServers' must be an object");
    }

    ServerCatalog catalog;
    for (const auto& [name, entry] : std::get<JSONValue::Object>(servers->value)) {
        if (name.empty()) {
            throw ToolClientError(ErrorKind::ConfigError, "server names must be non-empty");
        }
        if (!entry) {
            configError(name, "entry must be an object");
        }
        catalog.emplace(name, parseEntry(name, *entry));
    }
    LOG_INFO("Loaded {} server definition(s)", catalog.size());
    return catalog;
}

ServerCatalog LoadServerCatalog(const std::string& path) {
    FUNC_SCOPE();
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ToolClientError(ErrorKind::ConfigError, "cannot open configuration file '" + path + "'");
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    JSONValue doc;
    try {
        doc = parseJSON(ss.str());
    } catch (const JSONParseError& e) {
        throw ToolClientError(ErrorKind::ConfigError, "invalid JSON in '" + path + "': " + e.what());
    }
    return ParseServerCatalog(doc);
}

} // namespace toolclient
