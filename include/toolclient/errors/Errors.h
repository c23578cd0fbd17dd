//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Error taxonomy, exception type, Result values and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include "toolclient/JSONRPCTypes.h"

namespace toolclient {
namespace errors {

// Every failure surfaced by the client falls into exactly one of these kinds.
enum class ErrorKind {
    LaunchError,
    TransportError,
    ConnectError,
    UnknownServer,
    UnknownTool,
    InvalidArguments,
    Timeout,
    NotConnected,
    ServerError,
    ConfigError
};

inline const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::LaunchError: return "LaunchError";
        case ErrorKind::TransportError: return "TransportError";
        case ErrorKind::ConnectError: return "ConnectError";
        case ErrorKind::UnknownServer: return "UnknownServer";
        case ErrorKind::UnknownTool: return "UnknownTool";
        case ErrorKind::InvalidArguments: return "InvalidArguments";
        case ErrorKind::Timeout: return "Timeout";
        case ErrorKind::NotConnected: return "NotConnected";
        case ErrorKind::ServerError: return "ServerError";
        case ErrorKind::ConfigError: return "ConfigError";
    }
    return "Unknown";
}

//==========================================================================================================
// Failure
// Purpose: Value form of an error as returned by the invocation facade.
// Fields:
//   kind: Taxonomy entry.
//   message: Human-readable detail (server name, tool name, underlying cause).
//==========================================================================================================
struct Failure {
    ErrorKind kind{ErrorKind::ServerError};
    std::string message;

    std::string describe() const { return std::string(toString(kind)) + ": " + message; }
};

//==========================================================================================================
// ToolClientError
// Purpose: Exception carrying an ErrorKind. Thrown inside the library and across std::future boundaries;
//          the facade converts it into a Failure.
//==========================================================================================================
class ToolClientError : public std::runtime_error {
public:
    ToolClientError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }
    Failure toFailure() const { return Failure{kind_, what()}; }

private:
    ErrorKind kind_;
};

//==========================================================================================================
// Result<T>
// Purpose: Either a value or a Failure. Never throws on construction.
// Methods:
//   IsOk(): True when a value is held.
//   Value(): The held value; throws ToolClientError carrying the failure when called on an error.
//   Error(): The held failure; throws std::logic_error when called on a value.
//==========================================================================================================
template <typename T>
class Result {
public:
    Result(T value) : state_(std::move(value)) {}
    Result(Failure failure) : state_(std::move(failure)) {}

    static Result Fail(ErrorKind kind, std::string message) {
        return Result(Failure{kind, std::move(message)});
    }

    bool IsOk() const { return std::holds_alternative<T>(state_); }
    explicit operator bool() const { return IsOk(); }

    const T& Value() const {
        if (const auto* f = std::get_if<Failure>(&state_)) {
            throw ToolClientError(f->kind, f->message);
        }
        return std::get<T>(state_);
    }
    T& Value() {
        if (const auto* f = std::get_if<Failure>(&state_)) {
            throw ToolClientError(f->kind, f->message);
        }
        return std::get<T>(state_);
    }

    const Failure& Error() const {
        if (!std::holds_alternative<Failure>(state_)) {
            throw std::logic_error("Result holds a value, not an error");
        }
        return std::get<Failure>(state_);
    }

private:
    std::variant<T, Failure> state_;
};

// Result for operations with no payload.
using Status = Result<std::monostate>;

inline Status Ok() { return Status(std::monostate{}); }

//==========================================================================================================
// RpcError
// Purpose: Typed view of a JSON-RPC error object { code, message, data? } returned by a server.
//==========================================================================================================
struct RpcError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
};

// Convert a JSON-RPC error object to RpcError.
//
// Args:
//   errVal: JSONValue expected to be an Object with code/message and optional data.
//
// Returns:
//   std::optional<RpcError> populated when shape is valid.
inline std::optional<RpcError> rpcErrorFromErrorValue(const JSONValue& errVal) {
    auto code = getIntField(errVal, "code");
    auto message = getStringField(errVal, "message");
    if (!code.has_value() || !message.has_value()) {
        return std::nullopt;
    }
    RpcError e;
    e.code = static_cast<int>(*code);
    e.message = std::move(*message);
    if (const JSONValue* data = findField(errVal, "data")) {
        e.data = *data;
    }
    return e;
}

// Extract RpcError from a JSONRPCResponse if it carries an error.
inline std::optional<RpcError> rpcErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return rpcErrorFromErrorValue(response.error.value());
}

// Operator-facing text for a server error, e.g. "Unknown tool: x (code -32602)".
inline std::string describeRpcError(const JSONRPCResponse& response) {
    if (auto e = rpcErrorFromResponse(response)) {
        return e->message + " (code " + std::to_string(e->code) + ")";
    }
    if (response.error.has_value()) {
        return "malformed error object: " + serializeJSONValue(response.error.value());
    }
    return "no error";
}

} // namespace errors
} // namespace toolclient
