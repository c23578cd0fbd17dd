//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ArgumentValidator.cpp
// Purpose: Structural checks of tool call arguments against a tool's input schema
//==========================================================================================================

#include <cmath>
#include <string>
#include <vector>

#include "toolclient/validation/Validators.h"

namespace toolclient {
namespace validation {

bool matchesJsonType(const JSONValue& v, const std::string& type) {
    if (type == "string") return std::holds_alternative<std::string>(v.value);
    if (type == "boolean") return std::holds_alternative<bool>(v.value);
    if (type == "object") return v.isObject();
    if (type == "array") return v.isArray();
    if (type == "null") return v.isNull();
    if (type == "integer") {
        if (std::holds_alternative<int64_t>(v.value)) return true;
        if (const auto* d = std::get_if<double>(&v.value)) return std::isfinite(*d) && std::floor(*d) == *d;
        return false;
    }
    if (type == "number") {
        return std::holds_alternative<int64_t>(v.value) || std::holds_alternative<double>(v.value);
    }
    return true;
}

namespace {
// Collects the declared type names of a property schema ("type": "x" or "type": ["x", "y"]).
std::vector<std::string> declaredTypes(const JSONValue& propertySchema) {
    std::vector<std::string> out;
    const JSONValue* t = findField(propertySchema, "type");
    if (t == nullptr) {
        return out;
    }
    if (const auto* s = std::get_if<std::string>(&t->value)) {
        out.push_back(*s);
    } else if (const auto* arr = std::get_if<JSONValue::Array>(&t->value)) {
        for (const auto& item : *arr) {
            if (item) {
                if (const auto* s = std::get_if<std::string>(&item->value)) out.push_back(*s);
            }
        }
    }
    return out;
}

std::string typeName(const JSONValue& v) {
    return std::visit([](const auto& x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) return "null";
        else if constexpr (std::is_same_v<T, bool>) return "boolean";
        else if constexpr (std::is_same_v<T, int64_t>) return "integer";
        else if constexpr (std::is_same_v<T, double>) return "number";
        else if constexpr (std::is_same_v<T, std::string>) return "string";
        else if constexpr (std::is_same_v<T, JSONValue::Array>) return "array";
        else return "object";
    }, v.value);
}
} // namespace

std::optional<std::string> checkToolArguments(const JSONValue& inputSchema, const JSONValue& arguments) {
    if (!arguments.isNull() && !arguments.isObject()) {
        return "arguments must be a JSON object, got " + typeName(arguments);
    }
    if (!inputSchema.isObject()) {
        return std::nullopt;
    }

    if (const JSONValue* required = findField(inputSchema, "required")) {
        if (const auto* names = std::get_if<JSONValue::Array>(&required->value)) {
            for (const auto& n : *names) {
                if (!n) continue;
                const auto* name = std::get_if<std::string>(&n->value);
                if (name != nullptr && findField(arguments, *name) == nullptr) {
                    return "missing required argument '" + *name + "'";
                }
            }
        }
    }

    const JSONValue* properties = findField(inputSchema, "properties");
    const auto* argObj = std::get_if<JSONValue::Object>(&arguments.value);
    if (properties == nullptr || argObj == nullptr) {
        return std::nullopt;
    }
    for (const auto& [name, value] : *argObj) {
        const JSONValue* propSchema = findField(*properties, name);
        if (propSchema == nullptr || !value) {
            continue;
        }
        const auto types = declaredTypes(*propSchema);
        if (types.empty()) {
            continue;
        }
        bool ok = false;
        for (const auto& t : types) {
            if (matchesJsonType(*value, t)) { ok = true; break; }
        }
        if (!ok) {
            std::string expected;
            for (std::size_t k = 0; k < types.size(); ++k) {
                if (k > 0) expected += "|";
                expected += types[k];
            }
            return "argument '" + name + "' must be " + expected + ", got " + typeName(*value);
        }
    }
    return std::nullopt;
}

} // namespace validation
} // namespace toolclient
