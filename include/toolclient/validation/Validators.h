//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Validators.h
// Purpose: Lightweight validators for tool results and tool arguments
//==========================================================================================================

#pragma once

#include <string>
#include <optional>
#include "toolclient/JSONRPCTypes.h"

namespace toolclient {
namespace validation {

//------------------------------ Primitive content checks ------------------------------
// Any object with a string "type" tag.
inline bool isContentBlock(const JSONValue& v) {
    return getStringField(v, "type").has_value();
}

inline bool isTextContentItem(const JSONValue& v) {
    auto type = getStringField(v, "type");
    if (!type.has_value() || *type != "text") return false;
    return getStringField(v, "text").has_value();
}

//------------------------------ JSON validators (for client-side raw JSON) ------------------------------
// content must be an array of typed blocks; text blocks must carry a string text.
inline bool validateCallToolResultJson(const JSONValue& v) {
    const JSONValue* content = findField(v, "content");
    if (content == nullptr || !content->isArray()) return false;
    for (const auto& p : std::get<JSONValue::Array>(content->value)) {
        if (!p || !isContentBlock(*p)) return false;
        if (getStringField(*p, "type") == std::string("text") && !isTextContentItem(*p)) return false;
    }
    return true;
}

//------------------------------ Argument checks against an input schema ------------------------------
//==========================================================================================================
// matchesJsonType
// Purpose: Tests a value against one JSON Schema primitive type name.
// Args:
//   v: Value to test.
//   type: "string" | "integer" | "number" | "boolean" | "object" | "array" | "null".
// Returns:
//   True on match; unknown type names always match.
//==========================================================================================================
bool matchesJsonType(const JSONValue& v, const std::string& type);

//==========================================================================================================
// checkToolArguments
// Purpose: Structural pre-flight check of call arguments. Only "required" and per-property "type"
//          (a string or an array of strings) are enforced; nested schemas are not descended into.
// Args:
//   inputSchema: The tool's input schema; a non-object schema accepts any object.
//   arguments: Call arguments; null counts as an empty object.
// Returns:
//   std::nullopt when acceptable, otherwise a message naming the offending property.
//==========================================================================================================
std::optional<std::string> checkToolArguments(const JSONValue& inputSchema, const JSONValue& arguments);

} // namespace validation
} // namespace toolclient
