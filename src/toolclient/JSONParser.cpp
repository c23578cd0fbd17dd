//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Recursive-descent JSON parser, serializers and JSON-RPC message codecs
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <fmt/format.h>
#include "toolclient/JSONRPCTypes.h"
#include "logging/Logger.h"


namespace toolclient {

//----------------------------------------------------------------------------------------------------------
// JSONValue special members (out-of-line definitions)
//----------------------------------------------------------------------------------------------------------
JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) = default;
JSONValue::~JSONValue() {}

// Explicit constructors
JSONValue::JSONValue(std::nullptr_t) : value(nullptr) {}
JSONValue::JSONValue(bool v) : value(v) {}
JSONValue::JSONValue(int64_t v) : value(v) {}
JSONValue::JSONValue(double v) : value(v) {}
JSONValue::JSONValue(const char* s) : value(std::string(s ? s : "")) {}
JSONValue::JSONValue(const std::string& s) : value(s) {}
JSONValue::JSONValue(std::string&& s) : value(std::move(s)) {}
JSONValue::JSONValue(const Array& a) : value(a) {}
JSONValue::JSONValue(Array&& a) : value(std::move(a)) {}
JSONValue::JSONValue(const Object& o) : value(o) {}
JSONValue::JSONValue(Object&& o) : value(std::move(o)) {}

// -------------------------------
// Recursive JSON parser
// -------------------------------
namespace {
constexpr unsigned int kMaxDepth = 256u;

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    unsigned int depth{0};

    explicit JsonParser(const std::string& str, std::size_t start = 0) : s(str), i(start) {}

    [[noreturn]] void fail(const std::string& what) const {
        throw JSONParseError(what, i);
    }

    void skipWs() {
        while (i < s.size()) {
            char c = s[i];
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') { ++i; } else { break; }
        }
    }

    bool match(char c) {
        skipWs();
        if (i < s.size() && s[i] == c) { ++i; return true; }
        return false;
    }

    unsigned int parseHex4() {
        if (i + 4 > s.size()) fail("Invalid unicode escape");
        unsigned int code = 0;
        for (std::size_t k = 0; k < 4; ++k) {
            char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += 10u + static_cast<unsigned int>(h - 'a');
            else if (h >= 'A' && h <= 'F') code += 10u + static_cast<unsigned int>(h - 'A');
            else fail("Invalid hex in unicode escape");
        }
        return code;
    }

    static void appendUtf8(std::string& out, unsigned int code) {
        if (code <= 0x7F) {
            out.push_back(static_cast<char>(code));
        } else if (code <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else if (code <= 0xFFFF) {
            out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | ((code >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        }
    }

    std::string parseString() {
        skipWs();
        if (i >= s.size() || s[i] != '"') fail("Expected '\"' at string start");
        ++i; // skip opening quote
        std::string out;
        while (true) {
            if (i >= s.size()) fail("Unterminated string");
            char c = s[i++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) fail("Unescaped control character in string");
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (i >= s.size()) fail("Invalid escape");
            char e = s[i++];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    unsigned int code = parseHex4();
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        // High surrogate must be followed by an escaped low surrogate
                        if (i + 6 <= s.size() && s[i] == '\\' && s[i + 1] == 'u') {
                            i += 2;
                            unsigned int low = parseHex4();
                            if (low < 0xDC00 || low > 0xDFFF) fail("Invalid low surrogate");
                            code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                        } else {
                            fail("Unpaired high surrogate");
                        }
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        fail("Unpaired low surrogate");
                    }
                    appendUtf8(out, code);
                    break;
                }
                default: fail("Unknown escape");
            }
        }
        return out;
    }

    JSONValue parseNumber() {
        skipWs();
        std::size_t start = i;
        auto digits = [this]() {
            std::size_t from = i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
            return i - from;
        };
        if (i < s.size() && s[i] == '-') ++i;
        if (i + 1 < s.size() && s[i] == '0' && std::isdigit(static_cast<unsigned char>(s[i + 1]))) {
            fail("Leading zero in number");
        }
        if (digits() == 0) fail("Invalid number");
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            if (digits() == 0) fail("Invalid fraction");
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            if (digits() == 0) fail("Invalid exponent");
        }
        const std::string num = s.substr(start, i - start);
        if (!isFloat) {
            errno = 0;
            char* end = nullptr;
            long long v = std::strtoll(num.c_str(), &end, 10);
            if (errno != ERANGE) {
                return JSONValue(static_cast<int64_t>(v));
            }
            // Out of int64 range: fall through to double
        }
        char* end = nullptr;
        double d = std::strtod(num.c_str(), &end);
        return JSONValue(d);
    }

    JSONValue parseArray() {
        if (!match('[')) fail("Expected '['");
        if (++depth > kMaxDepth) fail("Nesting too deep");
        JSONValue::Array arr;
        if (!match(']')) {
            while (true) {
                arr.push_back(std::make_shared<JSONValue>(parseValue()));
                if (match(']')) break;
                if (!match(',')) fail("Expected ',' in array");
            }
        }
        --depth;
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        if (!match('{')) fail("Expected '{'");
        if (++depth > kMaxDepth) fail("Nesting too deep");
        JSONValue::Object obj;
        if (!match('}')) {
            while (true) {
                std::string key = parseString();
                if (!match(':')) fail("Expected ':' after key");
                obj[key] = std::make_shared<JSONValue>(parseValue());
                if (match('}')) break;
                if (!match(',')) fail("Expected ',' in object");
            }
        }
        --depth;
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) fail("Unexpected end of JSON");
        char c = s[i];
        if (c == '"') return JSONValue(parseString());
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (s.compare(i, 4, "true") == 0) { i += 4; return JSONValue(true); }
        if (s.compare(i, 5, "false") == 0) { i += 5; return JSONValue(false); }
        if (s.compare(i, 4, "null") == 0) { i += 4; return JSONValue(nullptr); }
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parseNumber();
        fail(std::string("Unexpected character '") + c + "'");
    }
};

void appendEscaped(std::string& out, const std::string& v) {
    out.push_back('"');
    for (char c : v) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += fmt::format("\\u{:04x}", static_cast<unsigned int>(static_cast<unsigned char>(c)));
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    out.push_back('"');
}

std::vector<const JSONValue::Object::value_type*> sortedEntries(const JSONValue::Object& o) {
    std::vector<const JSONValue::Object::value_type*> entries;
    entries.reserve(o.size());
    for (const auto& kv : o) entries.push_back(&kv);
    std::sort(entries.begin(), entries.end(), [](const auto* a, const auto* b) { return a->first < b->first; });
    return entries;
}

std::string formatDouble(double v) {
    std::string out = fmt::format("{}", v);
    if (out == "inf" || out == "-inf" || out == "nan") {
        return "null"; // not representable in JSON
    }
    return out;
}

// indent < 0 selects compact output
void writeValue(std::string& out, const JSONValue& value, int indent, int level) {
    const bool pretty = indent >= 0;
    auto newline = [&](int lvl) {
        if (pretty) {
            out.push_back('\n');
            out.append(static_cast<std::size_t>(indent * lvl), ' ');
        }
    };
    std::visit([&](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            out += v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            out += std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            out += formatDouble(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            appendEscaped(out, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            out.push_back('[');
            for (std::size_t k = 0; k < v.size(); ++k) {
                if (k > 0) out.push_back(',');
                newline(level + 1);
                if (v[k]) writeValue(out, *v[k], indent, level + 1); else out += "null";
            }
            if (!v.empty()) newline(level);
            out.push_back(']');
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            out.push_back('{');
            bool first = true;
            for (const auto* entry : sortedEntries(v)) {
                if (!first) out.push_back(',');
                first = false;
                newline(level + 1);
                appendEscaped(out, entry->first);
                out += pretty ? ": " : ":";
                if (entry->second) writeValue(out, *entry->second, indent, level + 1); else out += "null";
            }
            if (!v.empty()) newline(level);
            out.push_back('}');
        }
    }, value.get());
}

std::string serializeId(const JSONRPCId& id) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            std::string out;
            appendEscaped(out, v);
            return out;
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else {
            return "null";
        }
    }, id);
}

bool readId(const JSONValue& obj, JSONRPCId& id) {
    const JSONValue* idv = findField(obj, "id");
    if (idv == nullptr) {
        return false;
    }
    if (auto p = std::get_if<int64_t>(&idv->value)) { id = *p; return true; }
    if (auto p = std::get_if<std::string>(&idv->value)) { id = *p; return true; }
    if (auto p = std::get_if<double>(&idv->value)) { id = static_cast<int64_t>(*p); return true; }
    if (idv->isNull()) { id = nullptr; return true; }
    return false;
}

template <typename Message>
bool deserializeText(Message& msg, const std::string& json, const char* what) {
    try {
        return msg.FromJSONValue(parseJSON(json));
    } catch (const JSONParseError& e) {
        LOG_ERROR("Failed to deserialize {}: {}", what, e.what());
        return false;
    }
}
} // namespace

JSONValue parseJSON(const std::string& text) {
    FUNC_SCOPE();
    JsonParser p(text);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != text.size()) {
        p.fail("Trailing characters after JSON document");
    }
    return v;
}

std::string serializeJSONValue(const JSONValue& value) {
    std::string out;
    writeValue(out, value, -1, 0);
    return out;
}

std::string prettyPrintJSONValue(const JSONValue& value, int indent) {
    std::string out;
    writeValue(out, value, indent < 0 ? 0 : indent, 0);
    return out;
}

const JSONValue* findField(const JSONValue& value, const std::string& key) {
    const auto* obj = std::get_if<JSONValue::Object>(&value.value);
    if (obj == nullptr) {
        return nullptr;
    }
    auto it = obj->find(key);
    if (it == obj->end() || !it->second) {
        return nullptr;
    }
    return it->second.get();
}

std::optional<std::string> getStringField(const JSONValue& value, const std::string& key) {
    const JSONValue* f = findField(value, key);
    if (f != nullptr) {
        if (auto p = std::get_if<std::string>(&f->value)) return *p;
    }
    return std::nullopt;
}

std::optional<int64_t> getIntField(const JSONValue& value, const std::string& key) {
    const JSONValue* f = findField(value, key);
    if (f != nullptr) {
        if (auto p = std::get_if<int64_t>(&f->value)) return *p;
        if (auto p = std::get_if<double>(&f->value)) return static_cast<int64_t>(*p);
    }
    return std::nullopt;
}

std::optional<bool> getBoolField(const JSONValue& value, const std::string& key) {
    const JSONValue* f = findField(value, key);
    if (f != nullptr) {
        if (auto p = std::get_if<bool>(&f->value)) return *p;
    }
    return std::nullopt;
}

std::string idToString(const JSONRPCId& id) {
    return serializeId(id);
}

// JSONRPCRequest implementation
std::string JSONRPCRequest::Serialize() const {
    FUNC_SCOPE();
    std::string out = "{\"jsonrpc\":\"" + jsonrpc + "\",\"id\":" + serializeId(id) + ",\"method\":";
    appendEscaped(out, method);
    if (params.has_value()) {
        out += ",\"params\":" + serializeJSONValue(params.value());
    }
    out += "}";
    return out;
}

bool JSONRPCRequest::Deserialize(const std::string& json) {
    return deserializeText(*this, json, "JSONRPCRequest");
}

bool JSONRPCRequest::FromJSONValue(const JSONValue& v) {
    auto m = getStringField(v, "method");
    if (!m || m->empty() || !readId(v, id)) {
        return false;
    }
    method = *m;
    if (const JSONValue* p = findField(v, "params")) {
        params = *p;
    }
    return true;
}

// JSONRPCResponse implementation
std::string JSONRPCResponse::Serialize() const {
    FUNC_SCOPE();
    std::string out = "{\"jsonrpc\":\"" + jsonrpc + "\",\"id\":" + serializeId(id);
    if (error.has_value()) {
        out += ",\"error\":" + serializeJSONValue(error.value());
    } else {
        out += ",\"result\":" + (result.has_value() ? serializeJSONValue(result.value()) : std::string("null"));
    }
    out += "}";
    return out;
}

bool JSONRPCResponse::Deserialize(const std::string& json) {
    return deserializeText(*this, json, "JSONRPCResponse");
}

bool JSONRPCResponse::FromJSONValue(const JSONValue& v) {
    if (!readId(v, id)) {
        return false;
    }
    const JSONValue* r = findField(v, "result");
    const JSONValue* e = findField(v, "error");
    if (r == nullptr && e == nullptr) {
        return false;
    }
    if (r != nullptr) result = *r;
    if (e != nullptr) error = *e;
    return true;
}

// JSONRPCNotification implementation
std::string JSONRPCNotification::Serialize() const {
    FUNC_SCOPE();
    std::string out = "{\"jsonrpc\":\"" + jsonrpc + "\",\"method\":";
    appendEscaped(out, method);
    if (params.has_value()) {
        out += ",\"params\":" + serializeJSONValue(params.value());
    }
    out += "}";
    return out;
}

bool JSONRPCNotification::Deserialize(const std::string& json) {
    return deserializeText(*this, json, "JSONRPCNotification");
}

bool JSONRPCNotification::FromJSONValue(const JSONValue& v) {
    auto m = getStringField(v, "method");
    if (!m || m->empty()) {
        return false;
    }
    method = *m;
    if (const JSONValue* p = findField(v, "params")) {
        params = *p;
    }
    return true;
}

// Utility functions
JSONValue CreateErrorObject(int code, const std::string& message,
                            const std::optional<JSONValue>& data) {
    JSONValue::Object errorObj;
    errorObj["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(code));
    errorObj["message"] = std::make_shared<JSONValue>(message);
    if (data.has_value()) {
        errorObj["data"] = std::make_shared<JSONValue>(data.value());
    }
    return JSONValue(std::move(errorObj));
}

std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data) {
    auto response = std::make_unique<JSONRPCResponse>();
    response->id = id;
    response->error = CreateErrorObject(code, message, data);
    return response;
}

} // namespace toolclient
