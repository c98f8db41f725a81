//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Recursive-descent JSON parser, serializer and JSON-RPC message (de)serialization
//==========================================================================================================

#include <sstream>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <iomanip>

#include <fmt/format.h>

#include "dtmcp/JSONRPCTypes.h"
#include "logging/Logger.h"

namespace dtmcp {

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
JSONValue::JSONValue(int v) : value(static_cast<int64_t>(v)) {}
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
constexpr int kMaxDepth = 256;

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    int depth{0};

    explicit JsonParser(const std::string& str, std::size_t start = 0) : s(str), i(start) {}

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
        if (i + 4 > s.size()) throw std::runtime_error("Invalid unicode escape");
        unsigned int code = 0;
        for (int k = 0; k < 4; ++k) {
            char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += 10u + static_cast<unsigned int>(h - 'a');
            else if (h >= 'A' && h <= 'F') code += 10u + static_cast<unsigned int>(h - 'A');
            else throw std::runtime_error("Invalid hex in unicode escape");
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
        if (i >= s.size() || s[i] != '"') throw std::runtime_error("Expected '\"' at string start");
        ++i; // skip opening quote
        std::string out;
        while (true) {
            if (i >= s.size()) throw std::runtime_error("Unterminated string");
            char c = s[i++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) throw std::runtime_error("Control character in string");
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (i >= s.size()) throw std::runtime_error("Invalid escape");
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
                        if (i + 2 > s.size() || s[i] != '\\' || s[i + 1] != 'u') {
                            throw std::runtime_error("Unpaired surrogate in unicode escape");
                        }
                        i += 2;
                        unsigned int low = parseHex4();
                        if (low < 0xDC00 || low > 0xDFFF) throw std::runtime_error("Invalid low surrogate");
                        code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        throw std::runtime_error("Unpaired surrogate in unicode escape");
                    }
                    appendUtf8(out, code);
                    break;
                }
                default: throw std::runtime_error("Unknown escape");
            }
        }
        return out;
    }

    JSONValue parseNumber() {
        skipWs();
        std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        std::size_t intStart = i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        if (i == intStart) throw std::runtime_error("Invalid number");
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            std::size_t fracStart = i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
            if (i == fracStart) throw std::runtime_error("Invalid number fraction");
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            std::size_t expStart = i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
            if (i == expStart) throw std::runtime_error("Invalid number exponent");
        }
        std::string num = s.substr(start, i - start);
        if (!isFloat) {
            try {
                return JSONValue(static_cast<int64_t>(std::stoll(num)));
            } catch (const std::out_of_range&) {
                // Integers beyond int64 degrade to double
            }
        }
        return JSONValue(std::stod(num));
    }

    JSONValue parseArray() {
        if (!match('[')) throw std::runtime_error("Expected '['");
        if (++depth > kMaxDepth) throw std::runtime_error("JSON nesting too deep");
        JSONValue::Array arr;
        if (match(']')) { --depth; return JSONValue(std::move(arr)); }
        while (true) {
            JSONValue val = parseValue();
            arr.push_back(std::make_shared<JSONValue>(std::move(val)));
            if (match(']')) break;
            if (!match(',')) throw std::runtime_error("Expected ',' in array");
        }
        --depth;
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        if (!match('{')) throw std::runtime_error("Expected '{'");
        if (++depth > kMaxDepth) throw std::runtime_error("JSON nesting too deep");
        JSONValue::Object obj;
        if (match('}')) { --depth; return JSONValue(std::move(obj)); }
        while (true) {
            std::string key = parseString();
            if (!match(':')) throw std::runtime_error("Expected ':' after key");
            JSONValue val = parseValue();
            obj[key] = std::make_shared<JSONValue>(std::move(val));
            if (match('}')) break;
            if (!match(',')) throw std::runtime_error("Expected ',' in object");
        }
        --depth;
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) throw std::runtime_error("Unexpected end of JSON");
        char c = s[i];
        if (c == '"') return JSONValue(parseString());
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (s.compare(i, 4, "true") == 0) { i += 4; return JSONValue(true); }
        if (s.compare(i, 5, "false") == 0) { i += 5; return JSONValue(false); }
        if (s.compare(i, 4, "null") == 0) { i += 4; return JSONValue(nullptr); }
        return parseNumber();
    }
};

void appendEscaped(std::ostringstream& oss, const std::string& v) {
    oss << '"';
    for (char c : v) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
                break;
        }
    }
    oss << '"';
}

void serializeInto(std::ostringstream& oss, const JSONValue& value) {
    std::visit([&oss](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << v;
        } else if constexpr (std::is_same_v<T, double>) {
            if (std::isfinite(v)) {
                oss << fmt::format("{}", v);
            } else {
                oss << "null";
            }
        } else if constexpr (std::is_same_v<T, std::string>) {
            appendEscaped(oss, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            oss << '[';
            for (size_t k = 0; k < v.size(); ++k) {
                if (k > 0) oss << ',';
                if (v[k]) serializeInto(oss, *v[k]); else oss << "null";
            }
            oss << ']';
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            oss << '{';
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!first) oss << ',';
                first = false;
                appendEscaped(oss, key);
                oss << ':';
                if (val) serializeInto(oss, *val); else oss << "null";
            }
            oss << '}';
        }
    }, value.get());
}

bool idFromJSON(const JSONValue& v, JSONRPCId& out) {
    if (std::holds_alternative<std::string>(v.value)) { out = std::get<std::string>(v.value); return true; }
    if (std::holds_alternative<int64_t>(v.value)) { out = std::get<int64_t>(v.value); return true; }
    if (v.IsNull()) { out = nullptr; return true; }
    return false;
}
} // namespace

JSONValue ParseJSON(const std::string& text) {
    JsonParser p(text);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != text.size()) {
        throw std::runtime_error("Trailing characters after JSON value");
    }
    return v;
}

std::string SerializeJSON(const JSONValue& value) {
    std::ostringstream oss;
    serializeInto(oss, value);
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------
// json helpers
//----------------------------------------------------------------------------------------------------------
namespace json {

const JSONValue* Find(const JSONValue& object, const std::string& key) {
    if (!object.IsObject()) return nullptr;
    const auto& obj = std::get<JSONValue::Object>(object.value);
    auto it = obj.find(key);
    if (it == obj.end() || !it->second) return nullptr;
    return it->second.get();
}

std::optional<std::string> GetString(const JSONValue& object, const std::string& key) {
    const JSONValue* v = Find(object, key);
    if (!v || !v->IsString()) return std::nullopt;
    return std::get<std::string>(v->value);
}

std::optional<int64_t> GetInt(const JSONValue& object, const std::string& key) {
    const JSONValue* v = Find(object, key);
    if (!v) return std::nullopt;
    if (std::holds_alternative<int64_t>(v->value)) return std::get<int64_t>(v->value);
    if (std::holds_alternative<double>(v->value)) {
        double d = std::get<double>(v->value);
        if (std::floor(d) == d) return static_cast<int64_t>(d);
    }
    return std::nullopt;
}

std::optional<double> GetNumber(const JSONValue& object, const std::string& key) {
    const JSONValue* v = Find(object, key);
    if (!v) return std::nullopt;
    if (std::holds_alternative<double>(v->value)) return std::get<double>(v->value);
    if (std::holds_alternative<int64_t>(v->value)) return static_cast<double>(std::get<int64_t>(v->value));
    return std::nullopt;
}

std::optional<bool> GetBool(const JSONValue& object, const std::string& key) {
    const JSONValue* v = Find(object, key);
    if (!v || !std::holds_alternative<bool>(v->value)) return std::nullopt;
    return std::get<bool>(v->value);
}

ObjectBuilder& ObjectBuilder::Set(const std::string& key, JSONValue v) {
    obj_[key] = std::make_shared<JSONValue>(std::move(v));
    return *this;
}
ObjectBuilder& ObjectBuilder::Set(const std::string& key, const std::string& v) { return Set(key, JSONValue(v)); }
ObjectBuilder& ObjectBuilder::Set(const std::string& key, const char* v) { return Set(key, JSONValue(v)); }
ObjectBuilder& ObjectBuilder::Set(const std::string& key, int64_t v) { return Set(key, JSONValue(v)); }
ObjectBuilder& ObjectBuilder::Set(const std::string& key, int v) { return Set(key, JSONValue(v)); }
ObjectBuilder& ObjectBuilder::Set(const std::string& key, double v) { return Set(key, JSONValue(v)); }
ObjectBuilder& ObjectBuilder::Set(const std::string& key, bool v) { return Set(key, JSONValue(v)); }

} // namespace json

JSONValue IdToJSON(const JSONRPCId& id) {
    return std::visit([](const auto& v) -> JSONValue {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return JSONValue(v);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return JSONValue(v);
        } else {
            return JSONValue(nullptr);
        }
    }, id);
}

MessageKind ClassifyMessage(const JSONValue& message) {
    if (!message.IsObject()) return MessageKind::Invalid;
    const JSONValue* method = json::Find(message, "method");
    const JSONValue* id = json::Find(message, "id");
    if (method) {
        if (!method->IsString()) return MessageKind::Invalid;
        return id ? MessageKind::Request : MessageKind::Notification;
    }
    if (id && (json::Find(message, "result") || json::Find(message, "error"))) {
        return MessageKind::Response;
    }
    return MessageKind::Invalid;
}

// JSONRPCRequest implementation
std::string JSONRPCRequest::Serialize() const {
    JSONValue::Object obj;
    obj["jsonrpc"] = std::make_shared<JSONValue>(jsonrpc);
    obj["id"] = std::make_shared<JSONValue>(IdToJSON(id));
    obj["method"] = std::make_shared<JSONValue>(method);
    if (params.has_value()) {
        obj["params"] = std::make_shared<JSONValue>(params.value());
    }
    return SerializeJSON(JSONValue{std::move(obj)});
}

bool JSONRPCRequest::FromJSON(const JSONValue& message) {
    if (ClassifyMessage(message) != MessageKind::Request) return false;
    if (!idFromJSON(*json::Find(message, "id"), id)) return false;
    method = *json::GetString(message, "method");
    if (const JSONValue* p = json::Find(message, "params")) {
        params = *p;
    } else {
        params.reset();
    }
    return true;
}

bool JSONRPCRequest::Deserialize(const std::string& json) {
    try {
        return FromJSON(ParseJSON(json));
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to deserialize JSONRPCRequest: {}", e.what());
        return false;
    }
}

// JSONRPCResponse implementation
std::string JSONRPCResponse::Serialize() const {
    JSONValue::Object obj;
    obj["jsonrpc"] = std::make_shared<JSONValue>(jsonrpc);
    obj["id"] = std::make_shared<JSONValue>(IdToJSON(id));
    if (result.has_value()) {
        obj["result"] = std::make_shared<JSONValue>(result.value());
    }
    if (error.has_value()) {
        obj["error"] = std::make_shared<JSONValue>(error.value());
    }
    return SerializeJSON(JSONValue{std::move(obj)});
}

bool JSONRPCResponse::Deserialize(const std::string& json) {
    try {
        JSONValue message = ParseJSON(json);
        if (ClassifyMessage(message) != MessageKind::Response) return false;
        if (!idFromJSON(*json::Find(message, "id"), id)) return false;
        if (const JSONValue* r = json::Find(message, "result")) result = *r;
        if (const JSONValue* e = json::Find(message, "error")) error = *e;
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to deserialize JSONRPCResponse: {}", e.what());
        return false;
    }
}

// JSONRPCNotification implementation
std::string JSONRPCNotification::Serialize() const {
    JSONValue::Object obj;
    obj["jsonrpc"] = std::make_shared<JSONValue>(jsonrpc);
    obj["method"] = std::make_shared<JSONValue>(method);
    if (params.has_value()) {
        obj["params"] = std::make_shared<JSONValue>(params.value());
    }
    return SerializeJSON(JSONValue{std::move(obj)});
}

bool JSONRPCNotification::FromJSON(const JSONValue& message) {
    if (ClassifyMessage(message) != MessageKind::Notification) return false;
    method = *json::GetString(message, "method");
    if (const JSONValue* p = json::Find(message, "params")) {
        params = *p;
    } else {
        params.reset();
    }
    return true;
}

bool JSONRPCNotification::Deserialize(const std::string& json) {
    try {
        return FromJSON(ParseJSON(json));
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to deserialize JSONRPCNotification: {}", e.what());
        return false;
    }
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

} // namespace dtmcp
