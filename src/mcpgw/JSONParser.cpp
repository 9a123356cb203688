//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Recursive JSON parser/serializer and JSON-RPC message (de)serialization
//==========================================================================================================

#include <sstream>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <iomanip>
#include "mcpgw/JSONRPCTypes.h"
#include "logging/Logger.h"


namespace mcpgw {

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
// Minimal recursive JSON parser
// -------------------------------
namespace {
constexpr int kMaxDepth = 64;

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

    unsigned int parseHex4() {
        if (i + 4 > s.size()) throw std::runtime_error("Invalid unicode escape");
        unsigned int code = 0;
        for (std::size_t k = 0; k < 4; ++k) {
            char h = s[i + k];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += 10u + static_cast<unsigned int>(h - 'a');
            else if (h >= 'A' && h <= 'F') code += 10u + static_cast<unsigned int>(h - 'A');
            else throw std::runtime_error("Invalid hex in unicode escape");
        }
        i += 4;
        return code;
    }

    std::string parseString() {
        skipWs();
        if (i >= s.size() || s[i] != '"') throw std::runtime_error("Expected '\"' at string start");
        ++i; // skip opening quote
        std::string out;
        bool closed = false;
        while (i < s.size()) {
            char c = s[i++];
            if (c == '"') { closed = true; break; }
            if (c == '\\') {
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
                        // Combine UTF-16 surrogate pairs when the low half follows
                        if (code >= 0xD800 && code <= 0xDBFF && i + 6 <= s.size() && s[i] == '\\' && s[i + 1] == 'u') {
                            i += 2;
                            unsigned int low = parseHex4();
                            if (low >= 0xDC00 && low <= 0xDFFF) {
                                code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                            } else {
                                appendUtf8(out, code);
                                code = low;
                            }
                        }
                        appendUtf8(out, code);
                        break;
                    }
                    default: throw std::runtime_error("Unknown escape");
                }
            } else {
                out.push_back(c);
            }
        }
        if (!closed) throw std::runtime_error("Unterminated string");
        return out;
    }

    JSONValue parseNumber() {
        skipWs();
        std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        std::string num = s.substr(start, i - start);
        if (num.empty() || num == "-") {
            throw std::runtime_error("Invalid number");
        }
        try {
            if (!isFloat) {
                long long v = std::stoll(num);
                return JSONValue(static_cast<int64_t>(v));
            }
            return JSONValue(std::stod(num));
        } catch (const std::out_of_range&) {
            // Integers beyond int64 degrade to double precision
            return JSONValue(std::stod(num));
        } catch (const std::invalid_argument&) {
            throw std::runtime_error("Invalid number");
        }
    }

    JSONValue parseArray() {
        if (!match('[')) throw std::runtime_error("Expected '['");
        JSONValue::Array arr;
        skipWs();
        if (match(']')) return JSONValue(std::move(arr));
        while (true) {
            JSONValue val = parseValue();
            arr.push_back(std::make_shared<JSONValue>(std::move(val)));
            skipWs();
            if (match(']')) break;
            if (!match(',')) throw std::runtime_error("Expected ',' in array");
        }
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        if (!match('{')) throw std::runtime_error("Expected '{'");
        JSONValue::Object obj;
        skipWs();
        if (match('}')) return JSONValue(std::move(obj));
        while (true) {
            std::string key = parseString();
            skipWs();
            if (!match(':')) throw std::runtime_error("Expected ':' after key");
            JSONValue val = parseValue();
            obj[key] = std::make_shared<JSONValue>(std::move(val));
            skipWs();
            if (match('}')) break;
            if (!match(',')) throw std::runtime_error("Expected ',' in object");
        }
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) throw std::runtime_error("Unexpected end of JSON");
        if (++depth > kMaxDepth) throw std::runtime_error("JSON nesting too deep");
        struct DepthGuard { int& d; ~DepthGuard() { --d; } } guard{depth};
        char c = s[i];
        if (c == '"') return JSONValue(parseString());
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (c == 't') { // true
            if (s.compare(i, 4, "true") == 0) { i += 4; return JSONValue(true); }
            throw std::runtime_error("Invalid literal");
        }
        if (c == 'f') { // false
            if (s.compare(i, 5, "false") == 0) { i += 5; return JSONValue(false); }
            throw std::runtime_error("Invalid literal");
        }
        if (c == 'n') { // null
            if (s.compare(i, 4, "null") == 0) { i += 4; return JSONValue(nullptr); }
            throw std::runtime_error("Invalid literal");
        }
        // number
        return parseNumber();
    }
};

void writeEscaped(std::ostringstream& oss, const std::string& v) {
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
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
                break;
        }
    }
    oss << '"';
}

void writeId(std::ostringstream& oss, const JSONRPCId& id) {
    std::visit([&oss](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            writeEscaped(oss, v);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << v;
        } else {
            oss << "null";
        }
    }, id);
}

bool readId(const JSONValue& idVal, JSONRPCId& out) {
    if (std::holds_alternative<std::string>(idVal.value)) {
        out = std::get<std::string>(idVal.value);
        return true;
    }
    if (std::holds_alternative<int64_t>(idVal.value)) {
        out = std::get<int64_t>(idVal.value);
        return true;
    }
    if (std::holds_alternative<double>(idVal.value)) {
        double d = std::get<double>(idVal.value);
        if (std::floor(d) != d) {
            return false;
        }
        out = static_cast<int64_t>(d);
        return true;
    }
    if (std::holds_alternative<std::nullptr_t>(idVal.value)) {
        out = nullptr;
        return true;
    }
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
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << std::setprecision(17) << v;
            return oss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            std::ostringstream oss;
            writeEscaped(oss, v);
            return oss.str();
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            std::ostringstream oss;
            oss << '[';
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) oss << ',';
                oss << (v[i] ? SerializeJSON(*v[i]) : std::string("null"));
            }
            oss << ']';
            return oss.str();
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            std::ostringstream oss;
            oss << '{';
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!first) oss << ',';
                first = false;
                writeEscaped(oss, key);
                oss << ':' << (val ? SerializeJSON(*val) : std::string("null"));
            }
            oss << '}';
            return oss.str();
        } else {
            return "null";
        }
    }, value.get());
}

const JSONValue* FindMember(const JSONValue& value, const std::string& key) {
    if (!value.IsObject()) {
        return nullptr;
    }
    const auto& obj = std::get<JSONValue::Object>(value.value);
    auto it = obj.find(key);
    if (it == obj.end() || !it->second) {
        return nullptr;
    }
    return it->second.get();
}

std::optional<std::string> GetStringMember(const JSONValue& value, const std::string& key) {
    const JSONValue* m = FindMember(value, key);
    if (m == nullptr || !std::holds_alternative<std::string>(m->value)) {
        return std::nullopt;
    }
    return std::get<std::string>(m->value);
}

std::optional<double> GetNumberMember(const JSONValue& value, const std::string& key) {
    const JSONValue* m = FindMember(value, key);
    if (m == nullptr) {
        return std::nullopt;
    }
    if (std::holds_alternative<int64_t>(m->value)) {
        return static_cast<double>(std::get<int64_t>(m->value));
    }
    if (std::holds_alternative<double>(m->value)) {
        return std::get<double>(m->value);
    }
    return std::nullopt;
}

JSONRPCMessageKind ClassifyMessage(const JSONValue& value) {
    if (!value.IsObject()) {
        return JSONRPCMessageKind::Invalid;
    }
    const bool hasMethod = GetStringMember(value, "method").has_value();
    const bool hasId = FindMember(value, "id") != nullptr;
    if (hasMethod) {
        return hasId ? JSONRPCMessageKind::Request : JSONRPCMessageKind::Notification;
    }
    if (hasId && (FindMember(value, "result") != nullptr || FindMember(value, "error") != nullptr)) {
        return JSONRPCMessageKind::Response;
    }
    return JSONRPCMessageKind::Invalid;
}

bool IsInitializeRequest(const std::string& body) {
    try {
        JSONValue v = ParseJSON(body);
        if (ClassifyMessage(v) != JSONRPCMessageKind::Request) {
            return false;
        }
        auto method = GetStringMember(v, "method");
        return method.has_value() && method.value() == "initialize";
    } catch (const std::exception& e) {
        LOG_DEBUG("IsInitializeRequest: body is not JSON: {}", e.what());
        return false;
    }
}

// JSONRPCRequest implementation
std::string JSONRPCRequest::Serialize() const {
    FUNC_SCOPE();
    std::ostringstream oss;
    oss << "{\"jsonrpc\":\"" << jsonrpc << "\"";
    oss << ",\"id\":";
    writeId(oss, id);
    oss << ",\"method\":";
    writeEscaped(oss, method);
    if (params.has_value()) {
        oss << ",\"params\":" << SerializeJSON(params.value());
    }
    oss << "}";
    return oss.str();
}

bool JSONRPCRequest::FromJSON(const JSONValue& value) {
    if (ClassifyMessage(value) != JSONRPCMessageKind::Request) {
        return false;
    }
    if (!readId(*FindMember(value, "id"), id)) {
        return false;
    }
    method = GetStringMember(value, "method").value();
    if (const JSONValue* p = FindMember(value, "params"); p != nullptr) {
        params = *p;
    } else {
        params.reset();
    }
    return true;
}

// JSONRPCResponse implementation
std::string JSONRPCResponse::Serialize() const {
    FUNC_SCOPE();
    std::ostringstream oss;
    oss << "{\"jsonrpc\":\"" << jsonrpc << "\"";
    oss << ",\"id\":";
    writeId(oss, id);
    if (result.has_value()) {
        oss << ",\"result\":" << SerializeJSON(result.value());
    }
    if (error.has_value()) {
        oss << ",\"error\":" << SerializeJSON(error.value());
    }
    oss << "}";
    return oss.str();
}

// JSONRPCNotification implementation
std::string JSONRPCNotification::Serialize() const {
    FUNC_SCOPE();
    std::ostringstream oss;
    oss << "{\"jsonrpc\":\"" << jsonrpc << "\"";
    oss << ",\"method\":";
    writeEscaped(oss, method);
    if (params.has_value()) {
        oss << ",\"params\":" << SerializeJSON(params.value());
    }
    oss << "}";
    return oss.str();
}

bool JSONRPCNotification::FromJSON(const JSONValue& value) {
    if (ClassifyMessage(value) != JSONRPCMessageKind::Notification) {
        return false;
    }
    method = GetStringMember(value, "method").value();
    if (const JSONValue* p = FindMember(value, "params"); p != nullptr) {
        params = *p;
    } else {
        params.reset();
    }
    return true;
}

// Utility functions
JSONValue CreateErrorObject(int code, const std::string& message,
                           const std::optional<JSONValue>& data) {
    FUNC_SCOPE();
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
    FUNC_SCOPE();

    auto response = std::make_unique<JSONRPCResponse>();
    response->id = id;
    response->error = CreateErrorObject(code, message, data);
    return response;
}

} // namespace mcpgw
