//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Recursive-descent JSON parser, serializers and JSON-RPC message (de)serialization
//==========================================================================================================

#include <cmath>
#include <cctype>
#include <sstream>
#include <fmt/format.h>
#include "mcphost/JSONRPCTypes.h"
#include "logging/Logger.h"


namespace mcphost {

//----------------------------------------------------------------------------------------------------------
// JSONValue special members (out-of-line definitions)
//----------------------------------------------------------------------------------------------------------
JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) noexcept = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) noexcept = default;
JSONValue::~JSONValue() {}

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

const JSONValue* JSONValue::find(const std::string& key) const {
    if (!std::holds_alternative<Object>(value)) {
        return nullptr;
    }
    const auto& obj = std::get<Object>(value);
    auto it = obj.find(key);
    if (it == obj.end() || !it->second) {
        return nullptr;
    }
    return it->second.get();
}

bool operator==(const JSONValue& a, const JSONValue& b) {
    if (a.value.index() != b.value.index()) {
        // 1 and 1.0 compare equal
        if (a.isNumber() && b.isNumber()) {
            double da = std::holds_alternative<int64_t>(a.value) ? static_cast<double>(std::get<int64_t>(a.value)) : std::get<double>(a.value);
            double db = std::holds_alternative<int64_t>(b.value) ? static_cast<double>(std::get<int64_t>(b.value)) : std::get<double>(b.value);
            return da == db;
        }
        return false;
    }
    if (a.isArray()) {
        const auto& x = std::get<JSONValue::Array>(a.value);
        const auto& y = std::get<JSONValue::Array>(b.value);
        if (x.size() != y.size()) return false;
        for (size_t i = 0; i < x.size(); ++i) {
            if (!(*x[i] == *y[i])) return false;
        }
        return true;
    }
    if (a.isObject()) {
        const auto& x = std::get<JSONValue::Object>(a.value);
        const auto& y = std::get<JSONValue::Object>(b.value);
        if (x.size() != y.size()) return false;
        for (const auto& [k, v] : x) {
            auto it = y.find(k);
            if (it == y.end() || !(*v == *it->second)) return false;
        }
        return true;
    }
    return a.value == b.value;
}

// -------------------------------
// Recursive JSON parser
// -------------------------------
namespace {
constexpr int kMaxDepth = 256;

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    int depth{0};

    explicit JsonParser(const std::string& str) : s(str) {}

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
        if (i + 4 > s.size()) fail("Truncated unicode escape");
        unsigned int code = 0;
        for (int k = 0; k < 4; ++k) {
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
        ++i;
        std::string out;
        while (true) {
            if (i >= s.size()) fail("Unterminated string");
            char c = s[i++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) fail("Control character in string");
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
        if (i < s.size() && s[i] == '-') ++i;
        std::size_t intStart = i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        if (i == intStart) fail("Invalid number");
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            std::size_t fracStart = i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
            if (i == fracStart) fail("Invalid fraction");
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            std::size_t expStart = i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
            if (i == expStart) fail("Invalid exponent");
        }
        std::string num = s.substr(start, i - start);
        if (!isFloat) {
            try {
                return JSONValue(static_cast<int64_t>(std::stoll(num)));
            } catch (const std::out_of_range&) {
                // Integers beyond int64 degrade to double like most JSON implementations
                isFloat = true;
            }
        }
        try {
            return JSONValue(std::stod(num));
        } catch (const std::exception&) {
            fail("Number out of range");
        }
    }

    JSONValue parseArray() {
        if (!match('[')) fail("Expected '['");
        JSONValue::Array arr;
        if (match(']')) return JSONValue(std::move(arr));
        while (true) {
            arr.push_back(std::make_shared<JSONValue>(parseValue()));
            if (match(']')) break;
            if (!match(',')) fail("Expected ',' in array");
        }
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        if (!match('{')) fail("Expected '{'");
        JSONValue::Object obj;
        if (match('}')) return JSONValue(std::move(obj));
        while (true) {
            std::string key = parseString();
            if (!match(':')) fail("Expected ':' after key");
            obj[key] = std::make_shared<JSONValue>(parseValue());
            if (match('}')) break;
            if (!match(',')) fail("Expected ',' in object");
        }
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) fail("Unexpected end of JSON");
        if (++depth > kMaxDepth) fail("Nesting too deep");
        JSONValue out;
        char c = s[i];
        if (c == '"') {
            out = JSONValue(parseString());
        } else if (c == '{') {
            out = parseObject();
        } else if (c == '[') {
            out = parseArray();
        } else if (s.compare(i, 4, "true") == 0) {
            i += 4; out = JSONValue(true);
        } else if (s.compare(i, 5, "false") == 0) {
            i += 5; out = JSONValue(false);
        } else if (s.compare(i, 4, "null") == 0) {
            i += 4; out = JSONValue(nullptr);
        } else if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
            out = parseNumber();
        } else {
            fail(std::string("Unexpected character '") + c + "'");
        }
        --depth;
        return out;
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
                    out += fmt::format("\\u{:04x}", static_cast<int>(c));
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    out.push_back('"');
}

void appendNumber(std::string& out, double d) {
    if (!std::isfinite(d)) {
        out += "null";
        return;
    }
    std::string txt = fmt::format("{}", d);
    out += txt;
}

void serializeInto(std::string& out, const JSONValue& value, int indent, int level) {
    auto newline = [&](int lvl) {
        if (indent <= 0) return;
        out.push_back('\n');
        out.append(static_cast<size_t>(indent * lvl), ' ');
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
            appendNumber(out, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            appendEscaped(out, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            out.push_back('[');
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) out.push_back(',');
                newline(level + 1);
                if (v[i]) serializeInto(out, *v[i], indent, level + 1); else out += "null";
            }
            if (!v.empty()) newline(level);
            out.push_back(']');
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            out.push_back('{');
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!first) out.push_back(',');
                first = false;
                newline(level + 1);
                appendEscaped(out, key);
                out += indent > 0 ? ": " : ":";
                if (val) serializeInto(out, *val, indent, level + 1); else out += "null";
            }
            if (!v.empty()) newline(level);
            out.push_back('}');
        }
    }, value.get());
}

JSONValue idToJSON(const JSONRPCId& id) {
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

bool idFromJSON(const JSONValue& v, JSONRPCId& out) {
    if (std::holds_alternative<int64_t>(v.value)) { out = std::get<int64_t>(v.value); return true; }
    if (std::holds_alternative<std::string>(v.value)) { out = std::get<std::string>(v.value); return true; }
    if (std::holds_alternative<double>(v.value)) {
        // Some servers echo integer ids as 1.0
        double d = std::get<double>(v.value);
        if (std::floor(d) == d) { out = static_cast<int64_t>(d); return true; }
        return false;
    }
    if (v.isNull()) { out = nullptr; return true; }
    return false;
}
} // namespace

JSONValue ParseJSON(const std::string& text) {
    JsonParser p(text);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != text.size()) {
        p.fail("Trailing characters after JSON value");
    }
    return v;
}

std::string SerializeJSON(const JSONValue& value) {
    std::string out;
    serializeInto(out, value, 0, 0);
    return out;
}

std::string SerializeJSONPretty(const JSONValue& value) {
    std::string out;
    serializeInto(out, value, 2, 0);
    return out;
}

///////////////////////////////////////// Accessor helpers ///////////////////////////////////////////
std::string GetString(const JSONValue& obj, const std::string& key, const std::string& defaultValue) {
    const JSONValue* v = obj.find(key);
    if (v && v->isString()) {
        return std::get<std::string>(v->value);
    }
    return defaultValue;
}

bool GetBool(const JSONValue& obj, const std::string& key, bool defaultValue) {
    const JSONValue* v = obj.find(key);
    if (v && std::holds_alternative<bool>(v->value)) {
        return std::get<bool>(v->value);
    }
    return defaultValue;
}

int64_t GetInt(const JSONValue& obj, const std::string& key, int64_t defaultValue) {
    const JSONValue* v = obj.find(key);
    if (!v) return defaultValue;
    if (std::holds_alternative<int64_t>(v->value)) return std::get<int64_t>(v->value);
    if (std::holds_alternative<double>(v->value)) return static_cast<int64_t>(std::get<double>(v->value));
    return defaultValue;
}

std::optional<std::string> GetOptionalString(const JSONValue& obj, const std::string& key) {
    const JSONValue* v = obj.find(key);
    if (v && v->isString()) {
        return std::get<std::string>(v->value);
    }
    return std::nullopt;
}

JSONValue MakeObject(std::initializer_list<std::pair<const std::string, JSONValue>> members) {
    JSONValue::Object obj;
    for (const auto& [k, v] : members) {
        obj[k] = std::make_shared<JSONValue>(v);
    }
    return JSONValue(std::move(obj));
}

JSONValue MakeArray(const std::vector<JSONValue>& items) {
    JSONValue::Array arr;
    arr.reserve(items.size());
    for (const auto& v : items) {
        arr.push_back(std::make_shared<JSONValue>(v));
    }
    return JSONValue(std::move(arr));
}

void SetMember(JSONValue& obj, const std::string& key, JSONValue v) {
    if (!obj.isObject()) {
        obj.value = JSONValue::Object{};
    }
    std::get<JSONValue::Object>(obj.value)[key] = std::make_shared<JSONValue>(std::move(v));
}

void PushBack(JSONValue& arr, JSONValue v) {
    if (!arr.isArray()) {
        arr.value = JSONValue::Array{};
    }
    std::get<JSONValue::Array>(arr.value).push_back(std::make_shared<JSONValue>(std::move(v)));
}

std::string IdToString(const JSONRPCId& id) {
    return SerializeJSON(idToJSON(id));
}

///////////////////////////////////////// JSON-RPC messages ///////////////////////////////////////////
bool JSONRPCMessage::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        return FromJSON(ParseJSON(json));
    } catch (const JSONParseError& e) {
        LOG_ERROR("Failed to deserialize JSON-RPC message: {}", e.what());
        return false;
    }
}

JSONValue JSONRPCRequest::ToJSON() const {
    JSONValue out = MakeObject({{"jsonrpc", JSONValue(jsonrpc)}, {"method", JSONValue(method)}});
    SetMember(out, "id", idToJSON(id));
    if (params.has_value()) {
        SetMember(out, "params", params.value());
    }
    return out;
}

bool JSONRPCRequest::FromJSON(const JSONValue& v) {
    const JSONValue* m = v.find("method");
    const JSONValue* i = v.find("id");
    if (!m || !m->isString() || !i || !idFromJSON(*i, id)) {
        return false;
    }
    method = std::get<std::string>(m->value);
    if (const JSONValue* p = v.find("params")) {
        params = *p;
    }
    return !method.empty();
}

JSONValue JSONRPCResponse::ToJSON() const {
    JSONValue out = MakeObject({{"jsonrpc", JSONValue(jsonrpc)}});
    SetMember(out, "id", idToJSON(id));
    if (error.has_value()) {
        SetMember(out, "error", error.value());
    } else {
        SetMember(out, "result", result.has_value() ? result.value() : JSONValue(nullptr));
    }
    return out;
}

bool JSONRPCResponse::FromJSON(const JSONValue& v) {
    const JSONValue* i = v.find("id");
    if (!i || !idFromJSON(*i, id)) {
        return false;
    }
    if (const JSONValue* e = v.find("error")) {
        error = *e;
    }
    if (const JSONValue* r = v.find("result")) {
        result = *r;
    }
    return result.has_value() || error.has_value();
}

JSONValue JSONRPCNotification::ToJSON() const {
    JSONValue out = MakeObject({{"jsonrpc", JSONValue(jsonrpc)}, {"method", JSONValue(method)}});
    if (params.has_value()) {
        SetMember(out, "params", params.value());
    }
    return out;
}

bool JSONRPCNotification::FromJSON(const JSONValue& v) {
    const JSONValue* m = v.find("method");
    if (!m || !m->isString() || v.find("id") != nullptr) {
        return false;
    }
    method = std::get<std::string>(m->value);
    if (const JSONValue* p = v.find("params")) {
        params = *p;
    }
    return !method.empty();
}

MessageKind ClassifyMessage(const JSONValue& v) {
    if (!v.isObject()) {
        return MessageKind::Invalid;
    }
    const JSONValue* id = v.find("id");
    const JSONValue* method = v.find("method");
    bool hasMethod = method && method->isString();
    if (id && !id->isNull()) {
        if (v.find("result") || v.find("error")) {
            return MessageKind::Response;
        }
        if (hasMethod) {
            return MessageKind::Request;
        }
        return MessageKind::Invalid;
    }
    if (id && id->isNull() && v.find("error")) {
        // Error responses to unparseable requests carry a null id
        return MessageKind::Response;
    }
    return hasMethod ? MessageKind::Notification : MessageKind::Invalid;
}

JSONValue CreateErrorObject(int code, const std::string& message,
                            const std::optional<JSONValue>& data) {
    JSONValue errorObj = MakeObject({
        {"code", JSONValue(static_cast<int64_t>(code))},
        {"message", JSONValue(message)}
    });
    if (data.has_value()) {
        SetMember(errorObj, "data", data.value());
    }
    return errorObj;
}

std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data) {
    auto response = std::make_unique<JSONRPCResponse>();
    response->id = id;
    response->error = CreateErrorObject(code, message, data);
    return response;
}

} // namespace mcphost
