//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.h
// Purpose: JSON value model, parser/serializer and JSON-RPC 2.0 message types for line-delimited stdio
//==========================================================================================================

#pragma once

#include <cstdint>
#include <initializer_list>
#include <utility>
#include <string>
#include <memory>
#include <variant>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace mcphost {

//==========================================================================================================
// JSONValue
// Purpose: Simplified JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::unordered_map<std::string, std::shared_ptr<JSONValue>>;

    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        Array,
        Object
    > value;

    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&) noexcept;
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&) noexcept;
    ~JSONValue();

    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    auto& get() { return value; }
    const auto& get() const { return value; }

    bool isNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool isObject() const { return std::holds_alternative<Object>(value); }
    bool isArray() const { return std::holds_alternative<Array>(value); }
    bool isString() const { return std::holds_alternative<std::string>(value); }
    bool isNumber() const { return std::holds_alternative<int64_t>(value) || std::holds_alternative<double>(value); }

    //------------------------------------------------------------------------------------------------------
    // find
    // Purpose: Member lookup on an Object value.
    // Returns: Pointer to the member value, or nullptr when absent or when this is not an Object.
    //------------------------------------------------------------------------------------------------------
    const JSONValue* find(const std::string& key) const;
};

// Structural equality (object member order is irrelevant).
bool operator==(const JSONValue& a, const JSONValue& b);
inline bool operator!=(const JSONValue& a, const JSONValue& b) { return !(a == b); }

//==========================================================================================================
// JSONParseError
// Purpose: Thrown by ParseJSON on malformed input; offset is the byte position of the failure.
//==========================================================================================================
class JSONParseError : public std::runtime_error {
public:
    JSONParseError(const std::string& what, std::size_t offset)
        : std::runtime_error(what + " at offset " + std::to_string(offset)), offset(offset) {}
    std::size_t offset;
};

//==========================================================================================================
// ParseJSON / SerializeJSON
// Purpose: Full-document parse (trailing garbage rejected) and compact serialization.
// Notes:
//   SerializeJSON never emits a raw newline, so one serialized value is always exactly one wire line.
//   SerializeJSONPretty indents with two spaces and is used for files meant to be edited by hand.
//==========================================================================================================
JSONValue ParseJSON(const std::string& text);
std::string SerializeJSON(const JSONValue& value);
std::string SerializeJSONPretty(const JSONValue& value);

///////////////////////////////////////// Accessor helpers ///////////////////////////////////////////
// Typed reads with defaults; a missing member or a member of another type yields the default.
std::string GetString(const JSONValue& obj, const std::string& key, const std::string& defaultValue = "");
bool GetBool(const JSONValue& obj, const std::string& key, bool defaultValue);
int64_t GetInt(const JSONValue& obj, const std::string& key, int64_t defaultValue);
std::optional<std::string> GetOptionalString(const JSONValue& obj, const std::string& key);

// Builders used when composing params/results.
JSONValue MakeObject(std::initializer_list<std::pair<const std::string, JSONValue>> members = {});
JSONValue MakeArray(const std::vector<JSONValue>& items = {});
void SetMember(JSONValue& obj, const std::string& key, JSONValue v);
void PushBack(JSONValue& arr, JSONValue v);

//==========================================================================================================
// JSONRPCId
// Purpose: JSON-RPC 2.0 id variant: string, integer, or null.
//==========================================================================================================
using JSONRPCId = std::variant<std::string, int64_t, std::nullptr_t>;

std::string IdToString(const JSONRPCId& id);

//==========================================================================================================
// JSONRPCMessage
// Purpose: Abstract base for JSON-RPC 2.0 messages providing serialization APIs.
// Methods:
//   Serialize(): Returns the compact JSON string for the message (no trailing newline).
//   Deserialize(json): Parses a JSON string into this object; returns true on success.
//   FromJSON(value): Same as Deserialize for an already parsed value.
//==========================================================================================================
class JSONRPCMessage {
public:
    std::string jsonrpc = "2.0";

    virtual ~JSONRPCMessage() = default;
    virtual JSONValue ToJSON() const = 0;
    virtual bool FromJSON(const JSONValue& v) = 0;

    std::string Serialize() const { return SerializeJSON(ToJSON()); }
    bool Deserialize(const std::string& json);
};

// JSON-RPC Request
class JSONRPCRequest : public JSONRPCMessage {
public:
    JSONRPCId id;
    std::string method;
    std::optional<JSONValue> params;

    JSONRPCRequest() = default;
    JSONRPCRequest(JSONRPCId id, std::string method, std::optional<JSONValue> params = std::nullopt)
        : id(std::move(id)), method(std::move(method)), params(std::move(params)) {}

    JSONValue ToJSON() const override;
    bool FromJSON(const JSONValue& v) override;
};

//==========================================================================================================
// JSONRPCResponse
// Purpose: JSON-RPC 2.0 response message carrying either result or error.
// Methods:
//   IsError(): True when error is present.
//==========================================================================================================
class JSONRPCResponse : public JSONRPCMessage {
public:
    JSONRPCId id;
    std::optional<JSONValue> result;
    std::optional<JSONValue> error;

    JSONRPCResponse() = default;
    JSONRPCResponse(JSONRPCId id, JSONValue result)
        : id(std::move(id)), result(std::move(result)) {}
    JSONRPCResponse(JSONRPCId id, JSONValue error, bool /*isError*/)
        : id(std::move(id)), error(std::move(error)) {}

    JSONValue ToJSON() const override;
    bool FromJSON(const JSONValue& v) override;

    bool IsError() const { return error.has_value(); }
};

// JSON-RPC Notification (no id, no response)
class JSONRPCNotification : public JSONRPCMessage {
public:
    std::string method;
    std::optional<JSONValue> params;

    JSONRPCNotification() = default;
    JSONRPCNotification(std::string method, std::optional<JSONValue> params = std::nullopt)
        : method(std::move(method)), params(std::move(params)) {}

    JSONValue ToJSON() const override;
    bool FromJSON(const JSONValue& v) override;
};

//==========================================================================================================
// MessageKind / ClassifyMessage
// Purpose: Decide how an incoming line is routed.
//   Response:     has id and result or error.
//   Request:      has id and method (server-initiated request).
//   Notification: has method and no id.
//   Invalid:      anything else (including non-objects).
//==========================================================================================================
enum class MessageKind { Response, Request, Notification, Invalid };

MessageKind ClassifyMessage(const JSONValue& v);

//==========================================================================================================
// JSONRPCErrorCodes
// Purpose: Standard JSON-RPC error codes.
//==========================================================================================================
namespace JSONRPCErrorCodes {
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;
}

// Build a JSON error object with shape { code, message, data? }.
JSONValue CreateErrorObject(int code, const std::string& message,
                            const std::optional<JSONValue>& data = std::nullopt);

// Wrap an error object into a response echoing the given id.
std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data = std::nullopt);

} // namespace mcphost
