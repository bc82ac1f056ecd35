//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/authgate/JSONValue.h
// Purpose: JSON value type, parser and serializer used for configuration and introspection payloads
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>
#include <memory>
#include <variant>
#include <unordered_map>
#include <vector>

namespace authgate {

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

    // Constructors and special members (defined out-of-line)
    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&);
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&);
    ~JSONValue();

    // Explicit constructors for supported types
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

    bool isNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool isObject() const { return std::holds_alternative<Object>(value); }
    bool isArray() const { return std::holds_alternative<Array>(value); }
    bool isString() const { return std::holds_alternative<std::string>(value); }
    bool isBool() const { return std::holds_alternative<bool>(value); }
};

//==========================================================================================================
// ParseJSON
// Purpose: Parse a complete JSON document. Trailing non-whitespace content is rejected.
// Args:
//   text: JSON text.
//   out: Populated with the parsed value on success.
//   error: Human-readable reason on failure.
// Returns:
//   true on success; false when the document is malformed.
//==========================================================================================================
bool ParseJSON(const std::string& text, JSONValue& out, std::string& error);

//==========================================================================================================
// SerializeJSON
// Purpose: Compact JSON encoding of a value. Object key order is unspecified.
//==========================================================================================================
std::string SerializeJSON(const JSONValue& value);

// Human-readable name of the value's JSON type ("object", "string", ...), used in decode errors.
const char* JSONTypeName(const JSONValue& value);

} // namespace authgate
