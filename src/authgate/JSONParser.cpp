//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/authgate/JSONParser.cpp
// Purpose: Recursive JSON parser and serializer for JSONValue
//==========================================================================================================

#include <sstream>
#include <cctype>
#include <stdexcept>
#include <iomanip>
#include "authgate/JSONValue.h"

namespace authgate {

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
constexpr int kMaxDepth = 64;

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    int depth{0};

    explicit JsonParser(const std::string& str) : s(str) {}

    [[noreturn]] void fail(const std::string& what) const {
        throw std::runtime_error(what + " at offset " + std::to_string(i));
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
                    // Combine UTF-16 surrogate pairs
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
                default: fail("Unknown escape");
            }
        }
        return out;
    }

    JSONValue parseNumber() {
        skipWs();
        std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        std::size_t digitsStart = i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        if (i == digitsStart) fail("Invalid value");
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            std::size_t fracStart = i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
            if (i == fracStart) fail("Invalid number");
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            std::size_t expStart = i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
            if (i == expStart) fail("Invalid number");
        }
        std::string num = s.substr(start, i - start);
        if (!isFloat) {
            try {
                return JSONValue(static_cast<int64_t>(std::stoll(num)));
            } catch (const std::out_of_range&) {
                // Falls through to double for integers beyond int64
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
            JSONValue val = parseValue();
            arr.push_back(std::make_shared<JSONValue>(std::move(val)));
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
            JSONValue val = parseValue();
            obj[key] = std::make_shared<JSONValue>(std::move(val));
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
        } else {
            out = parseNumber();
        }
        --depth;
        return out;
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

void writeValue(std::ostringstream& oss, const JSONValue& value) {
    std::visit([&oss](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << v;
        } else if constexpr (std::is_same_v<T, double>) {
            oss << std::setprecision(17) << v;
        } else if constexpr (std::is_same_v<T, std::string>) {
            writeEscaped(oss, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            oss << '[';
            for (std::size_t k = 0; k < v.size(); ++k) {
                if (k > 0) oss << ',';
                if (v[k]) { writeValue(oss, *v[k]); } else { oss << "null"; }
            }
            oss << ']';
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            oss << '{';
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!first) oss << ',';
                first = false;
                writeEscaped(oss, key);
                oss << ':';
                if (val) { writeValue(oss, *val); } else { oss << "null"; }
            }
            oss << '}';
        }
    }, value.value);
}
} // namespace

bool ParseJSON(const std::string& text, JSONValue& out, std::string& error) {
    try {
        JsonParser p(text);
        JSONValue v = p.parseValue();
        p.skipWs();
        if (p.i != text.size()) {
            p.fail("Unexpected trailing content");
        }
        out = std::move(v);
        return true;
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
}

std::string SerializeJSON(const JSONValue& value) {
    std::ostringstream oss;
    writeValue(oss, value);
    return oss.str();
}

const char* JSONTypeName(const JSONValue& value) {
    switch (value.value.index()) {
        case 0: return "null";
        case 1: return "boolean";
        case 2: return "integer";
        case 3: return "number";
        case 4: return "string";
        case 5: return "array";
        case 6: return "object";
        default: return "unknown";
    }
}

} // namespace authgate
