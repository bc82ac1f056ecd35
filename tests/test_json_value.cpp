//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_json_value.cpp
// Purpose: Tests for the JSONValue parser and serializer
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "authgate/JSONValue.h"

using namespace authgate;

TEST(JSONValue, Parse_IntrospectionShape) {
    JSONValue v;
    std::string err;
    ASSERT_TRUE(ParseJSON("{\"active\":true,\"sub\":\"u1\",\"aud\":[\"api\"],\"exp\":1700000000,\"ratio\":0.5,\"ext\":null}", v, err)) << err;
    ASSERT_TRUE(v.isObject());
    const auto& o = std::get<JSONValue::Object>(v.value);
    EXPECT_TRUE(std::get<bool>(o.at("active")->value));
    EXPECT_EQ(std::get<std::string>(o.at("sub")->value), std::string("u1"));
    ASSERT_TRUE(o.at("aud")->isArray());
    EXPECT_EQ(std::get<JSONValue::Array>(o.at("aud")->value).size(), 1u);
    EXPECT_EQ(std::get<int64_t>(o.at("exp")->value), 1700000000);
    EXPECT_DOUBLE_EQ(std::get<double>(o.at("ratio")->value), 0.5);
    EXPECT_TRUE(o.at("ext")->isNull());
}

TEST(JSONValue, Parse_EscapesAndSurrogates) {
    JSONValue v;
    std::string err;
    ASSERT_TRUE(ParseJSON("\"a\\\"b\\n\\u00e9\\ud83d\\ude00\"", v, err)) << err;
    EXPECT_EQ(std::get<std::string>(v.value), std::string("a\"b\n\xC3\xA9\xF0\x9F\x98\x80"));
}

TEST(JSONValue, Parse_RejectsMalformed) {
    JSONValue v;
    std::string err;
    EXPECT_FALSE(ParseJSON("", v, err));
    EXPECT_FALSE(ParseJSON("{", v, err));
    EXPECT_FALSE(ParseJSON("{\"a\":1,}", v, err));
    EXPECT_FALSE(ParseJSON("{\"a\":1} trailing", v, err));
    EXPECT_FALSE(ParseJSON("[01x]", v, err));
    EXPECT_FALSE(ParseJSON("\"tab\there\"", v, err));
    EXPECT_FALSE(ParseJSON("not json", v, err));
    EXPECT_FALSE(err.empty());
}

TEST(JSONValue, Parse_DepthLimit) {
    std::string deep(100, '[');
    deep += std::string(100, ']');
    JSONValue v;
    std::string err;
    EXPECT_FALSE(ParseJSON(deep, v, err));
}

TEST(JSONValue, Serialize_RoundTripsScalarsAndEscapes) {
    JSONValue::Object o;
    o["k\"ey"] = std::make_shared<JSONValue>(std::string("line\nbreak"));
    JSONValue v(std::move(o));
    const std::string text = SerializeJSON(v);
    EXPECT_EQ(text, std::string("{\"k\\\"ey\":\"line\\nbreak\"}"));

    JSONValue back;
    std::string err;
    ASSERT_TRUE(ParseJSON(text, back, err)) << err;
    EXPECT_EQ(std::get<std::string>(std::get<JSONValue::Object>(back.value).at("k\"ey")->value), std::string("line\nbreak"));
}

TEST(JSONValue, TypeNames) {
    EXPECT_EQ(std::string(JSONTypeName(JSONValue())), std::string("null"));
    EXPECT_EQ(std::string(JSONTypeName(JSONValue(true))), std::string("boolean"));
    EXPECT_EQ(std::string(JSONTypeName(JSONValue(static_cast<int64_t>(3)))), std::string("integer"));
    EXPECT_EQ(std::string(JSONTypeName(JSONValue(1.5))), std::string("number"));
    EXPECT_EQ(std::string(JSONTypeName(JSONValue("s"))), std::string("string"));
    EXPECT_EQ(std::string(JSONTypeName(JSONValue(JSONValue::Array{}))), std::string("array"));
    EXPECT_EQ(std::string(JSONTypeName(JSONValue(JSONValue::Object{}))), std::string("object"));
}
