/*
 * Copyright (c) 2026 The CSVBIND Authors
 *
 * This file is part of the CSVBIND library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file codec_test.cpp
 * @brief Tests for the typed codec dispatcher
 *
 * Test categories:
 *   1. Capability selection (compile-time)
 *   2. Integer and float parsing with exact width checks
 *   3. Bool, string, enum and any
 *   4. Pointer variants
 *   5. Custom marshal and stream capabilities
 */

#include <gtest/gtest.h>
#include <csvbind/csvbind.h>

#include <any>
#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>

using csvbind::ColumnKind;
using csvbind::Errc;
using csvbind::Error;
using csvbind::ValueCodec;
using csvbind::decodeValue;
using csvbind::encodeValue;

namespace {

    // Custom tabular marshal: "x:y"
    struct Point {
        int x = 0;
        int y = 0;

        Error unmarshalCSV(std::string_view text) {
            size_t sep = text.find(':');
            if (sep == std::string_view::npos) {
                return Error(Errc::DecodeValueType, "Point (" + std::string(text) + ")");
            }
            if (Error err = decodeValue(text.substr(0, sep), x)) return err;
            return decodeValue(text.substr(sep + 1), y);
        }
        Error marshalCSV(std::string& out) const {
            out = std::to_string(x) + ":" + std::to_string(y);
            return {};
        }
    };

    // Stream capability only
    struct Celsius {
        double degrees = 0;
    };
    std::istream& operator>>(std::istream& is, Celsius& c) { return is >> c.degrees; }
    std::ostream& operator<<(std::ostream& os, const Celsius& c) { return os << c.degrees; }

    // No capability at all
    struct Opaque {
        int raw = 0;
    };

    enum class Color : uint8_t { RED = 1, GREEN = 2 };

} // namespace

// ============================================================================
// 1. Capability selection
// ============================================================================

static_assert(csvbind::isDecodable<int>() && csvbind::isEncodable<int>());
static_assert(csvbind::isDecodable<std::optional<double>>());
static_assert(csvbind::isDecodable<std::unique_ptr<std::string>>());
static_assert(csvbind::isDecodable<Point>() && csvbind::isEncodable<Point>());
static_assert(csvbind::isDecodable<Celsius>() && csvbind::isEncodable<Celsius>());
static_assert(!csvbind::isDecodable<Opaque>() && !csvbind::isEncodable<Opaque>());
static_assert(csvbind::toColumnKind<Point>() == ColumnKind::CUSTOM);
static_assert(csvbind::toColumnKind<Celsius>() == ColumnKind::TEXT);
static_assert(csvbind::toColumnKind<Color>() == ColumnKind::ENUM);
static_assert(csvbind::toColumnKind<std::optional<int16_t>>() == ColumnKind::INT16);

// Test 1: Codec of an unsupported type has no functions
TEST(CodecTest, Unsupported_NullFunctions) {
    ValueCodec codec = ValueCodec::of<Opaque>();
    EXPECT_FALSE(codec.canDecode());
    EXPECT_FALSE(codec.canEncode());
    EXPECT_EQ(codec.kind, ColumnKind::UNSUPPORTED);

    ValueCodec ints = ValueCodec::of<int32_t>();
    EXPECT_TRUE(ints.canDecode());
    EXPECT_TRUE(ints.canEncode());
    EXPECT_EQ(ints.typeName, "int32");
}

// ============================================================================
// 2. Numbers
// ============================================================================

// Test 2: Integers enforce the declared width exactly
TEST(CodecTest, Integer_Width) {
    int8_t i8 = 0;
    EXPECT_FALSE(decodeValue("127", i8));
    EXPECT_EQ(i8, 127);
    EXPECT_FALSE(decodeValue("-128", i8));
    EXPECT_EQ(i8, -128);

    Error err = decodeValue("128", i8);
    EXPECT_TRUE(err.is(Errc::DecodeValueType));
    EXPECT_EQ(err.detail(), "int8 (128)");
    EXPECT_EQ(i8, -128) << "failed decode must leave the target untouched";

    uint16_t u16 = 0;
    EXPECT_FALSE(decodeValue("65535", u16));
    EXPECT_TRUE(decodeValue("65536", u16).is(Errc::DecodeValueType));
    EXPECT_TRUE(decodeValue("-1", u16).is(Errc::DecodeValueType));
    EXPECT_TRUE(decodeValue("+1", u16).is(Errc::DecodeValueType));

    int64_t i64 = 0;
    EXPECT_FALSE(decodeValue("+42", i64));
    EXPECT_EQ(i64, 42);
}

// Test 3: The whole cell must be consumed
TEST(CodecTest, Integer_WholeCell) {
    int value = 0;
    EXPECT_TRUE(decodeValue("12abc", value).is(Errc::DecodeValueType));
    EXPECT_TRUE(decodeValue(" 12", value).is(Errc::DecodeValueType));
    EXPECT_TRUE(decodeValue("", value).is(Errc::DecodeValueType));
    EXPECT_TRUE(decodeValue("1.5", value).is(Errc::DecodeValueType));
}

// Test 4: Floats in decimal and exponent form
TEST(CodecTest, Float_Parse) {
    double d = 0;
    EXPECT_FALSE(decodeValue("3.25", d));
    EXPECT_DOUBLE_EQ(d, 3.25);
    EXPECT_FALSE(decodeValue("-1e3", d));
    EXPECT_DOUBLE_EQ(d, -1000.0);
    EXPECT_FALSE(decodeValue("+0.5", d));
    EXPECT_DOUBLE_EQ(d, 0.5);
    EXPECT_TRUE(decodeValue("1.2.3", d).is(Errc::DecodeValueType));

    float f = 0;
    EXPECT_FALSE(decodeValue("1.5", f));
    EXPECT_FLOAT_EQ(f, 1.5f);
    EXPECT_TRUE(decodeValue("1e300", f).is(Errc::DecodeValueType));
}

// Test 5: Number encoding and omitempty
TEST(CodecTest, Number_Encode) {
    std::string out;
    EXPECT_FALSE(encodeValue(int32_t{-17}, false, out));
    EXPECT_EQ(out, "-17");
    EXPECT_FALSE(encodeValue(0, false, out));
    EXPECT_EQ(out, "0");
    EXPECT_FALSE(encodeValue(0, true, out));
    EXPECT_EQ(out, "");
    EXPECT_FALSE(encodeValue(2.5, false, out));
    EXPECT_EQ(out, "2.5");
    EXPECT_FALSE(encodeValue(0.0, true, out));
    EXPECT_EQ(out, "");
}

// ============================================================================
// 3. Bool, string, enum, any
// ============================================================================

// Test 6: Bool spellings
TEST(CodecTest, Bool_Spellings) {
    for (const char* text : {"1", "t", "T", "TRUE", "true", "True"}) {
        bool b = false;
        EXPECT_FALSE(decodeValue(text, b)) << text;
        EXPECT_TRUE(b) << text;
    }
    for (const char* text : {"0", "f", "F", "FALSE", "false", "False"}) {
        bool b = true;
        EXPECT_FALSE(decodeValue(text, b)) << text;
        EXPECT_FALSE(b) << text;
    }
    bool b = false;
    EXPECT_TRUE(decodeValue("yes", b).is(Errc::DecodeValueType));

    std::string out;
    EXPECT_FALSE(encodeValue(true, false, out));
    EXPECT_EQ(out, "true");
    EXPECT_FALSE(encodeValue(false, false, out));
    EXPECT_EQ(out, "false");
    EXPECT_FALSE(encodeValue(false, true, out));
    EXPECT_EQ(out, "");
}

// Test 7: Strings are taken verbatim
TEST(CodecTest, String_Verbatim) {
    std::string s;
    EXPECT_FALSE(decodeValue("  padded, \"quoted\"  ", s));
    EXPECT_EQ(s, "  padded, \"quoted\"  ");

    std::string out;
    EXPECT_FALSE(encodeValue(std::string(""), true, out));
    EXPECT_EQ(out, "");
}

// Test 8: Enums go through their underlying integer
TEST(CodecTest, Enum_Underlying) {
    Color c = Color::RED;
    EXPECT_FALSE(decodeValue("2", c));
    EXPECT_EQ(c, Color::GREEN);
    EXPECT_TRUE(decodeValue("256", c).is(Errc::DecodeValueType));

    std::string out;
    EXPECT_FALSE(encodeValue(Color::GREEN, false, out));
    EXPECT_EQ(out, "2");
}

// Test 9: Any decodes as string and re-dispatches on encode
TEST(CodecTest, Any_DecodeEncode) {
    std::any value;
    EXPECT_FALSE(decodeValue("42", value));
    ASSERT_EQ(value.type(), typeid(std::string));
    EXPECT_EQ(std::any_cast<std::string>(value), "42");

    std::string out;
    EXPECT_FALSE(encodeValue(std::any(int64_t{7}), false, out));
    EXPECT_EQ(out, "7");
    EXPECT_FALSE(encodeValue(std::any(true), false, out));
    EXPECT_EQ(out, "true");
    EXPECT_FALSE(encodeValue(std::any(std::string("x")), false, out));
    EXPECT_EQ(out, "x");
    EXPECT_FALSE(encodeValue(std::any(std::string_view("view")), false, out));
    EXPECT_EQ(out, "view");
    EXPECT_FALSE(encodeValue(std::any(), false, out));
    EXPECT_EQ(out, "");

    EXPECT_TRUE(encodeValue(std::any(Opaque{}), false, out).is(Errc::TypeUnsupported));
}

// ============================================================================
// 4. Pointer variants
// ============================================================================

// Test 10: Optional assigned only on success
TEST(CodecTest, Optional_AssignOnSuccess) {
    std::optional<int> value;
    EXPECT_TRUE(decodeValue("x", value).is(Errc::DecodeValueType));
    EXPECT_FALSE(value.has_value());

    EXPECT_FALSE(decodeValue("5", value));
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 5);

    std::string out = "stale";
    std::optional<int> empty;
    EXPECT_FALSE(encodeValue(empty, false, out));
    EXPECT_EQ(out, "");
    EXPECT_FALSE(encodeValue(value, false, out));
    EXPECT_EQ(out, "5");
}

// Test 11: unique_ptr allocated lazily
TEST(CodecTest, UniquePtr_LazyAllocation) {
    std::unique_ptr<std::string> value;
    EXPECT_FALSE(decodeValue("hello", value));
    ASSERT_NE(value, nullptr);
    EXPECT_EQ(*value, "hello");

    std::string out;
    std::unique_ptr<std::string> empty;
    EXPECT_FALSE(encodeValue(empty, false, out));
    EXPECT_EQ(out, "");
}

// ============================================================================
// 5. Custom capabilities
// ============================================================================

// Test 12: Custom marshal wins
TEST(CodecTest, CustomMarshal) {
    Point p;
    EXPECT_FALSE(decodeValue("3:4", p));
    EXPECT_EQ(p.x, 3);
    EXPECT_EQ(p.y, 4);
    EXPECT_TRUE(decodeValue("34", p).is(Errc::DecodeValueType));

    std::string out;
    EXPECT_FALSE(encodeValue(Point{1, 2}, false, out));
    EXPECT_EQ(out, "1:2");
}

// Test 13: Stream capability must consume the whole cell
TEST(CodecTest, StreamCapability) {
    Celsius c;
    EXPECT_FALSE(decodeValue("21.5", c));
    EXPECT_DOUBLE_EQ(c.degrees, 21.5);
    EXPECT_TRUE(decodeValue("21.5C", c).is(Errc::DecodeValueType));
    EXPECT_TRUE(decodeValue("warm", c).is(Errc::DecodeValueType));

    std::string out;
    EXPECT_FALSE(encodeValue(Celsius{-3}, false, out));
    EXPECT_EQ(out, "-3");
}
