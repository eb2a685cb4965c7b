#include "parser/ast.hpp"

#include <cstdint>
#include <gtest/gtest.h>
#include <limits>

using namespace sml;
using namespace sml::parser;
using lexer::TokenKind;

class NumberTest : public ::testing::Test {
protected:
    auto number(const std::string& text, TokenKind kind = TokenKind::Number) -> NumberNode {
        auto result = make_number(0, text, kind);
        EXPECT_TRUE(is_ok(result)) << (is_err(result) ? unwrap_err(result) : "");
        if (is_err(result)) {
            return NumberNode{};
        }
        return unwrap(result)->as<NumberNode>();
    }

    auto error(const std::string& text, TokenKind kind = TokenKind::Number) -> std::string {
        auto result = make_number(0, text, kind);
        EXPECT_TRUE(is_err(result)) << text;
        if (is_ok(result)) {
            return "";
        }
        return unwrap_err(result);
    }
};

TEST_F(NumberTest, Integer) {
    auto n = number("10");
    EXPECT_TRUE(n.is_int);
    EXPECT_TRUE(n.is_uint);
    EXPECT_TRUE(n.is_float);
    EXPECT_FALSE(n.is_complex);
    EXPECT_EQ(n.int64, 10);
    EXPECT_EQ(n.uint64, 10u);
    EXPECT_DOUBLE_EQ(n.float64, 10.0);
    EXPECT_EQ(n.text, "10");
}

TEST_F(NumberTest, FractionIsFloatOnly) {
    auto n = number("3.5");
    EXPECT_FALSE(n.is_int);
    EXPECT_FALSE(n.is_uint);
    EXPECT_TRUE(n.is_float);
    EXPECT_FALSE(n.is_complex);
    EXPECT_DOUBLE_EQ(n.float64, 3.5);
}

TEST_F(NumberTest, Hexadecimal) {
    auto n = number("0x1A");
    EXPECT_TRUE(n.is_int);
    EXPECT_EQ(n.int64, 26);
    EXPECT_TRUE(n.is_uint);
    EXPECT_EQ(n.uint64, 26u);
    EXPECT_DOUBLE_EQ(n.float64, 26.0);
    EXPECT_EQ(n.text, "0x1A");
}

TEST_F(NumberTest, OctalAndBinaryPrefixes) {
    EXPECT_EQ(number("017").int64, 15);
    EXPECT_EQ(number("0o17").int64, 15);
    EXPECT_EQ(number("0b101").int64, 5);
}

TEST_F(NumberTest, NegativeIntegerIsNotUnsigned) {
    auto n = number("-7");
    EXPECT_TRUE(n.is_int);
    EXPECT_FALSE(n.is_uint);
    EXPECT_EQ(n.int64, -7);
    EXPECT_DOUBLE_EQ(n.float64, -7.0);
}

TEST_F(NumberTest, NegativeZeroIsUnsigned) {
    auto n = number("-0");
    EXPECT_TRUE(n.is_int);
    EXPECT_TRUE(n.is_uint);
    EXPECT_EQ(n.uint64, 0u);
}

TEST_F(NumberTest, IntegralFloatFillsIntegerViews) {
    auto n = number("1e3");
    EXPECT_TRUE(n.is_float);
    EXPECT_TRUE(n.is_int);
    EXPECT_TRUE(n.is_uint);
    EXPECT_EQ(n.int64, 1000);
    EXPECT_EQ(n.uint64, 1000u);
}

TEST_F(NumberTest, NegativeIntegralFloat) {
    auto n = number("-2.0");
    EXPECT_TRUE(n.is_int);
    EXPECT_FALSE(n.is_uint);
    EXPECT_EQ(n.int64, -2);
}

TEST_F(NumberTest, IntegerRangeLimits) {
    auto max_uint = number("18446744073709551615");
    EXPECT_TRUE(max_uint.is_uint);
    EXPECT_FALSE(max_uint.is_int);
    EXPECT_EQ(max_uint.uint64, std::numeric_limits<uint64_t>::max());
    EXPECT_TRUE(max_uint.is_float);

    auto past_int = number("9223372036854775808");
    EXPECT_TRUE(past_int.is_uint);
    EXPECT_FALSE(past_int.is_int);

    auto min_int = number("-9223372036854775808");
    EXPECT_TRUE(min_int.is_int);
    EXPECT_EQ(min_int.int64, std::numeric_limits<int64_t>::min());
}

TEST_F(NumberTest, Imaginary) {
    auto n = number("2i");
    EXPECT_TRUE(n.is_complex);
    EXPECT_FALSE(n.is_float);
    EXPECT_FALSE(n.is_int);
    EXPECT_DOUBLE_EQ(n.complex128.real(), 0.0);
    EXPECT_DOUBLE_EQ(n.complex128.imag(), 2.0);
}

TEST_F(NumberTest, ZeroImaginarySimplifies) {
    auto n = number("0i");
    EXPECT_TRUE(n.is_complex);
    EXPECT_TRUE(n.is_float);
    EXPECT_TRUE(n.is_int);
    EXPECT_TRUE(n.is_uint);
    EXPECT_EQ(n.int64, 0);
}

TEST_F(NumberTest, Complex) {
    auto n = number("1+2i", TokenKind::Complex);
    EXPECT_TRUE(n.is_complex);
    EXPECT_FALSE(n.is_float);
    EXPECT_DOUBLE_EQ(n.complex128.real(), 1.0);
    EXPECT_DOUBLE_EQ(n.complex128.imag(), 2.0);

    n = number("-1.5e+2-3i", TokenKind::Complex);
    EXPECT_DOUBLE_EQ(n.complex128.real(), -150.0);
    EXPECT_DOUBLE_EQ(n.complex128.imag(), -3.0);
}

TEST_F(NumberTest, ComplexWithZeroImaginaryPart) {
    auto n = number("3+0i", TokenKind::Complex);
    EXPECT_TRUE(n.is_complex);
    EXPECT_TRUE(n.is_float);
    EXPECT_TRUE(n.is_int);
    EXPECT_TRUE(n.is_uint);
    EXPECT_DOUBLE_EQ(n.float64, 3.0);
    EXPECT_EQ(n.int64, 3);
    EXPECT_EQ(n.uint64, 3u);
}

TEST_F(NumberTest, SimplifyComplexNegativeReal) {
    NumberNode n;
    n.is_complex = true;
    n.complex128 = {-4.0, 0.0};
    n.simplify_complex();
    EXPECT_TRUE(n.is_float);
    EXPECT_TRUE(n.is_int);
    EXPECT_FALSE(n.is_uint);
    EXPECT_EQ(n.int64, -4);
}

TEST_F(NumberTest, IllegalSyntax) {
    EXPECT_EQ(error("1e"), R"(illegal number syntax: "1e")");
    EXPECT_EQ(error("0x1.8"), R"(illegal number syntax: "0x1.8")");
    EXPECT_EQ(error("1e400"), R"(illegal number syntax: "1e400")");
    EXPECT_EQ(error("1i2", TokenKind::Complex), R"(illegal number syntax: "1i2")");
}

TEST_F(NumberTest, NodeKeepsPosition) {
    auto result = make_number(17, "5", TokenKind::Number);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result)->position(), 17);
    EXPECT_EQ(unwrap(result)->type(), NodeType::Number);
    EXPECT_EQ(unwrap(result)->to_string(), "5");
}
