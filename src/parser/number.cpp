//! # Numeric Literals
//!
//! Classifies the text of a `Number` or `Complex` token into the value
//! representations of a `NumberNode`.
//!
//! ## Rules
//!
//! 1. A complex token `re±imi` parses both halves as floats.
//! 2. A trailing `i` makes a pure imaginary number.
//! 3. Integers accept the base prefixes `0x`, `0o`, `0b` and a leading `0`
//!    for octal, and are tried as both uint64 and int64 (`-0` counts as
//!    unsigned too).
//! 4. An integer is promoted to float. Otherwise the text is parsed as a
//!    float, and an integral float fills in the int/uint views.
//!
//! Complex values with a zero imaginary part also get the real views
//! through `simplify_complex()`.

#include "lexer/token.hpp"
#include "parser/ast.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <optional>

namespace sml::parser {

namespace {

// 2^63 and 2^64 are exact in a double.
constexpr double TWO_POW_63 = 9223372036854775808.0;
constexpr double TWO_POW_64 = 18446744073709551616.0;

/// Parses an unsigned integer with an optional base prefix. No sign allowed.
auto parse_uint(std::string_view text) -> std::optional<uint64_t> {
    int base = 10;
    if (text.size() >= 2 && text[0] == '0') {
        switch (text[1]) {
        case 'x':
        case 'X':
            base = 16;
            text.remove_prefix(2);
            break;
        case 'o':
        case 'O':
            base = 8;
            text.remove_prefix(2);
            break;
        case 'b':
        case 'B':
            base = 2;
            text.remove_prefix(2);
            break;
        default:
            base = 8;
            text.remove_prefix(1);
            break;
        }
    }
    if (text.empty()) {
        return std::nullopt;
    }

    uint64_t value = 0;
    auto result = std::from_chars(text.data(), text.data() + text.size(), value, base);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

/// Parses a signed integer: an optional sign followed by `parse_uint` syntax.
auto parse_int(std::string_view text) -> std::optional<int64_t> {
    bool negative = false;
    if (!text.empty() && (text[0] == '+' || text[0] == '-')) {
        negative = text[0] == '-';
        text.remove_prefix(1);
    }

    auto magnitude = parse_uint(text);
    if (!magnitude) {
        return std::nullopt;
    }
    constexpr auto max = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    if (!negative) {
        if (*magnitude > max) {
            return std::nullopt;
        }
        return static_cast<int64_t>(*magnitude);
    }
    if (*magnitude > max + 1) {
        return std::nullopt;
    }
    if (*magnitude == max + 1) {
        return std::numeric_limits<int64_t>::min();
    }
    return -static_cast<int64_t>(*magnitude);
}

/// Parses a decimal floating-point number. Hexadecimal, infinities and NaN
/// are rejected, as is any value that overflows a double.
auto parse_float(std::string_view text) -> std::optional<double> {
    auto body = text;
    if (!body.empty() && (body[0] == '+' || body[0] == '-')) {
        body.remove_prefix(1);
    }
    if (body.empty() || !(std::isdigit(static_cast<unsigned char>(body[0])) || body[0] == '.')) {
        return std::nullopt;
    }
    if (body.find_first_of("xX") != std::string_view::npos) {
        return std::nullopt;
    }

    // strtod needs a terminated buffer.
    std::string digits(text);
    char* end_ptr = nullptr;
    double value = std::strtod(digits.c_str(), &end_ptr);
    if (end_ptr != digits.c_str() + digits.size() || std::isinf(value)) {
        return std::nullopt;
    }
    return value;
}

auto exact_int64(double value) -> std::optional<int64_t> {
    if (std::trunc(value) != value || value < -TWO_POW_63 || value >= TWO_POW_63) {
        return std::nullopt;
    }
    return static_cast<int64_t>(value);
}

auto exact_uint64(double value) -> std::optional<uint64_t> {
    if (std::trunc(value) != value || value < 0.0 || value >= TWO_POW_64) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(value);
}

/// Splits `re±imi` at the sign that starts the imaginary part.
auto parse_complex(std::string_view text) -> std::optional<std::complex<double>> {
    if (text.size() < 2 || text.back() != 'i') {
        return std::nullopt;
    }
    for (size_t i = text.size() - 1; i > 0; --i) {
        char c = text[i];
        if (c != '+' && c != '-') {
            continue;
        }
        char before = text[i - 1];
        if (before == 'e' || before == 'E') {
            continue; // exponent sign
        }
        auto real = parse_float(text.substr(0, i));
        auto imag = parse_float(text.substr(i, text.size() - i - 1));
        if (!real || !imag) {
            return std::nullopt;
        }
        return std::complex<double>(*real, *imag);
    }
    return std::nullopt;
}

auto illegal(std::string_view text) -> std::string {
    return "illegal number syntax: " + lexer::quote_literal(text);
}

} // namespace

void NumberNode::simplify_complex() {
    is_float = complex128.imag() == 0.0;
    if (!is_float) {
        return;
    }
    float64 = complex128.real();
    if (auto i = exact_int64(float64)) {
        is_int = true;
        int64 = *i;
    }
    if (auto u = exact_uint64(float64)) {
        is_uint = true;
        uint64 = *u;
    }
}

auto make_number(Pos pos, std::string text, lexer::TokenKind kind) -> Result<NodePtr, std::string> {
    NumberNode number;
    number.text = std::move(text);
    std::string_view literal = number.text;

    if (kind == lexer::TokenKind::Complex) {
        auto value = parse_complex(literal);
        if (!value) {
            return illegal(literal);
        }
        number.is_complex = true;
        number.complex128 = *value;
        number.simplify_complex();
        return make_node(Node{.kind = std::move(number), .pos = pos});
    }

    // Imaginary constants can only be complex unless they are zero.
    if (!literal.empty() && literal.back() == 'i') {
        if (auto imag = parse_float(literal.substr(0, literal.size() - 1))) {
            number.is_complex = true;
            number.complex128 = std::complex<double>(0.0, *imag);
            number.simplify_complex();
            return make_node(Node{.kind = std::move(number), .pos = pos});
        }
    }

    // Integers first so hex and octal forms are kept exact.
    auto u = parse_uint(literal);
    if (u) {
        number.is_uint = true;
        number.uint64 = *u;
    }
    if (auto i = parse_int(literal)) {
        number.is_int = true;
        number.int64 = *i;
        if (*i == 0) {
            number.is_uint = true; // -0
            number.uint64 = 0;
        }
    }

    if (number.is_int) {
        number.is_float = true;
        number.float64 = static_cast<double>(number.int64);
    } else if (number.is_uint) {
        number.is_float = true;
        number.float64 = static_cast<double>(number.uint64);
    } else if (auto f = parse_float(literal)) {
        number.is_float = true;
        number.float64 = *f;
        if (auto i = exact_int64(*f)) {
            number.is_int = true;
            number.int64 = *i;
        }
        if (auto fu = exact_uint64(*f)) {
            number.is_uint = true;
            number.uint64 = *fu;
        }
    }

    if (!number.is_int && !number.is_uint && !number.is_float) {
        return illegal(literal);
    }
    return make_node(Node{.kind = std::move(number), .pos = pos});
}

} // namespace sml::parser
