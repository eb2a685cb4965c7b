//! # Lexer - Numbers
//!
//! This file implements numeral scanning.
//!
//! ## Supported Formats
//!
//! | Format      | Example            |
//! |-------------|--------------------|
//! | Decimal     | `42`, `-7`, `+3`   |
//! | Hexadecimal | `0x1A`, `0XFF`     |
//! | Fractional  | `3.14`, `1.`       |
//! | Exponent    | `1e10`, `2.5E-3`   |
//! | Imaginary   | `2i`, `1.5i`       |
//! | Complex     | `1+2i`, `-1.5-3i`  |
//!
//! The scanner only checks the shape of a numeral. Values such as `089` or
//! `1e` are accepted here and rejected by the parser when the literal is
//! classified.

#include "lexer/lexer.hpp"

namespace sml::lexer {

namespace {

constexpr std::string_view DEC_DIGITS = "0123456789";
constexpr std::string_view HEX_DIGITS = "0123456789abcdefABCDEF";

} // namespace

auto Lexer::lex_number() -> State {
    if (!scan_number()) {
        return error("bad number syntax: " + quote_literal(source_.slice(start_, pos_)));
    }

    char32_t sign = peek();
    if (sign == '+' || sign == '-') {
        // Complex: 1+2i. No spaces, the second part must end in 'i'.
        if (!scan_number() || source_.content()[pos_ - 1] != 'i') {
            return error("bad number syntax: " + quote_literal(source_.slice(start_, pos_)));
        }
        emit(TokenKind::Complex);
    } else {
        emit(TokenKind::Number);
    }
    return State::Base;
}

auto Lexer::scan_number() -> bool {
    accept("+-");

    auto digits = DEC_DIGITS;
    size_t count = 0;
    if (accept("0")) {
        if (accept("xX")) {
            digits = HEX_DIGITS;
        } else {
            count = 1;
        }
    }
    count += accept_run(digits);
    if (accept(".")) {
        count += accept_run(digits);
    }
    if (count == 0) {
        return false;
    }

    if (accept("eE")) {
        accept("+-");
        accept_run(DEC_DIGITS);
    }
    accept("i");

    // Next thing mustn't be alphanumeric.
    if (is_alpha_numeric(peek())) {
        next_rune();
        return false;
    }
    return true;
}

} // namespace sml::lexer
