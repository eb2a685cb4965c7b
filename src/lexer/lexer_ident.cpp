//! # Lexer - Identifiers
//!
//! This file implements identifier and keyword lexing.
//!
//! ## Identifier Rules
//!
//! - Start with a letter or underscore (digits are taken by `Number`)
//! - Continue with letters, digits, or underscores
//! - Must be followed by a terminator: whitespace, end of input, or one of
//!   `.`, `,`, `|`, `:`, `)`, `(`
//!
//! ## Classification
//!
//! The word is checked against the keyword table first, then against the
//! boolean constants `true` and `false`. Anything else is an identifier.

#include "lexer/lexer.hpp"

namespace sml::lexer {

auto Lexer::lex_identifier() -> State {
    char32_t r = next_rune();
    while (is_alpha_numeric(r)) {
        r = next_rune();
    }
    backup();

    if (!at_terminator()) {
        return error("bad character " + describe_rune(r));
    }

    auto word = source_.slice(start_, pos_);
    if (auto keyword = lookup_keyword(word)) {
        emit(*keyword);
    } else if (word == "true" || word == "false") {
        emit(TokenKind::Bool);
    } else {
        emit(TokenKind::Identifier);
    }
    return State::Base;
}

auto Lexer::at_terminator() -> bool {
    char32_t r = peek();
    if (is_space(r)) {
        return true;
    }
    switch (r) {
    case EOF_RUNE:
    case '.':
    case ',':
    case '|':
    case ':':
    case ')':
    case '(':
        return true;
    default:
        return false;
    }
}

} // namespace sml::lexer
