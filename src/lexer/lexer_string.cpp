//! # Lexer - Strings
//!
//! Double-quoted strings with backslash escapes. The token text keeps the
//! quotes and the escapes exactly as written; the grammar has no position
//! that accepts a string, so escapes are never decoded.

#include "lexer/lexer.hpp"

namespace sml::lexer {

/// The opening quote has already been consumed.
auto Lexer::lex_quote() -> State {
    for (;;) {
        char32_t r = next_rune();
        if (r == '\\') {
            r = next_rune();
            if (r != EOF_RUNE && r != '\n') {
                continue;
            }
        }
        if (r == EOF_RUNE || r == '\n') {
            return error("unterminated quoted string");
        }
        if (r == '"') {
            break;
        }
    }
    emit(TokenKind::String);
    return State::Base;
}

} // namespace sml::lexer
