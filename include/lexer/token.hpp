//! # Token Definitions
//!
//! This module defines the tokens produced by the SML scanner.
//!
//! ## Overview
//!
//! A token is a classified, positioned span of source text. Tokens are
//! categorized into:
//!
//! - **Literals**: numbers, complex numbers, booleans, strings
//! - **Identifiers**: `foo`, `_bar`
//! - **Operators**: `-` (diff), `&&` (intersection), `||` (union), `@` (location)
//! - **Delimiters**: `(` and `)`
//! - **Layout**: runs of whitespace are emitted as `Space` tokens
//! - **Special**: end-of-input and error tokens
//! - **Keywords**: everything after the `Keyword` marker (currently `rect`)
//!
//! ## Keyword Marker
//!
//! Kinds ordered after `TokenKind::Keyword` are reserved for keywords found
//! through the keyword table. `is_keyword()` relies on this ordering.

#ifndef SML_LEXER_TOKEN_HPP
#define SML_LEXER_TOKEN_HPP

#include "common.hpp"

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace sml::lexer {

/// All token kinds of the SML language.
enum class TokenKind : uint8_t {
    Error,        ///< Scan error; the token text is the message
    Bool,         ///< Boolean constant: `true`, `false`
    Complex,      ///< Complex constant: `1+2i`
    Eof,          ///< End of input
    Identifier,   ///< Alphanumeric identifier
    LParen,       ///< `(`
    Number,       ///< Simple number, including imaginary: `42`, `0x1A`, `3.5e2`, `2i`
    RParen,       ///< `)`
    Space,        ///< Run of whitespace separating grammatic units
    String,       ///< Quoted string, quotes included
    Diff,         ///< `-` operator
    Intersection, ///< `&&` operator
    Union,        ///< `||` operator
    Location,     ///< `@` operator

    Keyword, ///< Marker only; never emitted
    KwRect,  ///< `rect`
};

/// Converts a token kind to its name for diagnostics (e.g. "right paren").
[[nodiscard]] auto token_kind_to_string(TokenKind kind) -> std::string_view;

/// Checks if a token kind is a keyword.
[[nodiscard]] constexpr auto is_keyword(TokenKind kind) -> bool {
    return kind > TokenKind::Keyword;
}

/// Looks up a keyword by identifier text.
///
/// Returns the keyword token kind, or `std::nullopt` if not a keyword.
[[nodiscard]] auto lookup_keyword(std::string_view ident) -> std::optional<TokenKind>;

/// Quotes source text for diagnostics, escaping quotes, backslashes and
/// newline/tab characters.
[[nodiscard]] auto quote_literal(std::string_view text) -> std::string;

/// A lexical token.
///
/// `text` is the exact source span for every kind except `Error`, whose
/// text is the human-readable message.
struct Token {
    TokenKind kind;
    Pos pos; ///< Byte offset of the first byte of the token.
    std::string text;

    [[nodiscard]] auto is(TokenKind k) const -> bool {
        return kind == k;
    }

    [[nodiscard]] auto is_one_of(std::initializer_list<TokenKind> kinds) const -> bool {
        for (auto k : kinds) {
            if (kind == k)
                return true;
        }
        return false;
    }

    [[nodiscard]] auto is_eof() const -> bool {
        return kind == TokenKind::Eof;
    }

    [[nodiscard]] auto is_error() const -> bool {
        return kind == TokenKind::Error;
    }

    /// Diagnostic rendering: `EOF`, the message of an error token, `<rect>`
    /// for keywords, otherwise the quoted text (truncated after 10 bytes).
    [[nodiscard]] auto to_string() const -> std::string;
};

auto operator<<(std::ostream& os, const Token& token) -> std::ostream&;

} // namespace sml::lexer

#endif // SML_LEXER_TOKEN_HPP
