//! # Lexer - Base State
//!
//! The `Base` state dispatches on the next rune. Operators and delimiters
//! are emitted directly; everything longer is handed to a dedicated state.
//!
//! ## Operators
//!
//! | Input | Token          |
//! |-------|----------------|
//! | `&&`  | `Intersection` |
//! | `\|\|`  | `Union`        |
//! | `-`   | `Diff`         |
//! | `@`   | `Location`     |
//!
//! A `-` immediately followed by a digit or `.` starts a negative numeral
//! instead of a `Diff` operator, so `1 - 2` is a difference while `-2` is a
//! number.
//!
//! ## Comments
//!
//! `// ...` runs to the end of the line and `/* ... */` to the closing
//! marker. Comment text is skipped, never emitted.

#include "lexer/lexer.hpp"
#include "log/log.hpp"

namespace sml::lexer {

namespace {

constexpr std::string_view LINE_COMMENT = "//";
constexpr std::string_view LEFT_COMMENT = "/*";
constexpr std::string_view RIGHT_COMMENT = "*/";

} // namespace

auto Lexer::lex_base() -> State {
    auto rest = source_.content().substr(pos_);
    if (rest.starts_with(LINE_COMMENT)) {
        return State::LineComment;
    }
    if (rest.starts_with(LEFT_COMMENT)) {
        return State::BlockComment;
    }
    if (rest.starts_with("&&")) {
        pos_ += 2;
        emit(TokenKind::Intersection);
        return State::Base;
    }
    if (rest.starts_with("||")) {
        pos_ += 2;
        emit(TokenKind::Union);
        return State::Base;
    }

    char32_t r = next_rune();
    if (is_space(r)) {
        return State::Space;
    }
    if (r == '-') {
        auto after = source_.content().substr(pos_);
        if (!after.empty() && (is_digit(static_cast<unsigned char>(after[0])) || after[0] == '.')) {
            backup();
            return State::Number;
        }
        emit(TokenKind::Diff);
        return State::Base;
    }
    if (r == '+' || is_digit(r)) {
        backup();
        return State::Number;
    }
    if (is_alpha_numeric(r)) {
        backup();
        return State::Identifier;
    }

    switch (r) {
    case '"':
        return State::Quote;
    case '(':
        emit(TokenKind::LParen);
        ++paren_depth_;
        return State::Base;
    case ')':
        emit(TokenKind::RParen);
        --paren_depth_;
        if (paren_depth_ < 0) {
            return error("unexpected right paren " + describe_rune(r));
        }
        return State::Base;
    case '@':
        emit(TokenKind::Location);
        return State::Base;
    case EOF_RUNE:
        emit(TokenKind::Eof);
        SML_LOG_DEBUG("lexer", source_.name() << ": end of input at " << pos_);
        return State::Halted;
    default:
        return error("unrecognized character: " + describe_rune(r));
    }
}

// ============================================================================
// Comments and Whitespace
// ============================================================================

auto Lexer::lex_line_comment() -> State {
    pos_ += LINE_COMMENT.size();
    auto newline = source_.content().find('\n', pos_);
    if (newline == std::string_view::npos) {
        // Comment runs to the end of the input; Base emits the Eof.
        pos_ = source_.length();
    } else {
        pos_ = newline + 1;
    }
    ignore();
    return State::Base;
}

auto Lexer::lex_block_comment() -> State {
    pos_ += LEFT_COMMENT.size();
    auto end = source_.content().find(RIGHT_COMMENT, pos_);
    if (end == std::string_view::npos) {
        return error("unclosed comment");
    }
    pos_ = end + RIGHT_COMMENT.size();
    ignore();
    return State::Base;
}

/// One space has already been consumed.
auto Lexer::lex_space() -> State {
    while (is_space(peek())) {
        next_rune();
    }
    emit(TokenKind::Space);
    return State::Base;
}

} // namespace sml::lexer
