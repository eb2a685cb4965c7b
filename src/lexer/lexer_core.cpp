//! # Lexer Core
//!
//! This file implements the scanner's machinery:
//!
//! - **Rune access**: `next_rune()`, `peek()`, `backup()`, `accept()`
//! - **Emission**: `emit()`, `ignore()`, `error()`
//! - **Driver**: `next()` runs states until a token is pending
//! - **Character classes**: whitespace, identifier characters, digits
//!
//! ## UTF-8
//!
//! Input is decoded as UTF-8 one rune at a time. Malformed sequences
//! decode to U+FFFD with a width of one byte so scanning always advances.
//! Letter and digit classes outside ASCII come from ICU's general
//! categories.

#include "lexer/lexer.hpp"
#include "log/log.hpp"

#include <cstdio>
#include <unicode/uchar.h>

namespace sml::lexer {

namespace {

void append_utf8(std::string& out, char32_t r) {
    if (r < 0x80) {
        out += static_cast<char>(r);
    } else if (r < 0x800) {
        out += static_cast<char>(0xC0 | (r >> 6));
        out += static_cast<char>(0x80 | (r & 0x3F));
    } else if (r < 0x10000) {
        out += static_cast<char>(0xE0 | (r >> 12));
        out += static_cast<char>(0x80 | ((r >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (r & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (r >> 18));
        out += static_cast<char>(0x80 | ((r >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((r >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (r & 0x3F));
    }
}

} // namespace

Lexer::Lexer(const Source& source) : source_(source) {
    SML_LOG_DEBUG("lexer", "scanning " << source_.name() << " (" << source_.length() << " bytes)");
}

// ============================================================================
// Driver
// ============================================================================

auto Lexer::next() -> std::optional<Token> {
    while (pending_.empty() && state_ != State::Halted) {
        state_ = step(state_);
    }
    if (pending_.empty()) {
        return std::nullopt;
    }

    Token token = std::move(pending_.front());
    pending_.pop_front();
    last_pos_ = token.pos;
    return token;
}

auto Lexer::tokenize() -> std::vector<Token> {
    std::vector<Token> tokens;
    while (auto token = next()) {
        tokens.push_back(std::move(*token));
    }
    return tokens;
}

auto Lexer::line_number() const -> uint32_t {
    return source_.location(last_pos_).line;
}

auto Lexer::step(State state) -> State {
    switch (state) {
    case State::Base:
        return lex_base();
    case State::LineComment:
        return lex_line_comment();
    case State::BlockComment:
        return lex_block_comment();
    case State::Space:
        return lex_space();
    case State::Identifier:
        return lex_identifier();
    case State::Number:
        return lex_number();
    case State::Quote:
        return lex_quote();
    case State::Halted:
        break;
    }
    return State::Halted;
}

// ============================================================================
// Rune Access
// ============================================================================

auto Lexer::next_rune() -> char32_t {
    if (pos_ >= source_.length()) {
        width_ = 0;
        return EOF_RUNE;
    }

    auto text = source_.content();
    auto c = static_cast<unsigned char>(text[pos_]);

    char32_t result;
    size_t remaining;
    if ((c & 0x80) == 0) {
        width_ = 1;
        pos_ += width_;
        return static_cast<char32_t>(c);
    } else if ((c & 0xE0) == 0xC0) {
        result = c & 0x1F;
        remaining = 1;
    } else if ((c & 0xF0) == 0xE0) {
        result = c & 0x0F;
        remaining = 2;
    } else if ((c & 0xF8) == 0xF0) {
        result = c & 0x07;
        remaining = 3;
    } else {
        width_ = 1;
        pos_ += width_;
        return 0xFFFD;
    }

    if (pos_ + remaining >= text.size()) {
        width_ = 1;
        pos_ += width_;
        return 0xFFFD;
    }
    for (size_t i = 1; i <= remaining; ++i) {
        auto cc = static_cast<unsigned char>(text[pos_ + i]);
        if ((cc & 0xC0) != 0x80) {
            width_ = 1;
            pos_ += width_;
            return 0xFFFD;
        }
        result = (result << 6) | (cc & 0x3F);
    }

    width_ = remaining + 1;
    pos_ += width_;
    return result;
}

auto Lexer::peek() -> char32_t {
    char32_t r = next_rune();
    backup();
    return r;
}

void Lexer::backup() {
    pos_ -= width_;
}

auto Lexer::accept(std::string_view valid) -> bool {
    char32_t r = next_rune();
    if (r < 0x80 && valid.find(static_cast<char>(r)) != std::string_view::npos) {
        return true;
    }
    backup();
    return false;
}

auto Lexer::accept_run(std::string_view valid) -> size_t {
    size_t count = 0;
    while (accept(valid)) {
        ++count;
    }
    return count;
}

// ============================================================================
// Emission
// ============================================================================

void Lexer::emit(TokenKind kind) {
    pending_.push_back(
        Token{.kind = kind, .pos = start_, .text = std::string(source_.slice(start_, pos_))});
    SML_LOG_TRACE("lexer", "emit " << token_kind_to_string(kind) << " " << pending_.back() << " at "
                                   << start_);
    start_ = pos_;
}

void Lexer::ignore() {
    start_ = pos_;
}

auto Lexer::error(std::string message) -> State {
    SML_LOG_DEBUG("lexer", source_.name() << ": scan error at " << start_ << ": " << message);
    errors_.push_back(LexerError{.message = message, .pos = start_});
    pending_.push_back(Token{.kind = TokenKind::Error, .pos = start_, .text = std::move(message)});
    return State::Halted;
}

// ============================================================================
// Character Classes
// ============================================================================

auto Lexer::is_space(char32_t r) -> bool {
    return r == ' ' || r == '\t' || is_end_of_line(r);
}

auto Lexer::is_end_of_line(char32_t r) -> bool {
    return r == '\r' || r == '\n';
}

auto Lexer::is_digit(char32_t r) -> bool {
    return r >= '0' && r <= '9';
}

auto Lexer::is_alpha_numeric(char32_t r) -> bool {
    if (r < 0x80) {
        return (r >= 'a' && r <= 'z') || (r >= 'A' && r <= 'Z') || r == '_' || is_digit(r);
    }
    if (r == EOF_RUNE || r == 0xFFFD || r > 0x10FFFF) {
        return false;
    }
    // Letters (Lu, Ll, Lt, Lm, Lo) and decimal digits (Nd).
    auto category = U_GET_GC_MASK(static_cast<UChar32>(r));
    return (category & (U_GC_L_MASK | U_GC_ND_MASK)) != 0;
}

auto Lexer::describe_rune(char32_t r) -> std::string {
    if (r == EOF_RUNE) {
        return "EOF";
    }
    char code[16];
    std::snprintf(code, sizeof(code), "U+%04X", static_cast<unsigned>(r));
    std::string out = code;
    out += " '";
    append_utf8(out, r);
    out += "'";
    return out;
}

} // namespace sml::lexer
