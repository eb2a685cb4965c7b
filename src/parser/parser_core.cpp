//! # Parser Core
//!
//! Token navigation and error construction for the SML parser.
//!
//! ## Token Navigation
//!
//! | Method      | Description                                   |
//! |-------------|-----------------------------------------------|
//! | `peek()`    | Current significant token, fetched on demand  |
//! | `advance()` | Consume and return the current token          |
//! | `check()`   | Test the current token's kind                 |
//! | `match()`   | Consume the current token if it matches       |
//!
//! The parser holds exactly one token of lookahead. `Space` tokens are
//! dropped as they are fetched. Cancellation is checked on every fetch and
//! shows up as an `Error` token carrying `operation cancelled`.

#include "log/log.hpp"
#include "parser/parser.hpp"

#include <sstream>

namespace sml::parser {

using lexer::Token;
using lexer::TokenKind;

auto ParseError::to_string() const -> std::string {
    std::ostringstream out;
    out << document << ":";
    if (line != 0) {
        out << line << ":" << column << ":";
    }
    out << " " << message;
    return out.str();
}

auto operator<<(std::ostream& os, const ParseError& error) -> std::ostream& {
    return os << error.to_string();
}

Parser::Parser(const lexer::Source& source, lexer::TokenSource& tokens,
               const CancellationToken* cancel)
    : source_(source), tokens_(tokens), cancel_(cancel) {}

auto Parser::parse() -> Result<NodePtr, ParseError> {
    SML_LOG_DEBUG("parser", "parsing " << source_.name());

    auto root = parse_expression();
    if (is_err(root)) {
        SML_LOG_DEBUG("parser", unwrap_err(root).to_string());
        return root;
    }

    const auto& token = peek();
    if (!token.is_eof()) {
        auto error = unexpected(token, "after expression");
        SML_LOG_DEBUG("parser", error.to_string());
        return error;
    }

    SML_LOG_DEBUG("parser", "parsed " << source_.name() << ": "
                                      << node_type_to_string(unwrap(root)->type()) << " root");
    return root;
}

// ============================================================================
// Token Navigation
// ============================================================================

auto Parser::fetch() -> Token {
    for (;;) {
        if (cancel_ && cancel_->is_cancelled()) {
            return Token{.kind = TokenKind::Error, .pos = last_pos_, .text = CANCELLED_MESSAGE};
        }
        auto token = tokens_.next();
        if (!token) {
            return Token{.kind = TokenKind::Error,
                         .pos = last_pos_,
                         .text = "token stream ended without end of input"};
        }
        last_pos_ = token->pos;
        if (token->is(TokenKind::Space)) {
            continue;
        }
        return std::move(*token);
    }
}

auto Parser::peek() -> const Token& {
    if (!lookahead_) {
        lookahead_ = fetch();
    }
    return *lookahead_;
}

auto Parser::advance() -> Token {
    if (!lookahead_) {
        lookahead_ = fetch();
    }
    Token token = std::move(*lookahead_);
    lookahead_.reset();
    return token;
}

auto Parser::check(TokenKind kind) -> bool {
    return peek().is(kind);
}

auto Parser::match(TokenKind kind) -> bool {
    if (check(kind)) {
        advance();
        return true;
    }
    return false;
}

// ============================================================================
// Errors
// ============================================================================

auto Parser::make_error(std::string message, Pos pos) const -> ParseError {
    auto loc = source_.location(pos);
    return ParseError{.message = std::move(message),
                      .pos = pos,
                      .line = loc.line,
                      .column = loc.column,
                      .document = std::string(source_.name())};
}

auto Parser::unexpected(const Token& token, std::string_view context) const -> ParseError {
    if (token.is_error()) {
        return make_error(token.text, token.pos);
    }
    return make_error("unexpected " + token.to_string() + " " + std::string(context), token.pos);
}

// ============================================================================
// Token Classes
// ============================================================================

auto Parser::is_ident_start(const Token& token) -> bool {
    return token.is(TokenKind::Identifier) || lexer::is_keyword(token.kind);
}

auto Parser::is_param_start(const Token& token) -> bool {
    return token.is_one_of({TokenKind::Number, TokenKind::Complex, TokenKind::LParen}) ||
           is_ident_start(token);
}

auto Parser::token_to_binary_op(TokenKind kind) -> std::optional<BinaryOp> {
    switch (kind) {
    case TokenKind::Diff:
        return BinaryOp::Diff;
    case TokenKind::Intersection:
        return BinaryOp::Intersection;
    case TokenKind::Union:
        return BinaryOp::Union;
    default:
        return std::nullopt;
    }
}

} // namespace sml::parser
