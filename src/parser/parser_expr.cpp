//! # Parser - Expressions
//!
//! The grammar rules, one method each. Binary operators are folded to the
//! left as they are read:
//!
//! ```text
//! a - b && c || d   =>   ((a - b) && c) || d
//! ```
//!
//! Only parentheses make the parser recurse, so their nesting is capped at
//! `MAX_NESTING_DEPTH`. Operator chains of any length fold in a loop.

#include "parser/parser.hpp"

namespace sml::parser {

using lexer::Token;
using lexer::TokenKind;

namespace {

constexpr const char* TOO_DEEP = "expression nested too deeply";

struct DepthGuard {
    size_t& depth;

    explicit DepthGuard(size_t& d) : depth(d) {
        ++depth;
    }

    ~DepthGuard() {
        --depth;
    }
};

} // namespace

auto Parser::parse_expression() -> Result<NodePtr, ParseError> {
    DepthGuard guard(depth_);
    if (depth_ > MAX_NESTING_DEPTH) {
        return make_error(TOO_DEEP, peek().pos);
    }

    auto left = parse_term();
    if (is_err(left)) {
        return left;
    }
    NodePtr node = std::move(unwrap(left));

    while (match(TokenKind::Union)) {
        auto right = parse_term();
        if (is_err(right)) {
            return right;
        }
        node = fold(BinaryOp::Union, std::move(node), std::move(unwrap(right)));
    }
    return node;
}

auto Parser::parse_term() -> Result<NodePtr, ParseError> {
    auto left = parse_factor();
    if (is_err(left)) {
        return left;
    }
    NodePtr node = std::move(unwrap(left));

    for (;;) {
        auto op = token_to_binary_op(peek().kind);
        if (!op || *op == BinaryOp::Union) {
            break;
        }
        advance();

        auto right = parse_factor();
        if (is_err(right)) {
            return right;
        }
        node = fold(*op, std::move(node), std::move(unwrap(right)));
    }
    return node;
}

/// A binary node sits at the position of its left operand.
auto Parser::fold(BinaryOp op, NodePtr left, NodePtr right) -> NodePtr {
    Pos pos = left->pos;
    return make_binary(op, std::move(left), std::move(right), pos);
}

auto Parser::parse_factor() -> Result<NodePtr, ParseError> {
    const auto& token = peek();
    if (token.is_one_of({TokenKind::Number, TokenKind::Complex})) {
        return parse_number();
    }
    if (is_ident_start(token)) {
        return parse_object();
    }
    if (token.is(TokenKind::LParen)) {
        return parse_group();
    }
    return unexpected(token, "in expression");
}

/// `( expression )`. Parentheses only group; they add no node.
auto Parser::parse_group() -> Result<NodePtr, ParseError> {
    Token open = advance();

    auto inner = parse_expression();
    if (is_err(inner)) {
        return inner;
    }

    const auto& token = peek();
    if (token.is_error()) {
        return unexpected(token, "");
    }
    if (token.is_eof()) {
        return make_error("unclosed left paren: expected right paren, found EOF", open.pos);
    }
    if (!token.is(TokenKind::RParen)) {
        return make_error("expected right paren, found " + token.to_string(), token.pos);
    }
    advance();
    return inner;
}

auto Parser::parse_object() -> Result<NodePtr, ParseError> {
    Token ident = advance();

    std::vector<NodePtr> params;
    std::vector<NodePtr> location_params;

    if (auto error = parse_params(params)) {
        return *error;
    }
    if (match(TokenKind::Location)) {
        if (auto error = parse_params(location_params)) {
            return *error;
        }
    }
    return make_object(ident.pos, std::move(ident.text), std::move(params),
                       std::move(location_params));
}

auto Parser::parse_params(std::vector<NodePtr>& out) -> std::optional<ParseError> {
    while (is_param_start(peek())) {
        auto param = parse_param();
        if (is_err(param)) {
            return std::move(unwrap_err(param));
        }
        out.push_back(std::move(unwrap(param)));
    }
    return std::nullopt;
}

auto Parser::parse_param() -> Result<NodePtr, ParseError> {
    const auto& token = peek();
    if (token.is_one_of({TokenKind::Number, TokenKind::Complex})) {
        return parse_number();
    }
    if (token.is(TokenKind::LParen)) {
        return parse_group();
    }
    if (is_ident_start(token)) {
        Token ident = advance();
        return make_object(ident.pos, std::move(ident.text));
    }
    return unexpected(token, "in parameter list");
}

auto Parser::parse_number() -> Result<NodePtr, ParseError> {
    Token token = advance();
    auto number = make_number(token.pos, std::move(token.text), token.kind);
    if (is_err(number)) {
        return make_error(std::move(unwrap_err(number)), token.pos);
    }
    return std::move(unwrap(number));
}

} // namespace sml::parser
