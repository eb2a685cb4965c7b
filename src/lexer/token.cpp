//! # Token Utilities
//!
//! Token kind names, the keyword table, and the diagnostic rendering of
//! tokens.

#include "lexer/token.hpp"

#include <unordered_map>

namespace sml::lexer {

namespace {

// Process-wide keyword table; read-only after static initialization.
const std::unordered_map<std::string_view, TokenKind> KEYWORDS = {
    {"rect", TokenKind::KwRect},
};

} // namespace

auto quote_literal(std::string_view text) -> std::string {
    std::string out = "\"";
    for (char c : text) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            out += c;
        }
    }
    out += '"';
    return out;
}

auto token_kind_to_string(TokenKind kind) -> std::string_view {
    switch (kind) {
    case TokenKind::Error:
        return "error";
    case TokenKind::Bool:
        return "boolean";
    case TokenKind::Complex:
        return "complex number";
    case TokenKind::Eof:
        return "end of input";
    case TokenKind::Identifier:
        return "identifier";
    case TokenKind::LParen:
        return "left paren";
    case TokenKind::Number:
        return "number";
    case TokenKind::RParen:
        return "right paren";
    case TokenKind::Space:
        return "space";
    case TokenKind::String:
        return "string";
    case TokenKind::Diff:
        return "diff";
    case TokenKind::Intersection:
        return "intersection";
    case TokenKind::Union:
        return "union";
    case TokenKind::Location:
        return "location";
    case TokenKind::Keyword:
        return "keyword";
    case TokenKind::KwRect:
        return "rect";
    }
    return "unknown";
}

auto lookup_keyword(std::string_view ident) -> std::optional<TokenKind> {
    auto it = KEYWORDS.find(ident);
    if (it == KEYWORDS.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto Token::to_string() const -> std::string {
    if (kind == TokenKind::Eof) {
        return "EOF";
    }
    if (kind == TokenKind::Error) {
        return text;
    }
    if (is_keyword(kind)) {
        return "<" + text + ">";
    }
    if (text.size() > 10) {
        return quote_literal(std::string_view(text).substr(0, 10)) + "...";
    }
    return quote_literal(text);
}

auto operator<<(std::ostream& os, const Token& token) -> std::ostream& {
    return os << token.to_string();
}

} // namespace sml::lexer
