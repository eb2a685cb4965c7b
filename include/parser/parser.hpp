//! # SML Parser
//!
//! Recursive-descent parser that consumes a token stream and builds one
//! expression tree.
//!
//! ## Grammar
//!
//! ```text
//! expression := term ( UNION term )*
//! term       := factor ( (INTERSECTION | DIFF) factor )*
//! factor     := NUMBER | object | LEFTPAREN expression RIGHTPAREN
//! object     := IDENTIFIER param* (LOCATION param*)?
//! param      := NUMBER | IDENTIFIER | LEFTPAREN expression RIGHTPAREN
//! ```
//!
//! Operators of one level fold to the left: `a - b && c` is
//! `(a - b) && c`. Space tokens are skipped between grammatic units, and
//! keywords such as `rect` are plain identifiers here.
//!
//! ## Errors
//!
//! The first error aborts the parse; no partial tree is returned. A scan
//! error reaches the parser as an `Error` token and is reported with its
//! message unchanged.

#ifndef SML_PARSER_PARSER_HPP
#define SML_PARSER_PARSER_HPP

#include "common.hpp"
#include "lexer/lexer.hpp"
#include "parser/ast.hpp"

#include <optional>
#include <string>

namespace sml::parser {

/// Maximum nesting of parentheses.
constexpr size_t MAX_NESTING_DEPTH = 1000;

// Parser error
struct ParseError {
    std::string message;
    Pos pos;
    uint32_t line = 0;   ///< 1-based; 0 when the error has no location.
    uint32_t column = 0; ///< 1-based, in bytes.
    std::string document;

    /// Renders `document:line:column: message`, or `document: message`
    /// for errors without a location.
    [[nodiscard]] auto to_string() const -> std::string;
};

auto operator<<(std::ostream& os, const ParseError& error) -> std::ostream&;

// Parser for one SML document
class Parser {
public:
    /// `source` is used for error locations; `tokens` must scan the same
    /// source. Both must outlive the parser.
    Parser(const lexer::Source& source, lexer::TokenSource& tokens,
           const CancellationToken* cancel = nullptr);

    /// Parses one expression followed by the end of input.
    [[nodiscard]] auto parse() -> Result<NodePtr, ParseError>;

private:
    const lexer::Source& source_;
    lexer::TokenSource& tokens_;
    const CancellationToken* cancel_;
    std::optional<lexer::Token> lookahead_;
    Pos last_pos_ = 0;

    size_t depth_ = 0; ///< Current nesting of parse_expression calls.

    // Token navigation
    [[nodiscard]] auto peek() -> const lexer::Token&;
    auto advance() -> lexer::Token;
    [[nodiscard]] auto check(lexer::TokenKind kind) -> bool;
    auto match(lexer::TokenKind kind) -> bool;
    [[nodiscard]] auto fetch() -> lexer::Token;

    // Error helpers
    [[nodiscard]] auto make_error(std::string message, Pos pos) const -> ParseError;
    [[nodiscard]] auto unexpected(const lexer::Token& token, std::string_view context) const
        -> ParseError;

    // Grammar
    auto parse_expression() -> Result<NodePtr, ParseError>;
    auto parse_term() -> Result<NodePtr, ParseError>;
    auto parse_factor() -> Result<NodePtr, ParseError>;
    auto parse_group() -> Result<NodePtr, ParseError>;
    auto parse_object() -> Result<NodePtr, ParseError>;
    auto parse_params(std::vector<NodePtr>& out) -> std::optional<ParseError>;
    auto parse_param() -> Result<NodePtr, ParseError>;
    auto parse_number() -> Result<NodePtr, ParseError>;

    [[nodiscard]] static auto fold(BinaryOp op, NodePtr left, NodePtr right) -> NodePtr;

    [[nodiscard]] static auto is_ident_start(const lexer::Token& token) -> bool;
    [[nodiscard]] static auto is_param_start(const lexer::Token& token) -> bool;
    [[nodiscard]] static auto token_to_binary_op(lexer::TokenKind kind) -> std::optional<BinaryOp>;
};

} // namespace sml::parser

#endif // SML_PARSER_PARSER_HPP
