//! # SML Scanner
//!
//! This module implements the character-level scanner that turns SML
//! source text into a stream of tokens.
//!
//! ## State Machine
//!
//! The scanner is a state machine. Each state is a member function that
//! consumes input, emits zero or more tokens, and returns the next state:
//!
//! | State          | Consumes                                        |
//! |----------------|-------------------------------------------------|
//! | `Base`         | dispatches on the next rune                     |
//! | `LineComment`  | `// ...` up to and including the newline       |
//! | `BlockComment` | `/* ... */`                                     |
//! | `Space`        | a maximal run of whitespace                     |
//! | `Identifier`   | letters, digits and underscores                 |
//! | `Number`       | signed, hex, fractional, exponent, imaginary    |
//! | `Quote`        | a double-quoted string with `\` escapes        |
//!
//! The machine halts after emitting `Eof` or an `Error` token; no token
//! follows either of them.
//!
//! ## Token Stream
//!
//! `Lexer` is a pull-based `TokenSource`: each `next()` runs the machine
//! until at least one token is pending. `ConcurrentTokenStream` (see
//! `token_stream.hpp`) runs the same machine on its own thread.
//!
//! ## Example
//!
//! ```cpp
//! Source source = Source::from_string("rect 1 2 @ 3 4");
//! Lexer lexer(source);
//! while (auto token = lexer.next()) {
//!     std::cout << *token << "\n";
//! }
//! ```

#ifndef SML_LEXER_LEXER_HPP
#define SML_LEXER_LEXER_HPP

#include "common.hpp"
#include "lexer/source.hpp"
#include "lexer/token.hpp"

#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace sml::lexer {

/// An error encountered during scanning.
struct LexerError {
    std::string message; ///< Human-readable error description.
    Pos pos;             ///< Start of the token being scanned.
};

/// A producer of tokens.
///
/// Implementations deliver tokens in strictly increasing position order and
/// end with exactly one `Eof` or `Error` token, after which `next()`
/// returns `std::nullopt`.
class TokenSource {
public:
    virtual ~TokenSource() = default;

    /// Returns the next token, or `std::nullopt` once the stream has ended.
    [[nodiscard]] virtual auto next() -> std::optional<Token> = 0;
};

/// Synchronous scanner for one SML document.
class Lexer : public TokenSource {
public:
    /// Constructs a scanner for the given source. The source must outlive
    /// the scanner.
    explicit Lexer(const Source& source);

    [[nodiscard]] auto next() -> std::optional<Token> override;

    /// Scans the whole remaining input. The last token is `Eof` or `Error`.
    [[nodiscard]] auto tokenize() -> std::vector<Token>;

    /// Returns true once the machine has stopped.
    [[nodiscard]] auto halted() const -> bool {
        return state_ == State::Halted;
    }

    [[nodiscard]] auto errors() const -> const std::vector<LexerError>& {
        return errors_;
    }

    /// Line (1-based) of the most recently returned token.
    [[nodiscard]] auto line_number() const -> uint32_t;

private:
    enum class State {
        Base,
        LineComment,
        BlockComment,
        Space,
        Identifier,
        Number,
        Quote,
        Halted,
    };

    static constexpr char32_t EOF_RUNE = static_cast<char32_t>(-1);

    const Source& source_;
    State state_ = State::Base;
    size_t pos_ = 0;      ///< Current position in the input.
    size_t start_ = 0;    ///< Start position of the pending token.
    size_t width_ = 0;    ///< Width of the last rune read.
    Pos last_pos_ = 0;    ///< Position of the most recently returned token.
    int paren_depth_ = 0; ///< Nesting depth of ( ) groups.
    std::deque<Token> pending_;
    std::vector<LexerError> errors_;

    // ========================================================================
    // Rune Access
    // ========================================================================

    /// Consumes and returns the next rune, or EOF_RUNE.
    auto next_rune() -> char32_t;

    /// Returns but does not consume the next rune.
    [[nodiscard]] auto peek() -> char32_t;

    /// Steps back one rune. Can only be called once per call of next_rune.
    void backup();

    /// Consumes the next rune if it is in `valid`.
    auto accept(std::string_view valid) -> bool;

    /// Consumes a run of runes from `valid`, returning how many were taken.
    auto accept_run(std::string_view valid) -> size_t;

    // ========================================================================
    // Emission
    // ========================================================================

    /// Queues a token spanning [start_, pos_).
    void emit(TokenKind kind);

    /// Skips over the pending input before this point.
    void ignore();

    /// Queues an error token and halts the machine.
    [[nodiscard]] auto error(std::string message) -> State;

    // ========================================================================
    // States
    // ========================================================================

    [[nodiscard]] auto step(State state) -> State;
    [[nodiscard]] auto lex_base() -> State;
    [[nodiscard]] auto lex_line_comment() -> State;
    [[nodiscard]] auto lex_block_comment() -> State;
    [[nodiscard]] auto lex_space() -> State;
    [[nodiscard]] auto lex_identifier() -> State;
    [[nodiscard]] auto lex_number() -> State;
    [[nodiscard]] auto lex_quote() -> State;

    /// Scans one numeral; false if it is malformed.
    [[nodiscard]] auto scan_number() -> bool;

    /// Reports whether the input is at a valid character to follow an
    /// identifier.
    [[nodiscard]] auto at_terminator() -> bool;

    // ========================================================================
    // Character Classes
    // ========================================================================

    [[nodiscard]] static auto is_space(char32_t r) -> bool;
    [[nodiscard]] static auto is_end_of_line(char32_t r) -> bool;
    [[nodiscard]] static auto is_alpha_numeric(char32_t r) -> bool;
    [[nodiscard]] static auto is_digit(char32_t r) -> bool;

    /// Formats a rune as `U+0029 ')'` for error messages.
    [[nodiscard]] static auto describe_rune(char32_t r) -> std::string;
};

} // namespace sml::lexer

#endif // SML_LEXER_LEXER_HPP
