//! # Kite Lexer
//!
//! Converts source text into a flat token sequence for the parser.
//!
//! ## Scanning Rules
//!
//! - Spaces, tabs and newlines separate tokens and are dropped
//! - Digits and `.` form a number; a second `.` ends the literal
//! - Letters and `_` start an identifier; reserved words become keywords
//! - `"..."` strings understand `\n`, `\t`, and `\x` for any other `x`
//! - An unterminated string runs to the end of the input
//!
//! Lexing stops at the first character that starts no token and reports it as
//! an `IllegalCharacter` error.
//!
//! ## Example
//!
//! ```cpp
//! auto source = make_rc<const Source>(Source::from_string("var x = 42", "<stdin>"));
//! Lexer lexer(source);
//! auto result = lexer.tokenize();
//! if (is_ok(result)) {
//!     for (const auto& token : unwrap(result)) {
//!         std::cout << token.to_string() << "\n";
//!     }
//! }
//! ```

#ifndef KITE_LEXER_LEXER_HPP
#define KITE_LEXER_LEXER_HPP

#include "kite/common.hpp"
#include "kite/error.hpp"
#include "kite/lexer/position.hpp"
#include "kite/lexer/source.hpp"
#include "kite/lexer/token.hpp"

#include <vector>

namespace kite::lexer {

class Lexer {
public:
    explicit Lexer(Rc<const Source> source);

    /// Tokenizes the entire source.
    ///
    /// On success the vector ends with exactly one `Eof` token.
    [[nodiscard]] auto tokenize() -> Result<std::vector<Token>, Error>;

private:
    // ========================================================================
    // State
    // ========================================================================

    Rc<const Source> source_; ///< Source being lexed.
    Position pos_;            ///< Position of the current character.
    Position token_start_;    ///< Start of the token being built.

    // ========================================================================
    // Character Access
    // ========================================================================

    /// Returns the current character, or '\0' at the end.
    [[nodiscard]] auto peek() const -> char;

    [[nodiscard]] auto is_at_end() const -> bool;

    /// Consumes and returns the current character.
    auto advance() -> char;

    // ========================================================================
    // Token Creation
    // ========================================================================

    /// Creates a token spanning `token_start_` to the current position.
    [[nodiscard]] auto make_token(TokenKind kind) const -> Token;
    [[nodiscard]] auto make_token(TokenKind kind, std::string value) const -> Token;

    // ========================================================================
    // Token Lexers
    // ========================================================================

    [[nodiscard]] auto lex_number() -> Token;
    [[nodiscard]] auto lex_identifier() -> Token;
    [[nodiscard]] auto lex_string() -> Token;

    /// Lexes an operator or punctuation, or reports an illegal character.
    [[nodiscard]] auto lex_operator() -> Result<Token, Error>;

    [[nodiscard]] static auto is_digit(char c) -> bool;
    [[nodiscard]] static auto is_identifier_start(char c) -> bool;
    [[nodiscard]] static auto is_identifier_continue(char c) -> bool;
};

/// Convenience wrapper: lexes `text` under `source_name`.
[[nodiscard]] auto tokenize(std::string source_name, std::string text)
    -> Result<std::vector<Token>, Error>;

} // namespace kite::lexer

#endif // KITE_LEXER_LEXER_HPP
