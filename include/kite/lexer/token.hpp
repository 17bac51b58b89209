//! # Token Definitions
//!
//! Token kinds produced by the kite lexer.
//!
//! ## Overview
//!
//! - **Literals**: integers, floats, strings
//! - **Names**: identifiers and keywords
//! - **Operators**: arithmetic, comparison, assignment, arrow
//! - **Delimiters**: parentheses, square brackets, comma
//!
//! Keywords share the single `Keyword` kind and carry their text as the token
//! value. The logical operators `&&`, `||` and `!` are keywords too, so the
//! parser matches them with `Token::matches(TokenKind::Keyword, "&&")`.

#ifndef KITE_LEXER_TOKEN_HPP
#define KITE_LEXER_TOKEN_HPP

#include "kite/common.hpp"
#include "kite/lexer/position.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace kite::lexer {

/// All token kinds. Closed set.
enum class TokenKind : uint8_t {
    Int,        ///< `42`
    Float,      ///< `3.14`, `.5`, `2.`
    String,     ///< `"text"` (escapes already processed)
    Identifier, ///< `foo`, `_bar1`
    Keyword,    ///< `var`, `if`, ..., `&&`, `||`, `!`
    Plus,       ///< `+`
    Minus,      ///< `-`
    Mul,        ///< `*`
    Div,        ///< `/`
    Pow,        ///< `**`
    Eq,         ///< `=`
    LParen,     ///< `(`
    RParen,     ///< `)`
    LSquare,    ///< `[`
    RSquare,    ///< `]`
    EE,         ///< `==`
    NE,         ///< `!=`
    LT,         ///< `<`
    GT,         ///< `>`
    LTE,        ///< `<=`
    GTE,        ///< `>=`
    Comma,      ///< `,`
    Arrow,      ///< `->`
    Eof,        ///< End of input
};

/// Upper-case kind name used in token dumps (e.g. "INT", "LSQUARE").
[[nodiscard]] auto token_kind_to_string(TokenKind kind) -> std::string_view;

/// Returns true if `text` is a reserved word.
[[nodiscard]] auto is_keyword(std::string_view text) -> bool;

/// A lexical token.
///
/// `value` holds the literal text of numbers, the unescaped contents of
/// strings, and the text of identifiers and keywords. Punctuation tokens
/// have no value.
struct Token {
    TokenKind kind;
    std::optional<std::string> value;
    SourceSpan span;

    [[nodiscard]] auto is(TokenKind k) const -> bool {
        return kind == k;
    }

    /// Checks both kind and value, e.g. `matches(TokenKind::Keyword, "then")`.
    [[nodiscard]] auto matches(TokenKind k, std::string_view text) const -> bool {
        return kind == k && value && *value == text;
    }

    [[nodiscard]] auto is_eof() const -> bool {
        return kind == TokenKind::Eof;
    }

    /// The value text, or an empty string for punctuation.
    [[nodiscard]] auto text() const -> const std::string&;

    /// `KIND` or `KIND:value`.
    [[nodiscard]] auto to_string() const -> std::string;
};

} // namespace kite::lexer

#endif // KITE_LEXER_TOKEN_HPP
