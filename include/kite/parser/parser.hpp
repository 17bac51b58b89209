//! # Kite Parser
//!
//! Recursive-descent parser with one token of lookahead.
//!
//! ## Grammar
//!
//! ```text
//! expr       := 'var' IDENT '=' expr
//!             | comp_expr (('&&' | '||') comp_expr)*
//! comp_expr  := '!' comp_expr | arith_expr (('==' | '!=' | '<' | '>' | '<=' | '>=') arith_expr)*
//! arith_expr := term (('+' | '-') term)*
//! term       := factor (('*' | '/') factor)*
//! factor     := ('+' | '-') factor | power
//! power      := call ('**' factor)*
//! call       := atom ('(' (expr (',' expr)*)? ')')?
//! atom       := INT | FLOAT | STRING | IDENT | '(' expr ')'
//!             | list_expr | if_expr | for_expr | while_expr | func_def
//! ```
//!
//! Every binary tier goes through `bin_op()`, a left-associative loop
//! parameterized by the operand parsers and the operator table.
//!
//! ## Error Selection
//!
//! The parser stops at the first error. Rules that can fail in several ways
//! (`expr`, `comp_expr`, list elements, call arguments) replace a nested error
//! with their own, broader message only when no token was consumed since the
//! rule's checkpoint. Errors from a deeper partial parse win.

#ifndef KITE_PARSER_PARSER_HPP
#define KITE_PARSER_PARSER_HPP

#include "kite/common.hpp"
#include "kite/error.hpp"
#include "kite/lexer/token.hpp"
#include "kite/parser/ast.hpp"

#include <initializer_list>
#include <string_view>
#include <vector>

namespace kite::parser {

using ParseResult = Result<ExprPtr, Error>;

class Parser {
public:
    /// `tokens` must end with an `Eof` token.
    explicit Parser(std::vector<lexer::Token> tokens);

    /// Parses one expression that must extend to the end of the input.
    [[nodiscard]] auto parse() -> ParseResult;

private:
    std::vector<lexer::Token> tokens_;
    size_t pos_ = 0;

    /// Operand parser used by `bin_op()`.
    using RuleFn = auto (Parser::*)() -> ParseResult;

    /// A binary operator accepted at one precedence tier.
    struct OpEntry {
        lexer::TokenKind kind;
        std::string_view keyword; ///< Non-empty for keyword operators (`&&`, `||`).
        BinaryOp op;
    };

    // ========================================================================
    // Token Access
    // ========================================================================

    [[nodiscard]] auto peek() const -> const lexer::Token&;
    auto advance() -> const lexer::Token&;
    [[nodiscard]] auto check(lexer::TokenKind kind) const -> bool;
    [[nodiscard]] auto check_keyword(std::string_view keyword) const -> bool;

    /// An InvalidSyntax error at the current token.
    [[nodiscard]] auto error_here(std::string message) const -> Error;

    /// Replaces the error in `result` with `message` if nothing was consumed
    /// since `checkpoint`.
    [[nodiscard]] auto widen_error(ParseResult result, size_t checkpoint,
                                   std::string_view message) const -> ParseResult;

    // ========================================================================
    // Expression Parsing
    // ========================================================================

    auto parse_expr() -> ParseResult;
    auto parse_comp_expr() -> ParseResult;
    auto parse_arith_expr() -> ParseResult;
    auto parse_term() -> ParseResult;
    auto parse_factor() -> ParseResult;
    auto parse_power() -> ParseResult;
    auto parse_call() -> ParseResult;
    auto parse_atom() -> ParseResult;
    auto parse_list_expr() -> ParseResult;

    /// Left-associative binary tier: `left (op right)*`.
    ///
    /// `right` defaults to `left` when null.
    auto bin_op(RuleFn left, std::initializer_list<OpEntry> ops, RuleFn right = nullptr)
        -> ParseResult;

    // ========================================================================
    // Control Flow and Functions
    // ========================================================================

    auto parse_if_expr() -> ParseResult;
    auto parse_for_expr() -> ParseResult;
    auto parse_while_expr() -> ParseResult;
    auto parse_func_def() -> ParseResult;
};

/// Convenience wrapper: parses a token vector.
[[nodiscard]] auto parse(std::vector<lexer::Token> tokens) -> ParseResult;

} // namespace kite::parser

#endif // KITE_PARSER_PARSER_HPP
