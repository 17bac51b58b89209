//! # Kite AST
//!
//! Expression tree produced by the parser. Every construct in kite is an
//! expression: loops evaluate to lists, `var` evaluates to the bound value,
//! and `fun` evaluates to the function.
//!
//! ## Node Kinds
//!
//! | Node            | Example                             |
//! |-----------------|-------------------------------------|
//! | `NumberExpr`    | `42`, `3.14`                        |
//! | `StringExpr`    | `"hi"`                              |
//! | `ListExpr`      | `[1, 2, 3]`                         |
//! | `VarAccessExpr` | `x`                                 |
//! | `VarAssignExpr` | `var x = 1`                         |
//! | `UnaryExpr`     | `-x`, `!x`                          |
//! | `BinaryExpr`    | `a + b`, `a && b`                   |
//! | `IfExpr`        | `if c then a elif d then b else e`  |
//! | `ForExpr`       | `for i = 0 to 10 step 2 then i`     |
//! | `WhileExpr`     | `while c then body`                 |
//! | `FuncDefExpr`   | `fun add(a, b) -> a + b`            |
//! | `CallExpr`      | `add(1, 2)`                         |
//!
//! Children are owned through `ExprPtr`. Function bodies are the exception:
//! they are held by `Rc` so that function values can share them after the
//! tree that defined them is gone.

#ifndef KITE_PARSER_AST_HPP
#define KITE_PARSER_AST_HPP

#include "kite/common.hpp"
#include "kite/lexer/position.hpp"
#include "kite/lexer/token.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace kite::parser {

struct Expr;

/// Owned pointer to an expression node.
using ExprPtr = Box<Expr>;

/// Shared, immutable expression (function bodies).
using SharedExpr = Rc<const Expr>;

// ============================================================================
// Operators
// ============================================================================

enum class UnaryOp {
    Neg, ///< `-x`
    Pos, ///< `+x`
    Not, ///< `!x`
};

enum class BinaryOp {
    // Arithmetic
    Add, ///< `+`
    Sub, ///< `-`
    Mul, ///< `*`
    Div, ///< `/`
    Pow, ///< `**`

    // Comparison
    Eq, ///< `==`
    Ne, ///< `!=`
    Lt, ///< `<`
    Gt, ///< `>`
    Le, ///< `<=`
    Ge, ///< `>=`

    // Logical
    And, ///< `&&`
    Or,  ///< `||`
};

[[nodiscard]] auto unary_op_to_string(UnaryOp op) -> std::string_view;
[[nodiscard]] auto binary_op_to_string(BinaryOp op) -> std::string_view;

// ============================================================================
// Literals and Names
// ============================================================================

/// Numeric literal. `is_float` is set when the literal text contains a `.`.
struct NumberExpr {
    std::string text;
    bool is_float;
    SourceSpan span;
};

struct StringExpr {
    std::string value;
    SourceSpan span;
};

struct ListExpr {
    std::vector<ExprPtr> elements;
    SourceSpan span;
};

struct VarAccessExpr {
    std::string name;
    SourceSpan span;
};

/// `var name = value`. Always binds in the current environment.
struct VarAssignExpr {
    std::string name;
    ExprPtr value;
    SourceSpan span;
};

// ============================================================================
// Operators
// ============================================================================

struct UnaryExpr {
    UnaryOp op;
    ExprPtr operand;
    SourceSpan span;
};

struct BinaryExpr {
    BinaryOp op;
    ExprPtr left;
    ExprPtr right;
    SourceSpan span;
};

// ============================================================================
// Control Flow
// ============================================================================

/// One `if`/`elif` arm.
struct IfCase {
    ExprPtr condition;
    ExprPtr body;
};

struct IfExpr {
    std::vector<IfCase> cases; ///< At least one.
    ExprPtr else_body;         ///< Null without `else`.
    SourceSpan span;
};

struct ForExpr {
    std::string var_name;
    ExprPtr start;
    ExprPtr end;
    ExprPtr step; ///< Null when no `step` clause.
    ExprPtr body;
    SourceSpan span;
};

struct WhileExpr {
    ExprPtr condition;
    ExprPtr body;
    SourceSpan span;
};

// ============================================================================
// Functions
// ============================================================================

/// `fun name(a, b) -> body`. The name is optional.
struct FuncDefExpr {
    std::optional<std::string> name;
    std::vector<std::string> params;
    SharedExpr body;
    SourceSpan span;
};

struct CallExpr {
    ExprPtr callee;
    std::vector<ExprPtr> args;
    SourceSpan span;
};

// ============================================================================
// Expression
// ============================================================================

struct Expr {
    std::variant<NumberExpr, StringExpr, ListExpr, VarAccessExpr, VarAssignExpr, UnaryExpr,
                 BinaryExpr, IfExpr, ForExpr, WhileExpr, FuncDefExpr, CallExpr>
        kind;
    SourceSpan span;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    /// Gets this expression as kind `T`. Throws if not that kind.
    template <typename T> [[nodiscard]] auto as() -> T& {
        if (!is<T>()) {
            throw std::bad_variant_access();
        }
        return std::get<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T& {
        if (!is<T>()) {
            throw std::bad_variant_access();
        }
        return std::get<T>(kind);
    }
};

/// Wraps a node into an `ExprPtr`, copying the node's span onto the expression.
template <typename T> [[nodiscard]] auto make_expr(T node) -> ExprPtr {
    SourceSpan span = node.span;
    return make_box<Expr>(Expr{.kind = std::move(node), .span = std::move(span)});
}

/// Renders an expression as a compact, fully parenthesized string.
///
/// Used by tests and trace logging, e.g. `(1 + (2 * 3))`.
[[nodiscard]] auto dump_expr(const Expr& expr) -> std::string;

} // namespace kite::parser

#endif // KITE_PARSER_AST_HPP
