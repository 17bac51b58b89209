//! # Tree-Walking Interpreter
//!
//! Evaluates an AST against a chain of environments.
//!
//! ## Evaluation Rules
//!
//! - Numbers, strings and lists build fresh values tagged with their span
//! - Variable reads return a retagged copy of the bound value
//! - `var` binds in the current environment and yields the bound value
//! - `if` evaluates conditions in order and runs only the first truthy arm
//! - `for` and `while` yield a list of the body's results
//! - `for` writes its counter into the current environment, so the counter
//!   stays visible after the loop with the first value that failed the test
//! - Calls check arity strictly, then run the body in a fresh environment
//!   whose parent is the function's defining environment
//! - Every environment a call creates belongs to the interpreter's arena
//!
//! Errors abort evaluation immediately and carry a traceback of the active
//! contexts.

#ifndef KITE_INTERP_INTERPRETER_HPP
#define KITE_INTERP_INTERPRETER_HPP

#include "kite/common.hpp"
#include "kite/error.hpp"
#include "kite/interp/context.hpp"
#include "kite/interp/environment.hpp"
#include "kite/interp/value.hpp"
#include "kite/parser/ast.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace kite::interp {

using EvalResult = Result<ValuePtr, Error>;

/// Where an expression is evaluated: its scope and its call-stack frame.
struct Frame {
    EnvPtr env;
    ContextPtr context;
};

class Interpreter {
public:
    Interpreter() = default;

    /// Evaluates `expr` in `frame`.
    [[nodiscard]] auto evaluate(const parser::Expr& expr, const Frame& frame) -> EvalResult;

    /// Invokes a function or builtin with already evaluated arguments.
    ///
    /// `span` is the call expression, used for arity errors and as the entry
    /// position of the callee's context.
    [[nodiscard]] auto call(const Value& callee, const std::vector<ValuePtr>& args,
                            const SourceSpan& span, const Frame& frame) -> EvalResult;

    /// Number of calls currently in progress.
    [[nodiscard]] auto call_depth() const -> size_t {
        return call_depth_;
    }

    [[nodiscard]] auto arena() -> EnvironmentArena& {
        return arena_;
    }

    [[nodiscard]] auto arena() const -> const EnvironmentArena& {
        return arena_;
    }

private:
    EnvironmentArena arena_;
    size_t call_depth_ = 0;

    // ========================================================================
    // Literals and Names
    // ========================================================================

    auto eval_number(const parser::NumberExpr& node, const Frame& frame) -> EvalResult;
    auto eval_string(const parser::StringExpr& node, const Frame& frame) -> EvalResult;
    auto eval_list(const parser::ListExpr& node, const Frame& frame) -> EvalResult;
    auto eval_var_access(const parser::VarAccessExpr& node, const Frame& frame) -> EvalResult;
    auto eval_var_assign(const parser::VarAssignExpr& node, const Frame& frame) -> EvalResult;

    // ========================================================================
    // Operators
    // ========================================================================

    auto eval_unary(const parser::UnaryExpr& node, const Frame& frame) -> EvalResult;
    auto eval_binary(const parser::BinaryExpr& node, const Frame& frame) -> EvalResult;

    // ========================================================================
    // Control Flow
    // ========================================================================

    auto eval_if(const parser::IfExpr& node, const Frame& frame) -> EvalResult;
    auto eval_for(const parser::ForExpr& node, const Frame& frame) -> EvalResult;
    auto eval_while(const parser::WhileExpr& node, const Frame& frame) -> EvalResult;

    // ========================================================================
    // Functions
    // ========================================================================

    auto eval_func_def(const parser::FuncDefExpr& node, const Frame& frame) -> EvalResult;
    auto eval_call(const parser::CallExpr& node, const Frame& frame) -> EvalResult;

    /// Fails with ArityMismatch unless `got == params.size()`.
    [[nodiscard]] static auto check_arity(std::string_view name,
                                          const std::vector<std::string>& params, size_t got,
                                          const SourceSpan& span, const ContextPtr& context)
        -> std::optional<Error>;
};

} // namespace kite::interp

#endif // KITE_INTERP_INTERPRETER_HPP
