//! # Runtime Values
//!
//! Every kite value is a `Value`: a closed variant of the language's data
//! kinds plus a diagnostic tag (source span and context) that says where the
//! value was produced.
//!
//! ## Variants
//!
//! | Variant           | Truthy when         | `repr()`                |
//! |-------------------|---------------------|-------------------------|
//! | `NullValue`       | never               | `null`                  |
//! | `NumberValue`     | non-zero            | `42`, `2.5`             |
//! | `BooleanValue`    | `true`              | `true`, `false`         |
//! | `StringValue`     | non-empty           | `"text"`                |
//! | `ListValue`       | always              | `[1, "a"]`              |
//! | `FunctionValue`   | always              | `<function add(a, b)>`  |
//! | `BuiltinFunction` | always              | `<built-in function print>` |
//!
//! ## Sharing
//!
//! Values are handled through `ValuePtr` and are never changed after they are
//! built, apart from their tag. Code that needs a differently tagged value
//! takes a `copy()` first, so a tag written for one use never leaks into a
//! binding or list element that holds the same value.

#ifndef KITE_INTERP_VALUE_HPP
#define KITE_INTERP_VALUE_HPP

#include "kite/common.hpp"
#include "kite/error.hpp"
#include "kite/interp/context.hpp"
#include "kite/parser/ast.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace kite::interp {

struct Value;
using ValuePtr = Rc<Value>;

class Environment;
using EnvPtr = Rc<Environment>;
using WeakEnvPtr = std::weak_ptr<Environment>;

// ============================================================================
// Variants
// ============================================================================

struct NullValue {};

/// Integer or floating number. Integer-ness survives arithmetic between ints.
struct NumberValue {
    std::variant<int64_t, double> number;

    [[nodiscard]] auto is_int() const -> bool {
        return std::holds_alternative<int64_t>(number);
    }

    [[nodiscard]] auto as_int() const -> int64_t {
        return std::get<int64_t>(number);
    }

    [[nodiscard]] auto as_double() const -> double {
        return is_int() ? static_cast<double>(std::get<int64_t>(number))
                        : std::get<double>(number);
    }
};

struct BooleanValue {
    bool value;
};

/// Longest string the operators build. Longer results fail with
/// IllegalOperation.
constexpr size_t MAX_STRING_LENGTH = size_t{256} * 1024 * 1024;

struct StringValue {
    std::string value;
};

struct ListValue {
    std::vector<ValuePtr> elements;
};

/// User-defined function. `closure` is the environment the function was
/// defined in; each call evaluates `body` in a fresh child of it. The closure
/// is not owned: it stays alive only while its arena keeps it reachable.
struct FunctionValue {
    std::string name; ///< `<anonymous>` for unnamed functions.
    std::vector<std::string> params;
    parser::SharedExpr body;
    WeakEnvPtr closure;
};

/// Arguments handed to a native builtin.
struct BuiltinCall {
    const std::vector<ValuePtr>& args;
    const SourceSpan& span;     ///< Span of the call expression.
    const ContextPtr& context;  ///< Context of the builtin's own frame.
};

using BuiltinFn = std::function<Result<ValuePtr, Error>(const BuiltinCall&)>;

struct BuiltinFunction {
    std::string name;
    std::vector<std::string> params;
    BuiltinFn impl;
};

// ============================================================================
// Value
// ============================================================================

struct Value {
    std::variant<NullValue, NumberValue, BooleanValue, StringValue, ListValue, FunctionValue,
                 BuiltinFunction>
        kind;
    SourceSpan span;    ///< Where the value was produced. Diagnostic only.
    ContextPtr context; ///< Context it was produced in. Diagnostic only.

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(kind);
    }

    [[nodiscard]] auto is_callable() const -> bool {
        return is<FunctionValue>() || is<BuiltinFunction>();
    }

    /// Boolean coercion used by `if`, `while`, `&&`, `||` and `!`.
    [[nodiscard]] auto is_true() const -> bool;

    /// Variant name for error messages (`Number`, `String`, ...).
    [[nodiscard]] auto type_name() const -> std::string_view;

    /// A new value with the same contents and tag. Lists copy their element
    /// vector; the elements themselves are shared.
    [[nodiscard]] auto copy() const -> ValuePtr;

    /// A copy carrying a new tag.
    [[nodiscard]] auto retagged(const SourceSpan& new_span, ContextPtr new_context) const
        -> ValuePtr;

    /// Source-like rendering: strings are quoted.
    [[nodiscard]] auto repr() const -> std::string;

    /// Plain rendering for `print`, `str` and concatenation: strings are bare.
    [[nodiscard]] auto to_display() const -> std::string;
};

// ============================================================================
// Factories
// ============================================================================

[[nodiscard]] auto make_null() -> ValuePtr;
[[nodiscard]] auto make_int(int64_t value) -> ValuePtr;
[[nodiscard]] auto make_float(double value) -> ValuePtr;
[[nodiscard]] auto make_number(NumberValue value) -> ValuePtr;
[[nodiscard]] auto make_bool(bool value) -> ValuePtr;
[[nodiscard]] auto make_string(std::string value) -> ValuePtr;
[[nodiscard]] auto make_list(std::vector<ValuePtr> elements) -> ValuePtr;
[[nodiscard]] auto make_function(std::string name, std::vector<std::string> params,
                                 parser::SharedExpr body, const EnvPtr& closure) -> ValuePtr;
[[nodiscard]] auto make_builtin(std::string name, std::vector<std::string> params, BuiltinFn impl)
    -> ValuePtr;

/// Shortest round-trip text of a number (`3`, `2.5`, `1e+21`).
[[nodiscard]] auto format_number(const NumberValue& number) -> std::string;

// ============================================================================
// Operators
// ============================================================================

/// Applies a binary operator. Dispatch is on the left operand's variant.
///
/// Errors are raised in `context`. Illegal operand pairings span both
/// operands; division by zero points at the divisor.
[[nodiscard]] auto binary_op(parser::BinaryOp op, const Value& left, const Value& right,
                             const ContextPtr& context) -> Result<ValuePtr, Error>;

/// Applies a unary operator. `-x` is evaluated as `x * -1` and needs a Number.
[[nodiscard]] auto unary_op(parser::UnaryOp op, const Value& operand, const ContextPtr& context)
    -> Result<ValuePtr, Error>;

} // namespace kite::interp

#endif // KITE_INTERP_VALUE_HPP
