//! # Value Operators
//!
//! Binary and unary operator semantics, dispatched on the left operand.
//!
//! ## Operator Table
//!
//! | Op                | Number         | String                 | List              | Function        |
//! |-------------------|----------------|------------------------|-------------------|-----------------|
//! | `+`               | sum            | concat (str or number) | append (new list) | illegal         |
//! | `-`               | difference     | illegal                | remove at index   | illegal         |
//! | `*`               | product        | repeat by int count    | illegal           | illegal         |
//! | `/`               | quotient       | illegal                | element at index  | illegal         |
//! | `**`              | power          | illegal                | illegal           | illegal         |
//! | `== != < > <= >=` | numeric        | lexicographic          | `>=` is true      | `>=` is an error|
//!
//! `&&` and `||` work for every variant: `a && b` yields `a` when `a` is falsy
//! and `b` otherwise, `a || b` yields `a` when `a` is truthy and `b` otherwise.
//! `==` and `!=` with `null` on either side test for null. Booleans compare
//! with `==` and `!=` only.
//!
//! Integer results stay integers: `+ - *` between ints (promoted to float on
//! overflow), exact `/` between ints, and `**` with a non-negative int
//! exponent.

#include "kite/interp/arith.hpp"
#include "kite/interp/value.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <type_traits>

namespace kite::interp {

using parser::BinaryOp;

namespace {

// ============================================================================
// Helpers
// ============================================================================

auto illegal_operation(BinaryOp op, const Value& left, const Value& right,
                       const ContextPtr& context) -> Error {
    std::string message = "Illegal operation: ";
    message += left.type_name();
    message += ' ';
    message += parser::binary_op_to_string(op);
    message += ' ';
    message += right.type_name();
    return runtime_error(RuntimeErrorKind::IllegalOperation, std::move(message),
                         SourceSpan::merge(left.span, right.span), context);
}

auto is_comparison(BinaryOp op) -> bool {
    switch (op) {
    case BinaryOp::Eq:
    case BinaryOp::Ne:
    case BinaryOp::Lt:
    case BinaryOp::Gt:
    case BinaryOp::Le:
    case BinaryOp::Ge:
        return true;
    default:
        return false;
    }
}

template <typename T> auto compare(BinaryOp op, const T& a, const T& b) -> bool {
    switch (op) {
    case BinaryOp::Eq:
        return a == b;
    case BinaryOp::Ne:
        return a != b;
    case BinaryOp::Lt:
        return a < b;
    case BinaryOp::Gt:
        return a > b;
    case BinaryOp::Le:
        return a <= b;
    case BinaryOp::Ge:
        return a >= b;
    default:
        return false;
    }
}

/// Integer power by squaring. Returns false on overflow.
auto checked_pow(int64_t base, int64_t exp, int64_t& out) -> bool {
    int64_t result = 1;
    while (exp > 0) {
        if (exp & 1) {
            if (!checked_mul(result, base, result)) {
                return false;
            }
        }
        exp >>= 1;
        if (exp > 0 && !checked_mul(base, base, base)) {
            return false;
        }
    }
    out = result;
    return true;
}

auto string_too_long(const Value& left, const Value& right, const ContextPtr& context) -> Error {
    return runtime_error(RuntimeErrorKind::IllegalOperation,
                         "String result exceeds the maximum length of " +
                             std::to_string(MAX_STRING_LENGTH) + " bytes",
                         SourceSpan::merge(left.span, right.span), context);
}

/// Validates a list index operand and converts it to a position.
auto list_index(const ListValue& list, const Value& left, const Value& right,
                const ContextPtr& context) -> Result<size_t, Error> {
    const auto& number = right.as<NumberValue>();
    if (!number.is_int()) {
        return runtime_error(RuntimeErrorKind::IllegalOperation,
                             "List index must be an integer, got " + format_number(number),
                             SourceSpan::merge(left.span, right.span), context);
    }

    int64_t index = number.as_int();
    if (index < 0 || static_cast<size_t>(index) >= list.elements.size()) {
        return runtime_error(RuntimeErrorKind::IndexOutOfRange,
                             "List index " + std::to_string(index) + " out of range for size " +
                                 std::to_string(list.elements.size()),
                             right.span, context);
    }
    return static_cast<size_t>(index);
}

// ============================================================================
// Per-Variant Operators
// ============================================================================

auto number_op(BinaryOp op, const Value& left, const Value& right, const ContextPtr& context)
    -> Result<ValuePtr, Error> {
    if (!right.is<NumberValue>()) {
        return illegal_operation(op, left, right, context);
    }

    const auto& a = left.as<NumberValue>();
    const auto& b = right.as<NumberValue>();
    bool both_int = a.is_int() && b.is_int();

    if (is_comparison(op)) {
        if (both_int) {
            return make_bool(compare(op, a.as_int(), b.as_int()));
        }
        return make_bool(compare(op, a.as_double(), b.as_double()));
    }

    int64_t int_result = 0;
    switch (op) {
    case BinaryOp::Add:
        if (both_int && checked_add(a.as_int(), b.as_int(), int_result)) {
            return make_int(int_result);
        }
        return make_float(a.as_double() + b.as_double());

    case BinaryOp::Sub:
        if (both_int && checked_sub(a.as_int(), b.as_int(), int_result)) {
            return make_int(int_result);
        }
        return make_float(a.as_double() - b.as_double());

    case BinaryOp::Mul:
        if (both_int && checked_mul(a.as_int(), b.as_int(), int_result)) {
            return make_int(int_result);
        }
        return make_float(a.as_double() * b.as_double());

    case BinaryOp::Div:
        if (b.as_double() == 0.0) {
            return runtime_error(RuntimeErrorKind::DivisionByZero, "Division by zero", right.span,
                                 context);
        }
        if (both_int && !(a.as_int() == std::numeric_limits<int64_t>::min() && b.as_int() == -1) &&
            a.as_int() % b.as_int() == 0) {
            return make_int(a.as_int() / b.as_int());
        }
        return make_float(a.as_double() / b.as_double());

    case BinaryOp::Pow:
        if (both_int && b.as_int() >= 0 && checked_pow(a.as_int(), b.as_int(), int_result)) {
            return make_int(int_result);
        }
        return make_float(std::pow(a.as_double(), b.as_double()));

    default:
        return illegal_operation(op, left, right, context);
    }
}

auto string_op(BinaryOp op, const Value& left, const Value& right, const ContextPtr& context)
    -> Result<ValuePtr, Error> {
    const auto& text = left.as<StringValue>().value;

    if (op == BinaryOp::Add) {
        std::string suffix;
        if (right.is<StringValue>()) {
            suffix = right.as<StringValue>().value;
        } else if (right.is<NumberValue>()) {
            suffix = format_number(right.as<NumberValue>());
        } else {
            return illegal_operation(op, left, right, context);
        }
        if (suffix.size() > MAX_STRING_LENGTH - std::min(text.size(), MAX_STRING_LENGTH)) {
            return string_too_long(left, right, context);
        }
        return make_string(text + suffix);
    }

    if (op == BinaryOp::Mul && right.is<NumberValue>()) {
        const auto& count = right.as<NumberValue>();
        if (!count.is_int() || count.as_int() < 0) {
            return runtime_error(RuntimeErrorKind::IllegalOperation,
                                 "String repeat count must be a non-negative integer, got " +
                                     format_number(count),
                                 SourceSpan::merge(left.span, right.span), context);
        }
        if (text.empty()) {
            return make_string("");
        }

        size_t length = 0;
        if (count.as_int() > static_cast<int64_t>(MAX_STRING_LENGTH) ||
            !checked_size_mul(text.size(), static_cast<size_t>(count.as_int()), MAX_STRING_LENGTH,
                              length)) {
            return string_too_long(left, right, context);
        }

        std::string repeated;
        repeated.reserve(length);
        for (int64_t i = 0; i < count.as_int(); ++i) {
            repeated += text;
        }
        return make_string(std::move(repeated));
    }

    if (is_comparison(op)) {
        if (right.is<StringValue>()) {
            return make_bool(compare(op, text, right.as<StringValue>().value));
        }
        if (right.is<NumberValue>()) {
            return make_bool(compare(op, text, format_number(right.as<NumberValue>())));
        }
    }

    return illegal_operation(op, left, right, context);
}

auto list_op(BinaryOp op, const Value& left, const Value& right, const ContextPtr& context)
    -> Result<ValuePtr, Error> {
    const auto& list = left.as<ListValue>();

    switch (op) {
    case BinaryOp::Add: {
        auto elements = list.elements;
        elements.push_back(right.copy());
        return make_list(std::move(elements));
    }

    case BinaryOp::Sub: {
        if (!right.is<NumberValue>()) {
            return illegal_operation(op, left, right, context);
        }
        auto index = list_index(list, left, right, context);
        if (is_err(index)) {
            return unwrap_err(index);
        }
        auto elements = list.elements;
        elements.erase(elements.begin() + static_cast<std::ptrdiff_t>(unwrap(index)));
        return make_list(std::move(elements));
    }

    case BinaryOp::Div: {
        if (!right.is<NumberValue>()) {
            return illegal_operation(op, left, right, context);
        }
        auto index = list_index(list, left, right, context);
        if (is_err(index)) {
            return unwrap_err(index);
        }
        return list.elements[unwrap(index)]->copy();
    }

    case BinaryOp::Ge:
        return make_bool(true);

    default:
        return illegal_operation(op, left, right, context);
    }
}

auto function_op(BinaryOp op, const Value& left, const Value& right, const ContextPtr& context)
    -> Result<ValuePtr, Error> {
    if (op == BinaryOp::Ge) {
        return runtime_error(RuntimeErrorKind::IllegalOperation,
                             "Uncaught SyntaxError: Unexpected token '>='", right.span, context);
    }
    return illegal_operation(op, left, right, context);
}

auto boolean_op(BinaryOp op, const Value& left, const Value& right, const ContextPtr& context)
    -> Result<ValuePtr, Error> {
    if ((op == BinaryOp::Eq || op == BinaryOp::Ne) && right.is<BooleanValue>()) {
        return make_bool(compare(op, left.as<BooleanValue>().value, right.as<BooleanValue>().value));
    }
    return illegal_operation(op, left, right, context);
}

} // anonymous namespace

// ============================================================================
// Entry Points
// ============================================================================

auto binary_op(BinaryOp op, const Value& left, const Value& right, const ContextPtr& context)
    -> Result<ValuePtr, Error> {
    if (op == BinaryOp::And) {
        return left.is_true() ? right.copy() : left.copy();
    }
    if (op == BinaryOp::Or) {
        return left.is_true() ? left.copy() : right.copy();
    }

    if ((op == BinaryOp::Eq || op == BinaryOp::Ne) &&
        (left.is<NullValue>() || right.is<NullValue>())) {
        bool both_null = left.is<NullValue>() && right.is<NullValue>();
        return make_bool(op == BinaryOp::Eq ? both_null : !both_null);
    }

    return std::visit(
        [&](const auto& v) -> Result<ValuePtr, Error> {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, NumberValue>) {
                return number_op(op, left, right, context);
            } else if constexpr (std::is_same_v<T, StringValue>) {
                return string_op(op, left, right, context);
            } else if constexpr (std::is_same_v<T, ListValue>) {
                return list_op(op, left, right, context);
            } else if constexpr (std::is_same_v<T, FunctionValue> ||
                                 std::is_same_v<T, BuiltinFunction>) {
                return function_op(op, left, right, context);
            } else if constexpr (std::is_same_v<T, BooleanValue>) {
                return boolean_op(op, left, right, context);
            } else {
                return illegal_operation(op, left, right, context);
            }
        },
        left.kind);
}

auto unary_op(parser::UnaryOp op, const Value& operand, const ContextPtr& context)
    -> Result<ValuePtr, Error> {
    switch (op) {
    case parser::UnaryOp::Not:
        return make_bool(!operand.is_true());

    case parser::UnaryOp::Pos:
        return operand.copy();

    case parser::UnaryOp::Neg: {
        if (!operand.is<NumberValue>()) {
            return runtime_error(RuntimeErrorKind::IllegalOperation,
                                 "Illegal operation: -" + std::string(operand.type_name()),
                                 operand.span, context);
        }
        Value minus_one{.kind = NumberValue{.number = int64_t{-1}},
                        .span = operand.span,
                        .context = context};
        return binary_op(BinaryOp::Mul, operand, minus_one, context);
    }
    }
    return operand.copy();
}

} // namespace kite::interp
