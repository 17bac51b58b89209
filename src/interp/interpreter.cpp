//! # Interpreter - Core
//!
//! Dispatch over expression kinds, plus literals, variables and operators.

#include "kite/interp/interpreter.hpp"
#include "kite/log/log.hpp"

#include <charconv>
#include <cstdlib>
#include <type_traits>

namespace kite::interp {

auto Interpreter::evaluate(const parser::Expr& expr, const Frame& frame) -> EvalResult {
    return std::visit(
        [this, &frame](const auto& node) -> EvalResult {
            using T = std::decay_t<decltype(node)>;

            if constexpr (std::is_same_v<T, parser::NumberExpr>) {
                return eval_number(node, frame);
            } else if constexpr (std::is_same_v<T, parser::StringExpr>) {
                return eval_string(node, frame);
            } else if constexpr (std::is_same_v<T, parser::ListExpr>) {
                return eval_list(node, frame);
            } else if constexpr (std::is_same_v<T, parser::VarAccessExpr>) {
                return eval_var_access(node, frame);
            } else if constexpr (std::is_same_v<T, parser::VarAssignExpr>) {
                return eval_var_assign(node, frame);
            } else if constexpr (std::is_same_v<T, parser::UnaryExpr>) {
                return eval_unary(node, frame);
            } else if constexpr (std::is_same_v<T, parser::BinaryExpr>) {
                return eval_binary(node, frame);
            } else if constexpr (std::is_same_v<T, parser::IfExpr>) {
                return eval_if(node, frame);
            } else if constexpr (std::is_same_v<T, parser::ForExpr>) {
                return eval_for(node, frame);
            } else if constexpr (std::is_same_v<T, parser::WhileExpr>) {
                return eval_while(node, frame);
            } else if constexpr (std::is_same_v<T, parser::FuncDefExpr>) {
                return eval_func_def(node, frame);
            } else {
                static_assert(std::is_same_v<T, parser::CallExpr>, "unhandled expression kind");
                return eval_call(node, frame);
            }
        },
        expr.kind);
}

// ============================================================================
// Literals and Names
// ============================================================================

auto Interpreter::eval_number(const parser::NumberExpr& node, const Frame& frame) -> EvalResult {
    ValuePtr value;

    if (!node.is_float) {
        int64_t parsed = 0;
        const char* begin = node.text.data();
        const char* end = begin + node.text.size();
        auto [ptr, ec] = std::from_chars(begin, end, parsed);
        if (ec == std::errc{} && ptr == end) {
            value = make_int(parsed);
        }
    }

    // Floats, and integers too large for int64
    if (!value) {
        value = make_float(std::strtod(node.text.c_str(), nullptr));
    }

    value->span = node.span;
    value->context = frame.context;
    return value;
}

auto Interpreter::eval_string(const parser::StringExpr& node, const Frame& frame) -> EvalResult {
    auto value = make_string(node.value);
    value->span = node.span;
    value->context = frame.context;
    return value;
}

auto Interpreter::eval_list(const parser::ListExpr& node, const Frame& frame) -> EvalResult {
    std::vector<ValuePtr> elements;
    elements.reserve(node.elements.size());

    for (const auto& element : node.elements) {
        auto result = evaluate(*element, frame);
        if (is_err(result)) {
            return result;
        }
        elements.push_back(std::move(unwrap(result)));
    }

    auto value = make_list(std::move(elements));
    value->span = node.span;
    value->context = frame.context;
    return value;
}

auto Interpreter::eval_var_access(const parser::VarAccessExpr& node, const Frame& frame)
    -> EvalResult {
    auto value = frame.env->get(node.name);
    if (!value) {
        return runtime_error(RuntimeErrorKind::UndefinedVariable,
                             "\"" + node.name + "\" is not defined", node.span, frame.context);
    }
    return value->retagged(node.span, frame.context);
}

auto Interpreter::eval_var_assign(const parser::VarAssignExpr& node, const Frame& frame)
    -> EvalResult {
    auto result = evaluate(*node.value, frame);
    if (is_err(result)) {
        return result;
    }

    KITE_LOG_TRACE("interp", "Bind " << node.name << " in " << frame.context->name);
    frame.env->set(node.name, unwrap(result));
    return result;
}

// ============================================================================
// Operators
// ============================================================================

auto Interpreter::eval_unary(const parser::UnaryExpr& node, const Frame& frame) -> EvalResult {
    auto operand = evaluate(*node.operand, frame);
    if (is_err(operand)) {
        return operand;
    }

    auto result = unary_op(node.op, *unwrap(operand), frame.context);
    if (is_ok(result)) {
        auto& value = unwrap(result);
        value->span = node.span;
        value->context = frame.context;
    }
    return result;
}

auto Interpreter::eval_binary(const parser::BinaryExpr& node, const Frame& frame) -> EvalResult {
    auto left = evaluate(*node.left, frame);
    if (is_err(left)) {
        return left;
    }

    auto right = evaluate(*node.right, frame);
    if (is_err(right)) {
        return right;
    }

    auto result = binary_op(node.op, *unwrap(left), *unwrap(right), frame.context);
    if (is_ok(result)) {
        auto& value = unwrap(result);
        value->span = node.span;
        value->context = frame.context;
    }
    return result;
}

} // namespace kite::interp
