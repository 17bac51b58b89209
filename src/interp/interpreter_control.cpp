//! # Interpreter - Control Flow
//!
//! `if`, `for` and `while`. Loops are expressions that collect the value of
//! every body evaluation into a list.
//!
//! ## For Loops
//!
//! ```text
//! for i = start to end step s then body
//! ```
//!
//! | Step   | Runs while    |
//! |--------|---------------|
//! | `>= 0` | `i < end`     |
//! | `< 0`  | `i > end`     |
//!
//! The step defaults to `1`. The counter stays an integer when `start` and
//! `step` are integers.

#include "kite/interp/arith.hpp"
#include "kite/interp/interpreter.hpp"
#include "kite/log/log.hpp"

namespace kite::interp {

namespace {

/// Evaluates a loop bound and checks that it is a number.
auto number_operand(Interpreter& interp, const parser::Expr& expr, const Frame& frame,
                    std::string_view role) -> Result<NumberValue, Error> {
    auto result = interp.evaluate(expr, frame);
    if (is_err(result)) {
        return unwrap_err(result);
    }

    const auto& value = unwrap(result);
    if (!value->is<NumberValue>()) {
        return runtime_error(RuntimeErrorKind::IllegalOperation,
                             "For loop " + std::string(role) + " must be a Number, got " +
                                 std::string(value->type_name()),
                             expr.span, frame.context);
    }
    return value->as<NumberValue>();
}

auto add_numbers(const NumberValue& a, const NumberValue& b) -> NumberValue {
    int64_t sum = 0;
    if (a.is_int() && b.is_int() && checked_add(a.as_int(), b.as_int(), sum)) {
        return NumberValue{.number = sum};
    }
    return NumberValue{.number = a.as_double() + b.as_double()};
}

auto less_than(const NumberValue& a, const NumberValue& b) -> bool {
    if (a.is_int() && b.is_int()) {
        return a.as_int() < b.as_int();
    }
    return a.as_double() < b.as_double();
}

} // anonymous namespace

auto Interpreter::eval_if(const parser::IfExpr& node, const Frame& frame) -> EvalResult {
    auto run_branch = [&](const parser::Expr& body) -> EvalResult {
        auto result = evaluate(body, frame);
        if (is_err(result)) {
            return result;
        }
        return unwrap(result)->retagged(node.span, frame.context);
    };

    for (const auto& arm : node.cases) {
        auto condition = evaluate(*arm.condition, frame);
        if (is_err(condition)) {
            return condition;
        }
        if (unwrap(condition)->is_true()) {
            return run_branch(*arm.body);
        }
    }

    if (node.else_body) {
        return run_branch(*node.else_body);
    }

    auto null = make_null();
    null->span = node.span;
    null->context = frame.context;
    return null;
}

auto Interpreter::eval_for(const parser::ForExpr& node, const Frame& frame) -> EvalResult {
    auto start = number_operand(*this, *node.start, frame, "start");
    if (is_err(start)) {
        return unwrap_err(start);
    }
    auto end = number_operand(*this, *node.end, frame, "end");
    if (is_err(end)) {
        return unwrap_err(end);
    }

    NumberValue step{.number = int64_t{1}};
    if (node.step) {
        auto step_result = number_operand(*this, *node.step, frame, "step");
        if (is_err(step_result)) {
            return unwrap_err(step_result);
        }
        step = unwrap(step_result);
    }

    const NumberValue& limit = unwrap(end);
    bool ascending = step.as_double() >= 0;
    NumberValue counter = unwrap(start);

    auto bind_counter = [&]() {
        auto value = make_number(counter);
        value->span = node.span;
        value->context = frame.context;
        frame.env->set(node.var_name, std::move(value));
    };

    std::vector<ValuePtr> results;
    while (ascending ? less_than(counter, limit) : less_than(limit, counter)) {
        bind_counter();
        counter = add_numbers(counter, step);

        auto body = evaluate(*node.body, frame);
        if (is_err(body)) {
            return body;
        }
        results.push_back(std::move(unwrap(body)));
    }
    bind_counter();

    KITE_LOG_TRACE("interp", "for " << node.var_name << " ran " << results.size() << " times");

    auto list = make_list(std::move(results));
    list->span = node.span;
    list->context = frame.context;
    return list;
}

auto Interpreter::eval_while(const parser::WhileExpr& node, const Frame& frame) -> EvalResult {
    std::vector<ValuePtr> results;

    while (true) {
        auto condition = evaluate(*node.condition, frame);
        if (is_err(condition)) {
            return condition;
        }
        if (!unwrap(condition)->is_true()) {
            break;
        }

        auto body = evaluate(*node.body, frame);
        if (is_err(body)) {
            return body;
        }
        results.push_back(std::move(unwrap(body)));
    }

    auto list = make_list(std::move(results));
    list->span = node.span;
    list->context = frame.context;
    return list;
}

} // namespace kite::interp
