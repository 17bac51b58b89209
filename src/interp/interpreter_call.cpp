//! # Interpreter - Functions
//!
//! Function definition and the call protocol shared by user functions and
//! builtins:
//!
//! 1. Evaluate the callee, then the arguments left to right
//! 2. Check arity (exact match)
//! 3. Push a context named after the function, entered at the call site
//! 4. Run the body in a child of the defining environment, or the native code
//! 5. Retag the result with the call's span

#include "kite/interp/interpreter.hpp"
#include "kite/log/log.hpp"

namespace kite::interp {

auto Interpreter::eval_func_def(const parser::FuncDefExpr& node, const Frame& frame)
    -> EvalResult {
    auto function = make_function(node.name.value_or("<anonymous>"), node.params, node.body,
                                  frame.env);
    function->span = node.span;
    function->context = frame.context;

    if (node.name) {
        frame.env->set(*node.name, function);
    }
    return function;
}

auto Interpreter::eval_call(const parser::CallExpr& node, const Frame& frame) -> EvalResult {
    auto callee = evaluate(*node.callee, frame);
    if (is_err(callee)) {
        return callee;
    }

    std::vector<ValuePtr> args;
    args.reserve(node.args.size());
    for (const auto& arg : node.args) {
        auto result = evaluate(*arg, frame);
        if (is_err(result)) {
            return result;
        }
        args.push_back(std::move(unwrap(result)));
    }

    auto result = call(*unwrap(callee), args, node.span, frame);
    if (is_err(result)) {
        return result;
    }
    return unwrap(result)->retagged(node.span, frame.context);
}

auto Interpreter::check_arity(std::string_view name, const std::vector<std::string>& params,
                              size_t got, const SourceSpan& span, const ContextPtr& context)
    -> std::optional<Error> {
    if (got == params.size()) {
        return std::nullopt;
    }

    std::string message = got > params.size() ? "too many" : "too few";
    message += " args passed into '";
    message += name;
    message += "' (expected " + std::to_string(params.size()) + ", got " + std::to_string(got) +
               ")";
    return runtime_error(RuntimeErrorKind::ArityMismatch, std::move(message), span, context);
}

auto Interpreter::call(const Value& callee, const std::vector<ValuePtr>& args,
                       const SourceSpan& span, const Frame& frame) -> EvalResult {
    if (const auto* function = std::get_if<FunctionValue>(&callee.kind)) {
        if (auto error = check_arity(function->name, function->params, args.size(), span,
                                     frame.context)) {
            return *error;
        }

        KITE_LOG_TRACE("interp", "Call " << function->name << " (depth " << call_depth_ + 1
                                         << ")");

        auto closure = function->closure.lock();
        if (!closure) {
            return runtime_error(RuntimeErrorKind::IllegalOperation,
                                 "'" + function->name +
                                     "' can no longer be called: its defining scope was released",
                                 span, frame.context);
        }

        auto env = arena_.make_child(closure);
        for (size_t i = 0; i < args.size(); ++i) {
            env->set(function->params[i], args[i]);
        }

        Frame inner{.env = std::move(env),
                    .context = make_call_context(function->name, frame.context, span.start)};

        ++call_depth_;
        auto result = evaluate(*function->body, inner);
        --call_depth_;
        return result;
    }

    if (const auto* builtin = std::get_if<BuiltinFunction>(&callee.kind)) {
        if (auto error =
                check_arity(builtin->name, builtin->params, args.size(), span, frame.context)) {
            return *error;
        }

        KITE_LOG_TRACE("interp", "Call builtin " << builtin->name);

        auto context = make_call_context(builtin->name, frame.context, span.start);
        return builtin->impl(BuiltinCall{.args = args, .span = span, .context = context});
    }

    return runtime_error(RuntimeErrorKind::IllegalOperation,
                         "Illegal operation: " + std::string(callee.type_name()) +
                             " is not a function",
                         callee.span, frame.context);
}

} // namespace kite::interp
