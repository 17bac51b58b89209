//! # Builtins
//!
//! Native implementations of the global functions.

#include "kite/interp/builtins.hpp"
#include "kite/log/log.hpp"

namespace kite::interp {

namespace {

auto invalid_argument(const BuiltinCall& call, std::string message) -> Error {
    return runtime_error(RuntimeErrorKind::InvalidArgument, std::move(message), call.span,
                         call.context);
}

/// Builtin that classifies its single argument.
auto type_predicate(bool (*test)(const Value&)) -> BuiltinFn {
    return [test](const BuiltinCall& call) -> Result<ValuePtr, Error> {
        return make_bool(test(*call.args[0]));
    };
}

auto builtin_str(const BuiltinCall& call) -> Result<ValuePtr, Error> {
    return make_string(call.args[0]->to_display());
}

auto builtin_len(const BuiltinCall& call) -> Result<ValuePtr, Error> {
    const auto& value = *call.args[0];
    if (value.is<StringValue>()) {
        return make_int(static_cast<int64_t>(value.as<StringValue>().value.size()));
    }
    if (value.is<ListValue>()) {
        return make_int(static_cast<int64_t>(value.as<ListValue>().elements.size()));
    }
    return invalid_argument(call, "len() expects a String or List, got " +
                                      std::string(value.type_name()));
}

auto builtin_append(const BuiltinCall& call) -> Result<ValuePtr, Error> {
    const auto& list = *call.args[0];
    if (!list.is<ListValue>()) {
        return invalid_argument(call, "First argument of append() must be a List, got " +
                                          std::string(list.type_name()));
    }

    auto elements = list.as<ListValue>().elements;
    elements.push_back(call.args[1]);
    return make_list(std::move(elements));
}

auto builtin_extend(const BuiltinCall& call) -> Result<ValuePtr, Error> {
    const auto& first = *call.args[0];
    const auto& second = *call.args[1];
    if (!first.is<ListValue>()) {
        return invalid_argument(call, "First argument of extend() must be a List, got " +
                                          std::string(first.type_name()));
    }
    if (!second.is<ListValue>()) {
        return invalid_argument(call, "Second argument of extend() must be a List, got " +
                                          std::string(second.type_name()));
    }

    auto elements = first.as<ListValue>().elements;
    const auto& more = second.as<ListValue>().elements;
    elements.insert(elements.end(), more.begin(), more.end());
    return make_list(std::move(elements));
}

} // anonymous namespace

void register_builtins(Environment& globals, std::ostream& out) {
    globals.set("null", make_null());
    globals.set("true", make_bool(true));
    globals.set("false", make_bool(false));

    globals.set("print",
                make_builtin("print", {"value"},
                             [&out](const BuiltinCall& call) -> Result<ValuePtr, Error> {
                                 out << call.args[0]->to_display() << "\n";
                                 return make_null();
                             }));
    globals.set("str", make_builtin("str", {"value"}, builtin_str));
    globals.set("len", make_builtin("len", {"value"}, builtin_len));

    globals.set("isNumber", make_builtin("isNumber", {"value"}, type_predicate([](const Value& v) {
                                             return v.is<NumberValue>();
                                         })));
    globals.set("isString", make_builtin("isString", {"value"}, type_predicate([](const Value& v) {
                                             return v.is<StringValue>();
                                         })));
    globals.set("isList", make_builtin("isList", {"value"}, type_predicate([](const Value& v) {
                                           return v.is<ListValue>();
                                       })));
    globals.set("isFunction",
                make_builtin("isFunction", {"value"},
                             type_predicate([](const Value& v) { return v.is_callable(); })));

    globals.set("append", make_builtin("append", {"list", "value"}, builtin_append));
    globals.set("extend", make_builtin("extend", {"listA", "listB"}, builtin_extend));

    KITE_LOG_DEBUG("interp", "Registered " << globals.symbols().size() << " global names");
}

} // namespace kite::interp
