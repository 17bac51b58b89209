//! # Runtime Values
//!
//! Factories, truthiness, copying and display for `Value`.

#include "kite/interp/value.hpp"

#include <array>
#include <charconv>
#include <sstream>
#include <type_traits>

namespace kite::interp {

// ============================================================================
// Factories
// ============================================================================

namespace {

auto make_value(decltype(Value::kind) kind) -> ValuePtr {
    return make_rc<Value>(Value{.kind = std::move(kind), .span = {}, .context = nullptr});
}

void write_params(std::ostringstream& out, const std::vector<std::string>& params) {
    for (size_t i = 0; i < params.size(); ++i) {
        if (i > 0) {
            out << ", ";
        }
        out << params[i];
    }
}

} // anonymous namespace

auto make_null() -> ValuePtr {
    return make_value(NullValue{});
}

auto make_int(int64_t value) -> ValuePtr {
    return make_value(NumberValue{.number = value});
}

auto make_float(double value) -> ValuePtr {
    return make_value(NumberValue{.number = value});
}

auto make_number(NumberValue value) -> ValuePtr {
    return make_value(std::move(value));
}

auto make_bool(bool value) -> ValuePtr {
    return make_value(BooleanValue{.value = value});
}

auto make_string(std::string value) -> ValuePtr {
    return make_value(StringValue{.value = std::move(value)});
}

auto make_list(std::vector<ValuePtr> elements) -> ValuePtr {
    return make_value(ListValue{.elements = std::move(elements)});
}

auto make_function(std::string name, std::vector<std::string> params, parser::SharedExpr body,
                   const EnvPtr& closure) -> ValuePtr {
    return make_value(FunctionValue{.name = std::move(name),
                                    .params = std::move(params),
                                    .body = std::move(body),
                                    .closure = closure});
}

auto make_builtin(std::string name, std::vector<std::string> params, BuiltinFn impl)
    -> ValuePtr {
    return make_value(BuiltinFunction{
        .name = std::move(name), .params = std::move(params), .impl = std::move(impl)});
}

auto format_number(const NumberValue& number) -> std::string {
    if (number.is_int()) {
        return std::to_string(number.as_int());
    }

    std::array<char, 64> buffer{};
    auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(),
                                   std::get<double>(number.number));
    if (ec != std::errc{}) {
        return "nan";
    }
    return std::string(buffer.data(), end);
}

// ============================================================================
// Value
// ============================================================================

auto Value::is_true() const -> bool {
    return std::visit(
        [](const auto& v) -> bool {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, NullValue>) {
                return false;
            } else if constexpr (std::is_same_v<T, NumberValue>) {
                return v.as_double() != 0.0;
            } else if constexpr (std::is_same_v<T, BooleanValue>) {
                return v.value;
            } else if constexpr (std::is_same_v<T, StringValue>) {
                return !v.value.empty();
            } else {
                return true;
            }
        },
        kind);
}

auto Value::type_name() const -> std::string_view {
    return std::visit(
        [](const auto& v) -> std::string_view {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, NullValue>) {
                return "Null";
            } else if constexpr (std::is_same_v<T, NumberValue>) {
                return "Number";
            } else if constexpr (std::is_same_v<T, BooleanValue>) {
                return "Boolean";
            } else if constexpr (std::is_same_v<T, StringValue>) {
                return "String";
            } else if constexpr (std::is_same_v<T, ListValue>) {
                return "List";
            } else if constexpr (std::is_same_v<T, FunctionValue>) {
                return "Function";
            } else {
                return "BuiltinFunction";
            }
        },
        kind);
}

auto Value::copy() const -> ValuePtr {
    return make_rc<Value>(*this);
}

auto Value::retagged(const SourceSpan& new_span, ContextPtr new_context) const -> ValuePtr {
    auto result = copy();
    result->span = new_span;
    result->context = std::move(new_context);
    return result;
}

auto Value::repr() const -> std::string {
    if (is<StringValue>()) {
        return "\"" + as<StringValue>().value + "\"";
    }
    return to_display();
}

auto Value::to_display() const -> std::string {
    std::ostringstream out;

    std::visit(
        [&out](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, NullValue>) {
                out << "null";
            } else if constexpr (std::is_same_v<T, NumberValue>) {
                out << format_number(v);
            } else if constexpr (std::is_same_v<T, BooleanValue>) {
                out << (v.value ? "true" : "false");
            } else if constexpr (std::is_same_v<T, StringValue>) {
                out << v.value;
            } else if constexpr (std::is_same_v<T, ListValue>) {
                out << '[';
                for (size_t i = 0; i < v.elements.size(); ++i) {
                    if (i > 0) {
                        out << ", ";
                    }
                    out << v.elements[i]->repr();
                }
                out << ']';
            } else if constexpr (std::is_same_v<T, FunctionValue>) {
                out << "<function " << v.name << '(';
                write_params(out, v.params);
                out << ")>";
            } else {
                out << "<built-in function " << v.name << '>';
            }
        },
        kind);

    return out.str();
}

} // namespace kite::interp
