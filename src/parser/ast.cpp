//! # AST Utilities
//!
//! Operator spellings and the `dump_expr()` tree printer.
//!
//! ## Dump Format
//!
//! | Node       | Output                                 |
//! |------------|----------------------------------------|
//! | Number     | `42`                                   |
//! | String     | `"text"`                               |
//! | List       | `[a, b]`                               |
//! | Assign     | `(var x = v)`                          |
//! | Unary      | `(-x)`, `(!x)`                         |
//! | Binary     | `(a + b)`                              |
//! | If         | `(if c then a elif d then b else e)`   |
//! | For        | `(for i = s to e step t then b)`       |
//! | While      | `(while c then b)`                     |
//! | Function   | `(fun name(a, b) -> body)`             |
//! | Call       | `f(a, b)`                              |

#include "kite/parser/ast.hpp"

#include <sstream>
#include <type_traits>

namespace kite::parser {

auto unary_op_to_string(UnaryOp op) -> std::string_view {
    switch (op) {
    case UnaryOp::Neg:
        return "-";
    case UnaryOp::Pos:
        return "+";
    case UnaryOp::Not:
        return "!";
    }
    return "?";
}

auto binary_op_to_string(BinaryOp op) -> std::string_view {
    switch (op) {
    case BinaryOp::Add:
        return "+";
    case BinaryOp::Sub:
        return "-";
    case BinaryOp::Mul:
        return "*";
    case BinaryOp::Div:
        return "/";
    case BinaryOp::Pow:
        return "**";
    case BinaryOp::Eq:
        return "==";
    case BinaryOp::Ne:
        return "!=";
    case BinaryOp::Lt:
        return "<";
    case BinaryOp::Gt:
        return ">";
    case BinaryOp::Le:
        return "<=";
    case BinaryOp::Ge:
        return ">=";
    case BinaryOp::And:
        return "&&";
    case BinaryOp::Or:
        return "||";
    }
    return "?";
}

namespace {

void dump_list(std::ostringstream& out, const std::vector<ExprPtr>& items) {
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out << ", ";
        }
        out << dump_expr(*items[i]);
    }
}

} // anonymous namespace

auto dump_expr(const Expr& expr) -> std::string {
    std::ostringstream out;

    std::visit(
        [&out](const auto& node) {
            using T = std::decay_t<decltype(node)>;

            if constexpr (std::is_same_v<T, NumberExpr>) {
                out << node.text;
            } else if constexpr (std::is_same_v<T, StringExpr>) {
                out << '"' << node.value << '"';
            } else if constexpr (std::is_same_v<T, ListExpr>) {
                out << '[';
                dump_list(out, node.elements);
                out << ']';
            } else if constexpr (std::is_same_v<T, VarAccessExpr>) {
                out << node.name;
            } else if constexpr (std::is_same_v<T, VarAssignExpr>) {
                out << "(var " << node.name << " = " << dump_expr(*node.value) << ')';
            } else if constexpr (std::is_same_v<T, UnaryExpr>) {
                out << '(' << unary_op_to_string(node.op) << dump_expr(*node.operand) << ')';
            } else if constexpr (std::is_same_v<T, BinaryExpr>) {
                out << '(' << dump_expr(*node.left) << ' ' << binary_op_to_string(node.op) << ' '
                    << dump_expr(*node.right) << ')';
            } else if constexpr (std::is_same_v<T, IfExpr>) {
                out << '(';
                for (size_t i = 0; i < node.cases.size(); ++i) {
                    out << (i == 0 ? "if " : " elif ") << dump_expr(*node.cases[i].condition)
                        << " then " << dump_expr(*node.cases[i].body);
                }
                if (node.else_body) {
                    out << " else " << dump_expr(*node.else_body);
                }
                out << ')';
            } else if constexpr (std::is_same_v<T, ForExpr>) {
                out << "(for " << node.var_name << " = " << dump_expr(*node.start) << " to "
                    << dump_expr(*node.end);
                if (node.step) {
                    out << " step " << dump_expr(*node.step);
                }
                out << " then " << dump_expr(*node.body) << ')';
            } else if constexpr (std::is_same_v<T, WhileExpr>) {
                out << "(while " << dump_expr(*node.condition) << " then "
                    << dump_expr(*node.body) << ')';
            } else if constexpr (std::is_same_v<T, FuncDefExpr>) {
                out << "(fun";
                if (node.name) {
                    out << ' ' << *node.name;
                }
                out << '(';
                for (size_t i = 0; i < node.params.size(); ++i) {
                    if (i > 0) {
                        out << ", ";
                    }
                    out << node.params[i];
                }
                out << ") -> " << dump_expr(*node.body) << ')';
            } else if constexpr (std::is_same_v<T, CallExpr>) {
                out << dump_expr(*node.callee) << '(';
                dump_list(out, node.args);
                out << ')';
            }
        },
        expr.kind);

    return out.str();
}

} // namespace kite::parser
