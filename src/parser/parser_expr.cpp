//! # Parser - Expressions
//!
//! Precedence tiers from `expr` down to `atom`, plus list literals and calls.
//!
//! ## Precedence (low to high)
//!
//! | Tier         | Operators                      |
//! |--------------|--------------------------------|
//! | `expr`       | `&&`, `\|\|`                   |
//! | `comp_expr`  | `!` prefix, `== != < > <= >=`  |
//! | `arith_expr` | `+ -`                          |
//! | `term`       | `* /`                          |
//! | `factor`     | unary `+ -`                    |
//! | `power`      | `**` (right operand: `factor`) |
//! | `call`       | `f(args)`                      |

#include "kite/parser/parser.hpp"

namespace kite::parser {

using lexer::TokenKind;

namespace {

constexpr std::string_view EXPECTED_EXPR = "Expected 'var', 'if', 'for', 'while', 'fun', int, "
                                           "float, identifier, '+', '-', '(', '[' or '!'";
constexpr std::string_view EXPECTED_COMP = "Expected int, float, identifier, '+', '-', '(', '!'";
constexpr std::string_view EXPECTED_ATOM =
    "Expected int, float, identifier, '+', '-', '(', 'if', 'for', 'while', 'fun'";
constexpr std::string_view EXPECTED_LIST_ITEM = "Expected ']', 'var', 'if', 'for', 'while', "
                                                "'fun', int, float, identifier, '+', '-', '(' or '!'";
constexpr std::string_view EXPECTED_ARGUMENT = "Expected ')', 'var', 'if', 'for', 'while', "
                                               "'fun', int, float, identifier, '+', '-', '(' or '!'";

} // anonymous namespace

auto Parser::parse_expr() -> ParseResult {
    size_t checkpoint = pos_;

    if (check_keyword("var")) {
        auto start = advance().span;

        if (!check(TokenKind::Identifier)) {
            return error_here("Expected identifier");
        }
        std::string name = advance().text();

        if (!check(TokenKind::Eq)) {
            return error_here("Expected '='");
        }
        advance();

        auto value = parse_expr();
        if (is_err(value)) {
            return value;
        }
        ExprPtr value_expr = std::move(unwrap(value));
        SourceSpan span = SourceSpan::merge(start, value_expr->span);
        return make_expr(
            VarAssignExpr{.name = std::move(name), .value = std::move(value_expr), .span = span});
    }

    auto result = bin_op(&Parser::parse_comp_expr,
                         {{TokenKind::Keyword, "&&", BinaryOp::And},
                          {TokenKind::Keyword, "||", BinaryOp::Or}});
    return widen_error(std::move(result), checkpoint, EXPECTED_EXPR);
}

auto Parser::parse_comp_expr() -> ParseResult {
    size_t checkpoint = pos_;

    if (check_keyword("!")) {
        auto start = advance().span;
        auto operand = parse_comp_expr();
        if (is_err(operand)) {
            return operand;
        }
        ExprPtr operand_expr = std::move(unwrap(operand));
        SourceSpan span = SourceSpan::merge(start, operand_expr->span);
        return make_expr(
            UnaryExpr{.op = UnaryOp::Not, .operand = std::move(operand_expr), .span = span});
    }

    auto result = bin_op(&Parser::parse_arith_expr, {{TokenKind::EE, {}, BinaryOp::Eq},
                                                     {TokenKind::NE, {}, BinaryOp::Ne},
                                                     {TokenKind::LT, {}, BinaryOp::Lt},
                                                     {TokenKind::GT, {}, BinaryOp::Gt},
                                                     {TokenKind::LTE, {}, BinaryOp::Le},
                                                     {TokenKind::GTE, {}, BinaryOp::Ge}});
    return widen_error(std::move(result), checkpoint, EXPECTED_COMP);
}

auto Parser::parse_arith_expr() -> ParseResult {
    return bin_op(&Parser::parse_term,
                  {{TokenKind::Plus, {}, BinaryOp::Add}, {TokenKind::Minus, {}, BinaryOp::Sub}});
}

auto Parser::parse_term() -> ParseResult {
    return bin_op(&Parser::parse_factor,
                  {{TokenKind::Mul, {}, BinaryOp::Mul}, {TokenKind::Div, {}, BinaryOp::Div}});
}

auto Parser::parse_factor() -> ParseResult {
    if (check(TokenKind::Plus) || check(TokenKind::Minus)) {
        const auto& token = advance();
        auto op = token.is(TokenKind::Minus) ? UnaryOp::Neg : UnaryOp::Pos;
        auto start = token.span;

        auto operand = parse_factor();
        if (is_err(operand)) {
            return operand;
        }
        ExprPtr operand_expr = std::move(unwrap(operand));
        SourceSpan span = SourceSpan::merge(start, operand_expr->span);
        return make_expr(UnaryExpr{.op = op, .operand = std::move(operand_expr), .span = span});
    }

    return parse_power();
}

auto Parser::parse_power() -> ParseResult {
    return bin_op(&Parser::parse_call, {{TokenKind::Pow, {}, BinaryOp::Pow}},
                  &Parser::parse_factor);
}

auto Parser::parse_call() -> ParseResult {
    auto callee = parse_atom();
    if (is_err(callee) || !check(TokenKind::LParen)) {
        return callee;
    }
    advance();

    std::vector<ExprPtr> args;
    if (!check(TokenKind::RParen)) {
        size_t checkpoint = pos_;
        auto first = widen_error(parse_expr(), checkpoint, EXPECTED_ARGUMENT);
        if (is_err(first)) {
            return first;
        }
        args.push_back(std::move(unwrap(first)));

        while (check(TokenKind::Comma)) {
            advance();
            auto arg = parse_expr();
            if (is_err(arg)) {
                return arg;
            }
            args.push_back(std::move(unwrap(arg)));
        }

        if (!check(TokenKind::RParen)) {
            return error_here("Expected ',' or ')'");
        }
    }
    auto end = advance().span;

    ExprPtr callee_expr = std::move(unwrap(callee));
    SourceSpan span = SourceSpan::merge(callee_expr->span, end);
    return make_expr(
        CallExpr{.callee = std::move(callee_expr), .args = std::move(args), .span = span});
}

auto Parser::parse_atom() -> ParseResult {
    const auto& token = peek();

    if (token.is(TokenKind::Int) || token.is(TokenKind::Float)) {
        advance();
        return make_expr(NumberExpr{
            .text = token.text(), .is_float = token.is(TokenKind::Float), .span = token.span});
    }

    if (token.is(TokenKind::String)) {
        advance();
        return make_expr(StringExpr{.value = token.text(), .span = token.span});
    }

    if (token.is(TokenKind::Identifier)) {
        advance();
        return make_expr(VarAccessExpr{.name = token.text(), .span = token.span});
    }

    if (token.is(TokenKind::LParen)) {
        advance();
        auto inner = parse_expr();
        if (is_err(inner)) {
            return inner;
        }
        if (!check(TokenKind::RParen)) {
            return error_here("Expected ')'");
        }
        advance();
        return inner;
    }

    if (token.is(TokenKind::LSquare)) {
        return parse_list_expr();
    }
    if (token.matches(TokenKind::Keyword, "if")) {
        return parse_if_expr();
    }
    if (token.matches(TokenKind::Keyword, "for")) {
        return parse_for_expr();
    }
    if (token.matches(TokenKind::Keyword, "while")) {
        return parse_while_expr();
    }
    if (token.matches(TokenKind::Keyword, "fun")) {
        return parse_func_def();
    }

    return error_here(std::string(EXPECTED_ATOM));
}

auto Parser::parse_list_expr() -> ParseResult {
    auto start = advance().span; // '['

    std::vector<ExprPtr> elements;
    if (!check(TokenKind::RSquare)) {
        size_t checkpoint = pos_;
        auto first = widen_error(parse_expr(), checkpoint, EXPECTED_LIST_ITEM);
        if (is_err(first)) {
            return first;
        }
        elements.push_back(std::move(unwrap(first)));

        while (check(TokenKind::Comma)) {
            advance();
            auto element = parse_expr();
            if (is_err(element)) {
                return element;
            }
            elements.push_back(std::move(unwrap(element)));
        }

        if (!check(TokenKind::RSquare)) {
            return error_here("Expected ',' or ']'");
        }
    }
    auto end = advance().span;

    return make_expr(
        ListExpr{.elements = std::move(elements), .span = SourceSpan::merge(start, end)});
}

} // namespace kite::parser
