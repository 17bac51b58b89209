//! # Parser - Control Flow and Functions
//!
//! ```text
//! if_expr    := 'if' expr 'then' expr ('elif' expr 'then' expr)* ('else' expr)?
//! for_expr   := 'for' IDENT '=' expr 'to' expr ('step' expr)? 'then' expr
//! while_expr := 'while' expr 'then' expr
//! func_def   := 'fun' IDENT? '(' (IDENT (',' IDENT)*)? ')' '->' expr
//! ```
//!
//! Each node spans from its introducing keyword to the end of its last child.

#include "kite/parser/parser.hpp"

namespace kite::parser {

using lexer::TokenKind;

auto Parser::parse_if_expr() -> ParseResult {
    auto start = advance().span; // 'if'

    std::vector<IfCase> cases;
    ExprPtr else_body;

    while (true) {
        auto condition = parse_expr();
        if (is_err(condition)) {
            return condition;
        }

        if (!check_keyword("then")) {
            return error_here("Expected 'then'");
        }
        advance();

        auto body = parse_expr();
        if (is_err(body)) {
            return body;
        }

        cases.push_back(
            IfCase{.condition = std::move(unwrap(condition)), .body = std::move(unwrap(body))});

        if (!check_keyword("elif")) {
            break;
        }
        advance();
    }

    if (check_keyword("else")) {
        advance();
        auto body = parse_expr();
        if (is_err(body)) {
            return body;
        }
        else_body = std::move(unwrap(body));
    }

    const auto& last = else_body ? else_body->span : cases.back().body->span;
    SourceSpan span = SourceSpan::merge(start, last);
    return make_expr(
        IfExpr{.cases = std::move(cases), .else_body = std::move(else_body), .span = span});
}

auto Parser::parse_for_expr() -> ParseResult {
    auto start = advance().span; // 'for'

    if (!check(TokenKind::Identifier)) {
        return error_here("Expected identifier");
    }
    std::string var_name = advance().text();

    if (!check(TokenKind::Eq)) {
        return error_here("Expected '='");
    }
    advance();

    auto start_value = parse_expr();
    if (is_err(start_value)) {
        return start_value;
    }

    if (!check_keyword("to")) {
        return error_here("Expected 'to'");
    }
    advance();

    auto end_value = parse_expr();
    if (is_err(end_value)) {
        return end_value;
    }

    ExprPtr step;
    if (check_keyword("step")) {
        advance();
        auto step_value = parse_expr();
        if (is_err(step_value)) {
            return step_value;
        }
        step = std::move(unwrap(step_value));
    }

    if (!check_keyword("then")) {
        return error_here("Expected 'then'");
    }
    advance();

    auto body = parse_expr();
    if (is_err(body)) {
        return body;
    }
    ExprPtr body_expr = std::move(unwrap(body));
    SourceSpan span = SourceSpan::merge(start, body_expr->span);

    return make_expr(ForExpr{.var_name = std::move(var_name),
                             .start = std::move(unwrap(start_value)),
                             .end = std::move(unwrap(end_value)),
                             .step = std::move(step),
                             .body = std::move(body_expr),
                             .span = span});
}

auto Parser::parse_while_expr() -> ParseResult {
    auto start = advance().span; // 'while'

    auto condition = parse_expr();
    if (is_err(condition)) {
        return condition;
    }

    if (!check_keyword("then")) {
        return error_here("Expected 'then'");
    }
    advance();

    auto body = parse_expr();
    if (is_err(body)) {
        return body;
    }
    ExprPtr body_expr = std::move(unwrap(body));
    SourceSpan span = SourceSpan::merge(start, body_expr->span);

    return make_expr(WhileExpr{
        .condition = std::move(unwrap(condition)), .body = std::move(body_expr), .span = span});
}

auto Parser::parse_func_def() -> ParseResult {
    auto start = advance().span; // 'fun'

    std::optional<std::string> name;
    if (check(TokenKind::Identifier)) {
        name = advance().text();
        if (!check(TokenKind::LParen)) {
            return error_here("Expected '('");
        }
    } else if (!check(TokenKind::LParen)) {
        return error_here("Expected identifier or '('");
    }
    advance();

    std::vector<std::string> params;
    if (check(TokenKind::Identifier)) {
        params.push_back(advance().text());

        while (check(TokenKind::Comma)) {
            advance();
            if (!check(TokenKind::Identifier)) {
                return error_here("Expected identifier");
            }
            params.push_back(advance().text());
        }

        if (!check(TokenKind::RParen)) {
            return error_here("Expected ',' or ')'");
        }
    } else if (!check(TokenKind::RParen)) {
        return error_here("Expected identifier or ')'");
    }
    advance();

    if (!check(TokenKind::Arrow)) {
        return error_here("Expected '->'");
    }
    advance();

    auto body = parse_expr();
    if (is_err(body)) {
        return body;
    }
    SharedExpr body_expr = std::move(unwrap(body));
    SourceSpan span = SourceSpan::merge(start, body_expr->span);

    return make_expr(FuncDefExpr{
        .name = std::move(name), .params = std::move(params), .body = body_expr, .span = span});
}

} // namespace kite::parser
