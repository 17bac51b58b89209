//! # Parser Core
//!
//! This file implements core parser infrastructure:
//!
//! - **Token access**: `peek()`, `advance()`, `check()`, `check_keyword()`
//! - **Error selection**: `error_here()`, `widen_error()`
//! - **Binary tiers**: the shared `bin_op()` loop
//! - **Entry point**: `parse()`

#include "kite/log/log.hpp"
#include "kite/parser/parser.hpp"

namespace kite::parser {

Parser::Parser(std::vector<lexer::Token> tokens) : tokens_(std::move(tokens)) {}

auto Parser::peek() const -> const lexer::Token& {
    if (pos_ >= tokens_.size()) {
        return tokens_.back(); // EOF
    }
    return tokens_[pos_];
}

auto Parser::advance() -> const lexer::Token& {
    const auto& token = peek();
    if (!token.is_eof()) {
        ++pos_;
    }
    return token;
}

auto Parser::check(lexer::TokenKind kind) const -> bool {
    return peek().kind == kind;
}

auto Parser::check_keyword(std::string_view keyword) const -> bool {
    return peek().matches(lexer::TokenKind::Keyword, keyword);
}

auto Parser::error_here(std::string message) const -> Error {
    return Error::invalid_syntax(std::move(message), peek().span);
}

auto Parser::widen_error(ParseResult result, size_t checkpoint, std::string_view message) const
    -> ParseResult {
    if (is_err(result) && pos_ == checkpoint) {
        return error_here(std::string(message));
    }
    return result;
}

auto Parser::bin_op(RuleFn left, std::initializer_list<OpEntry> ops, RuleFn right)
    -> ParseResult {
    if (!right) {
        right = left;
    }

    auto lhs_result = (this->*left)();
    if (is_err(lhs_result)) {
        return lhs_result;
    }
    ExprPtr lhs = std::move(unwrap(lhs_result));

    while (true) {
        const OpEntry* matched = nullptr;
        for (const auto& entry : ops) {
            bool hit = entry.keyword.empty() ? check(entry.kind)
                                             : peek().matches(entry.kind, entry.keyword);
            if (hit) {
                matched = &entry;
                break;
            }
        }
        if (!matched) {
            break;
        }
        advance();

        auto rhs_result = (this->*right)();
        if (is_err(rhs_result)) {
            return rhs_result;
        }
        ExprPtr rhs = std::move(unwrap(rhs_result));

        SourceSpan span = SourceSpan::merge(lhs->span, rhs->span);
        lhs = make_expr(
            BinaryExpr{.op = matched->op, .left = std::move(lhs), .right = std::move(rhs), .span = span});
    }

    return lhs;
}

auto Parser::parse() -> ParseResult {
    auto result = parse_expr();
    if (is_ok(result) && !peek().is_eof()) {
        return error_here(
            "Expected '+', '-', '*', '/', '**', '==', '!=', '<', '>', '<=', '>=', '&&' or '||'");
    }

    if (is_ok(result)) {
        KITE_LOG_TRACE("parser", "Parsed " << dump_expr(*unwrap(result)));
    } else {
        KITE_LOG_DEBUG("parser", "Syntax error: " << unwrap_err(result).message);
    }
    return result;
}

auto parse(std::vector<lexer::Token> tokens) -> ParseResult {
    Parser parser(std::move(tokens));
    return parser.parse();
}

} // namespace kite::parser
