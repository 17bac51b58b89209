//! # Token Utilities
//!
//! Kind names, the keyword set, and token formatting.

#include "kite/lexer/token.hpp"

#include <array>

namespace kite::lexer {

namespace {

constexpr std::array<std::string_view, 13> KEYWORDS = {
    "var", "&&", "||", "!", "if", "then", "elif", "else", "for", "to", "step", "while", "fun",
};

} // anonymous namespace

auto token_kind_to_string(TokenKind kind) -> std::string_view {
    switch (kind) {
    case TokenKind::Int:
        return "INT";
    case TokenKind::Float:
        return "FLOAT";
    case TokenKind::String:
        return "STRING";
    case TokenKind::Identifier:
        return "IDENTIFIER";
    case TokenKind::Keyword:
        return "KEYWORD";
    case TokenKind::Plus:
        return "PLUS";
    case TokenKind::Minus:
        return "MINUS";
    case TokenKind::Mul:
        return "MUL";
    case TokenKind::Div:
        return "DIV";
    case TokenKind::Pow:
        return "POW";
    case TokenKind::Eq:
        return "EQ";
    case TokenKind::LParen:
        return "LPAREN";
    case TokenKind::RParen:
        return "RPAREN";
    case TokenKind::LSquare:
        return "LSQUARE";
    case TokenKind::RSquare:
        return "RSQUARE";
    case TokenKind::EE:
        return "EE";
    case TokenKind::NE:
        return "NE";
    case TokenKind::LT:
        return "LT";
    case TokenKind::GT:
        return "GT";
    case TokenKind::LTE:
        return "LTE";
    case TokenKind::GTE:
        return "GTE";
    case TokenKind::Comma:
        return "COMMA";
    case TokenKind::Arrow:
        return "ARROW";
    case TokenKind::Eof:
        return "EOF";
    }
    return "UNKNOWN";
}

auto is_keyword(std::string_view text) -> bool {
    for (auto keyword : KEYWORDS) {
        if (keyword == text) {
            return true;
        }
    }
    return false;
}

auto Token::text() const -> const std::string& {
    static const std::string empty;
    return value ? *value : empty;
}

auto Token::to_string() const -> std::string {
    std::string result(token_kind_to_string(kind));
    if (value) {
        result += ':';
        result += *value;
    }
    return result;
}

} // namespace kite::lexer
