//! # Lexer - Operators
//!
//! ## Single-Character Tokens
//!
//! `+ / ( ) [ ] ,`
//!
//! ## Multi-Character Operators
//!
//! | Operator | Variants            |
//! |----------|---------------------|
//! | `-`      | `->`                |
//! | `*`      | `**`                |
//! | `=`      | `==`                |
//! | `!`      | `!=` (else keyword) |
//! | `<`      | `<=`                |
//! | `>`      | `>=`                |
//! | `&`      | `&&` only           |
//! | `\|`     | `\|\|` only         |

#include "kite/lexer/lexer.hpp"

namespace kite::lexer {

auto Lexer::lex_operator() -> Result<Token, Error> {
    char c = advance();

    switch (c) {
    case '+':
        return make_token(TokenKind::Plus);
    case '/':
        return make_token(TokenKind::Div);
    case '(':
        return make_token(TokenKind::LParen);
    case ')':
        return make_token(TokenKind::RParen);
    case '[':
        return make_token(TokenKind::LSquare);
    case ']':
        return make_token(TokenKind::RSquare);
    case ',':
        return make_token(TokenKind::Comma);

    case '-':
        if (peek() == '>') {
            advance();
            return make_token(TokenKind::Arrow);
        }
        return make_token(TokenKind::Minus);

    case '*':
        if (peek() == '*') {
            advance();
            return make_token(TokenKind::Pow);
        }
        return make_token(TokenKind::Mul);

    case '=':
        if (peek() == '=') {
            advance();
            return make_token(TokenKind::EE);
        }
        return make_token(TokenKind::Eq);

    case '!':
        if (peek() == '=') {
            advance();
            return make_token(TokenKind::NE);
        }
        return make_token(TokenKind::Keyword, "!");

    case '<':
        if (peek() == '=') {
            advance();
            return make_token(TokenKind::LTE);
        }
        return make_token(TokenKind::LT);

    case '>':
        if (peek() == '=') {
            advance();
            return make_token(TokenKind::GTE);
        }
        return make_token(TokenKind::GT);

    case '&':
        if (peek() == '&') {
            advance();
            return make_token(TokenKind::Keyword, "&&");
        }
        break;

    case '|':
        if (peek() == '|') {
            advance();
            return make_token(TokenKind::Keyword, "||");
        }
        break;

    default:
        break;
    }

    return Error::illegal_character(std::string(1, c), SourceSpan{token_start_, pos_});
}

} // namespace kite::lexer
