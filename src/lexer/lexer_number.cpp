//! # Lexer - Numbers
//!
//! Numeric literals are runs of digits with at most one `.`:
//!
//! | Input  | Token        |
//! |--------|--------------|
//! | `42`   | `INT:42`     |
//! | `3.14` | `FLOAT:3.14` |
//! | `.5`   | `FLOAT:.5`   |
//! | `2.`   | `FLOAT:2.`   |
//!
//! A second `.` ends the literal, so `1.2.3` lexes as `FLOAT:1.2` then
//! `FLOAT:.3`.

#include "kite/lexer/lexer.hpp"

namespace kite::lexer {

auto Lexer::lex_number() -> Token {
    std::string text;
    bool has_dot = false;

    while (!is_at_end() && is_digit(peek())) {
        if (peek() == '.') {
            if (has_dot) {
                break;
            }
            has_dot = true;
        }
        text += advance();
    }

    return make_token(has_dot ? TokenKind::Float : TokenKind::Int, std::move(text));
}

} // namespace kite::lexer
