//! # Lexer - Identifiers
//!
//! Identifiers start with an ASCII letter or `_` and continue with letters,
//! digits and `_`. Reserved words are emitted as `Keyword` tokens carrying
//! their text.

#include "kite/lexer/lexer.hpp"

namespace kite::lexer {

auto Lexer::lex_identifier() -> Token {
    std::string text;
    while (!is_at_end() && is_identifier_continue(peek())) {
        text += advance();
    }

    auto kind = is_keyword(text) ? TokenKind::Keyword : TokenKind::Identifier;
    return make_token(kind, std::move(text));
}

} // namespace kite::lexer
