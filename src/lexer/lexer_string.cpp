//! # Lexer - Strings
//!
//! Double-quoted string literals. The token value holds the processed text.
//!
//! ## Escape Sequences
//!
//! | Escape | Result        |
//! |--------|---------------|
//! | `\n`   | Newline       |
//! | `\t`   | Tab           |
//! | `\x`   | `x` otherwise |

#include "kite/lexer/lexer.hpp"

namespace kite::lexer {

auto Lexer::lex_string() -> Token {
    std::string text;
    bool escaped = false;

    advance(); // opening quote

    while (!is_at_end() && (peek() != '"' || escaped)) {
        char c = advance();
        if (escaped) {
            switch (c) {
            case 'n':
                text += '\n';
                break;
            case 't':
                text += '\t';
                break;
            default:
                text += c;
            }
            escaped = false;
        } else if (c == '\\') {
            escaped = true;
        } else {
            text += c;
        }
    }

    if (!is_at_end()) {
        advance(); // closing quote
    }

    return make_token(TokenKind::String, std::move(text));
}

} // namespace kite::lexer
