//! # Lexer Core
//!
//! This file implements the scanning loop and shared lexer helpers:
//!
//! - **Character access**: `peek()`, `advance()`, `is_at_end()`
//! - **Token creation**: `make_token()`
//! - **Dispatch**: `tokenize()` routes each character to a token lexer

#include "kite/lexer/lexer.hpp"
#include "kite/log/log.hpp"

namespace kite::lexer {

Lexer::Lexer(Rc<const Source> source) : source_(std::move(source)) {
    pos_.source = source_;
    token_start_ = pos_;
}

auto Lexer::peek() const -> char {
    return source_->at(pos_.index);
}

auto Lexer::is_at_end() const -> bool {
    return pos_.index >= source_->length();
}

auto Lexer::advance() -> char {
    char c = peek();
    pos_.advance(c);
    return c;
}

auto Lexer::make_token(TokenKind kind) const -> Token {
    return Token{.kind = kind, .value = std::nullopt, .span = {token_start_, pos_}};
}

auto Lexer::make_token(TokenKind kind, std::string value) const -> Token {
    return Token{.kind = kind, .value = std::move(value), .span = {token_start_, pos_}};
}

auto Lexer::is_digit(char c) -> bool {
    return (c >= '0' && c <= '9') || c == '.';
}

auto Lexer::is_identifier_start(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

auto Lexer::is_identifier_continue(char c) -> bool {
    return is_identifier_start(c) || (c >= '0' && c <= '9');
}

auto Lexer::tokenize() -> Result<std::vector<Token>, Error> {
    std::vector<Token> tokens;

    while (!is_at_end()) {
        char c = peek();
        token_start_ = pos_;

        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            advance();
        } else if (is_digit(c)) {
            tokens.push_back(lex_number());
        } else if (is_identifier_start(c)) {
            tokens.push_back(lex_identifier());
        } else if (c == '"') {
            tokens.push_back(lex_string());
        } else {
            auto result = lex_operator();
            if (is_err(result)) {
                KITE_LOG_DEBUG("lexer", "Illegal character at row " << pos_.row << ", col "
                                                                     << pos_.col);
                return unwrap_err(result);
            }
            tokens.push_back(std::move(unwrap(result)));
        }
    }

    // EOF covers one column past the last character
    token_start_ = pos_;
    Token eof{.kind = TokenKind::Eof, .value = std::nullopt, .span = {pos_, pos_.advanced('\0')}};
    tokens.push_back(std::move(eof));

    KITE_LOG_TRACE("lexer", "Produced " << tokens.size() << " tokens from '"
                                        << source_->filename() << "'");
    return tokens;
}

auto tokenize(std::string source_name, std::string text) -> Result<std::vector<Token>, Error> {
    auto source = make_rc<const Source>(std::move(source_name), std::move(text));
    Lexer lexer(source);
    return lexer.tokenize();
}

} // namespace kite::lexer
