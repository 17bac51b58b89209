#include "kite/lexer/position.hpp"

namespace kite::lexer {

void Position::advance(char c) {
    ++index;
    ++col;
    if (c == '\n') {
        col = 0;
        ++row;
    }
}

} // namespace kite::lexer
