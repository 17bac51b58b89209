//! # Source Positions
//!
//! A `Position` is a cursor into a `Source`: byte index plus 0-based row and
//! column. The lexer advances one position character by character and copies
//! it whenever a token starts or ends, so every token, AST node and runtime
//! value carries an independent `(start, end)` snapshot.
//!
//! Positions share ownership of their source. A function body defined on one
//! REPL line keeps that line's text alive for later diagnostics.

#ifndef KITE_LEXER_POSITION_HPP
#define KITE_LEXER_POSITION_HPP

#include "kite/common.hpp"
#include "kite/lexer/source.hpp"

#include <cstdint>
#include <string_view>

namespace kite::lexer {

struct Position {
    size_t index = 0;            ///< Byte offset into the source.
    uint32_t row = 0;            ///< 0-based row.
    uint32_t col = 0;            ///< 0-based column.
    Rc<const Source> source;     ///< Owning source, null for synthetic positions.

    /// Moves past `c`. A newline resets the column and starts the next row.
    void advance(char c);

    /// Returns a copy advanced past `c`.
    [[nodiscard]] auto advanced(char c) const -> Position {
        Position next = *this;
        next.advance(c);
        return next;
    }

    [[nodiscard]] auto file_name() const -> std::string_view {
        return source ? source->filename() : std::string_view{};
    }

    [[nodiscard]] auto file_text() const -> std::string_view {
        return source ? source->content() : std::string_view{};
    }

    [[nodiscard]] auto operator==(const Position& other) const -> bool {
        return index == other.index && row == other.row && col == other.col &&
               source == other.source;
    }
};

} // namespace kite::lexer

namespace kite {

/// A `(start, end)` range of source. `end` is exclusive.
struct SourceSpan {
    lexer::Position start;
    lexer::Position end;

    /// The span from the start of `a` to the end of `b`.
    [[nodiscard]] static auto merge(const SourceSpan& a, const SourceSpan& b) -> SourceSpan {
        return {a.start, b.end};
    }
};

} // namespace kite

#endif // KITE_LEXER_POSITION_HPP
