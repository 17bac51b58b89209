//! # Source Text Management
//!
//! A `Source` owns one piece of program text (a REPL line or a script) and the
//! label it is reported under. It provides row access for diagnostics.
//!
//! ## Example
//!
//! ```cpp
//! auto source = make_rc<const Source>(Source::from_string("var x = 42", "<stdin>"));
//! std::string_view row = source->line(0); // "var x = 42"
//! ```

#ifndef KITE_LEXER_SOURCE_HPP
#define KITE_LEXER_SOURCE_HPP

#include "kite/common.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace kite::lexer {

/// Program text plus its source name.
///
/// String views returned by `content()`, `slice()` and `line()` are valid as
/// long as the Source object exists.
class Source {
public:
    /// Constructs a source from a name and content. Builds the row index.
    Source(std::string filename, std::string content);

    [[nodiscard]] auto content() const -> std::string_view {
        return content_;
    }

    [[nodiscard]] auto filename() const -> std::string_view {
        return filename_;
    }

    [[nodiscard]] auto length() const -> size_t {
        return content_.size();
    }

    /// Returns the character at the given offset, or '\0' past the end.
    [[nodiscard]] auto at(size_t offset) const -> char;

    /// Returns a substring from `start` to `end` (exclusive), clamped to bounds.
    [[nodiscard]] auto slice(size_t start, size_t end) const -> std::string_view;

    /// Returns the text of a 0-based row without its trailing newline.
    ///
    /// Returns an empty view if the row is out of range.
    [[nodiscard]] auto line(uint32_t row) const -> std::string_view;

    [[nodiscard]] auto line_count() const -> uint32_t;

    /// Loads a source file from disk.
    [[nodiscard]] static auto from_file(const std::string& path) -> Result<Source, std::string>;

    /// Creates a source from an in-memory string.
    [[nodiscard]] static auto from_string(std::string content, std::string name = "<input>")
        -> Source;

private:
    std::string filename_;
    std::string content_;
    std::vector<size_t> line_offsets_; ///< Byte offset of each row start.

    void build_line_index();
};

} // namespace kite::lexer

#endif // KITE_LEXER_SOURCE_HPP
