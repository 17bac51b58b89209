//! # Diagnostics
//!
//! The single error type shared by the lexer, parser and interpreter.
//!
//! ## Error Kinds
//!
//! | Kind               | Stage       | Display name        |
//! |--------------------|-------------|---------------------|
//! | `IllegalCharacter` | Lexer       | `Illegal Character` |
//! | `InvalidSyntax`    | Parser      | `Invalid Syntax`    |
//! | `Runtime`          | Interpreter | `Runtime Error`     |
//!
//! Runtime errors carry a `RuntimeErrorKind` and a traceback captured from the
//! context chain at the moment the error is raised.
//!
//! ## Display Format
//!
//! ```text
//! Invalid Syntax: 'Expected 'then''
//! 	File: '<stdin>' row(0), col(10)
//!
//! if 1 == 1 2
//!           ^
//! ```

#ifndef KITE_ERROR_HPP
#define KITE_ERROR_HPP

#include "kite/common.hpp"
#include "kite/lexer/position.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace kite {

/// Pipeline stage that produced an error.
enum class ErrorKind : uint8_t {
    IllegalCharacter,
    InvalidSyntax,
    Runtime,
};

/// Subdivision of runtime errors.
enum class RuntimeErrorKind : uint8_t {
    None,              ///< Not a runtime error.
    UndefinedVariable, ///< Name not bound in any enclosing environment.
    DivisionByZero,    ///< Divisor is exactly zero.
    IllegalOperation,  ///< Operator not defined for the operand variants.
    ArityMismatch,     ///< Wrong number of call arguments.
    InvalidArgument,   ///< Builtin received an argument of the wrong variant.
    IndexOutOfRange,   ///< List index outside `[0, size)`.
};

[[nodiscard]] auto error_kind_name(ErrorKind kind) -> std::string_view;
[[nodiscard]] auto runtime_error_kind_name(RuntimeErrorKind kind) -> std::string_view;

/// One traceback line: the position reached inside a context.
struct TraceFrame {
    std::string context_name;
    lexer::Position position;
};

struct Error {
    ErrorKind kind;
    RuntimeErrorKind runtime_kind = RuntimeErrorKind::None;
    std::string message;
    SourceSpan span;
    std::vector<TraceFrame> traceback; ///< Innermost frame first. Runtime errors only.

    [[nodiscard]] static auto illegal_character(std::string message, SourceSpan span) -> Error;
    [[nodiscard]] static auto invalid_syntax(std::string message, SourceSpan span) -> Error;
    [[nodiscard]] static auto runtime(RuntimeErrorKind kind, std::string message, SourceSpan span,
                                      std::vector<TraceFrame> traceback) -> Error;

    [[nodiscard]] auto is_runtime() const -> bool {
        return kind == ErrorKind::Runtime;
    }

    [[nodiscard]] auto name() const -> std::string_view {
        return error_kind_name(kind);
    }

    /// Full multi-line rendering, ending with a newline.
    [[nodiscard]] auto to_string() const -> std::string;
};

/// The source row of `span.start` followed by a caret underline.
///
/// The underline is `start.col` spaces and `max(1, end.col - start.col)`
/// carets. A span that crosses rows is underlined to the end of its first row.
[[nodiscard]] auto string_with_arrows(const SourceSpan& span) -> std::string;

} // namespace kite

#endif // KITE_ERROR_HPP
