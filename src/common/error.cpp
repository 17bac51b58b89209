//! # Error Rendering
//!
//! Display names, constructors and the text format of `kite::Error`.

#include "kite/error.hpp"

#include <algorithm>
#include <sstream>

namespace kite {

auto error_kind_name(ErrorKind kind) -> std::string_view {
    switch (kind) {
    case ErrorKind::IllegalCharacter:
        return "Illegal Character";
    case ErrorKind::InvalidSyntax:
        return "Invalid Syntax";
    case ErrorKind::Runtime:
        return "Runtime Error";
    }
    return "Error";
}

auto runtime_error_kind_name(RuntimeErrorKind kind) -> std::string_view {
    switch (kind) {
    case RuntimeErrorKind::None:
        return "None";
    case RuntimeErrorKind::UndefinedVariable:
        return "UndefinedVariable";
    case RuntimeErrorKind::DivisionByZero:
        return "DivisionByZero";
    case RuntimeErrorKind::IllegalOperation:
        return "IllegalOperation";
    case RuntimeErrorKind::ArityMismatch:
        return "ArityMismatch";
    case RuntimeErrorKind::InvalidArgument:
        return "InvalidArgument";
    case RuntimeErrorKind::IndexOutOfRange:
        return "IndexOutOfRange";
    }
    return "Unknown";
}

auto Error::illegal_character(std::string message, SourceSpan span) -> Error {
    return Error{ErrorKind::IllegalCharacter, RuntimeErrorKind::None, std::move(message),
                 std::move(span), {}};
}

auto Error::invalid_syntax(std::string message, SourceSpan span) -> Error {
    return Error{ErrorKind::InvalidSyntax, RuntimeErrorKind::None, std::move(message),
                 std::move(span), {}};
}

auto Error::runtime(RuntimeErrorKind kind, std::string message, SourceSpan span,
                    std::vector<TraceFrame> traceback) -> Error {
    return Error{ErrorKind::Runtime, kind, std::move(message), std::move(span),
                 std::move(traceback)};
}

auto Error::to_string() const -> std::string {
    std::ostringstream out;
    const auto& start = span.start;

    if (is_runtime()) {
        out << "Traceback (most recent call last):\n";
        for (const auto& frame : traceback) {
            out << "\tFile: '" << frame.position.file_name() << "' row(" << frame.position.row
                << "), col(" << frame.position.col << "), in " << frame.context_name << "\n";
        }
        out << name() << ": '" << message << "'\n";
    } else {
        out << name() << ": '" << message << "'\n";
        out << "\tFile: '" << start.file_name() << "' row(" << start.row << "), col(" << start.col
            << ")\n\n";
    }

    out << string_with_arrows(span) << "\n";
    return out.str();
}

auto string_with_arrows(const SourceSpan& span) -> std::string {
    const auto& start = span.start;
    const auto& end = span.end;
    if (!start.source) {
        return "";
    }

    std::string_view row_text = start.source->line(start.row);
    std::string result(row_text);
    result += '\n';

    uint32_t width = 1;
    if (end.row == start.row) {
        if (end.col > start.col) {
            width = end.col - start.col;
        }
    } else if (row_text.size() > start.col) {
        width = static_cast<uint32_t>(row_text.size()) - start.col;
    }

    result.append(start.col, ' ');
    result.append(width, '^');
    return result;
}

} // namespace kite
