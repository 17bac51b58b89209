//! # Front End Drivers
//!
//! Interactive loop, one-shot evaluation and line-by-line scripts.

#include "kite/cli/repl.hpp"

#include "kite/lexer/source.hpp"
#include "kite/log/log.hpp"

#include <string>

namespace kite::cli {

namespace {

auto is_blank(const std::string& line) -> bool {
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

/// Prints a successful result unless it is null. Returns false on error.
auto report(const Result<interp::ValuePtr, Error>& result, std::ostream& out, std::ostream& err)
    -> bool {
    if (is_err(result)) {
        err << unwrap_err(result).to_string();
        return false;
    }

    const auto& value = unwrap(result);
    if (!value->is<interp::NullValue>()) {
        out << value->repr() << "\n";
    }
    return true;
}

} // anonymous namespace

auto run_repl(runtime::Session& session, const CliOptions& options, std::istream& in,
              std::ostream& out, std::ostream& err) -> int {
    std::string line;

    while (true) {
        out << options.prompt << std::flush;
        if (!std::getline(in, line)) {
            out << "\n";
            break;
        }
        if (is_blank(line)) {
            continue;
        }

        auto result = session.run(options.source_name, line);
        report(result, out, err);
    }

    KITE_LOG_INFO("repl", "Session ended after " << session.run_count() << " successful inputs");
    return 0;
}

auto run_eval(runtime::Session& session, const std::string& source_name, const std::string& text,
              std::ostream& out, std::ostream& err) -> int {
    auto result = session.run(source_name, text);
    return report(result, out, err) ? 0 : 1;
}

auto run_script(runtime::Session& session, const std::string& path, std::ostream& err) -> int {
    auto source = lexer::Source::from_file(path);
    if (is_err(source)) {
        err << "error: " << unwrap_err(source) << "\n";
        return 1;
    }

    const auto& file = unwrap(source);
    for (uint32_t row = 0; row < file.line_count(); ++row) {
        std::string line(file.line(row));
        if (is_blank(line)) {
            continue;
        }

        KITE_LOG_DEBUG("repl", path << ":" << row + 1);
        auto result = session.run(path, std::move(line));
        if (is_err(result)) {
            err << unwrap_err(result).to_string();
            return 1;
        }
    }
    return 0;
}

} // namespace kite::cli
