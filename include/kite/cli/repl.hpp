//! # Front End Drivers
//!
//! The three ways the `kite` executable feeds a session:
//!
//! | Mode        | Input                         | Output                          |
//! |-------------|-------------------------------|---------------------------------|
//! | Interactive | one line per prompt           | `repr()` of each non-null result|
//! | Eval (`-e`) | one string                    | `repr()` of a non-null result   |
//! | Script      | each non-blank line of a file | only what the program prints    |
//!
//! Errors are written to `err` in their display format. Interactive mode keeps
//! going after an error; eval and script mode stop and return 1.

#ifndef KITE_CLI_REPL_HPP
#define KITE_CLI_REPL_HPP

#include "kite/cli/options.hpp"
#include "kite/runtime/session.hpp"

#include <istream>
#include <ostream>

namespace kite::cli {

/// Reads lines from `in` until EOF. Returns the exit code (always 0).
auto run_repl(runtime::Session& session, const CliOptions& options, std::istream& in,
              std::ostream& out, std::ostream& err) -> int;

/// Evaluates `text` once. Returns 0 on success, 1 on error.
auto run_eval(runtime::Session& session, const std::string& source_name, const std::string& text,
              std::ostream& out, std::ostream& err) -> int;

/// Runs each non-blank line of the file at `path`. Returns 0 on success, 1 on
/// the first error or if the file cannot be read.
auto run_script(runtime::Session& session, const std::string& path, std::ostream& err) -> int;

} // namespace kite::cli

#endif // KITE_CLI_REPL_HPP
