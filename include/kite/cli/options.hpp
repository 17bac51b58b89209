//! # Command-Line Options
//!
//! ```text
//! kite [options] [script]
//!
//!   -e <text>, --eval=<text>   Evaluate one input and exit
//!   --prompt=<text>            Interactive prompt (default "basic> ")
//!   --version                  Print the version and exit
//!   -h, --help                 Print usage and exit
//! ```
//!
//! Logging flags (`--log-level=`, `-v`, `-q`, ...) are accepted and skipped
//! here; `log::parse_log_options()` handles them.

#ifndef KITE_CLI_OPTIONS_HPP
#define KITE_CLI_OPTIONS_HPP

#include "kite/common.hpp"

#include <optional>
#include <ostream>
#include <string>

namespace kite::cli {

struct CliOptions {
    std::string prompt = "basic> ";
    std::string source_name = "<stdin>"; ///< Diagnostic label for interactive and `-e` input.
    std::optional<std::string> eval_text;
    std::optional<std::string> script_path;
    bool show_version = false;
    bool show_help = false;
};

/// Parses argv. Returns an error message for unknown or malformed arguments.
[[nodiscard]] auto parse_cli_options(int argc, char* argv[]) -> Result<CliOptions, std::string>;

void print_usage(std::ostream& out);
void print_version(std::ostream& out);

} // namespace kite::cli

#endif // KITE_CLI_OPTIONS_HPP
