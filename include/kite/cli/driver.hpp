//! # CLI Driver
//!
//! `kite_main()` configures logging, parses arguments and dispatches to the
//! interactive loop, `-e` evaluation or a script file.
//!
//! Exit codes: 0 on success, 1 when the program reports an error, 2 on bad
//! command-line arguments.

#ifndef KITE_CLI_DRIVER_HPP
#define KITE_CLI_DRIVER_HPP

namespace kite::cli {

auto kite_main(int argc, char* argv[]) -> int;

} // namespace kite::cli

#endif // KITE_CLI_DRIVER_HPP
