//! # Sessions
//!
//! A `Session` runs one top-level input at a time through the full pipeline
//! (lex, parse, evaluate) against a global environment that persists between
//! runs. Variables and functions defined by one `run()` are visible to the
//! next.
//!
//! After every run the session releases the call environments that neither
//! the globals nor the run's result can reach. A function value kept by the
//! host across runs may therefore lose its defining scope.
//!
//! ## Example
//!
//! ```cpp
//! Session session;
//! (void)session.run("<stdin>", "fun add(a, b) -> a + b");
//! auto result = session.run("<stdin>", "add(2, 3)");
//! if (is_ok(result)) {
//!     std::cout << unwrap(result)->repr() << "\n"; // 5
//! } else {
//!     std::cerr << unwrap_err(result).to_string();
//! }
//! ```
//!
//! Sessions share no state; independent sessions may live side by side.

#ifndef KITE_RUNTIME_SESSION_HPP
#define KITE_RUNTIME_SESSION_HPP

#include "kite/common.hpp"
#include "kite/error.hpp"
#include "kite/interp/environment.hpp"
#include "kite/interp/interpreter.hpp"
#include "kite/interp/value.hpp"

#include <iostream>
#include <ostream>
#include <string>

namespace kite::runtime {

struct SessionOptions {
    std::ostream* output = &std::cout; ///< Where `print` writes. Must outlive the session.
};

class Session {
public:
    explicit Session(SessionOptions options = {});

    /// Lexes, parses and evaluates one input.
    ///
    /// `source_name` only labels diagnostics (e.g. `<stdin>`).
    [[nodiscard]] auto run(std::string source_name, std::string source_text)
        -> Result<interp::ValuePtr, Error>;

    [[nodiscard]] auto globals() const -> const interp::EnvPtr& {
        return globals_;
    }

    /// Number of environments the session currently owns, globals included.
    [[nodiscard]] auto live_environments() const -> size_t {
        return interpreter_.arena().size();
    }

    /// Number of successful `run()` calls.
    [[nodiscard]] auto run_count() const -> size_t {
        return run_count_;
    }

private:
    SessionOptions options_;
    interp::Interpreter interpreter_;
    interp::EnvPtr globals_;
    size_t run_count_ = 0;
};

} // namespace kite::runtime

#endif // KITE_RUNTIME_SESSION_HPP
