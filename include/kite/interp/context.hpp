//! # Execution Contexts
//!
//! A `Context` is one call-stack frame: the program itself or one function
//! invocation. Contexts exist only to build tracebacks; variable lookup goes
//! through `Environment` instead.
//!
//! ```text
//! <program>            entry: none
//!   └─ add             entry: call site of add(...) in <program>
//!        └─ helper     entry: call site of helper(...) inside add
//! ```

#ifndef KITE_INTERP_CONTEXT_HPP
#define KITE_INTERP_CONTEXT_HPP

#include "kite/common.hpp"
#include "kite/error.hpp"
#include "kite/lexer/position.hpp"

#include <optional>
#include <string>
#include <vector>

namespace kite::interp {

struct Context;
using ContextPtr = Rc<const Context>;

struct Context {
    std::string name;                     ///< `<program>` or the function name.
    ContextPtr parent;                    ///< Calling context, null for the program.
    std::optional<lexer::Position> entry; ///< Call site in the parent context.
};

/// Creates the root `<program>` context.
[[nodiscard]] auto make_program_context() -> ContextPtr;

/// Creates the context for a call made from `caller` at `call_site`.
[[nodiscard]] auto make_call_context(std::string name, ContextPtr caller,
                                     const lexer::Position& call_site) -> ContextPtr;

/// Walks the context chain, innermost first, starting at `position` in `context`.
[[nodiscard]] auto capture_traceback(const ContextPtr& context, const lexer::Position& position)
    -> std::vector<TraceFrame>;

/// Builds a runtime error with a traceback rooted at `span.start`.
[[nodiscard]] auto runtime_error(RuntimeErrorKind kind, std::string message,
                                 const SourceSpan& span, const ContextPtr& context) -> Error;

} // namespace kite::interp

#endif // KITE_INTERP_CONTEXT_HPP
