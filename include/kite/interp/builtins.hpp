//! # Builtins
//!
//! Names bound in every session's global environment.
//!
//! ## Constants
//!
//! `null`, `true`, `false`
//!
//! ## Functions
//!
//! | Name         | Params           | Result                                  |
//! |--------------|------------------|-----------------------------------------|
//! | `print`      | `value`          | writes the plain text and a newline; `null` |
//! | `str`        | `value`          | plain text as a String                  |
//! | `len`        | `value`          | length of a String or List              |
//! | `isNumber`   | `value`          | Boolean                                 |
//! | `isString`   | `value`          | Boolean                                 |
//! | `isList`     | `value`          | Boolean                                 |
//! | `isFunction` | `value`          | Boolean, true for builtins as well      |
//! | `append`     | `list, value`    | new List with `value` at the end        |
//! | `extend`     | `listA, listB`   | new List with both lists' elements      |
//!
//! `append` and `extend` never modify their arguments.

#ifndef KITE_INTERP_BUILTINS_HPP
#define KITE_INTERP_BUILTINS_HPP

#include "kite/interp/environment.hpp"

#include <ostream>

namespace kite::interp {

/// Binds the constants and builtin functions in `globals`.
///
/// `print` writes to `out`, which must outlive the environment.
void register_builtins(Environment& globals, std::ostream& out);

} // namespace kite::interp

#endif // KITE_INTERP_BUILTINS_HPP
