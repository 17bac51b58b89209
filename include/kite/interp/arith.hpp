//! # Checked Integer Arithmetic
//!
//! Overflow-checked `int64_t` operations used by the number operators and the
//! for-loop counter. Each returns false and leaves `out` untouched when the
//! exact result does not fit.

#ifndef KITE_INTERP_ARITH_HPP
#define KITE_INTERP_ARITH_HPP

#include <cstddef>
#include <cstdint>
#include <limits>

namespace kite::interp {

inline auto checked_add(int64_t a, int64_t b, int64_t& out) -> bool {
    constexpr auto max = std::numeric_limits<int64_t>::max();
    constexpr auto min = std::numeric_limits<int64_t>::min();
    if ((b > 0 && a > max - b) || (b < 0 && a < min - b)) {
        return false;
    }
    out = a + b;
    return true;
}

inline auto checked_sub(int64_t a, int64_t b, int64_t& out) -> bool {
    constexpr auto max = std::numeric_limits<int64_t>::max();
    constexpr auto min = std::numeric_limits<int64_t>::min();
    if ((b < 0 && a > max + b) || (b > 0 && a < min + b)) {
        return false;
    }
    out = a - b;
    return true;
}

inline auto checked_mul(int64_t a, int64_t b, int64_t& out) -> bool {
    constexpr auto max = std::numeric_limits<int64_t>::max();
    constexpr auto min = std::numeric_limits<int64_t>::min();
    if (a == 0 || b == 0) {
        out = 0;
        return true;
    }
    if (a > 0) {
        if ((b > 0 && a > max / b) || (b < 0 && b < min / a)) {
            return false;
        }
    } else {
        if ((b > 0 && a < min / b) || (b < 0 && a < max / b)) {
            return false;
        }
    }
    out = a * b;
    return true;
}

/// `a * b` for sizes, failing when the product exceeds `limit`.
inline auto checked_size_mul(size_t a, size_t b, size_t limit, size_t& out) -> bool {
    if (a != 0 && b > limit / a) {
        return false;
    }
    out = a * b;
    return true;
}

} // namespace kite::interp

#endif // KITE_INTERP_ARITH_HPP
