#pragma once

#include <cmath>
#include <relaxfp/core/config.hpp>
#include <relaxfp/core/types.hpp>
#include <type_traits>

namespace relaxfp::inline v1 {

// Tag acknowledging the precondition of a relaxed primitive
//
// Every relaxed primitive takes this tag as its first argument, so each call
// site states in the source that it guarantees finite operands. Passing a NaN
// or an infinity is undefined behavior; it is never reported.
struct assume_finite_t {
  explicit assume_finite_t() = default;
};
inline constexpr assume_finite_t assume_finite{};

} // namespace relaxfp::inline v1

namespace relaxfp::inline v1::intrinsics {

// Relaxed ("fast-math") primitives
//
// Each primitive computes the IEEE operation, but under a scope where the
// compiler may:
// - assume neither operand is NaN or infinite,
// - ignore the sign of zero,
// - reassociate and contract chains of relaxed operations
//   (e.g. reorder a summation, fuse a*b+c),
// - replace a division by multiplication with the reciprocal.
//
// The result is only meaningful when it is finite too: an overflow or a
// division by zero yields an unspecified value.
//
// Only Clang exposes these flags per block (RELAXFP_FAST_MATH_SCOPE). Other
// compilers get the finite-operand assumption only. The finiteness check
// stays outside the fast-math block, where isfinite is still honored.
//
// During constant evaluation the operations are plain IEEE arithmetic.

namespace detail {

template <Float F>
RELAXFP_INLINE constexpr void require_finite(F a, F b) {
  if (std::is_constant_evaluated()) {
    return;
  }
  RELAXFP_ASSERT(std::isfinite(a) && std::isfinite(b),
                 "relaxed arithmetic requires finite operands");
  RELAXFP_ASSUME(RELAXFP_IS_FINITE(a) && RELAXFP_IS_FINITE(b));
}

} // namespace detail

template <Float F>
RELAXFP_INLINE constexpr F fadd_fast(assume_finite_t, F a, F b) {
  detail::require_finite(a, b);
  {
    RELAXFP_FAST_MATH_SCOPE
    return a + b;
  }
}

template <Float F>
RELAXFP_INLINE constexpr F fsub_fast(assume_finite_t, F a, F b) {
  detail::require_finite(a, b);
  {
    RELAXFP_FAST_MATH_SCOPE
    return a - b;
  }
}

template <Float F>
RELAXFP_INLINE constexpr F fmul_fast(assume_finite_t, F a, F b) {
  detail::require_finite(a, b);
  {
    RELAXFP_FAST_MATH_SCOPE
    return a * b;
  }
}

template <Float F>
RELAXFP_INLINE constexpr F fdiv_fast(assume_finite_t, F a, F b) {
  detail::require_finite(a, b);
  {
    RELAXFP_FAST_MATH_SCOPE
    return a / b;
  }
}

// Truncated remainder: the result has the sign of the dividend, as fmod.
// Not constexpr: std::fmod is not usable in constant expressions before
// C++23.
template <Float F>
RELAXFP_INLINE F frem_fast(assume_finite_t, F a, F b) {
  detail::require_finite(a, b);
  {
    RELAXFP_FAST_MATH_SCOPE
    return std::fmod(a, b);
  }
}

} // namespace relaxfp::inline v1::intrinsics
