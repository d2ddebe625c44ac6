#pragma once

#include <relaxfp/operations/intrinsics.hpp>

namespace relaxfp::inline v1::ext {

// Named relaxed operations on bare float/double
//
// An alternative to the Relaxed<F> wrapper for code that keeps plain
// primitives: no wrapper value is introduced, and every call carries the
// assume_finite tag as its precondition marker.
//
//   double s = ext::fast_add(assume_finite, a, b);
//
// Same primitives, same contract as the wrapper operators: operands must be
// finite, otherwise the behavior is undefined.

template <Float F>
RELAXFP_INLINE constexpr F fast_add(assume_finite_t tag, F a, F b) {
  return intrinsics::fadd_fast(tag, a, b);
}

template <Float F>
RELAXFP_INLINE constexpr F fast_sub(assume_finite_t tag, F a, F b) {
  return intrinsics::fsub_fast(tag, a, b);
}

template <Float F>
RELAXFP_INLINE constexpr F fast_mul(assume_finite_t tag, F a, F b) {
  return intrinsics::fmul_fast(tag, a, b);
}

template <Float F>
RELAXFP_INLINE constexpr F fast_div(assume_finite_t tag, F a, F b) {
  return intrinsics::fdiv_fast(tag, a, b);
}

// Truncated remainder, sign of the dividend
template <Float F> RELAXFP_INLINE F fast_rem(assume_finite_t tag, F a, F b) {
  return intrinsics::frem_fast(tag, a, b);
}

} // namespace relaxfp::inline v1::ext
