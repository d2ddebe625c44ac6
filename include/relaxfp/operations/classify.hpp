#pragma once

#include <cmath>
#include <relaxfp/core/relaxed.hpp>

namespace relaxfp::inline v1 {

// Classification predicates
//
// Straight passthroughs to <cmath>: the result for a Relaxed<F> is the
// result for the F it holds, NaN and infinities included.

template <Float F> RELAXFP_INLINE bool isnan(Relaxed<F> x) {
  return std::isnan(x.get());
}

template <Float F> RELAXFP_INLINE bool isinf(Relaxed<F> x) {
  return std::isinf(x.get());
}

template <Float F> RELAXFP_INLINE bool isfinite(Relaxed<F> x) {
  return std::isfinite(x.get());
}

// Normal: not zero, subnormal, infinite or NaN
template <Float F> RELAXFP_INLINE bool isnormal(Relaxed<F> x) {
  return std::isnormal(x.get());
}

// One of FP_NAN, FP_INFINITE, FP_ZERO, FP_SUBNORMAL, FP_NORMAL
template <Float F> RELAXFP_INLINE int fpclassify(Relaxed<F> x) {
  return std::fpclassify(x.get());
}

// Sign bit set: true for -0, negative values and NaNs with the sign bit set
template <Float F> RELAXFP_INLINE bool signbit(Relaxed<F> x) {
  return std::signbit(x.get());
}

template <Float F> RELAXFP_INLINE bool is_sign_positive(Relaxed<F> x) {
  return !std::signbit(x.get());
}

template <Float F> RELAXFP_INLINE bool is_sign_negative(Relaxed<F> x) {
  return std::signbit(x.get());
}

} // namespace relaxfp::inline v1
