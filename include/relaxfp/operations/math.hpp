#pragma once

#include <cmath>
#include <limits>
#include <numbers>
#include <relaxfp/core/relaxed.hpp>
#include <type_traits>
#include <utility>

namespace relaxfp::inline v1 {

// Delegated math functions
//
// Every function here forwards to the primitive's own IEEE 754 operation in
// <cmath>; none of them uses the relaxed primitives, so NaN and infinity
// inputs are handled exactly as for a bare float/double (sqrt(-1) is NaN).
//
// The functions live in namespace relaxfp and are found by argument dependent
// lookup, so generic code written as
//
//   using std::sqrt;
//   auto r = sqrt(x);
//
// works for float, double and Relaxed<F>. Results of type F come back
// wrapped. Extra arguments of type F are taken as std::type_identity_t<F>, so
// they accept a bare primitive or a Relaxed<F> alike.

template <Float F> using arg_t = std::type_identity_t<F>;

// Rounding

template <Float F> RELAXFP_INLINE Relaxed<F> floor(Relaxed<F> x) {
  return Relaxed<F>(std::floor(x.get()));
}

template <Float F> RELAXFP_INLINE Relaxed<F> ceil(Relaxed<F> x) {
  return Relaxed<F>(std::ceil(x.get()));
}

// Halfway cases round away from zero
template <Float F> RELAXFP_INLINE Relaxed<F> round(Relaxed<F> x) {
  return Relaxed<F>(std::round(x.get()));
}

template <Float F> RELAXFP_INLINE Relaxed<F> trunc(Relaxed<F> x) {
  return Relaxed<F>(std::trunc(x.get()));
}

// Fractional part, with the sign of x: x - trunc(x)
template <Float F> RELAXFP_INLINE Relaxed<F> fract(Relaxed<F> x) {
  return Relaxed<F>(x.get() - std::trunc(x.get()));
}

// Sign and magnitude

template <Float F> RELAXFP_INLINE Relaxed<F> abs(Relaxed<F> x) {
  return Relaxed<F>(std::fabs(x.get()));
}

template <Float F> RELAXFP_INLINE Relaxed<F> fabs(Relaxed<F> x) {
  return Relaxed<F>(std::fabs(x.get()));
}

// 1 for +0 and positive values, -1 for -0 and negative values, NaN for NaN
template <Float F> RELAXFP_INLINE Relaxed<F> signum(Relaxed<F> x) {
  if (std::isnan(x.get())) {
    return Relaxed<F>(std::numeric_limits<F>::quiet_NaN());
  }
  return Relaxed<F>(std::copysign(F{1}, x.get()));
}

template <Float F>
RELAXFP_INLINE Relaxed<F> copysign(Relaxed<F> x, arg_t<F> sign) {
  return Relaxed<F>(std::copysign(x.get(), sign));
}

// Roots and powers

template <Float F> RELAXFP_INLINE Relaxed<F> sqrt(Relaxed<F> x) {
  return Relaxed<F>(std::sqrt(x.get()));
}

template <Float F> RELAXFP_INLINE Relaxed<F> cbrt(Relaxed<F> x) {
  return Relaxed<F>(std::cbrt(x.get()));
}

template <Float F> RELAXFP_INLINE Relaxed<F> pow(Relaxed<F> x, arg_t<F> y) {
  return Relaxed<F>(std::pow(x.get(), y));
}

// Integer power
template <Float F> RELAXFP_INLINE Relaxed<F> powi(Relaxed<F> x, int n) {
  return Relaxed<F>(static_cast<F>(std::pow(x.get(), n)));
}

// Reciprocal, 1/x with IEEE division
template <Float F> RELAXFP_INLINE Relaxed<F> recip(Relaxed<F> x) {
  return Relaxed<F>(F{1} / x.get());
}

template <Float F>
RELAXFP_INLINE Relaxed<F> hypot(Relaxed<F> x, arg_t<F> other) {
  return Relaxed<F>(std::hypot(x.get(), other));
}

// Exponential and logarithm

template <Float F> RELAXFP_INLINE Relaxed<F> exp(Relaxed<F> x) {
  return Relaxed<F>(std::exp(x.get()));
}

template <Float F> RELAXFP_INLINE Relaxed<F> exp2(Relaxed<F> x) {
  return Relaxed<F>(std::exp2(x.get()));
}

// e^x - 1, accurate near zero
template <Float F> RELAXFP_INLINE Relaxed<F> expm1(Relaxed<F> x) {
  return Relaxed<F>(std::expm1(x.get()));
}

// Natural logarithm
template <Float F> RELAXFP_INLINE Relaxed<F> log(Relaxed<F> x) {
  return Relaxed<F>(std::log(x.get()));
}

// Logarithm with an arbitrary base: ln(x) / ln(base)
template <Float F>
RELAXFP_INLINE Relaxed<F> log(Relaxed<F> x, arg_t<F> base) {
  return Relaxed<F>(std::log(x.get()) / std::log(base));
}

template <Float F> RELAXFP_INLINE Relaxed<F> log2(Relaxed<F> x) {
  return Relaxed<F>(std::log2(x.get()));
}

template <Float F> RELAXFP_INLINE Relaxed<F> log10(Relaxed<F> x) {
  return Relaxed<F>(std::log10(x.get()));
}

// ln(1 + x), accurate near zero
template <Float F> RELAXFP_INLINE Relaxed<F> log1p(Relaxed<F> x) {
  return Relaxed<F>(std::log1p(x.get()));
}

// Trigonometry (radians)

template <Float F> RELAXFP_INLINE Relaxed<F> sin(Relaxed<F> x) {
  return Relaxed<F>(std::sin(x.get()));
}

template <Float F> RELAXFP_INLINE Relaxed<F> cos(Relaxed<F> x) {
  return Relaxed<F>(std::cos(x.get()));
}

template <Float F> RELAXFP_INLINE Relaxed<F> tan(Relaxed<F> x) {
  return Relaxed<F>(std::tan(x.get()));
}

template <Float F> RELAXFP_INLINE Relaxed<F> asin(Relaxed<F> x) {
  return Relaxed<F>(std::asin(x.get()));
}

template <Float F> RELAXFP_INLINE Relaxed<F> acos(Relaxed<F> x) {
  return Relaxed<F>(std::acos(x.get()));
}

template <Float F> RELAXFP_INLINE Relaxed<F> atan(Relaxed<F> x) {
  return Relaxed<F>(std::atan(x.get()));
}

// Four quadrant arctangent of y/x, with y the wrapped value
template <Float F> RELAXFP_INLINE Relaxed<F> atan2(Relaxed<F> y, arg_t<F> x) {
  return Relaxed<F>(std::atan2(y.get(), x));
}

// Sine and cosine in one call: {sin(x), cos(x)}
template <Float F>
RELAXFP_INLINE std::pair<Relaxed<F>, Relaxed<F>> sin_cos(Relaxed<F> x) {
  return {Relaxed<F>(std::sin(x.get())), Relaxed<F>(std::cos(x.get()))};
}

// Hyperbolic functions

template <Float F> RELAXFP_INLINE Relaxed<F> sinh(Relaxed<F> x) {
  return Relaxed<F>(std::sinh(x.get()));
}

template <Float F> RELAXFP_INLINE Relaxed<F> cosh(Relaxed<F> x) {
  return Relaxed<F>(std::cosh(x.get()));
}

template <Float F> RELAXFP_INLINE Relaxed<F> tanh(Relaxed<F> x) {
  return Relaxed<F>(std::tanh(x.get()));
}

template <Float F> RELAXFP_INLINE Relaxed<F> asinh(Relaxed<F> x) {
  return Relaxed<F>(std::asinh(x.get()));
}

template <Float F> RELAXFP_INLINE Relaxed<F> acosh(Relaxed<F> x) {
  return Relaxed<F>(std::acosh(x.get()));
}

template <Float F> RELAXFP_INLINE Relaxed<F> atanh(Relaxed<F> x) {
  return Relaxed<F>(std::atanh(x.get()));
}

// Euclidean division
//
// div_euclid rounds the quotient so that rem_euclid is never negative:
//   x == div_euclid(x, y) * y + rem_euclid(x, y),  0 <= rem_euclid(x, y)
// up to rounding, for finite non-zero y.

template <Float F>
RELAXFP_INLINE Relaxed<F> div_euclid(Relaxed<F> x, arg_t<F> rhs) {
  const F q = std::trunc(x.get() / rhs);
  if (std::fmod(x.get(), rhs) < F{0}) {
    return Relaxed<F>(rhs > F{0} ? q - F{1} : q + F{1});
  }
  return Relaxed<F>(q);
}

template <Float F>
RELAXFP_INLINE Relaxed<F> rem_euclid(Relaxed<F> x, arg_t<F> rhs) {
  const F r = std::fmod(x.get(), rhs);
  return Relaxed<F>(r < F{0} ? r + std::fabs(rhs) : r);
}

// Minimum and maximum; a NaN operand is ignored in favor of the other

template <Float F> RELAXFP_INLINE Relaxed<F> fmax(Relaxed<F> x, arg_t<F> y) {
  return Relaxed<F>(std::fmax(x.get(), y));
}

template <Float F> RELAXFP_INLINE Relaxed<F> fmin(Relaxed<F> x, arg_t<F> y) {
  return Relaxed<F>(std::fmin(x.get(), y));
}

// Fused multiply-add: x * a + b with a single rounding
template <Float F>
RELAXFP_INLINE Relaxed<F> fma(Relaxed<F> x, arg_t<F> a, arg_t<F> b) {
  return Relaxed<F>(std::fma(x.get(), a, b));
}

// Angle conversion

namespace detail {
// 180 / pi, rounded once to the target precision
template <Float F>
inline constexpr F degrees_per_radian = F(180) / std::numbers::pi_v<F>;
template <>
inline constexpr float degrees_per_radian<float> =
    57.2957795130823208767981548141051703f;
} // namespace detail

template <Float F>
RELAXFP_INLINE constexpr Relaxed<F> to_degrees(Relaxed<F> x) {
  return Relaxed<F>(x.get() * detail::degrees_per_radian<F>);
}

template <Float F>
RELAXFP_INLINE constexpr Relaxed<F> to_radians(Relaxed<F> x) {
  return Relaxed<F>(x.get() * (std::numbers::pi_v<F> / F(180)));
}

} // namespace relaxfp::inline v1
