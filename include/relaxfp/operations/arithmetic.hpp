#pragma once

#include <concepts>
#include <type_traits>
#include <relaxfp/core/relaxed.hpp>
#include <relaxfp/operations/intrinsics.hpp>

namespace relaxfp::inline v1 {

// Relaxed arithmetic operators
//
// Each operation has three operand forms with identical semantics:
//   Relaxed<F> op F           invokes the relaxed primitive
//   F op Relaxed<F>           wraps the left operand, then Relaxed op F
//   Relaxed<F> op Relaxed<F>  unwraps the right operand, then Relaxed op F
//
// The wrapper op primitive form is the only place a relaxed primitive is
// called; constructing a Relaxed<F> is the caller's acknowledgement of the
// finite-operand precondition.
//
// Mixing widths (Relaxed<double> + 1.0f, Relaxed<double> * Relaxed<float>)
// or integers (Relaxed<double> + 1) selects a deleted overload, so it fails
// to compile instead of falling back to strict arithmetic through operator F.

// Relaxed<F> op F

template <Float F>
RELAXFP_INLINE constexpr Relaxed<F> operator+(Relaxed<F> lhs, F rhs) {
  return Relaxed<F>(intrinsics::fadd_fast(assume_finite, lhs.get(), rhs));
}

template <Float F>
RELAXFP_INLINE constexpr Relaxed<F> operator-(Relaxed<F> lhs, F rhs) {
  return Relaxed<F>(intrinsics::fsub_fast(assume_finite, lhs.get(), rhs));
}

template <Float F>
RELAXFP_INLINE constexpr Relaxed<F> operator*(Relaxed<F> lhs, F rhs) {
  return Relaxed<F>(intrinsics::fmul_fast(assume_finite, lhs.get(), rhs));
}

template <Float F>
RELAXFP_INLINE constexpr Relaxed<F> operator/(Relaxed<F> lhs, F rhs) {
  return Relaxed<F>(intrinsics::fdiv_fast(assume_finite, lhs.get(), rhs));
}

template <Float F>
RELAXFP_INLINE Relaxed<F> operator%(Relaxed<F> lhs, F rhs) {
  return Relaxed<F>(intrinsics::frem_fast(assume_finite, lhs.get(), rhs));
}

// F op Relaxed<F>

template <Float F>
RELAXFP_INLINE constexpr Relaxed<F> operator+(F lhs, Relaxed<F> rhs) {
  return Relaxed<F>(lhs) + rhs.get();
}

template <Float F>
RELAXFP_INLINE constexpr Relaxed<F> operator-(F lhs, Relaxed<F> rhs) {
  return Relaxed<F>(lhs) - rhs.get();
}

template <Float F>
RELAXFP_INLINE constexpr Relaxed<F> operator*(F lhs, Relaxed<F> rhs) {
  return Relaxed<F>(lhs) * rhs.get();
}

template <Float F>
RELAXFP_INLINE constexpr Relaxed<F> operator/(F lhs, Relaxed<F> rhs) {
  return Relaxed<F>(lhs) / rhs.get();
}

template <Float F>
RELAXFP_INLINE Relaxed<F> operator%(F lhs, Relaxed<F> rhs) {
  return Relaxed<F>(lhs) % rhs.get();
}

// Relaxed<F> op Relaxed<F>

template <Float F>
RELAXFP_INLINE constexpr Relaxed<F>
operator+(Relaxed<F> lhs, Relaxed<F> rhs) {
  return lhs + rhs.get();
}

template <Float F>
RELAXFP_INLINE constexpr Relaxed<F>
operator-(Relaxed<F> lhs, Relaxed<F> rhs) {
  return lhs - rhs.get();
}

template <Float F>
RELAXFP_INLINE constexpr Relaxed<F>
operator*(Relaxed<F> lhs, Relaxed<F> rhs) {
  return lhs * rhs.get();
}

template <Float F>
RELAXFP_INLINE constexpr Relaxed<F>
operator/(Relaxed<F> lhs, Relaxed<F> rhs) {
  return lhs / rhs.get();
}

template <Float F>
RELAXFP_INLINE Relaxed<F> operator%(Relaxed<F> lhs, Relaxed<F> rhs) {
  return lhs % rhs.get();
}

// Mixed operands

template <Float F, MixedOperand<F> T>
Relaxed<F> operator+(Relaxed<F>, T) = delete;
template <Float F, MixedOperand<F> T>
Relaxed<F> operator-(Relaxed<F>, T) = delete;
template <Float F, MixedOperand<F> T>
Relaxed<F> operator*(Relaxed<F>, T) = delete;
template <Float F, MixedOperand<F> T>
Relaxed<F> operator/(Relaxed<F>, T) = delete;
template <Float F, MixedOperand<F> T>
Relaxed<F> operator%(Relaxed<F>, T) = delete;

// A wrapper on the left is covered above
template <Float F, typename T>
  requires(std::is_arithmetic_v<T> && !std::same_as<T, F>)
Relaxed<F> operator+(T, Relaxed<F>) = delete;
template <Float F, typename T>
  requires(std::is_arithmetic_v<T> && !std::same_as<T, F>)
Relaxed<F> operator-(T, Relaxed<F>) = delete;
template <Float F, typename T>
  requires(std::is_arithmetic_v<T> && !std::same_as<T, F>)
Relaxed<F> operator*(T, Relaxed<F>) = delete;
template <Float F, typename T>
  requires(std::is_arithmetic_v<T> && !std::same_as<T, F>)
Relaxed<F> operator/(T, Relaxed<F>) = delete;
template <Float F, typename T>
  requires(std::is_arithmetic_v<T> && !std::same_as<T, F>)
Relaxed<F> operator%(T, Relaxed<F>) = delete;

// Compound assignment: self = self op rhs, for every rhs accepted by op.
// No relaxed-math logic lives here.

template <Float F, typename Rhs>
  requires requires(Relaxed<F> a, Rhs b) {
    { a + b } -> std::same_as<Relaxed<F>>;
  }
RELAXFP_INLINE constexpr Relaxed<F> &operator+=(Relaxed<F> &self, Rhs rhs) {
  self = self + rhs;
  return self;
}

template <Float F, typename Rhs>
  requires requires(Relaxed<F> a, Rhs b) {
    { a - b } -> std::same_as<Relaxed<F>>;
  }
RELAXFP_INLINE constexpr Relaxed<F> &operator-=(Relaxed<F> &self, Rhs rhs) {
  self = self - rhs;
  return self;
}

template <Float F, typename Rhs>
  requires requires(Relaxed<F> a, Rhs b) {
    { a * b } -> std::same_as<Relaxed<F>>;
  }
RELAXFP_INLINE constexpr Relaxed<F> &operator*=(Relaxed<F> &self, Rhs rhs) {
  self = self * rhs;
  return self;
}

template <Float F, typename Rhs>
  requires requires(Relaxed<F> a, Rhs b) {
    { a / b } -> std::same_as<Relaxed<F>>;
  }
RELAXFP_INLINE constexpr Relaxed<F> &operator/=(Relaxed<F> &self, Rhs rhs) {
  self = self / rhs;
  return self;
}

template <Float F, typename Rhs>
  requires requires(Relaxed<F> a, Rhs b) {
    { a % b } -> std::same_as<Relaxed<F>>;
  }
RELAXFP_INLINE Relaxed<F> &operator%=(Relaxed<F> &self, Rhs rhs) {
  self = self % rhs;
  return self;
}

} // namespace relaxfp::inline v1
