#pragma once

#include <compare>
#include <concepts>
#include <relaxfp/core/config.hpp>
#include <relaxfp/core/format.hpp>
#include <relaxfp/core/types.hpp>
#include <type_traits>

namespace relaxfp::inline v1 {

// "Fast-math" wrapper for float and double
//
// Holds exactly one primitive value and enforces no invariant on it: NaN
// (any payload), infinities, signed zeros and subnormals are all legal.
// The wrapper only selects relaxed semantics for + - * / % (see
// operations/arithmetic.hpp). Comparisons, conversions and the delegated
// math functions behave exactly like the primitive.
//
// The layout is the layout of F, so arrays of Relaxed<F> and arrays of F can
// be converted with std::bit_cast or memcpy.
template <Float F> class Relaxed {
public:
  using value_type = F;
  using format = format_t<F>;

  // Positive zero, like a value-initialized F
  constexpr Relaxed() = default;

  // Implicit: any F can stand where a Relaxed<F> is expected
  constexpr Relaxed(F x) : value_(x) {}

  // Implicit: a Relaxed<F> can be passed wherever an F is expected
  constexpr operator F() const { return value_; }

  // Get the inner value
  constexpr F get() const { return value_; }

  // Comparisons are the primitive's IEEE 754 comparisons: NaN compares
  // unequal to everything, +0 == -0. Mixed forms take the primitive exactly
  // so that they win over the built-in operators reached through operator F.
  friend constexpr bool operator==(Relaxed a, Relaxed b) {
    return a.value_ == b.value_;
  }
  friend constexpr bool operator==(Relaxed a, F b) {
    return a.value_ == b;
  }
  friend constexpr std::partial_ordering operator<=>(Relaxed a, Relaxed b) {
    return a.value_ <=> b.value_;
  }
  friend constexpr std::partial_ordering operator<=>(Relaxed a, F b) {
    return a.value_ <=> b;
  }

  // Sign operations are exact; they are not part of the relaxed contract
  constexpr Relaxed operator+() const { return *this; }
  constexpr Relaxed operator-() const { return Relaxed(-value_); }

private:
  F value_{};
};

// "Fast-math" wrapper for float
using relaxed_f32 = Relaxed<float>;
// "Fast-math" wrapper for double
using relaxed_f64 = Relaxed<double>;

// Representation transparency
static_assert(sizeof(relaxed_f32) == sizeof(float));
static_assert(sizeof(relaxed_f64) == sizeof(double));
static_assert(alignof(relaxed_f32) == alignof(float));
static_assert(alignof(relaxed_f64) == alignof(double));
static_assert(std::is_trivially_copyable_v<relaxed_f32>);
static_assert(std::is_trivially_copyable_v<relaxed_f64>);
static_assert(std::is_standard_layout_v<relaxed_f32>);
static_assert(std::is_standard_layout_v<relaxed_f64>);

// Wrap a primitive
template <Float F> constexpr Relaxed<F> wrap(F x) {
  return Relaxed<F>(x);
}

// Unwrap a wrapper; a bare primitive passes through
template <Float F> constexpr F unwrap(Relaxed<F> x) {
  return x.get();
}
template <Float F> constexpr F unwrap(F x) { return x; }

// True for Relaxed<float> and Relaxed<double>
template <typename T> struct is_relaxed : std::false_type {};
template <Float F> struct is_relaxed<Relaxed<F>> : std::true_type {};
template <typename T>
inline constexpr bool is_relaxed_v = is_relaxed<std::remove_cvref_t<T>>::value;

// Concept: T is an operand of another type than Relaxed<F> and F: any other
// arithmetic type, or a wrapper of the other width. Operators taking such an
// operand are deleted, so widths and integers never mix implicitly.
template <typename T, typename F>
concept MixedOperand =
    (std::is_arithmetic_v<T> && !std::same_as<T, F>) ||
    (is_relaxed_v<T> && !std::same_as<std::remove_cvref_t<T>, Relaxed<F>>);

// Mixed comparisons (Relaxed<double> == 0, Relaxed<float> < 1.0) do not
// compile; convert the operand to F first. The reversed forms are
// synthesized from these.
template <Float F, MixedOperand<F> T>
bool operator==(Relaxed<F>, T) = delete;
template <Float F, MixedOperand<F> T>
std::partial_ordering operator<=>(Relaxed<F>, T) = delete;

} // namespace relaxfp::inline v1
