#pragma once

#include <concepts>
#include <relaxfp/core/relaxed.hpp>

namespace relaxfp::inline v1 {

// Additive identity trait
//
// Zero<T>::zero() is the additive identity of T and Zero<T>::is_zero(x)
// tests for it. Only the two primitive floats and their wrappers are
// specialized; the wrapper specializations defer to the primitive and are
// unaffected by relaxed arithmetic.
template <typename T> struct Zero;

template <Float F> struct Zero<F> {
  static constexpr F zero() { return F{}; }

  // True for +0 and -0 only
  static constexpr bool is_zero(F x) { return x == F{}; }
};

template <Float F> struct Zero<Relaxed<F>> {
  static constexpr Relaxed<F> zero() { return Relaxed<F>(Zero<F>::zero()); }
  static constexpr bool is_zero(Relaxed<F> x) {
    return Zero<F>::is_zero(x.get());
  }
};

// Concept: T has an additive identity
template <typename T>
concept HasZero = requires(T x) {
  { Zero<T>::zero() } -> std::same_as<T>;
  { Zero<T>::is_zero(x) } -> std::convertible_to<bool>;
};

template <HasZero T> constexpr T zero() { return Zero<T>::zero(); }

template <HasZero T> constexpr bool is_zero(T x) {
  return Zero<T>::is_zero(x);
}

} // namespace relaxfp::inline v1
