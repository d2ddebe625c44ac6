#pragma once

#include <array>
#include <bit>
#include <cmath>
#include <cstddef>
#include <cstdio>
#include <limits>
#include <relaxfp/relaxfp.hpp>

namespace relaxfp::test_helpers {

// The native primitive is the ORACLE: every delegated operation on a
// Relaxed<F> must agree with the same operation on the bare F, and every
// relaxed operator must agree with the IEEE operator whenever its operands
// and its result are finite.

// Raw encoding of a native value
template <Float F> constexpr bits_t<F> native_bits(F x) {
  return std::bit_cast<bits_t<F>>(x);
}

// Bit-for-bit equality: distinguishes -0 from +0 and compares NaN payloads
template <Float F> constexpr bool same_bits(F a, F b) {
  return native_bits(a) == native_bits(b);
}

template <Float F> constexpr bool same_bits(Relaxed<F> a, F b) {
  return same_bits(a.get(), b);
}

// Both NaN, or bit-identical
template <Float F> bool same_value(F a, F b) {
  if (std::isnan(a) && std::isnan(b)) {
    return true;
  }
  return same_bits(a, b);
}

// Quiet NaN carrying `payload` in the low mantissa bits
template <Float F> constexpr F nan_with_payload(bits_t<F> payload) {
  using Format = format_t<F>;
  bits_t<F> bits = Format::exp_mask | Format::quiet_bit |
                   (payload & (Format::mant_mask >> 1));
  return std::bit_cast<F>(bits);
}

// Signaling NaN (quiet bit clear, payload non-zero)
template <Float F> constexpr F signaling_nan(bits_t<F> payload) {
  using Format = format_t<F>;
  bits_t<F> mant = payload & (Format::mant_mask >> 1);
  if (mant == 0) {
    mant = 1;
  }
  return std::bit_cast<F>(static_cast<bits_t<F>>(Format::exp_mask | mant));
}

// Values that exercise every IEEE 754 category
template <Float F> std::array<F, 16> special_values() {
  using limits = std::numeric_limits<F>;
  return {F{0},
          -F{0},
          F{1.5},
          F{-1.5},
          F{1},
          F{-1},
          limits::min(),
          limits::denorm_min(),
          -limits::denorm_min(),
          limits::max(),
          limits::lowest(),
          limits::infinity(),
          -limits::infinity(),
          limits::quiet_NaN(),
          -limits::quiet_NaN(),
          nan_with_payload<F>(0x2A)};
}

// Moderate non-zero operands: every quotient and remainder stays finite
template <Float F> constexpr std::array<F, 10> moderate_samples() {
  return {F{-1024}, F{-7.75}, F{-3.5}, F{-1},  F{-0.25},
          F{0.5},   F{1},     F{2},    F{6.5}, F{4096}};
}

// Every kind of finite operand: the moderate values, both zeros, the
// subnormal and normal extremes
template <Float F> constexpr std::array<F, 17> finite_samples() {
  using limits = std::numeric_limits<F>;
  constexpr auto moderate = moderate_samples<F>();
  std::array<F, 17> all = {F{0},
                           -F{0},
                           limits::denorm_min(),
                           -limits::denorm_min(),
                           limits::min(),
                           limits::max(),
                           limits::lowest()};
  for (std::size_t i = 0; i < moderate.size(); ++i) {
    all[7 + i] = moderate[i];
  }
  return all;
}

// A relaxed operation is only specified when its IEEE result is finite too
// (no overflow, no division by zero, no 0/0)
template <Float F> bool has_finite_result(F ieee_result) {
  return std::isfinite(ieee_result);
}

// got is within `ulps` representable steps of want; +0 equals -0
template <Float F> bool within_ulps(F got, F want, int ulps) {
  if (got == want) {
    return true;
  }
  const F inf = std::numeric_limits<F>::infinity();
  F lo = want, hi = want;
  for (int i = 0; i < ulps; ++i) {
    lo = std::nextafter(lo, -inf);
    hi = std::nextafter(hi, inf);
  }
  return got >= lo && got <= hi;
}

// A relaxed division may be evaluated as a multiplication by the reciprocal
inline constexpr int reciprocal_ulps = 2;

// Print one result line and count failures
inline bool report(const char *name, bool ok, int &failures) {
  std::printf("%s: %s\n", name, ok ? "PASS" : "FAIL");
  if (!ok) {
    ++failures;
  }
  return ok;
}

} // namespace relaxfp::test_helpers
