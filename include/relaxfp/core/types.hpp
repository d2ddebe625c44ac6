#pragma once

#include <concepts>
#include <cstdint>
#include <limits>

namespace relaxfp::inline v1 {

// Concept: the primitive floating point types a Relaxed wrapper may hold.
// Exactly IEEE 754 binary32 and binary64; long double is excluded because its
// layout is platform dependent.
template <typename F>
concept Float = (std::same_as<F, float> || std::same_as<F, double>) &&
                std::numeric_limits<F>::is_iec559;

// Unsigned integer holding exactly Bits bits, used for raw bit patterns
namespace detail {
template <int Bits> struct exact_uint;
template <> struct exact_uint<32> {
  using type = std::uint32_t;
};
template <> struct exact_uint<64> {
  using type = std::uint64_t;
};
} // namespace detail

template <int Bits> using uint_t = typename detail::exact_uint<Bits>::type;

} // namespace relaxfp::v1
