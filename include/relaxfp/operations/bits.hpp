#pragma once

#include <bit>
#include <relaxfp/core/format.hpp>
#include <relaxfp/core/relaxed.hpp>

namespace relaxfp::inline v1 {

// Bit pattern and byte sequence conversions
//
// Every conversion is exact and total: NaN payloads, signed zeros and
// subnormals survive a round trip unchanged.
//
// The from_* functions cannot deduce the float type from an integer or byte
// array, so it is given explicitly:
//
//   auto one = from_bits<double>(0x3FF0000000000000);

// Raw IEEE 754 encoding (std::uint32_t for float, std::uint64_t for double)
template <Float F> constexpr bits_t<F> to_bits(Relaxed<F> x) {
  return std::bit_cast<bits_t<F>>(x.get());
}

template <Float F> constexpr Relaxed<F> from_bits(bits_t<F> bits) {
  return Relaxed<F>(std::bit_cast<F>(bits));
}

// Big endian: most significant byte first
template <Float F> constexpr bytes_t<F> to_be_bytes(Relaxed<F> x) {
  constexpr int n = format_t<F>::byte_count;
  const bits_t<F> bits = to_bits(x);
  bytes_t<F> bytes{};
  for (int i = 0; i < n; ++i) {
    bytes[i] = static_cast<std::uint8_t>(bits >> (8 * (n - 1 - i)));
  }
  return bytes;
}

// Little endian: least significant byte first
template <Float F> constexpr bytes_t<F> to_le_bytes(Relaxed<F> x) {
  constexpr int n = format_t<F>::byte_count;
  const bits_t<F> bits = to_bits(x);
  bytes_t<F> bytes{};
  for (int i = 0; i < n; ++i) {
    bytes[i] = static_cast<std::uint8_t>(bits >> (8 * i));
  }
  return bytes;
}

// Native byte order: the object representation of the value
template <Float F> constexpr bytes_t<F> to_ne_bytes(Relaxed<F> x) {
  return std::bit_cast<bytes_t<F>>(x.get());
}

template <Float F> constexpr Relaxed<F> from_be_bytes(bytes_t<F> bytes) {
  constexpr int n = format_t<F>::byte_count;
  bits_t<F> bits = 0;
  for (int i = 0; i < n; ++i) {
    bits = static_cast<bits_t<F>>(bits << 8) | bytes[i];
  }
  return from_bits<F>(bits);
}

template <Float F> constexpr Relaxed<F> from_le_bytes(bytes_t<F> bytes) {
  constexpr int n = format_t<F>::byte_count;
  bits_t<F> bits = 0;
  for (int i = n - 1; i >= 0; --i) {
    bits = static_cast<bits_t<F>>(bits << 8) | bytes[i];
  }
  return from_bits<F>(bits);
}

template <Float F> constexpr Relaxed<F> from_ne_bytes(bytes_t<F> bytes) {
  return Relaxed<F>(std::bit_cast<F>(bytes));
}

} // namespace relaxfp::inline v1
