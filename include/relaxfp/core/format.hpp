#pragma once

#include <array>
#include <cstdint>
#include <relaxfp/core/types.hpp>

namespace relaxfp::inline v1 {

// Layout descriptor for the IEEE 754 binary interchange formats
// Bit layout: [Sign (MSB)][Exponent][Mantissa (LSB)]
template <int ExpBits,  // Number of exponent bits
          int MantBits, // Number of stored mantissa bits (no implicit bit)
          int TotalBits = 1 + ExpBits + MantBits>
struct FormatDescriptor {
  static constexpr int sign_bits = 1;
  static constexpr int exp_bits = ExpBits;
  static constexpr int mant_bits = MantBits;
  static constexpr int total_bits = TotalBits;
  static constexpr int byte_count = TotalBits / 8;

  static constexpr int mant_offset = 0;
  static constexpr int exp_offset = MantBits;
  static constexpr int sign_offset = ExpBits + MantBits;

  static constexpr int exp_bias = (1 << (ExpBits - 1)) - 1;

  using storage_type = uint_t<TotalBits>;
  using byte_array = std::array<std::uint8_t, byte_count>;

  static constexpr storage_type sign_mask = storage_type{1} << sign_offset;
  static constexpr storage_type exp_mask =
      ((storage_type{1} << ExpBits) - 1) << exp_offset;
  static constexpr storage_type mant_mask =
      ((storage_type{1} << MantBits) - 1) << mant_offset;

  // Most significant stored mantissa bit: set for quiet NaNs
  static constexpr storage_type quiet_bit = storage_type{1}
                                            << (MantBits - 1);

  // Compile-time validation
  static_assert(ExpBits > 1, "Exponent must have at least 2 bits");
  static_assert(MantBits > 0, "Mantissa must have at least 1 bit");
  static_assert(TotalBits == 1 + ExpBits + MantBits,
                "IEEE interchange formats carry no padding");
  static_assert(TotalBits % 8 == 0, "Total bits must be a whole byte count");
};

using binary32 = FormatDescriptor<8, 23>;  // IEEE 754 single precision
using binary64 = FormatDescriptor<11, 52>; // IEEE 754 double precision

// Format of each supported primitive
template <Float F> struct format_of;
template <> struct format_of<float> {
  using type = binary32;
};
template <> struct format_of<double> {
  using type = binary64;
};

template <Float F> using format_t = typename format_of<F>::type;

template <Float F> using bits_t = typename format_t<F>::storage_type;
template <Float F> using bytes_t = typename format_t<F>::byte_array;

static_assert(sizeof(float) * 8 == binary32::total_bits,
              "float must be IEEE 754 binary32");
static_assert(sizeof(double) * 8 == binary64::total_bits,
              "double must be IEEE 754 binary64");
static_assert(std::numeric_limits<float>::digits == binary32::mant_bits + 1);
static_assert(std::numeric_limits<double>::digits == binary64::mant_bits + 1);

} // namespace relaxfp::inline v1
