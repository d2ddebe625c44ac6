#include <array>
#include <cstdint>
#include <relaxfp/relaxfp.hpp>
#include <type_traits>

using namespace relaxfp;

// ============================================================================
// Float concept
// ============================================================================

static_assert(Float<float>, "float is IEEE 754 binary32");
static_assert(Float<double>, "double is IEEE 754 binary64");
static_assert(!Float<long double>,
              "long double has a platform dependent layout");
static_assert(!Float<int>, "integers are not wrapped");
static_assert(!Float<const double>, "cv-qualified types are not wrapped");
static_assert(!Float<relaxed_f64>, "wrappers do not nest");

// ============================================================================
// Wrapper detection
// ============================================================================

static_assert(is_relaxed_v<relaxed_f32>);
static_assert(is_relaxed_v<const relaxed_f64 &>);
static_assert(!is_relaxed_v<float>);
static_assert(!is_relaxed_v<double>);

static_assert(std::is_same_v<relaxed_f32::value_type, float>);
static_assert(std::is_same_v<relaxed_f64::value_type, double>);
static_assert(std::is_same_v<decltype(Relaxed(1.0f)), relaxed_f32>,
              "CTAD from float");
static_assert(std::is_same_v<decltype(wrap(1.0)), relaxed_f64>,
              "wrap(double)");

// Conversions are implicit both ways
static_assert(std::is_convertible_v<float, relaxed_f32>);
static_assert(std::is_convertible_v<relaxed_f32, float>);
static_assert(std::is_convertible_v<double, relaxed_f64>);
static_assert(std::is_convertible_v<relaxed_f64, double>);

// Value type properties
static_assert(std::is_trivially_copyable_v<relaxed_f64>);
static_assert(std::is_trivially_destructible_v<relaxed_f64>);
static_assert(std::is_nothrow_default_constructible_v<relaxed_f32>);
static_assert(sizeof(std::array<relaxed_f64, 8>) == sizeof(double[8]));

// ============================================================================
// IEEE 754 format descriptors
// ============================================================================

// binary32: 1 sign, 8 exponent, 23 mantissa bits
static_assert(std::is_same_v<format_t<float>, binary32>);
static_assert(binary32::exp_bits == 8 && binary32::mant_bits == 23);
static_assert(binary32::total_bits == 32 && binary32::byte_count == 4);
static_assert(binary32::exp_bias == 127);
static_assert(binary32::sign_mask == 0x80000000u);
static_assert(binary32::exp_mask == 0x7F800000u);
static_assert(binary32::mant_mask == 0x007FFFFFu);
static_assert(binary32::quiet_bit == 0x00400000u);

// binary64: 1 sign, 11 exponent, 52 mantissa bits
static_assert(std::is_same_v<format_t<double>, binary64>);
static_assert(binary64::exp_bits == 11 && binary64::mant_bits == 52);
static_assert(binary64::total_bits == 64 && binary64::byte_count == 8);
static_assert(binary64::exp_bias == 1023);
static_assert(binary64::sign_mask == 0x8000000000000000ull);
static_assert(binary64::exp_mask == 0x7FF0000000000000ull);
static_assert(binary64::mant_mask == 0x000FFFFFFFFFFFFFull);
static_assert(binary64::quiet_bit == 0x0008000000000000ull);

// Masks partition the word
static_assert((binary32::sign_mask | binary32::exp_mask |
               binary32::mant_mask) == 0xFFFFFFFFu);
static_assert((binary64::sign_mask ^ binary64::exp_mask ^
               binary64::mant_mask) == ~std::uint64_t{0});

// ============================================================================
// Bit and byte types
// ============================================================================

static_assert(std::is_same_v<uint_t<32>, std::uint32_t>);
static_assert(std::is_same_v<uint_t<64>, std::uint64_t>);
static_assert(std::is_same_v<bits_t<float>, std::uint32_t>);
static_assert(std::is_same_v<bits_t<double>, std::uint64_t>);
static_assert(std::is_same_v<bytes_t<float>, std::array<std::uint8_t, 4>>);
static_assert(std::is_same_v<bytes_t<double>, std::array<std::uint8_t, 8>>);
static_assert(std::is_same_v<relaxed_f64::format, binary64>);

int main() {
  // Wrapper values of each width
  relaxed_f32 a = 0.0f;
  relaxed_f64 b = 0.0;

  // Raw encodings
  bits_t<float> c = 0;
  bytes_t<double> d{};

  // Suppress unused variable warnings
  (void)a;
  (void)b;
  (void)c;
  (void)d;

  return 0;
}
