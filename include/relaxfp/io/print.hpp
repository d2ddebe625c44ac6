#pragma once

#include <charconv>
#include <ostream>
#include <relaxfp/core/relaxed.hpp>
#include <version>

#if defined(__cpp_lib_format)
#include <format>
#endif

namespace relaxfp::inline v1 {

// Text output
//
// A Relaxed<F> prints exactly like the F it holds, in every style the
// standard library offers for F.

// Stream output; honors the stream's flags (std::scientific, std::uppercase,
// precision, width)
template <typename CharT, typename Traits, Float F>
std::basic_ostream<CharT, Traits> &
operator<<(std::basic_ostream<CharT, Traits> &os, Relaxed<F> x) {
  return os << x.get();
}

// Shortest representation that reads back to the same value
template <Float F>
std::to_chars_result to_chars(char *first, char *last, Relaxed<F> x) {
  return std::to_chars(first, last, x.get());
}

// Fixed, scientific (lower case exponent), general or hex notation
template <Float F>
std::to_chars_result to_chars(char *first, char *last, Relaxed<F> x,
                              std::chars_format fmt) {
  return std::to_chars(first, last, x.get(), fmt);
}

template <Float F>
std::to_chars_result to_chars(char *first, char *last, Relaxed<F> x,
                              std::chars_format fmt, int precision) {
  return std::to_chars(first, last, x.get(), fmt, precision);
}

} // namespace relaxfp::inline v1

#if defined(__cpp_lib_format)
// std::format support: every format spec accepted for F ({}, {:e}, {:E},
// {:.3f}, ...) is accepted for Relaxed<F> with identical output
template <relaxfp::Float F, typename CharT>
struct std::formatter<relaxfp::Relaxed<F>, CharT> : std::formatter<F, CharT> {
  template <typename FormatContext>
  auto format(relaxfp::Relaxed<F> x, FormatContext &ctx) const {
    return std::formatter<F, CharT>::format(x.get(), ctx);
  }
};
#endif
