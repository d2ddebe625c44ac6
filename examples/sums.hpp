#pragma once

#include <cstddef>
#include <relaxfp/relaxfp.hpp>
#include <vector>

namespace relaxfp::examples {

// Summation kernels
//
// fast_sum and fast_dot accumulate through Relaxed<double>, so the compiler
// may reorder the loop (vectorize, split the accumulator). regular_sum is the
// strict left-to-right IEEE sum. All inputs must be finite for the relaxed
// kernels.

inline double fast_sum(const std::vector<double> &xs) {
  relaxed_f64 acc = 0.0;
  for (double x : xs) {
    acc += x;
  }
  return acc.get();
}

// Extra elements of the longer sequence are ignored
inline double fast_dot(const std::vector<double> &xs,
                       const std::vector<double> &ys) {
  const std::size_t n = xs.size() < ys.size() ? xs.size() : ys.size();
  relaxed_f64 acc = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    acc += wrap(xs[i]) * wrap(ys[i]);
  }
  return acc.get();
}

inline double regular_sum(const std::vector<double> &xs) {
  double acc = 0.0;
  for (double x : xs) {
    acc += x;
  }
  return acc;
}

} // namespace relaxfp::examples
