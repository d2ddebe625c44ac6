// sums: relaxed versus strict summation
//
// Sums a large vector both ways and reports the results and timings. The two
// sums may differ in the last bits when the relaxed loop is reordered.

#include "sums.hpp"

#include <chrono>
#include <cstddef>
#include <cstdio>
#include <random>
#include <vector>

using clock_type = std::chrono::steady_clock;

template <typename Fn> static double time_ms(Fn &&fn, double &result) {
  auto t0 = clock_type::now();
  result = fn();
  auto t1 = clock_type::now();
  return std::chrono::duration<double, std::milli>(t1 - t0).count();
}

int main() {
  constexpr std::size_t N = 1u << 22;
  std::vector<double> xs(N), ys(N);
  std::mt19937 rng(123);
  std::uniform_real_distribution<double> dist(-1.0, 1.0);
  for (std::size_t i = 0; i < N; ++i) {
    xs[i] = dist(rng);
    ys[i] = dist(rng);
  }

  using namespace relaxfp::examples;
  double regular = 0, fast = 0, dot = 0;
  double regular_ms = time_ms([&] { return regular_sum(xs); }, regular);
  double fast_ms = time_ms([&] { return fast_sum(xs); }, fast);
  double dot_ms = time_ms([&] { return fast_dot(xs, ys); }, dot);

  printf("regular_sum = %.17g  (%.3f ms)\n", regular, regular_ms);
  printf("fast_sum    = %.17g  (%.3f ms)\n", fast, fast_ms);
  printf("fast_dot    = %.17g  (%.3f ms)\n", dot, dot_ms);
  printf("difference  = %.3g\n", fast - regular);
  return 0;
}
