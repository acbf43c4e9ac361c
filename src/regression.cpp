#include <tyredeg/regression.hpp>
#include <algorithm>
#include <cmath>
#include <utility>

namespace tyredeg {

std::optional<double> median(std::vector<double> values) {
  if (values.empty()) return std::nullopt;
  const std::size_t n = values.size();
  const std::size_t mid = n / 2;
  std::nth_element(values.begin(), values.begin() + mid, values.end());
  const double hi = values[mid];
  if (n % 2 == 1) return hi;
  const double lo = *std::max_element(values.begin(), values.begin() + mid);
  return 0.5 * (lo + hi);
}

double stddev(const std::vector<double>& values) {
  if (values.size() < 2) return 0.0;
  double mean = 0.0;
  for (double v : values) mean += v;
  mean /= static_cast<double>(values.size());
  double ss = 0.0;
  for (double v : values) ss += (v - mean) * (v - mean);
  return std::sqrt(ss / static_cast<double>(values.size()));
}

std::optional<double> theil_sen_slope(const std::vector<double>& x,
                                      const std::vector<double>& y) {
  if (x.size() != y.size() || x.size() < 2) return std::nullopt;
  std::vector<double> slopes;
  slopes.reserve(x.size() * (x.size() - 1) / 2);
  for (std::size_t i = 0; i < x.size(); ++i) {
    for (std::size_t j = i + 1; j < x.size(); ++j) {
      const double dx = x[j] - x[i];
      if (dx == 0.0) continue;
      slopes.push_back((y[j] - y[i]) / dx);
    }
  }
  return median(std::move(slopes));
}

} // namespace tyredeg
