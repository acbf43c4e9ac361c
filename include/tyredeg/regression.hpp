#pragma once
#include <optional>
#include <vector>

namespace tyredeg {

// Median of the values (mean of the two middle values for even counts).
// nullopt for empty input.
std::optional<double> median(std::vector<double> values);

// Population standard deviation; 0 for fewer than two values.
double stddev(const std::vector<double>& values);

// Theil–Sen estimator: median of the slopes over all pairs with distinct x.
// Robust against a minority of outlier laps (traffic, yellow flags).
// nullopt when sizes differ or no pair has distinct x.
std::optional<double> theil_sen_slope(const std::vector<double>& x,
                                      const std::vector<double>& y);

} // namespace tyredeg
