#include <tyredeg/health.hpp>
#include <algorithm>
#include <tyredeg/config.hpp>

namespace tyredeg {

double max_tyre_laps(double max_degradation, double effective_degradation) {
  return max_degradation / std::max(effective_degradation, kMinEffectiveDegradation);
}

double effective_tyre_laps(int laps_on_tyre, double mismatch_penalty) {
  const int laps = std::max(0, laps_on_tyre);
  const double penalty = std::max(0.0, mismatch_penalty);
  return static_cast<double>(laps) * (1.0 + penalty / kMismatchLapScale);
}

int tyre_health(int laps_on_tyre, double effective_degradation,
                double max_degradation, double mismatch_penalty) {
  const double max_laps = max_tyre_laps(max_degradation, effective_degradation);
  if (max_laps <= 0.0) return 0;
  const double eff_laps = effective_tyre_laps(laps_on_tyre, mismatch_penalty);
  const double h = std::clamp(100.0 * (1.0 - eff_laps / max_laps), 0.0, 100.0);
  return static_cast<int>(h);
}

} // namespace tyredeg
