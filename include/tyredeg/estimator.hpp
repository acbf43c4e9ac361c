#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <tyredeg/config.hpp>
#include <tyredeg/lap.hpp>
#include <tyredeg/stint.hpp>
#include <tyredeg/tyre.hpp>

namespace tyredeg {

struct CompoundFit {
  double prior_rate = 0.0;
  double fitted_rate = 0.0;             // equals prior_rate when no evidence
  std::vector<double> slopes;           // positive per-stint slopes (s/lap)
  std::optional<double> median_slope;
  bool updated() const { return median_slope.has_value(); }
};

// Blends prior and observed median: w * prior + (1 - w) * observed, never negative.
double blend_degradation_rate(double prior, double observed, double prior_weight);

// Per-stint Theil–Sen slope of fuel-corrected deltas for one compound. Stints
// shorter than kMinEstimatorStintLaps, with fewer than kMinAnalysisLaps
// analysis laps, or with flat deltas yield nullopt. The whole stint is fitted
// unless cfg.enable_warmup, which drops warm-up laps and laps past
// max_analysis_laps.
std::optional<double> stint_degradation_slope(const StintSeries& s,
                                              const TyreProfile& profile,
                                              const ModelConfig& cfg);

// Fits every registry compound and writes the blended rate back into `registry`.
// Compounds without a positive slope keep their prior. Unknown compounds are ignored.
std::map<std::string, CompoundFit> estimate_degradation_rates(const std::vector<DerivedLap>& laps,
                                                              TyreRegistry& registry,
                                                              const ModelConfig& cfg);

} // namespace tyredeg
