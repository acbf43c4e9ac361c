#include <tyredeg/estimator.hpp>
#include <algorithm>
#include <limits>
#include <tyredeg/regression.hpp>
#include <tyredeg/stint.hpp>

namespace tyredeg {

double blend_degradation_rate(double prior, double observed, double prior_weight) {
  const double w = std::clamp(prior_weight, 0.0, 1.0);
  return std::max(0.0, w * prior + (1.0 - w) * observed);
}

std::optional<double> stint_degradation_slope(const StintSeries& s,
                                              const TyreProfile& profile,
                                              const ModelConfig& cfg) {
  if (static_cast<int>(s.laps.size()) < kMinEstimatorStintLaps) return std::nullopt;

  const auto all = fuel_corrected_deltas(s, cfg.fuel_effect);
  int first = 1;
  int last = std::numeric_limits<int>::max();
  if (cfg.enable_warmup) {
    first = profile.warmup_laps + 1;
    last = profile.max_analysis_laps.value_or(last);
  }
  const auto analysis = slice_laps_on_tyre(all, first, last);

  if (static_cast<int>(analysis.size()) < kMinAnalysisLaps) return std::nullopt;
  if (stddev(analysis.delta) <= 0.0) return std::nullopt;

  const auto slope = theil_sen_slope(analysis.lap_on_tyre, analysis.delta);
  // Negative slopes are timing noise, not evidence of zero wear.
  if (!slope || *slope <= 0.0) return std::nullopt;
  return slope;
}

std::map<std::string, CompoundFit> estimate_degradation_rates(const std::vector<DerivedLap>& laps,
                                                              TyreRegistry& registry,
                                                              const ModelConfig& cfg) {
  std::map<std::string, CompoundFit> fits;
  for (const auto& [name, profile] : registry) {
    auto& f = fits[name];
    f.prior_rate = profile.degradation_rate;
    f.fitted_rate = profile.degradation_rate;
  }

  const auto stints = group_stints(laps, [&](const DerivedLap& d) {
    return registry.count(d.compound) > 0;
  });

  for (const auto& s : stints) {
    const auto& profile = registry.at(s.compound);
    if (auto slope = stint_degradation_slope(s, profile, cfg); slope.has_value()) {
      fits[s.compound].slopes.push_back(*slope);
    }
  }

  for (auto& [name, f] : fits) {
    f.median_slope = median(f.slopes);
    if (!f.median_slope) continue;
    f.fitted_rate = blend_degradation_rate(f.prior_rate, *f.median_slope, cfg.prior_weight);
    registry.at(name).degradation_rate = f.fitted_rate;
  }
  return fits;
}

} // namespace tyredeg
