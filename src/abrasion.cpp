#include <tyredeg/abrasion.hpp>
#include <algorithm>
#include <tyredeg/regression.hpp>
#include <tyredeg/stint.hpp>

namespace tyredeg {

AbrasionEstimate estimate_track_abrasion_detail(const std::vector<DerivedLap>& laps,
                                                const ModelConfig& cfg) {
  AbrasionEstimate out;
  const auto& baseline = cfg.abrasion_baseline;

  const auto stints = group_stints(laps, [&](const DerivedLap& d) {
    return d.condition == TrackCondition::Dry && baseline.count(d.compound) > 0;
  });

  for (const auto& s : stints) {
    if (static_cast<int>(s.laps.size()) < kMinAbrasionStintLaps) continue;
    const double base_rate = baseline.at(s.compound);
    if (base_rate <= 0.0) continue;

    const auto d = fuel_corrected_deltas(s, cfg.fuel_effect);
    if (stddev(d.delta) <= 0.0) continue;

    const auto slope = theil_sen_slope(d.lap_on_tyre, d.delta);
    if (slope && *slope > 0.0) out.samples.push_back(*slope / base_rate);
  }

  if (static_cast<int>(out.samples.size()) < kMinAbrasionSamples) return out;
  const double m = median(out.samples).value_or(1.0);
  out.factor = std::clamp(m, kMinAbrasion, kMaxAbrasion);
  return out;
}

} // namespace tyredeg
