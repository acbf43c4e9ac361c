#pragma once
#include <vector>
#include <tyredeg/config.hpp>
#include <tyredeg/lap.hpp>

namespace tyredeg {

struct AbrasionEstimate {
  double factor = 1.0;          // clamped to [kMinAbrasion, kMaxAbrasion]
  std::vector<double> samples;  // observed slope / baseline, one per stint
};

// Surface aggressiveness relative to the slick baselines in cfg.abrasion_baseline.
// Uses DRY laps of stints with at least kMinAbrasionStintLaps laps; fewer than
// kMinAbrasionSamples samples yield the neutral factor 1.0.
AbrasionEstimate estimate_track_abrasion_detail(const std::vector<DerivedLap>& laps,
                                                const ModelConfig& cfg);

inline double estimate_track_abrasion(const std::vector<DerivedLap>& laps,
                                      const ModelConfig& cfg) {
  return estimate_track_abrasion_detail(laps, cfg).factor;
}

} // namespace tyredeg
