#pragma once
#include <map>
#include <string>
#include <tyredeg/mismatch.hpp>

namespace tyredeg {

// Abrasion is measured relative to these slick baselines (s/lap).
inline std::map<std::string, double> default_abrasion_baseline() {
  return {{"HARD", 0.003}, {"MEDIUM", 0.009}, {"SOFT", 0.015}};
}

struct ModelConfig {
  double sigma_epsilon = 0.3;     // observation noise std-dev (s)
  double sigma_eta = 0.1;         // process noise std-dev (s)
  double fuel_effect = 0.032;     // seconds per kg of fuel
  double starting_fuel = 110.0;   // kg at lap 1
  double fuel_burn_rate = 1.6;    // kg per lap
  bool enable_warmup = false;     // trim warm-up laps and laps past the cap before fitting
  bool enable_track_abrasion = true;
  double prior_weight = 0.3;      // weight kept on the prior degradation rate
  MismatchTable mismatch{};
  std::map<std::string, double> abrasion_baseline = default_abrasion_baseline();
};

// Fitting thresholds and clamps.
inline constexpr int kMinAbrasionStintLaps = 8;
inline constexpr int kMinAbrasionSamples = 3;
inline constexpr double kMinAbrasion = 0.7;
inline constexpr double kMaxAbrasion = 1.4;
inline constexpr int kMinEstimatorStintLaps = 5;
inline constexpr int kMinAnalysisLaps = 3;

// Health scoring tunables.
inline constexpr double kMinEffectiveDegradation = 0.001;
inline constexpr double kMismatchLapScale = 5.0;

} // namespace tyredeg
