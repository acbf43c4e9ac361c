#pragma once
#include <random>
#include <string>
#include <vector>
#include <tyredeg/config.hpp>
#include <tyredeg/lap.hpp>

namespace tyredeg {

struct SyntheticStint {
  std::string compound;            // e.g., "MEDIUM"
  int laps = 0;                    // laps run on this set
  double degradation_per_lap = 0.0;// true wear (s/lap)
};

struct SyntheticDriver {
  std::string driver;
  double base_pace = 0.0;          // fuel-free lap time on a fresh set (s)
  std::vector<SyntheticStint> stints;
  std::string track_condition = "DRY";
};

struct SyntheticNoise {
  double jitter_s = 0.0;           // uniform noise in [-jitter, +jitter]
  double outlier_prob = 0.0;       // chance of a slow lap (traffic, yellow flag), clamped to [0, 1]
  double outlier_s = 3.0;          // time added to a slow lap
};

// Noise-free lap time for the given lap of a stint.
double synthetic_lap_time(double base_pace, double degradation_per_lap, int lap_on_tyre,
                          int lap_number, const ModelConfig& cfg);

// One LapRecord per driver per lap, lap numbers starting at 1, stint ids
// starting at 1. Fuel follows cfg. Deterministic with caller-provided rng.
std::vector<LapRecord> simulate_session(const std::vector<SyntheticDriver>& drivers,
                                        const ModelConfig& cfg,
                                        const SyntheticNoise& noise,
                                        std::mt19937& rng);

} // namespace tyredeg
