#pragma once
#include <optional>
#include <string>
#include <tyredeg/tyre.hpp>

namespace tyredeg {

// Interpretable per-lap tyre state for one driver.
struct HealthSummary {
  int health = 0;                     // 0..100
  int laps_on_tyre = 0;
  std::string compound;
  TyreCategory category = TyreCategory::Slick;
  TrackCondition track_condition = TrackCondition::Dry;
  double effective_degradation = 0.0; // s/lap after abrasion
  double mismatch_penalty = 0.0;
  double track_abrasion = 1.0;
  double expected_pace = 0.0;         // closed form: reset + (laps - 1) * effective degradation

  // Kalman posterior for the same lap, when the filter processed it.
  std::optional<double> filtered_pace;
  std::optional<double> filtered_variance;
};

// Laps the set can run before reaching max_degradation. Degradation is floored
// at kMinEffectiveDegradation.
double max_tyre_laps(double max_degradation, double effective_degradation);

// Laps on tyre scaled by the mismatch penalty (1 + penalty / kMismatchLapScale).
double effective_tyre_laps(int laps_on_tyre, double mismatch_penalty);

// 100 * (1 - effective_laps / max_laps), clamped to [0, 100] and truncated.
int tyre_health(int laps_on_tyre, double effective_degradation,
                double max_degradation, double mismatch_penalty);

} // namespace tyredeg
