#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <tyredeg/config.hpp>
#include <tyredeg/tyre.hpp>

namespace tyredeg {

// One timing record per driver per lap, as supplied by the session collaborator.
struct LapRecord {
  std::string driver;                                // e.g., "VER"
  int lap_number = 0;                                // 1-based
  std::optional<std::chrono::milliseconds> lap_time; // missing for aborted laps
  std::optional<std::string> compound;               // e.g., "SOFT"
  int stint = 0;                                     // increments on tyre change
  std::optional<std::string> track_condition;        // "DRY" / "DAMP" / "WET"
};

// Filtered, fuel-annotated copy of a LapRecord. Only lives through a fit pass
// (and inside the model for predictions).
struct DerivedLap {
  std::string driver;
  int lap_number = 0;
  double lap_time_s = 0.0;
  std::string compound;                         // trimmed, upper case
  int stint = 0;
  TrackCondition condition = TrackCondition::Dry;
  bool condition_normalized = false;            // label was absent or unrecognized
  double fuel_mass = 0.0;                       // kg, >= 0
};

// Fuel on board at the start of a lap, linear burn floored at zero.
double fuel_mass_at(int lap_number, const ModelConfig& cfg);

// Drops warm-up laps (lap_number <= 1), laps without a time and laps without a
// compound; maps unknown conditions to DRY; sorts by (driver, lap_number).
// The input is never modified.
std::vector<DerivedLap> prepare_laps(const std::vector<LapRecord>& records,
                                     const ModelConfig& cfg,
                                     const std::optional<std::string>& driver = std::nullopt);

// Number of prepared laps whose condition label had to be normalized.
std::size_t count_normalized_conditions(const std::vector<DerivedLap>& laps);

} // namespace tyredeg
