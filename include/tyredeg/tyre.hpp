#pragma once
#include <istream>
#include <map>
#include <optional>
#include <string>

namespace tyredeg {

enum class TyreCategory : int {
  Slick = 0,
  Inter = 1,
  Wet = 2
};

enum class TrackCondition : int {
  Dry = 0,
  Damp = 1,
  Wet = 2
};

const char* category_name(TyreCategory c);   // "SLICK", "INTER", "WET"
const char* condition_name(TrackCondition c); // "DRY", "DAMP", "WET"

// Trimmed, upper-cased copy of a compound or catalog label.
std::string normalize_label(std::string label);

// Case-insensitive, whitespace tolerant; "INTERMEDIATE" is accepted for INTER.
std::optional<TyreCategory> parse_category(const std::string& label);

// Exact match on "DRY", "DAMP" or "WET". Anything else yields nullopt.
std::optional<TrackCondition> parse_track_condition(const std::string& label);

struct TyreProfile {
  std::string name;                      // e.g., "SOFT"
  TyreCategory category = TyreCategory::Slick;
  double degradation_rate = 0.0;         // seconds lost per lap of wear, >= 0
  double reset_pace = 0.0;               // fuel-free lap time on lap 1 of a fresh set (s)
  int warmup_laps = 0;                   // >= 0
  std::optional<int> max_analysis_laps;  // cap on laps used for slope fitting
  double max_degradation = 0.0;          // cumulative seconds before the set is spent
};

// Non-negative rate and warm-up, positive max degradation, non-empty name.
bool validate_profile(const TyreProfile& p);

// Keyed by compound name (upper case). Ordered for deterministic iteration.
using TyreRegistry = std::map<std::string, TyreProfile>;

// Built-in priors: HARD, MEDIUM, SOFT, INTERMEDIATE, WET.
const TyreRegistry& default_tyre_registry();

// Lookup helper; nullptr for unknown compounds.
const TyreProfile* find_profile(const TyreRegistry& reg, const std::string& compound);

// Stream-based CSV loader. Columns:
//   name,category,degradation_rate,reset_pace,warmup_laps,max_analysis_laps,max_degradation
// max_analysis_laps may be empty. Optional header row, '#' comments and blank
// lines are ignored, whitespace around fields is trimmed. Invalid rows are skipped.
TyreRegistry tyre_registry_from_csv_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<TyreRegistry> load_tyre_registry_csv(const std::string& path);

} // namespace tyredeg
