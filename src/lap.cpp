#include <tyredeg/lap.hpp>
#include <algorithm>
#include <utility>

namespace tyredeg {

double fuel_mass_at(int lap_number, const ModelConfig& cfg) {
  const double burned = static_cast<double>(lap_number - 1) * cfg.fuel_burn_rate;
  return std::max(0.0, cfg.starting_fuel - burned);
}

std::vector<DerivedLap> prepare_laps(const std::vector<LapRecord>& records,
                                     const ModelConfig& cfg,
                                     const std::optional<std::string>& driver) {
  std::vector<DerivedLap> out;
  out.reserve(records.size());

  for (const auto& r : records) {
    if (driver && r.driver != *driver) continue;
    if (r.lap_number <= 1) continue;
    if (!r.lap_time.has_value()) continue;
    if (!r.compound.has_value()) continue;

    DerivedLap d;
    d.compound = normalize_label(*r.compound);
    if (d.compound.empty()) continue;

    d.driver = r.driver;
    d.lap_number = r.lap_number;
    d.stint = r.stint;
    d.lap_time_s = std::chrono::duration<double>(*r.lap_time).count();
    d.fuel_mass = fuel_mass_at(r.lap_number, cfg);

    const auto cond = r.track_condition ? parse_track_condition(*r.track_condition)
                                        : std::nullopt;
    d.condition = cond.value_or(TrackCondition::Dry);
    d.condition_normalized = !cond.has_value();

    out.push_back(std::move(d));
  }

  std::stable_sort(out.begin(), out.end(), [](const DerivedLap& a, const DerivedLap& b) {
    if (a.driver != b.driver) return a.driver < b.driver;
    return a.lap_number < b.lap_number;
  });
  return out;
}

std::size_t count_normalized_conditions(const std::vector<DerivedLap>& laps) {
  return static_cast<std::size_t>(std::count_if(laps.begin(), laps.end(),
      [](const DerivedLap& d){ return d.condition_normalized; }));
}

} // namespace tyredeg
