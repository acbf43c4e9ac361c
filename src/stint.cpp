#include <tyredeg/stint.hpp>
#include <algorithm>
#include <map>
#include <tuple>
#include <utility>

namespace tyredeg {

std::vector<StintSeries> group_stints(const std::vector<DerivedLap>& laps,
                                      const std::function<bool(const DerivedLap&)>& keep) {
  using Key = std::tuple<std::string, std::string, int>;
  std::map<Key, StintSeries> groups;
  for (const auto& lap : laps) {
    if (keep && !keep(lap)) continue;
    auto& g = groups[Key{lap.compound, lap.driver, lap.stint}];
    if (g.laps.empty()) {
      g.compound = lap.compound;
      g.driver = lap.driver;
      g.stint = lap.stint;
    }
    g.laps.push_back(&lap);
  }

  std::vector<StintSeries> out;
  out.reserve(groups.size());
  for (auto& [key, g] : groups) {
    // Prepared laps are sorted per driver already; keep it robust to raw order.
    std::stable_sort(g.laps.begin(), g.laps.end(), [](const DerivedLap* a, const DerivedLap* b) {
      return a->lap_number < b->lap_number;
    });
    out.push_back(std::move(g));
  }
  return out;
}

DeltaSeries fuel_corrected_deltas(const StintSeries& s, double fuel_effect) {
  DeltaSeries d;
  if (s.laps.empty()) return d;
  d.lap_on_tyre.reserve(s.laps.size());
  d.delta.reserve(s.laps.size());

  const auto corrected = [&](const DerivedLap* lap) {
    return lap->lap_time_s - fuel_effect * lap->fuel_mass;
  };
  const double first = corrected(s.laps.front());
  for (std::size_t i = 0; i < s.laps.size(); ++i) {
    d.lap_on_tyre.push_back(static_cast<double>(i + 1));
    d.delta.push_back(corrected(s.laps[i]) - first);
  }
  return d;
}

DeltaSeries slice_laps_on_tyre(const DeltaSeries& d, int first, int last) {
  DeltaSeries out;
  for (std::size_t i = 0; i < d.size(); ++i) {
    const double lot = d.lap_on_tyre[i];
    if (lot < first || lot > last) continue;
    out.lap_on_tyre.push_back(lot);
    out.delta.push_back(d.delta[i]);
  }
  return out;
}

} // namespace tyredeg
