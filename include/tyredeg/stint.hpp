#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <vector>
#include <tyredeg/lap.hpp>

namespace tyredeg {

// Laps one driver completed on one compound within one stint, in lap order.
struct StintSeries {
  std::string compound;
  std::string driver;
  int stint = 0;
  std::vector<const DerivedLap*> laps; // points into the prepared lap table
};

// Groups prepared laps by (compound, driver, stint). Laps rejected by `keep`
// are ignored. Pointers stay valid as long as `laps` is alive and unmodified.
std::vector<StintSeries> group_stints(const std::vector<DerivedLap>& laps,
                                      const std::function<bool(const DerivedLap&)>& keep);

// Fuel-corrected lap time deltas from the first lap of the stint, indexed by
// lap-on-tyre (1..n).
struct DeltaSeries {
  std::vector<double> lap_on_tyre;
  std::vector<double> delta;
  std::size_t size() const { return delta.size(); }
};

DeltaSeries fuel_corrected_deltas(const StintSeries& s, double fuel_effect);

// Keeps only entries whose lap-on-tyre lies in [first, last].
DeltaSeries slice_laps_on_tyre(const DeltaSeries& d, int first, int last);

} // namespace tyredeg
