#include <tyredeg/pace_filter.hpp>
#include <optional>

namespace tyredeg {

LatentPaceHistory compute_latent_states(const std::vector<DerivedLap>& laps,
                                        const TyreRegistry& registry,
                                        double track_abrasion,
                                        const ModelConfig& cfg) {
  LatentPaceHistory history;
  const double proc_var = cfg.sigma_eta * cfg.sigma_eta;
  const double obs_var = cfg.sigma_epsilon * cfg.sigma_epsilon;

  // Laps arrive grouped by driver and sorted by lap number (see prepare_laps).
  std::string driver;
  LatentPaceFilter filter(proc_var, obs_var);
  std::optional<int> prev_stint;

  for (const auto& lap : laps) {
    if (lap.driver != driver || history.count(lap.driver) == 0) {
      driver = lap.driver;
      history[driver];
      filter = LatentPaceFilter(proc_var, obs_var);
      prev_stint.reset();
    }

    const TyreProfile* tyre = find_profile(registry, lap.compound);
    if (!tyre) continue;

    if (!filter.initialized() || prev_stint != lap.stint) {
      filter.reset(tyre->reset_pace);
      prev_stint = lap.stint;
    } else {
      filter.update(tyre->degradation_rate * track_abrasion,
                    cfg.fuel_effect * lap.fuel_mass,
                    lap.lap_time_s);
    }

    history[driver].push_back(PaceEstimate{lap.lap_number, lap.stint, lap.compound,
                                           filter.mean(), filter.variance()});
  }
  return history;
}

} // namespace tyredeg
