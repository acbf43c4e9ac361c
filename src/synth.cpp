#include <tyredeg/synth.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <utility>

namespace tyredeg {

static inline double clamp01(double x) {
  return x < 0.0 ? 0.0 : (x > 1.0 ? 1.0 : x);
}

double synthetic_lap_time(double base_pace, double degradation_per_lap, int lap_on_tyre,
                          int lap_number, const ModelConfig& cfg) {
  const double wear = std::max(0.0, degradation_per_lap) * (lap_on_tyre - 1);
  return base_pace + wear + cfg.fuel_effect * fuel_mass_at(lap_number, cfg);
}

std::vector<LapRecord> simulate_session(const std::vector<SyntheticDriver>& drivers,
                                        const ModelConfig& cfg,
                                        const SyntheticNoise& noise,
                                        std::mt19937& rng) {
  std::uniform_real_distribution<double> U(0.0, 1.0);
  const double jitter = std::max(0.0, noise.jitter_s);
  const double p_slow = clamp01(noise.outlier_prob);

  std::vector<LapRecord> out;
  for (const auto& d : drivers) {
    int lap_number = 1;
    int stint_id = 1;
    for (const auto& s : d.stints) {
      for (int k = 1; k <= s.laps; ++k, ++lap_number) {
        double t = synthetic_lap_time(d.base_pace, s.degradation_per_lap, k, lap_number, cfg);
        if (jitter > 0.0) t += (2.0 * U(rng) - 1.0) * jitter;
        if (p_slow > 0.0 && U(rng) < p_slow) t += noise.outlier_s;

        LapRecord r;
        r.driver = d.driver;
        r.lap_number = lap_number;
        r.lap_time = std::chrono::milliseconds(std::llround(t * 1000.0));
        r.compound = s.compound;
        r.stint = stint_id;
        r.track_condition = d.track_condition;
        out.push_back(std::move(r));
      }
      ++stint_id;
    }
  }
  return out;
}

} // namespace tyredeg
