#pragma once
#include <map>
#include <string>
#include <vector>
#include <tyredeg/config.hpp>
#include <tyredeg/lap.hpp>
#include <tyredeg/tyre.hpp>

namespace tyredeg {

// Scalar Kalman filter over the fuel-free "true pace" of a tyre set.
// State drifts by the expected wear each lap; observations are lap times with
// the fuel effect added back in.
class LatentPaceFilter {
public:
  LatentPaceFilter(double process_var, double observation_var)
    : q_(process_var), r_(observation_var) {}

  // Fresh tyre set: mean = reset pace, variance = process noise.
  void reset(double reset_pace) {
    x_ = reset_pace;
    p_ = q_;
    gain_ = 0.0;
    innovation_ = 0.0;
    initialized_ = true;
  }

  // Predict with `drift` (s/lap), then correct with the observed lap time.
  // `fuel_offset` is fuel_effect * fuel_mass for the observed lap.
  void update(double drift, double fuel_offset, double observed_s) {
    const double x_pred = x_ + drift;
    const double p_pred = p_ + q_;
    innovation_ = observed_s - (x_pred + fuel_offset);
    gain_ = p_pred / (p_pred + r_);
    x_ = x_pred + gain_ * innovation_;
    p_ = (1.0 - gain_) * p_pred;
  }

  bool initialized() const { return initialized_; }
  double mean() const { return x_; }
  double variance() const { return p_; }
  double gain() const { return gain_; }
  double innovation() const { return innovation_; }

private:
  double q_;
  double r_;
  double x_ = 0.0;
  double p_ = 0.0;
  double gain_ = 0.0;
  double innovation_ = 0.0;
  bool initialized_ = false;
};

struct PaceEstimate {
  int lap_number = 0;
  int stint = 0;
  std::string compound;
  double mean = 0.0;      // filtered fuel-free pace (s)
  double variance = 0.0;
};

// Per driver, one entry per processed lap in lap order.
using LatentPaceHistory = std::map<std::string, std::vector<PaceEstimate>>;

// Runs the filter over every driver's prepared laps. Resets at each stint
// change; laps on compounds missing from `registry` are skipped.
LatentPaceHistory compute_latent_states(const std::vector<DerivedLap>& laps,
                                        const TyreRegistry& registry,
                                        double track_abrasion,
                                        const ModelConfig& cfg);

} // namespace tyredeg
