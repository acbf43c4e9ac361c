#pragma once
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>
#include <tyredeg/abrasion.hpp>
#include <tyredeg/config.hpp>
#include <tyredeg/estimator.hpp>
#include <tyredeg/health.hpp>
#include <tyredeg/lap.hpp>
#include <tyredeg/pace_filter.hpp>
#include <tyredeg/tyre.hpp>

namespace tyredeg {

// predict() called before a successful fit().
class NotFittedError : public std::logic_error {
public:
  NotFittedError() : std::logic_error("tyre model must be fitted before prediction") {}
};

// Diagnostics of the last successful fit.
struct FitReport {
  std::size_t input_laps = 0;
  std::size_t prepared_laps = 0;
  std::size_t normalized_conditions = 0;
  AbrasionEstimate abrasion{};
  std::map<std::string, CompoundFit> compounds;
};

// Per-driver, per-stint tyre degradation model.
//
// fit() runs the batch pass (prepare -> abrasion -> rates -> latent pace) and
// needs exclusive access. Afterwards the model is read-mostly: predict() may be
// called from several threads, only its result cache is mutated.
class TyreDegradationModel {
public:
  explicit TyreDegradationModel(ModelConfig cfg = {},
                                TyreRegistry priors = default_tyre_registry());
  TyreDegradationModel(const TyreDegradationModel&) = delete;
  TyreDegradationModel& operator=(const TyreDegradationModel&) = delete;

  // Returns false (and changes nothing) when no lap survives preparation.
  bool fit(const std::vector<LapRecord>& laps,
           const std::optional<std::string>& driver = std::nullopt);

  // Health of `driver`'s current set at `lap_number`. nullptr when the driver
  // has no laps up to that point or runs an unknown compound.
  // Throws NotFittedError before a successful fit.
  std::shared_ptr<const HealthSummary> predict(const std::string& driver, int lap_number,
                                               std::optional<TrackCondition> condition = std::nullopt) const;

  // Drop cached predictions (e.g., on a playback restart).
  void clear_cache();
  std::size_t cache_size() const;

  double mismatch_penalty(const std::string& compound, TrackCondition condition) const;

  bool is_fitted() const { return fitted_; }
  double track_abrasion() const { return track_abrasion_; }
  const ModelConfig& config() const { return cfg_; }
  const TyreRegistry& profiles() const { return profiles_; }
  const LatentPaceHistory& latent_states() const { return latent_; }
  const std::vector<PaceEstimate>* latent_states_for(const std::string& driver) const;
  const FitReport& last_fit_report() const { return report_; }

private:
  using CacheKey = std::tuple<std::string, int, int>; // driver, lap, condition or -1

  std::shared_ptr<const HealthSummary> compute_(const std::string& driver, int lap_number,
                                                std::optional<TrackCondition> condition) const;

  ModelConfig cfg_;
  TyreRegistry priors_;
  TyreRegistry profiles_;
  double track_abrasion_{1.0};
  bool fitted_{false};

  std::vector<DerivedLap> laps_;  // private prepared copy, sorted by (driver, lap)
  LatentPaceHistory latent_;
  FitReport report_{};

  mutable std::mutex cache_mu_;
  mutable std::map<CacheKey, std::shared_ptr<const HealthSummary>> cache_;
};

} // namespace tyredeg
