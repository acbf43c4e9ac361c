#include <tyredeg/model.hpp>
#include <algorithm>
#include <utility>
#include <tyredeg/log.hpp>

namespace tyredeg {

TyreDegradationModel::TyreDegradationModel(ModelConfig cfg, TyreRegistry priors)
  : cfg_(std::move(cfg)), priors_(std::move(priors)) {
  // Profiles violating the invariants never enter the registry.
  for (auto it = priors_.begin(); it != priors_.end();) {
    if (!validate_profile(it->second)) {
      TYREDEG_LOG_WARN("dropping invalid tyre profile '%s'", it->first.c_str());
      it = priors_.erase(it);
    } else {
      ++it;
    }
  }
  profiles_ = priors_;
}

bool TyreDegradationModel::fit(const std::vector<LapRecord>& laps,
                               const std::optional<std::string>& driver) {
  auto prepared = prepare_laps(laps, cfg_, driver);
  if (prepared.empty()) {
    TYREDEG_LOG_WARN("fit skipped: no usable laps out of %zu records", laps.size());
    return false;
  }

  FitReport report;
  report.input_laps = laps.size();
  report.prepared_laps = prepared.size();
  report.normalized_conditions = count_normalized_conditions(prepared);

  TyreRegistry profiles = priors_;
  if (cfg_.enable_track_abrasion) {
    report.abrasion = estimate_track_abrasion_detail(prepared, cfg_);
  }
  const double abrasion = report.abrasion.factor;
  report.compounds = estimate_degradation_rates(prepared, profiles, cfg_);
  auto latent = compute_latent_states(prepared, profiles, abrasion, cfg_);

  profiles_ = std::move(profiles);
  track_abrasion_ = abrasion;
  laps_ = std::move(prepared);
  latent_ = std::move(latent);
  report_ = std::move(report);
  fitted_ = true;
  clear_cache();

  TYREDEG_LOG_INFO("fitted on %zu of %zu laps, track abrasion %.3f (%zu samples)",
                   report_.prepared_laps, report_.input_laps, track_abrasion_,
                   report_.abrasion.samples.size());
  for (const auto& [name, f] : report_.compounds) {
    TYREDEG_LOG_INFO("  %s: %.4f s/lap (%zu stints)", name.c_str(), f.fitted_rate, f.slopes.size());
  }
  return true;
}

double TyreDegradationModel::mismatch_penalty(const std::string& compound,
                                              TrackCondition condition) const {
  const TyreProfile* tyre = find_profile(profiles_, compound);
  if (!tyre) return 0.0;
  return cfg_.mismatch.penalty(tyre->category, condition);
}

const std::vector<PaceEstimate>* TyreDegradationModel::latent_states_for(const std::string& driver) const {
  auto it = latent_.find(driver);
  if (it == latent_.end()) return nullptr;
  return &it->second;
}

std::shared_ptr<const HealthSummary> TyreDegradationModel::predict(const std::string& driver,
                                                                   int lap_number,
                                                                   std::optional<TrackCondition> condition) const {
  if (!fitted_) throw NotFittedError();

  const CacheKey key{driver, lap_number, condition ? static_cast<int>(*condition) : -1};
  {
    std::lock_guard<std::mutex> lock(cache_mu_);
    auto it = cache_.find(key);
    if (it != cache_.end()) return it->second;
  }

  auto result = compute_(driver, lap_number, condition);
  if (result) {
    std::lock_guard<std::mutex> lock(cache_mu_);
    // Another caller may have raced us; keep the first stored object.
    return cache_.emplace(key, result).first->second;
  }
  return result;
}

std::shared_ptr<const HealthSummary> TyreDegradationModel::compute_(const std::string& driver,
                                                                    int lap_number,
                                                                    std::optional<TrackCondition> condition) const {
  auto first = std::lower_bound(laps_.begin(), laps_.end(), driver,
      [](const DerivedLap& d, const std::string& name){ return d.driver < name; });
  auto end = std::upper_bound(first, laps_.end(), lap_number,
      [&](int lap, const DerivedLap& d){ return d.driver != driver || lap < d.lap_number; });
  if (first == end) return nullptr;

  const DerivedLap& last = *(end - 1);
  const TyreProfile* tyre = find_profile(profiles_, last.compound);
  if (!tyre) return nullptr;

  const int laps_on_tyre = static_cast<int>(std::count_if(first, end,
      [&](const DerivedLap& d){ return d.stint == last.stint; }));

  auto out = std::make_shared<HealthSummary>();
  out->laps_on_tyre = laps_on_tyre;
  out->compound = last.compound;
  out->category = tyre->category;
  out->track_condition = condition.value_or(last.condition);
  out->track_abrasion = track_abrasion_;
  out->effective_degradation = tyre->degradation_rate * track_abrasion_;
  out->mismatch_penalty = cfg_.mismatch.penalty(tyre->category, out->track_condition);
  out->health = tyre_health(laps_on_tyre, out->effective_degradation,
                            tyre->max_degradation, out->mismatch_penalty);
  out->expected_pace = tyre->reset_pace + (laps_on_tyre - 1) * out->effective_degradation;

  if (const auto* states = latent_states_for(driver)) {
    auto it = std::find_if(states->begin(), states->end(),
        [&](const PaceEstimate& e){ return e.lap_number == last.lap_number; });
    if (it != states->end()) {
      out->filtered_pace = it->mean;
      out->filtered_variance = it->variance;
    }
  }
  return out;
}

void TyreDegradationModel::clear_cache() {
  std::lock_guard<std::mutex> lock(cache_mu_);
  cache_.clear();
}

std::size_t TyreDegradationModel::cache_size() const {
  std::lock_guard<std::mutex> lock(cache_mu_);
  return cache_.size();
}

} // namespace tyredeg
