#include <catch2/catch.hpp>
#include <chrono>
#include <random>
#include <thread>
#include <vector>

#include <tyredeg/model.hpp>
#include <tyredeg/synth.hpp>

using Catch::Detail::Approx;
using namespace tyredeg;
using std::chrono::milliseconds;

static LapRecord rec(const char* driver, int n, int ms, const char* compound, int stint,
                     std::optional<std::string> cond = std::nullopt) {
  return LapRecord{driver, n, milliseconds(ms), std::string(compound), stint, cond};
}

// Driver A: SOFT on laps 2-4, then MEDIUM from lap 5 through lap 10. Lap times
// fall quickly enough that no compound sees a positive fuel-corrected trend,
// so every rate stays at its prior.
static std::vector<LapRecord> scenario_c_laps() {
  std::vector<LapRecord> laps;
  laps.push_back(rec("A", 1, 95000, "SOFT", 1));
  for (int n = 2; n <= 4; ++n) laps.push_back(rec("A", n, 92000 - 500 * n, "SOFT", 1));
  for (int n = 5; n <= 10; ++n) laps.push_back(rec("A", n, 93000 - 500 * n, "MEDIUM", 2));
  return laps;
}

TEST_CASE("predict before fit fails with NotFittedError") {
  TyreDegradationModel model;
  REQUIRE_FALSE(model.is_fitted());
  REQUIRE_THROWS_AS(model.predict("A", 10), NotFittedError);
  REQUIRE_THROWS_AS(model.predict("", 0), NotFittedError);
  REQUIRE_THROWS_AS(model.predict("B", -1, TrackCondition::Wet), NotFittedError);
}

TEST_CASE("fit without usable laps leaves the model unfitted") {
  TyreDegradationModel model;

  SECTION("empty table") {
    REQUIRE_FALSE(model.fit({}));
  }

  SECTION("everything filtered") {
    std::vector<LapRecord> laps{
      rec("A", 1, 90000, "SOFT", 1),
      LapRecord{"A", 2, std::nullopt, std::string("SOFT"), 1, std::nullopt},
    };
    REQUIRE_FALSE(model.fit(laps));
  }

  REQUIRE_FALSE(model.is_fitted());
  REQUIRE(model.track_abrasion() == 1.0);
  REQUIRE(model.profiles().at("SOFT").degradation_rate == 0.05);
  REQUIRE(model.latent_states().empty());
  REQUIRE_THROWS_AS(model.predict("A", 2), NotFittedError);
}

TEST_CASE("predict: MEDIUM six laps into the stint on a dry track") {
  TyreDegradationModel model;
  REQUIRE(model.fit(scenario_c_laps()));
  REQUIRE(model.is_fitted());
  REQUIRE(model.track_abrasion() == 1.0);
  REQUIRE(model.profiles().at("MEDIUM").degradation_rate == 0.03);

  const auto h = model.predict("A", 10);
  REQUIRE(h != nullptr);
  REQUIRE(h->laps_on_tyre == 6);
  REQUIRE(h->compound == "MEDIUM");
  REQUIRE(h->category == TyreCategory::Slick);
  REQUIRE(h->track_condition == TrackCondition::Dry);
  REQUIRE(h->track_abrasion == 1.0);
  REQUIRE(h->effective_degradation == Approx(0.03));
  REQUIRE(h->mismatch_penalty == 0.0);
  // max_laps = 2.0 / 0.03 = 66.7, effective laps = 6 -> 91
  REQUIRE(h->health == 91);
  REQUIRE(h->expected_pace == Approx(69.0 + 5 * 0.03));
  REQUIRE(h->filtered_pace.has_value());
  REQUIRE(h->filtered_variance.has_value());

  SECTION("earlier lap in the same stint") {
    const auto h7 = model.predict("A", 7);
    REQUIRE(h7 != nullptr);
    REQUIRE(h7->laps_on_tyre == 3);
    REQUIRE(h7->health == 95);
  }

  SECTION("lap past the data uses the most recent lap") {
    const auto later = model.predict("A", 15);
    REQUIRE(later != nullptr);
    REQUIRE(later->laps_on_tyre == 6);
  }

  SECTION("previous stint") {
    const auto soft = model.predict("A", 3);
    REQUIRE(soft != nullptr);
    REQUIRE(soft->compound == "SOFT");
    REQUIRE(soft->laps_on_tyre == 2);
  }

  SECTION("explicit condition overrides the recorded one") {
    const auto wet = model.predict("A", 10, TrackCondition::Wet);
    REQUIRE(wet != nullptr);
    REQUIRE(wet->mismatch_penalty == Approx(8.0));
    REQUIRE(wet->track_condition == TrackCondition::Wet);
    // 6 * (1 + 8 / 5) = 15.6 effective laps
    REQUIRE(wet->health == 76);
    REQUIRE(model.mismatch_penalty("MEDIUM", TrackCondition::Wet) == Approx(8.0));
  }

  SECTION("absent data is an empty result, not an error") {
    REQUIRE(model.predict("A", 1) == nullptr);
    REQUIRE(model.predict("Z", 10) == nullptr);
  }
}

TEST_CASE("predict: recorded condition and unknown compounds") {
  std::vector<LapRecord> laps;
  for (int n = 2; n <= 6; ++n) laps.push_back(rec("D", n, 90000 - 400 * n, "MEDIUM", 1, "DAMP"));
  for (int n = 2; n <= 6; ++n) laps.push_back(rec("X", n, 90000, "HYPERSOFT", 1));
  for (int n = 2; n <= 4; ++n) laps.push_back(rec("M", n, 90000 - 400 * n, "HARD", 1, "SLUSH"));

  TyreDegradationModel model;
  REQUIRE(model.fit(laps));
  REQUIRE(model.last_fit_report().normalized_conditions == 8);

  const auto damp = model.predict("D", 6);
  REQUIRE(damp != nullptr);
  REQUIRE(damp->track_condition == TrackCondition::Damp);
  REQUIRE(damp->mismatch_penalty == Approx(2.0));

  const auto slush = model.predict("M", 4);
  REQUIRE(slush != nullptr);
  REQUIRE(slush->track_condition == TrackCondition::Dry);

  REQUIRE(model.predict("X", 6) == nullptr);
  REQUIRE(model.latent_states_for("X") != nullptr);
  REQUIRE(model.latent_states_for("X")->empty());
  REQUIRE(model.mismatch_penalty("HYPERSOFT", TrackCondition::Wet) == 0.0);
}

TEST_CASE("predict: lower-case condition labels count as dry") {
  std::vector<LapRecord> laps;
  for (int n = 2; n <= 6; ++n) laps.push_back(rec("W", n, 90000 - 400 * n, "MEDIUM", 1, "wet"));

  TyreDegradationModel model;
  REQUIRE(model.fit(laps));
  REQUIRE(model.last_fit_report().normalized_conditions == 5);

  const auto h = model.predict("W", 6);
  REQUIRE(h != nullptr);
  REQUIRE(h->track_condition == TrackCondition::Dry);
  REQUIRE(h->mismatch_penalty == 0.0);
}

TEST_CASE("prediction cache") {
  TyreDegradationModel model;
  REQUIRE(model.fit(scenario_c_laps()));

  const auto first = model.predict("A", 10);
  const auto again = model.predict("A", 10);
  REQUIRE(first.get() == again.get());
  REQUIRE(model.cache_size() == 1);

  const auto wet = model.predict("A", 10, TrackCondition::Wet);
  REQUIRE(wet.get() != first.get());
  REQUIRE(model.cache_size() == 2);

  REQUIRE(model.predict("Z", 10) == nullptr);
  REQUIRE(model.cache_size() == 2);

  model.clear_cache();
  REQUIRE(model.cache_size() == 0);
  const auto fresh = model.predict("A", 10);
  REQUIRE(fresh != nullptr);
  REQUIRE(fresh.get() != first.get());
  REQUIRE(fresh->health == first->health);
}

TEST_CASE("concurrent predictions share one cached result") {
  TyreDegradationModel model;
  REQUIRE(model.fit(scenario_c_laps()));

  std::vector<std::shared_ptr<const HealthSummary>> results(8);
  std::vector<std::thread> workers;
  for (std::size_t i = 0; i < results.size(); ++i) {
    workers.emplace_back([&, i]{ results[i] = model.predict("A", 10); });
  }
  for (auto& w : workers) w.join();

  for (const auto& r : results) {
    REQUIRE(r != nullptr);
    REQUIRE(r.get() == results.front().get());
  }
  REQUIRE(model.cache_size() == 1);
}

TEST_CASE("fit: two long stints are not enough to estimate abrasion") {
  std::vector<LapRecord> laps;
  for (int n = 2; n <= 12; ++n) laps.push_back(rec("A", n, 90000 + 100 * n, "MEDIUM", 1));
  for (int n = 2; n <= 12; ++n) laps.push_back(rec("B", n, 90000 + 120 * n, "MEDIUM", 1));

  TyreDegradationModel model;
  REQUIRE(model.fit(laps));
  REQUIRE(model.track_abrasion() == 1.0);
  REQUIRE(model.last_fit_report().abrasion.samples.size() == 2);
}

TEST_CASE("fit: clean SOFT stint blends toward the observed slope") {
  std::vector<LapRecord> laps;
  for (int k = 0; k < 6; ++k) laps.push_back(rec("A", 2 + k, 90000 + 200 * k, "SOFT", 1));
  // Another driver's laps are excluded by the driver filter.
  for (int k = 0; k < 6; ++k) laps.push_back(rec("B", 2 + k, 90000 + 900 * k, "SOFT", 1));

  TyreDegradationModel model;
  REQUIRE(model.fit(laps, std::string("A")));

  const double observed = 0.2 + 1.6 * 0.032;
  const double rate = model.profiles().at("SOFT").degradation_rate;
  REQUIRE(rate == Approx(0.3 * 0.05 + 0.7 * observed));
  REQUIRE(model.last_fit_report().compounds.at("SOFT").slopes.size() == 1);
  REQUIRE(model.predict("B", 7) == nullptr);

  SECTION("refitting starts again from the priors") {
    REQUIRE(model.fit(laps, std::string("A")));
    REQUIRE(model.profiles().at("SOFT").degradation_rate == Approx(rate));
  }
}

TEST_CASE("fit: five-lap MEDIUM stints update the rate with default settings") {
  std::vector<LapRecord> laps;
  for (const char* d : {"A", "B", "C"}) {
    for (int n = 2; n <= 6; ++n) laps.push_back(rec(d, n, 90000 + 300 * (n - 2), "MEDIUM", 1));
  }

  TyreDegradationModel model;
  REQUIRE(model.fit(laps));
  REQUIRE(model.last_fit_report().compounds.at("MEDIUM").slopes.size() == 3);
  const double observed = 0.3 + 1.6 * 0.032;
  REQUIRE(model.profiles().at("MEDIUM").degradation_rate == Approx(0.3 * 0.03 + 0.7 * observed));
}

TEST_CASE("fit on a synthetic race keeps every invariant") {
  ModelConfig cfg;
  const std::vector<SyntheticDriver> grid{
    {"VER", 68.4, {{"MEDIUM", 18, 0.035}, {"HARD", 22, 0.015}, {"SOFT", 12, 0.060}}},
    {"HAM", 68.6, {{"SOFT", 12, 0.055}, {"HARD", 24, 0.012}, {"MEDIUM", 16, 0.030}}},
    {"LEC", 68.5, {{"MEDIUM", 20, 0.032}, {"HARD", 32, 0.014}}},
    {"NOR", 68.7, {{"HARD", 28, 0.011}, {"MEDIUM", 24, 0.033}}},
  };
  std::mt19937 rng(7);
  const auto laps = simulate_session(grid, cfg, SyntheticNoise{0.2, 0.1, 3.0}, rng);

  TyreDegradationModel model(cfg);
  REQUIRE(model.fit(laps));
  REQUIRE(model.track_abrasion() >= 0.7);
  REQUIRE(model.track_abrasion() <= 1.4);
  for (const auto& [name, p] : model.profiles()) {
    REQUIRE(p.degradation_rate >= 0.0);
  }
  REQUIRE(model.latent_states().size() == 4);

  for (const auto& d : grid) {
    int prev = 101;
    int prev_stint_laps = 0;
    for (int lap = 2; lap <= 52; ++lap) {
      const auto h = model.predict(d.driver, lap);
      if (!h) continue;
      REQUIRE(h->health >= 0);
      REQUIRE(h->health <= 100);
      if (h->laps_on_tyre > prev_stint_laps) {
        REQUIRE(h->health <= prev);
      }
      prev = h->health;
      prev_stint_laps = h->laps_on_tyre;
    }
  }
}

TEST_CASE("abrasion estimation can be switched off") {
  ModelConfig cfg;
  cfg.enable_track_abrasion = false;
  std::vector<LapRecord> laps;
  for (const char* d : {"A", "B", "C", "D"}) {
    for (int n = 2; n <= 12; ++n) laps.push_back(rec(d, n, 90000 + 50 * n, "SOFT", 1));
  }

  TyreDegradationModel model(cfg);
  REQUIRE(model.fit(laps));
  REQUIRE(model.track_abrasion() == 1.0);
  REQUIRE(model.last_fit_report().abrasion.samples.empty());
}
