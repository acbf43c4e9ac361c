#include <catch2/catch.hpp>
#include <chrono>
#include <vector>

#include <tyredeg/lap.hpp>

using Catch::Detail::Approx;
using namespace tyredeg;
using std::chrono::milliseconds;

static LapRecord lap(const char* driver, int n, int ms, const char* compound, int stint,
                     std::optional<std::string> cond = std::nullopt) {
  return LapRecord{driver, n, milliseconds(ms), std::string(compound), stint, cond};
}

TEST_CASE("fuel_mass_at burns linearly and floors at zero") {
  ModelConfig cfg;
  REQUIRE(fuel_mass_at(1, cfg) == Approx(110.0));
  REQUIRE(fuel_mass_at(2, cfg) == Approx(108.4));
  REQUIRE(fuel_mass_at(11, cfg) == Approx(94.0));
  REQUIRE(fuel_mass_at(80, cfg) == Approx(0.0));
}

TEST_CASE("prepare_laps filters and augments") {
  ModelConfig cfg;
  std::vector<LapRecord> raw{
    lap("B", 3, 91200, "soft", 1, "WET"),
    lap("A", 1, 95000, "SOFT", 1),            // formation/warm-up lap
    lap("A", 3, 90500, "SOFT", 1, "DAMP"),
    lap("A", 2, 90400, "SOFT", 1, "FOGGY"),
    LapRecord{"A", 4, std::nullopt, std::string("SOFT"), 1, std::nullopt},
    LapRecord{"A", 5, milliseconds(90600), std::nullopt, 1, std::nullopt},
    lap("A", 6, 90700, "  ", 1),
  };
  const auto before = raw;

  const auto out = prepare_laps(raw, cfg);
  REQUIRE(out.size() == 3);

  SECTION("sorted by driver then lap") {
    REQUIRE(out[0].driver == "A");
    REQUIRE(out[0].lap_number == 2);
    REQUIRE(out[1].lap_number == 3);
    REQUIRE(out[2].driver == "B");
  }

  SECTION("fuel mass and seconds are derived") {
    REQUIRE(out[0].lap_time_s == Approx(90.4));
    REQUIRE(out[0].fuel_mass == Approx(108.4));
    REQUIRE(out[1].fuel_mass == Approx(106.8));
  }

  SECTION("conditions are normalized and flagged") {
    REQUIRE(out[0].condition == TrackCondition::Dry);
    REQUIRE(out[0].condition_normalized);
    REQUIRE(out[1].condition == TrackCondition::Damp);
    REQUIRE_FALSE(out[1].condition_normalized);
    REQUIRE(out[2].condition == TrackCondition::Wet);
    REQUIRE(count_normalized_conditions(out) == 1);
  }

  SECTION("compound labels are upper-cased") {
    REQUIRE(out[2].compound == "SOFT");
  }

  SECTION("input records are untouched") {
    REQUIRE(raw.size() == before.size());
    REQUIRE(raw[0].driver == "B");
    REQUIRE(*raw[3].track_condition == "FOGGY");
  }
}

TEST_CASE("prepare_laps only accepts exact condition labels") {
  ModelConfig cfg;
  std::vector<LapRecord> raw{
    lap("W", 2, 90000, "MEDIUM", 1, "wet"),
    lap("W", 3, 90100, "MEDIUM", 1, " Damp "),
    lap("W", 4, 90200, "MEDIUM", 1, "WET"),
  };
  const auto out = prepare_laps(raw, cfg);
  REQUIRE(out.size() == 3);
  REQUIRE(out[0].condition == TrackCondition::Dry);
  REQUIRE(out[0].condition_normalized);
  REQUIRE(out[1].condition == TrackCondition::Dry);
  REQUIRE(out[1].condition_normalized);
  REQUIRE(out[2].condition == TrackCondition::Wet);
  REQUIRE_FALSE(out[2].condition_normalized);
  REQUIRE(count_normalized_conditions(out) == 2);
}

TEST_CASE("prepare_laps driver filter and empty input") {
  ModelConfig cfg;
  std::vector<LapRecord> raw{
    lap("A", 2, 90000, "HARD", 1),
    lap("B", 2, 90100, "HARD", 1),
  };
  const auto only_b = prepare_laps(raw, cfg, std::string("B"));
  REQUIRE(only_b.size() == 1);
  REQUIRE(only_b[0].driver == "B");

  REQUIRE(prepare_laps({}, cfg).empty());
  REQUIRE(prepare_laps(raw, cfg, std::string("Z")).empty());
}
