#include <cstdio>
#include <random>
#include <string>
#include <vector>

#include <tyredeg/health_format.hpp>
#include <tyredeg/log.hpp>
#include <tyredeg/model.hpp>
#include <tyredeg/synth.hpp>

using namespace tyredeg;

// Fits the model on a synthetic two-stop race and prints tyre health every
// few laps. Optional argv[1]: tyre catalog CSV overriding the built-in priors.
int main(int argc, char** argv) {
  TyreRegistry priors = default_tyre_registry();
  if (argc > 1) {
    auto loaded = load_tyre_registry_csv(argv[1]);
    if (!loaded) {
      TYREDEG_LOG_ERROR("cannot open tyre catalog '%s'", argv[1]);
      return 1;
    }
    if (loaded->empty()) {
      TYREDEG_LOG_ERROR("tyre catalog '%s' has no valid rows", argv[1]);
      return 1;
    }
    priors = *loaded;
  }

  ModelConfig cfg;
  const std::vector<SyntheticDriver> grid{
    {"VER", 68.4, {{"MEDIUM", 18, 0.035}, {"HARD", 22, 0.015}, {"SOFT", 12, 0.060}}},
    {"HAM", 68.6, {{"SOFT", 12, 0.055}, {"HARD", 24, 0.012}, {"MEDIUM", 16, 0.030}}},
    {"LEC", 68.5, {{"MEDIUM", 20, 0.032}, {"HARD", 32, 0.014}}},
    {"NOR", 68.7, {{"HARD", 28, 0.011}, {"MEDIUM", 24, 0.033}}},
  };
  SyntheticNoise noise{0.15, 0.05, 2.5};
  std::mt19937 rng(2024);
  const auto laps = simulate_session(grid, cfg, noise, rng);

  TyreDegradationModel model(cfg, priors);
  if (!model.fit(laps)) {
    TYREDEG_LOG_ERROR("no usable laps in session");
    return 1;
  }

  std::printf("track abrasion: %.3f\n", model.track_abrasion());
  for (const auto& [name, p] : model.profiles()) {
    std::printf("  %-12s %-5s %.4f s/lap\n", name.c_str(), category_name(p.category),
                p.degradation_rate);
  }

  for (int lap = 5; lap <= 52; lap += 5) {
    std::printf("lap %2d:", lap);
    for (const auto& d : grid) {
      const auto h = model.predict(d.driver, lap);
      std::printf("  %s %-18s", d.driver.c_str(), format_degradation_text(h.get()).c_str());
    }
    std::printf("\n");
  }
  return 0;
}
