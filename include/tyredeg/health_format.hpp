#pragma once
#include <cstdint>
#include <string>
#include <tyredeg/health.hpp>

namespace tyredeg {

struct Rgb {
  std::uint8_t r = 0;
  std::uint8_t g = 0;
  std::uint8_t b = 0;
};

// Geometry and color of a horizontal health bar for the presentation layer.
struct HealthBar {
  int width = 100;
  int height = 12;
  double fill_width = 0.0;
  Rgb color{};
  int health = 0;   // clamped to [0, 100]
};

// Color bands: >= 75 green, >= 50 yellow-green, >= 25 amber, else red.
Rgb health_color(int health);

HealthBar format_health_bar(int health, int width = 100, int height = 12);

// "SOFT (L12): 83%", or "N/A" without a summary.
std::string format_degradation_text(const HealthSummary* summary);

} // namespace tyredeg
