#include <tyredeg/health_format.hpp>
#include <algorithm>

namespace tyredeg {

Rgb health_color(int health) {
  if (health >= 75) return {0, 220, 0};
  if (health >= 50) return {200, 220, 0};
  if (health >= 25) return {220, 180, 0};
  return {220, 50, 0};
}

HealthBar format_health_bar(int health, int width, int height) {
  HealthBar bar;
  bar.health = std::clamp(health, 0, 100);
  bar.width = std::max(0, width);
  bar.height = std::max(0, height);
  bar.fill_width = (bar.health / 100.0) * bar.width;
  bar.color = health_color(bar.health);
  return bar;
}

std::string format_degradation_text(const HealthSummary* summary) {
  if (!summary) return "N/A";
  std::string out = summary->compound.empty() ? "?" : summary->compound;
  out += " (L" + std::to_string(summary->laps_on_tyre) + "): ";
  out += std::to_string(summary->health) + "%";
  return out;
}

} // namespace tyredeg
