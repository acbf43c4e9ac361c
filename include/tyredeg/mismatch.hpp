#pragma once
#include <array>
#include <cstddef>
#include <initializer_list>
#include <tyredeg/tyre.hpp>

namespace tyredeg {

struct MismatchEntry {
  TyreCategory category;
  TrackCondition condition;
  double penalty;
};

// Additional wear multiplier for a tyre category used on a track condition.
// Filled once at construction; immutable afterwards. Pairs not listed are 0.
class MismatchTable {
public:
  // Default 3x3 table: matched pairs 0.0, SLICK on WET is the maximum (8.0).
  MismatchTable();
  MismatchTable(std::initializer_list<MismatchEntry> entries);

  // Always >= 0.
  double penalty(TyreCategory category, TrackCondition condition) const {
    return cells_[index_(category, condition)];
  }

  double max_penalty() const;

private:
  static std::size_t index_(TyreCategory c, TrackCondition t) {
    return static_cast<std::size_t>(c) * 3 + static_cast<std::size_t>(t);
  }

  void set_(const MismatchEntry& e);

  std::array<double, 9> cells_{};
};

} // namespace tyredeg
