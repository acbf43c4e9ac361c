#include <tyredeg/mismatch.hpp>
#include <algorithm>

namespace tyredeg {

static const MismatchEntry kDefaultEntries[] = {
  {TyreCategory::Slick, TrackCondition::Dry,  0.0},
  {TyreCategory::Slick, TrackCondition::Damp, 2.0},
  {TyreCategory::Slick, TrackCondition::Wet,  8.0},
  {TyreCategory::Inter, TrackCondition::Dry,  1.5},
  {TyreCategory::Inter, TrackCondition::Damp, 0.0},
  {TyreCategory::Inter, TrackCondition::Wet,  0.5},
  {TyreCategory::Wet,   TrackCondition::Dry,  4.0},
  {TyreCategory::Wet,   TrackCondition::Damp, 1.0},
  {TyreCategory::Wet,   TrackCondition::Wet,  0.0},
};

MismatchTable::MismatchTable() {
  for (const auto& e : kDefaultEntries) set_(e);
}

MismatchTable::MismatchTable(std::initializer_list<MismatchEntry> entries) {
  for (const auto& e : entries) set_(e);
}

void MismatchTable::set_(const MismatchEntry& e) {
  cells_[index_(e.category, e.condition)] = std::max(0.0, e.penalty);
}

double MismatchTable::max_penalty() const {
  return *std::max_element(cells_.begin(), cells_.end());
}

} // namespace tyredeg
