#include <tyredeg/tyre.hpp>
#include <cctype>
#include <fstream>
#include <sstream>
#include <vector>

namespace tyredeg {

std::string normalize_label(std::string label) {
  static const char* kSpace = " \t\r\n";
  const auto first = label.find_first_not_of(kSpace);
  if (first == std::string::npos) return {};
  label = label.substr(first, label.find_last_not_of(kSpace) - first + 1);
  for (auto& c : label) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return label;
}

const char* category_name(TyreCategory c) {
  switch (c) {
    case TyreCategory::Slick: return "SLICK";
    case TyreCategory::Inter: return "INTER";
    case TyreCategory::Wet:   return "WET";
  }
  return "SLICK";
}

const char* condition_name(TrackCondition c) {
  switch (c) {
    case TrackCondition::Dry:  return "DRY";
    case TrackCondition::Damp: return "DAMP";
    case TrackCondition::Wet:  return "WET";
  }
  return "DRY";
}

std::optional<TyreCategory> parse_category(const std::string& label) {
  const auto L = normalize_label(label);
  if (L == "SLICK") return TyreCategory::Slick;
  if (L == "INTER" || L == "INTERMEDIATE") return TyreCategory::Inter;
  if (L == "WET") return TyreCategory::Wet;
  return std::nullopt;
}

std::optional<TrackCondition> parse_track_condition(const std::string& label) {
  if (label == "DRY")  return TrackCondition::Dry;
  if (label == "DAMP") return TrackCondition::Damp;
  if (label == "WET")  return TrackCondition::Wet;
  return std::nullopt;
}

bool validate_profile(const TyreProfile& p) {
  if (p.name.empty()) return false;
  if (p.degradation_rate < 0.0) return false;
  if (p.warmup_laps < 0) return false;
  if (p.max_analysis_laps && *p.max_analysis_laps <= 0) return false;
  return p.max_degradation > 0.0;
}

static TyreRegistry make_registry_builtin() {
  TyreRegistry reg;
  auto add = [&](const TyreProfile& p){ reg[p.name] = p; };
  add({"HARD",         TyreCategory::Slick, 0.01, 69.5, 3, std::nullopt, 2.0});
  add({"MEDIUM",       TyreCategory::Slick, 0.03, 69.0, 3, std::nullopt, 2.0});
  add({"SOFT",         TyreCategory::Slick, 0.05, 68.5, 1, 10,           2.0});
  add({"INTERMEDIATE", TyreCategory::Inter, 0.04, 75.0, 2, std::nullopt, 3.0});
  add({"WET",          TyreCategory::Wet,   0.02, 80.0, 2, std::nullopt, 2.5});
  return reg;
}

const TyreRegistry& default_tyre_registry() {
  static const TyreRegistry reg = make_registry_builtin();
  return reg;
}

const TyreProfile* find_profile(const TyreRegistry& reg, const std::string& compound) {
  auto it = reg.find(compound);
  if (it == reg.end()) return nullptr;
  return &it->second;
}

static std::vector<std::string> csv_fields(const std::string& line) {
  std::vector<std::string> fields;
  std::size_t start = 0;
  for (;;) {
    const auto comma = line.find(',', start);
    fields.push_back(line.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
    if (comma == std::string::npos) break;
    start = comma + 1;
  }
  return fields;
}

// Whole-field numeric parse; surrounding whitespace is allowed, trailing junk is not.
template <typename T>
static std::optional<T> parse_field(const std::string& field) {
  std::istringstream is(field);
  T v{};
  if (!(is >> v)) return std::nullopt;
  is >> std::ws;
  if (!is.eof()) return std::nullopt;
  return v;
}

// name,category,degradation_rate,reset_pace,warmup_laps,max_analysis_laps,max_degradation
static std::optional<TyreProfile> parse_profile_row(const std::vector<std::string>& f) {
  if (f.size() < 7) return std::nullopt;
  const auto category = parse_category(f[1]);
  const auto rate = parse_field<double>(f[2]);
  const auto reset = parse_field<double>(f[3]);
  const auto warmup = parse_field<int>(f[4]);
  const auto max_deg = parse_field<double>(f[6]);
  if (!category || !rate || !reset || !warmup || !max_deg) return std::nullopt;

  TyreProfile p{normalize_label(f[0]), *category, *rate, *reset, *warmup, std::nullopt, *max_deg};
  if (!normalize_label(f[5]).empty()) {
    p.max_analysis_laps = parse_field<int>(f[5]);
    if (!p.max_analysis_laps) return std::nullopt;
  }
  if (!validate_profile(p)) return std::nullopt;
  return p;
}

TyreRegistry tyre_registry_from_csv_stream(std::istream& in) {
  TyreRegistry out;
  std::string line;
  bool first_row = true;

  while (std::getline(in, line)) {
    const auto fields = csv_fields(line);
    const auto key = normalize_label(fields[0]);
    if (fields.size() == 1 && key.empty()) continue;
    if (!key.empty() && key[0] == '#') continue;

    const bool header = first_row && key == "NAME";
    first_row = false;
    if (header) continue;

    if (auto p = parse_profile_row(fields)) out[p->name] = *p; // later rows win
  }
  return out;
}

std::optional<TyreRegistry> load_tyre_registry_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return tyre_registry_from_csv_stream(f);
}

} // namespace tyredeg
