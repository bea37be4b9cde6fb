#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace arlink::overlay {

// Normalized point inside a detection box, (0,0) = top-left.
struct AnchorPoint {
  double x{0.5};
  double y{0.5};
};

struct CalibrationEntry {
  std::string category;
  std::vector<std::string> keywords;            // matched as case-insensitive substrings
  AnchorPoint anchor;
};

// Maps annotation labels to anchor points on the tracked object. Entries are
// checked in order and the first keyword hit wins.
class CalibrationTable {
 public:
  CalibrationTable(std::vector<CalibrationEntry> entries, AnchorPoint default_anchor);

  // cap / middle / bottom of a bottle-shaped object.
  static CalibrationTable Default();

  // Reads {"entries": [{category, keywords, x, y}], "default_anchor": {x, y}}.
  // Missing keys fall back to Default(). Throws std::invalid_argument when an
  // anchor lies outside [0,1].
  static CalibrationTable FromJson(const nlohmann::json& j);

  [[nodiscard]] std::optional<std::string> Classify(const std::string& label) const;
  [[nodiscard]] const CalibrationEntry* Find(const std::string& category) const;

  // Anchor for a category tag, falling back to the label, then nullopt.
  [[nodiscard]] std::optional<AnchorPoint> AnchorFor(const std::optional<std::string>& category,
                                                     const std::string& label) const;

  [[nodiscard]] const std::vector<CalibrationEntry>& entries() const noexcept { return entries_; }
  [[nodiscard]] const AnchorPoint& default_anchor() const noexcept { return default_anchor_; }

 private:
  std::vector<CalibrationEntry> entries_;
  AnchorPoint default_anchor_;
};

}  // namespace arlink::overlay
