#include "arlink/overlay/CalibrationTable.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace arlink::overlay {

namespace {

std::string toLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

void validateAnchor(const AnchorPoint& anchor, const std::string& what) {
  auto in_range = [](double v) { return v >= 0.0 && v <= 1.0; };
  if (!in_range(anchor.x) || !in_range(anchor.y)) {
    throw std::invalid_argument("Anchor for '" + what + "' must lie in [0,1]");
  }
}

AnchorPoint anchorFromJson(const nlohmann::json& node, const AnchorPoint& fallback) {
  AnchorPoint anchor = fallback;
  anchor.x = node.value("x", fallback.x);
  anchor.y = node.value("y", fallback.y);
  return anchor;
}

}  // namespace

CalibrationTable::CalibrationTable(std::vector<CalibrationEntry> entries, AnchorPoint default_anchor)
    : entries_(std::move(entries)), default_anchor_(default_anchor) {
  for (auto& entry : entries_) {
    if (entry.category.empty()) {
      throw std::invalid_argument("Calibration entry without category");
    }
    validateAnchor(entry.anchor, entry.category);
    for (auto& keyword : entry.keywords) {
      keyword = toLower(keyword);
    }
  }
  validateAnchor(default_anchor_, "default_anchor");
}

CalibrationTable CalibrationTable::Default() {
  std::vector<CalibrationEntry> entries{
      {"cap", {"cap", "top"}, {0.5, 0.15}},
      {"middle", {"middle", "center", "body"}, {0.5, 0.5}},
      {"bottom", {"bottom", "base"}, {0.5, 0.85}},
  };
  return CalibrationTable(std::move(entries), AnchorPoint{0.5, 0.15});
}

CalibrationTable CalibrationTable::FromJson(const nlohmann::json& j) {
  CalibrationTable defaults = Default();
  if (!j.is_object()) {
    return defaults;
  }

  std::vector<CalibrationEntry> entries;
  if (j.contains("entries")) {
    if (!j["entries"].is_array()) {
      throw std::invalid_argument("calibration.entries must be an array");
    }
    for (const auto& node : j["entries"]) {
      CalibrationEntry entry;
      try {
        entry.category = node.value("category", "");
        if (node.contains("keywords")) {
          entry.keywords = node["keywords"].get<std::vector<std::string>>();
        }
        entry.anchor = anchorFromJson(node, AnchorPoint{});
      } catch (const nlohmann::json::exception& ex) {
        throw std::invalid_argument("calibration entry '" + entry.category + "': " + ex.what());
      }
      entries.push_back(std::move(entry));
    }
  } else {
    entries = defaults.entries_;
  }

  AnchorPoint default_anchor = defaults.default_anchor_;
  if (j.contains("default_anchor")) {
    default_anchor = anchorFromJson(j["default_anchor"], default_anchor);
  }
  return CalibrationTable(std::move(entries), default_anchor);
}

std::optional<std::string> CalibrationTable::Classify(const std::string& label) const {
  const std::string lowered = toLower(label);
  for (const auto& entry : entries_) {
    if (lowered.find(toLower(entry.category)) != std::string::npos) {
      return entry.category;
    }
    for (const auto& keyword : entry.keywords) {
      if (!keyword.empty() && lowered.find(keyword) != std::string::npos) {
        return entry.category;
      }
    }
  }
  return std::nullopt;
}

const CalibrationEntry* CalibrationTable::Find(const std::string& category) const {
  for (const auto& entry : entries_) {
    if (entry.category == category) {
      return &entry;
    }
  }
  return nullptr;
}

std::optional<AnchorPoint> CalibrationTable::AnchorFor(const std::optional<std::string>& category,
                                                       const std::string& label) const {
  if (category) {
    if (const auto* entry = Find(*category)) {
      return entry->anchor;
    }
  }
  if (auto classified = Classify(label)) {
    if (const auto* entry = Find(*classified)) {
      return entry->anchor;
    }
  }
  return std::nullopt;
}

}  // namespace arlink::overlay
