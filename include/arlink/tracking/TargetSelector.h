#pragma once

#include <optional>
#include <string>
#include <vector>

#include "arlink/tracking/DetectionTypes.h"

namespace arlink::tracking {

struct TargetFilterConfig {
  std::vector<std::string> target_categories{"bottle", "cup", "wine glass"};
  double score_threshold{0.25};
  int max_results{10};                           // detector result cap (<=0: no cap)
};

bool IsTargetCategory(const std::string& category, const TargetFilterConfig& config);

// Picks the best allow-listed candidate. Candidates are first capped to the
// top `max_results` by score, as the detector would, so a target ranked below
// the cap is never seen.
std::optional<DetectionBox> SelectTarget(const std::vector<ObjectCandidate>& candidates,
                                         const TargetFilterConfig& config,
                                         DetectionSource source = DetectionSource::LOCAL);

}  // namespace arlink::tracking
