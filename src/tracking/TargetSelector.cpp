#include "arlink/tracking/TargetSelector.h"

#include <algorithm>

namespace arlink::tracking {

bool IsTargetCategory(const std::string& category, const TargetFilterConfig& config) {
  return std::find(config.target_categories.begin(), config.target_categories.end(), category) !=
         config.target_categories.end();
}

std::optional<DetectionBox> SelectTarget(const std::vector<ObjectCandidate>& candidates,
                                         const TargetFilterConfig& config,
                                         DetectionSource source) {
  std::vector<const ObjectCandidate*> ranked;
  ranked.reserve(candidates.size());
  for (const auto& candidate : candidates) {
    if (candidate.score >= config.score_threshold) {
      ranked.push_back(&candidate);
    }
  }

  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const ObjectCandidate* a, const ObjectCandidate* b) {
                     return a->score > b->score;
                   });
  if (config.max_results > 0 && ranked.size() > static_cast<size_t>(config.max_results)) {
    ranked.resize(static_cast<size_t>(config.max_results));
  }

  for (const auto* candidate : ranked) {
    if (!IsTargetCategory(candidate->category, config)) {
      continue;
    }
    if (candidate->bbox.width <= 0.0F || candidate->bbox.height <= 0.0F) {
      continue;
    }
    DetectionBox box;
    box.origin = cv::Point2f(candidate->bbox.x, candidate->bbox.y);
    box.size = cv::Size2f(candidate->bbox.width, candidate->bbox.height);
    box.category = candidate->category;
    box.confidence = candidate->score;
    box.source = source;
    return box;
  }
  return std::nullopt;
}

}  // namespace arlink::tracking
