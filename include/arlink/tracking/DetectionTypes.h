#pragma once

#include <map>
#include <optional>
#include <string>

#include <opencv2/core.hpp>

namespace arlink::tracking {

enum class DetectionSource {
  LOCAL,   // in-process detector
  REMOTE   // remote vision service
};

// Raw detector output before target filtering.
struct ObjectCandidate {
  std::string category;
  double score{0.0};
  cv::Rect2f bbox;                               // pixel coordinates
};

struct DetectionBox {
  cv::Point2f origin;                            // top-left (px)
  cv::Size2f size;                               // width/height (px)
  std::string category;
  double confidence{0.0};                        // 0-1
  DetectionSource source{DetectionSource::LOCAL};
  std::map<std::string, cv::Point2f> parts;      // named landmarks (px), remote only
};

// Outcome of one detection cycle. `failed` is set when the attempt raised an
// error; `box` is empty in that case.
struct CycleResult {
  std::optional<DetectionBox> box;
  bool failed{false};
  DetectionSource source{DetectionSource::LOCAL};
};

// A box with non-positive width or height counts as "no detection".
inline bool IsValid(const DetectionBox& box) {
  return box.size.width > 0.0F && box.size.height > 0.0F;
}

inline bool IsValid(const std::optional<DetectionBox>& box) {
  return box.has_value() && IsValid(*box);
}

inline const char* ToString(DetectionSource source) {
  switch (source) {
    case DetectionSource::LOCAL:
      return "local";
    case DetectionSource::REMOTE:
      return "remote";
  }
  return "unknown";
}

}  // namespace arlink::tracking
