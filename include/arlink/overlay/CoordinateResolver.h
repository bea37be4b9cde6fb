#pragma once

#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "arlink/overlay/CalibrationTable.h"
#include "arlink/sync/Annotation.h"
#include "arlink/tracking/DetectionTypes.h"

namespace arlink::overlay {

// Axis-aligned extent of the reference model in model space.
struct ModelBounds {
  double min_x{-0.5};
  double max_x{0.5};
  double min_y{-1.0};
  double max_y{1.0};
  double min_z{-0.5};
  double max_z{0.5};
};

// Throws std::invalid_argument unless max > min on x and y.
void ValidateModelBounds(const ModelBounds& bounds);

enum class UnmatchedPolicy {
  DEFAULT_ANCHOR,  // table's default anchor
  LINEAR           // normalized model position mapped onto the box
};

const char* ToString(UnmatchedPolicy policy);
UnmatchedPolicy ParseUnmatchedPolicy(const std::string& text);

// Pixel position of `anchor` inside `box`, nullopt for an absent or degenerate box.
std::optional<cv::Point2f> ResolveAnchor(const AnchorPoint& anchor,
                                         const std::optional<tracking::DetectionBox>& box);

// Maps position.x/y through `bounds` onto the box with the vertical axis inverted.
std::optional<cv::Point2f> ResolveLinear(const sync::Annotation& annotation,
                                         const std::optional<tracking::DetectionBox>& box,
                                         const ModelBounds& bounds);

struct ResolvedMarker {
  std::string id;
  std::string label;
  cv::Point2f pixel;
};

class CoordinateResolver {
 public:
  CoordinateResolver(CalibrationTable table, ModelBounds bounds,
                     UnmatchedPolicy policy = UnmatchedPolicy::DEFAULT_ANCHOR);

  [[nodiscard]] std::optional<cv::Point2f> Resolve(
      const sync::Annotation& annotation, const std::optional<tracking::DetectionBox>& box) const;

  // Empty when the box is absent or degenerate. Keeps annotation order.
  [[nodiscard]] std::vector<ResolvedMarker> ResolveAll(
      const std::vector<sync::Annotation>& annotations,
      const std::optional<tracking::DetectionBox>& box) const;

  [[nodiscard]] const CalibrationTable& table() const noexcept { return table_; }
  [[nodiscard]] const ModelBounds& bounds() const noexcept { return bounds_; }
  [[nodiscard]] UnmatchedPolicy policy() const noexcept { return policy_; }

 private:
  CalibrationTable table_;
  ModelBounds bounds_;
  UnmatchedPolicy policy_;
};

}  // namespace arlink::overlay
