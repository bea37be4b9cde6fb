#include "arlink/overlay/CoordinateResolver.h"

#include <stdexcept>
#include <utility>

namespace arlink::overlay {

void ValidateModelBounds(const ModelBounds& bounds) {
  if (!(bounds.max_x > bounds.min_x) || !(bounds.max_y > bounds.min_y)) {
    throw std::invalid_argument("model_bounds requires max > min on x and y");
  }
}

const char* ToString(UnmatchedPolicy policy) {
  switch (policy) {
    case UnmatchedPolicy::DEFAULT_ANCHOR:
      return "default_anchor";
    case UnmatchedPolicy::LINEAR:
      return "linear";
  }
  return "unknown";
}

UnmatchedPolicy ParseUnmatchedPolicy(const std::string& text) {
  if (text == "default_anchor") {
    return UnmatchedPolicy::DEFAULT_ANCHOR;
  }
  if (text == "linear") {
    return UnmatchedPolicy::LINEAR;
  }
  throw std::invalid_argument("Unknown unmatched_policy: " + text);
}

std::optional<cv::Point2f> ResolveAnchor(const AnchorPoint& anchor,
                                         const std::optional<tracking::DetectionBox>& box) {
  if (!tracking::IsValid(box)) {
    return std::nullopt;
  }
  return cv::Point2f(static_cast<float>(box->origin.x + anchor.x * box->size.width),
                     static_cast<float>(box->origin.y + anchor.y * box->size.height));
}

std::optional<cv::Point2f> ResolveLinear(const sync::Annotation& annotation,
                                         const std::optional<tracking::DetectionBox>& box,
                                         const ModelBounds& bounds) {
  if (!tracking::IsValid(box)) {
    return std::nullopt;
  }
  const double nx = (annotation.position.x - bounds.min_x) / (bounds.max_x - bounds.min_x);
  const double ny = (annotation.position.y - bounds.min_y) / (bounds.max_y - bounds.min_y);
  return cv::Point2f(static_cast<float>(box->origin.x + nx * box->size.width),
                     static_cast<float>(box->origin.y + (1.0 - ny) * box->size.height));
}

CoordinateResolver::CoordinateResolver(CalibrationTable table, ModelBounds bounds,
                                       UnmatchedPolicy policy)
    : table_(std::move(table)), bounds_(bounds), policy_(policy) {
  ValidateModelBounds(bounds_);
}

std::optional<cv::Point2f> CoordinateResolver::Resolve(
    const sync::Annotation& annotation, const std::optional<tracking::DetectionBox>& box) const {
  if (!tracking::IsValid(box)) {
    return std::nullopt;
  }
  if (auto anchor = table_.AnchorFor(annotation.category, annotation.label)) {
    return ResolveAnchor(*anchor, box);
  }
  if (policy_ == UnmatchedPolicy::LINEAR) {
    return ResolveLinear(annotation, box, bounds_);
  }
  return ResolveAnchor(table_.default_anchor(), box);
}

std::vector<ResolvedMarker> CoordinateResolver::ResolveAll(
    const std::vector<sync::Annotation>& annotations,
    const std::optional<tracking::DetectionBox>& box) const {
  std::vector<ResolvedMarker> markers;
  if (!tracking::IsValid(box)) {
    return markers;
  }
  markers.reserve(annotations.size());
  for (const auto& annotation : annotations) {
    if (auto pixel = Resolve(annotation, box)) {
      markers.push_back({annotation.id, annotation.label, *pixel});
    }
  }
  return markers;
}

}  // namespace arlink::overlay
