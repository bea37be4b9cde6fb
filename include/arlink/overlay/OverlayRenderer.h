#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "arlink/overlay/CoordinateResolver.h"
#include "arlink/tracking/DetectionTypes.h"
#include "arlink/tracking/DetectorFusion.h"
#include "arlink/tracking/TrackingStateMachine.h"

namespace arlink::overlay {

struct OverlayStyle {
  cv::Scalar box_color{0, 255, 0};              // BGR
  cv::Scalar marker_color{0, 200, 255};
  cv::Scalar part_color{255, 128, 0};
  cv::Scalar text_color{255, 255, 255};
  int marker_radius{8};
  int part_radius{4};
  double font_scale{0.5};
  bool draw_box{true};
  bool draw_parts{true};
};

// Everything the render tick needs for one frame.
struct OverlayFrameState {
  std::optional<tracking::DetectionBox> box;
  std::vector<ResolvedMarker> markers;
  std::size_t annotation_count{0};               // whole store, drawn or not
  std::optional<tracking::TrackingStatus> status;  // empty until the first cycle
  tracking::StrategyKind strategy{tracking::StrategyKind::LOCAL};
  std::string detection_text{"Ready"};
  bool overlay_enabled{true};
};

// "N STRUCTURE(S) IDENTIFIED"
std::string MarkerCountText(std::size_t count);

// "<category> (<pct>%)" for a valid box, otherwise `idle_text`.
std::string DetectionStatusText(const std::optional<tracking::DetectionBox>& box,
                                const std::string& idle_text = "Ready");

// HUD text for the tracking status, "INITIALIZING" before the first cycle.
std::string TrackingHudText(const std::optional<tracking::TrackingStatus>& status);

// "FAST" for the local strategy, "AI VISION" for the remote one.
const char* StrategyHudText(tracking::StrategyKind kind);

// Status block lines, top to bottom.
std::vector<std::string> HudLines(const OverlayFrameState& state);

class OverlayRenderer {
 public:
  explicit OverlayRenderer(OverlayStyle style = {});

  // Draws onto `frame` in place.
  void Draw(cv::Mat& frame, const OverlayFrameState& state) const;

  [[nodiscard]] const OverlayStyle& style() const noexcept { return style_; }

 private:
  void drawBox(cv::Mat& frame, const tracking::DetectionBox& box) const;
  void drawParts(cv::Mat& frame, const tracking::DetectionBox& box) const;
  void drawMarkers(cv::Mat& frame, const std::vector<ResolvedMarker>& markers) const;
  void drawHud(cv::Mat& frame, const OverlayFrameState& state) const;

  OverlayStyle style_;
};

}  // namespace arlink::overlay
