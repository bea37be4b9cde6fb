#include "arlink/overlay/OverlayRenderer.h"

#include <algorithm>
#include <cmath>

#include <opencv2/imgproc.hpp>

namespace arlink::overlay {

namespace {

cv::Scalar statusColor(const std::optional<tracking::TrackingStatus>& status) {
  if (!status) {
    return cv::Scalar(200, 200, 200);
  }
  switch (*status) {
    case tracking::TrackingStatus::LOCKED:
      return cv::Scalar(0, 255, 0);
    case tracking::TrackingStatus::SEARCHING:
      return cv::Scalar(0, 255, 255);
    case tracking::TrackingStatus::LOST:
      return cv::Scalar(0, 0, 255);
  }
  return cv::Scalar(128, 128, 128);
}

}  // namespace

std::string MarkerCountText(std::size_t count) {
  return std::to_string(count) + " STRUCTURE(S) IDENTIFIED";
}

std::string DetectionStatusText(const std::optional<tracking::DetectionBox>& box,
                                const std::string& idle_text) {
  if (!tracking::IsValid(box)) {
    return idle_text;
  }
  const int pct = static_cast<int>(std::lround(box->confidence * 100.0));
  return box->category + " (" + std::to_string(pct) + "%)";
}

std::string TrackingHudText(const std::optional<tracking::TrackingStatus>& status) {
  if (!status) {
    return "INITIALIZING";
  }
  return tracking::ToHudText(*status);
}

const char* StrategyHudText(tracking::StrategyKind kind) {
  return kind == tracking::StrategyKind::REMOTE ? "AI VISION" : "FAST";
}

std::vector<std::string> HudLines(const OverlayFrameState& state) {
  return {TrackingHudText(state.status), state.detection_text,
          std::string("MODE: ") + StrategyHudText(state.strategy),
          MarkerCountText(state.annotation_count)};
}

OverlayRenderer::OverlayRenderer(OverlayStyle style) : style_(style) {}

void OverlayRenderer::Draw(cv::Mat& frame, const OverlayFrameState& state) const {
  if (frame.empty()) {
    return;
  }
  if (state.overlay_enabled && tracking::IsValid(state.box)) {
    if (style_.draw_box) {
      drawBox(frame, *state.box);
    }
    if (style_.draw_parts && state.box->source == tracking::DetectionSource::REMOTE) {
      drawParts(frame, *state.box);
    }
    drawMarkers(frame, state.markers);
  }
  drawHud(frame, state);
}

void OverlayRenderer::drawBox(cv::Mat& frame, const tracking::DetectionBox& box) const {
  const cv::Rect rect(cv::Rect2f(box.origin, box.size));
  cv::rectangle(frame, rect, style_.box_color, 2, cv::LINE_AA);
}

void OverlayRenderer::drawParts(cv::Mat& frame, const tracking::DetectionBox& box) const {
  for (const auto& [name, point] : box.parts) {
    cv::circle(frame, point, style_.part_radius, style_.part_color, -1, cv::LINE_AA);
    cv::putText(frame, name,
                cv::Point(static_cast<int>(point.x) + 6, static_cast<int>(point.y) + 4),
                cv::FONT_HERSHEY_SIMPLEX, style_.font_scale * 0.8, style_.part_color, 1,
                cv::LINE_AA);
  }
}

void OverlayRenderer::drawMarkers(cv::Mat& frame, const std::vector<ResolvedMarker>& markers) const {
  for (const auto& marker : markers) {
    cv::circle(frame, marker.pixel, style_.marker_radius, style_.marker_color, 2, cv::LINE_AA);
    cv::circle(frame, marker.pixel, 2, style_.marker_color, -1, cv::LINE_AA);
    if (!marker.label.empty()) {
      cv::putText(frame, marker.label,
                  cv::Point(static_cast<int>(marker.pixel.x) + style_.marker_radius + 4,
                            static_cast<int>(marker.pixel.y) - 4),
                  cv::FONT_HERSHEY_SIMPLEX, style_.font_scale, style_.text_color, 1,
                  cv::LINE_AA);
    }
  }
}

void OverlayRenderer::drawHud(cv::Mat& frame, const OverlayFrameState& state) const {
  const std::vector<std::string> lines = HudLines(state);

  // Translucent backing block, top-left.
  const int padding = 8;
  const int line_height = 20;
  const int block_height = static_cast<int>(lines.size()) * line_height + padding * 2;
  const int block_width = std::min(280, frame.cols - 20);
  if (block_width <= 0 || frame.rows < block_height + 20) {
    return;
  }
  cv::Rect hud_rect(10, 10, block_width, block_height);
  cv::Mat backing = frame.clone();
  cv::rectangle(backing, hud_rect, cv::Scalar(0, 0, 0), -1);
  cv::addWeighted(backing, 0.6, frame, 0.4, 0.0, frame);

  int y = 10 + padding + 15;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    const cv::Scalar color = i == 0 ? statusColor(state.status) : style_.text_color;
    cv::putText(frame, lines[i], cv::Point(10 + padding, y), cv::FONT_HERSHEY_SIMPLEX,
                style_.font_scale, color, i == 0 ? 2 : 1, cv::LINE_AA);
    y += line_height;
  }
}

}  // namespace arlink::overlay
