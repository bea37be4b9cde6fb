#include "arlink/session/OverlaySession.h"

#include <spdlog/spdlog.h>

#include <utility>

namespace arlink::session {

OverlaySession::OverlaySession(boost::asio::io_context& io, const SessionConfig& config,
                               tracking::ObjectDetector& detector,
                               tracking::VisionClient& vision_client, sync::SyncChannel& channel,
                               std::string client_id, CameraFactory camera_factory, FrameSink sink)
    : render_interval_(config.render_interval),
      client_id_(std::move(client_id)),
      camera_factory_(std::move(camera_factory)),
      sink_(std::move(sink)),
      fusion_(io, detector, vision_client, config.fusion),
      store_(channel, client_id_),
      resolver_(config.calibration, config.model_bounds, config.unmatched_policy),
      renderer_(config.style),
      render_timer_(io) {
  fusion_.SetResultCallback([this](const tracking::CycleResult& result) { OnCycleResult(result); });
  tracking_.SetTransitionListener([](tracking::TrackingStatus from, tracking::TrackingStatus to) {
    spdlog::info("Tracking {} -> {}", tracking::ToString(from), tracking::ToString(to));
  });
  store_.SetClassifier(
      [this](const std::string& label) { return resolver_.table().Classify(label); });
  store_.SetChangeCallback(
      [](std::size_t size) { spdlog::debug("Annotation count: {}", size); });
  channel.SetStateHandler([](sync::ChannelState state) {
    spdlog::info("Annotation channel {}", sync::ToString(state));
  });
}

OverlaySession::~OverlaySession() {
  Stop();
}

bool OverlaySession::Start() {
  if (running_) {
    return camera_ != nullptr;
  }
  running_ = true;
  started_at_ = std::chrono::steady_clock::now();

  bool camera_ok = true;
  try {
    camera_ = camera_factory_();
    if (!camera_) {
      throw overlay::CameraError("No camera available");
    }
  } catch (const overlay::CameraError& ex) {
    spdlog::error("Camera unavailable: {}", ex.what());
    camera_.reset();
    detection_text_ = std::string("Camera error: ") + ex.what();
    overlay_enabled_ = false;
    camera_ok = false;
  }

  if (camera_ok) {
    fusion_.Start();
  }
  spdlog::info("Overlay session {} started", client_id_);
  scheduleRender();
  return camera_ok;
}

void OverlaySession::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  render_timer_.cancel();
  fusion_.Stop();
  camera_.reset();
  spdlog::info("Overlay session {} stopped", client_id_);
}

std::optional<tracking::TrackingStatus> OverlaySession::status() const {
  if (tracking_.cycle_count() == 0) {
    return std::nullopt;
  }
  return tracking_.status();
}

void OverlaySession::scheduleRender() {
  render_timer_.expires_after(render_interval_);
  render_timer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec || !running_) {
      return;
    }
    RenderOnce();
    scheduleRender();
  });
}

double OverlaySession::nextTimestampMs() {
  double ts = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() -
                                                        started_at_)
                  .count();
  if (ts <= last_timestamp_ms_) {
    ts = last_timestamp_ms_ + 1.0;
  }
  last_timestamp_ms_ = ts;
  return ts;
}

void OverlaySession::RenderOnce() {
  if (camera_) {
    if (!camera_->Read(frame_)) {
      return;
    }
    fusion_.OnDisplayFrame(frame_, nextTimestampMs());
  } else if (frame_.empty()) {
    frame_ = cv::Mat(480, 640, CV_8UC3, cv::Scalar(0, 0, 0));
  }

  cv::Mat composed = frame_.clone();
  renderer_.Draw(composed, FrameState());
  if (sink_) {
    sink_(composed);
  }
}

overlay::OverlayFrameState OverlaySession::FrameState() const {
  overlay::OverlayFrameState state;
  state.box = latest_box_;
  state.status = status();
  state.strategy = fusion_.strategy();
  state.detection_text = detection_text_;
  state.overlay_enabled = overlay_enabled_;
  state.annotation_count = store_.size();
  if (overlay_enabled_) {
    state.markers = resolver_.ResolveAll(store_.annotations(), latest_box_);
  }
  return state;
}

void OverlaySession::OnCycleResult(const tracking::CycleResult& result) {
  tracking_.Update(result);
  if (tracking::IsValid(result.box)) {
    latest_box_ = result.box;
  } else {
    latest_box_.reset();
  }
  detection_text_ = overlay::DetectionStatusText(latest_box_);
}

sync::Annotation OverlaySession::AddAnnotation(const cv::Point3d& position,
                                               const std::string& label) {
  sync::Annotation annotation;
  annotation.position = position;
  annotation.label = label;
  return store_.Add(std::move(annotation));
}

void OverlaySession::RemoveAnnotation(const std::string& id) {
  store_.Remove(id);
}

void OverlaySession::ClearAll() {
  store_.Remove(sync::kRemoveAllId);
}

void OverlaySession::ToggleStrategy() {
  fusion_.ToggleStrategy();
  // The previous strategy's box and status no longer apply; the status reads
  // as pending until the new strategy completes a cycle.
  tracking_.Reset();
  latest_box_.reset();
  detection_text_ = overlay::DetectionStatusText(latest_box_);
}

bool OverlaySession::HandleKey(int key) {
  switch (key) {
    case 27:
    case 'q':
    case 'Q':
      return false;
    case 'v':
    case 'V':
      ToggleStrategy();
      break;
    case 'c':
    case 'C':
      ClearAll();
      break;
    default:
      break;
  }
  return true;
}

}  // namespace arlink::session
