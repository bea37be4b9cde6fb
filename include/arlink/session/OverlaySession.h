#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <opencv2/core.hpp>

#include "arlink/overlay/CameraCapture.h"
#include "arlink/overlay/CoordinateResolver.h"
#include "arlink/overlay/OverlayRenderer.h"
#include "arlink/session/SessionConfig.h"
#include "arlink/sync/AnnotationStore.h"
#include "arlink/sync/SyncChannel.h"
#include "arlink/tracking/DetectorFusion.h"
#include "arlink/tracking/ObjectDetector.h"
#include "arlink/tracking/TrackingStateMachine.h"
#include "arlink/tracking/VisionClient.h"

namespace arlink::session {

// Wires detection, tracking status, the annotation store and the renderer
// onto one io_context. The render tick reads the camera, feeds detection and
// hands the composed frame to the sink; it never waits on detection or the
// network.
class OverlaySession {
 public:
  using CameraFactory = std::function<std::unique_ptr<overlay::FrameSource>()>;
  using FrameSink = std::function<void(const cv::Mat& frame)>;

  OverlaySession(boost::asio::io_context& io, const SessionConfig& config,
                 tracking::ObjectDetector& detector, tracking::VisionClient& vision_client,
                 sync::SyncChannel& channel, std::string client_id, CameraFactory camera_factory,
                 FrameSink sink);
  ~OverlaySession();

  OverlaySession(const OverlaySession&) = delete;
  OverlaySession& operator=(const OverlaySession&) = delete;

  // Opens the camera and starts detection and rendering. Returns false when
  // the camera is unavailable; rendering then continues on a blank frame with
  // the error in the status line.
  bool Start();
  void Stop();

  // One render tick.
  void RenderOnce();

  // State the next render tick would draw.
  [[nodiscard]] overlay::OverlayFrameState FrameState() const;

  void OnCycleResult(const tracking::CycleResult& result);

  sync::Annotation AddAnnotation(const cv::Point3d& position, const std::string& label);
  void RemoveAnnotation(const std::string& id);
  // Local-only.
  void ClearAll();
  void ToggleStrategy();

  // v: toggle strategy, c: clear all, q/ESC: quit. Returns false on quit.
  bool HandleKey(int key);

  [[nodiscard]] bool running() const noexcept { return running_; }
  [[nodiscard]] bool overlay_enabled() const noexcept { return overlay_enabled_; }
  [[nodiscard]] const std::optional<tracking::DetectionBox>& latest_box() const noexcept {
    return latest_box_;
  }
  [[nodiscard]] std::optional<tracking::TrackingStatus> status() const;
  [[nodiscard]] const std::string& detection_text() const noexcept { return detection_text_; }
  [[nodiscard]] const std::string& client_id() const noexcept { return client_id_; }

  [[nodiscard]] sync::AnnotationStore& store() noexcept { return store_; }
  [[nodiscard]] tracking::DetectorFusion& fusion() noexcept { return fusion_; }
  [[nodiscard]] const tracking::TrackingStateMachine& tracking_state() const noexcept { return tracking_; }
  [[nodiscard]] const overlay::CoordinateResolver& resolver() const noexcept { return resolver_; }

 private:
  void scheduleRender();
  double nextTimestampMs();

  std::chrono::milliseconds render_interval_;
  std::string client_id_;
  CameraFactory camera_factory_;
  FrameSink sink_;

  tracking::DetectorFusion fusion_;
  tracking::TrackingStateMachine tracking_;
  sync::AnnotationStore store_;
  overlay::CoordinateResolver resolver_;
  overlay::OverlayRenderer renderer_;

  std::unique_ptr<overlay::FrameSource> camera_;
  boost::asio::steady_timer render_timer_;
  std::chrono::steady_clock::time_point started_at_;
  double last_timestamp_ms_{-1.0};

  bool running_{false};
  bool overlay_enabled_{true};
  std::optional<tracking::DetectionBox> latest_box_;
  std::string detection_text_{"Ready"};
  cv::Mat frame_;
};

}  // namespace arlink::session
