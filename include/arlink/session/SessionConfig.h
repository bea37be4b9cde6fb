#pragma once

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "arlink/overlay/CalibrationTable.h"
#include "arlink/overlay/CameraCapture.h"
#include "arlink/overlay/CoordinateResolver.h"
#include "arlink/overlay/OverlayRenderer.h"
#include "arlink/sync/WebSocketChannel.h"
#include "arlink/tracking/DetectorFusion.h"
#include "arlink/tracking/HttpVisionClient.h"
#include "arlink/tracking/ObjectDetector.h"

namespace arlink::session {

struct SessionConfig {
  std::string log_level{"info"};
  std::string client_id;                         // empty: generated at start
  std::chrono::milliseconds render_interval{33};
  std::string window_title{"arlink overlay"};

  overlay::CameraConfig camera;
  tracking::LocalDetectorConfig detector;
  tracking::FusionConfig fusion;
  tracking::HttpVisionConfig vision;
  sync::ChannelConfig channel;
  overlay::CalibrationTable calibration{overlay::CalibrationTable::Default()};
  overlay::ModelBounds model_bounds;
  overlay::UnmatchedPolicy unmatched_policy{overlay::UnmatchedPolicy::DEFAULT_ANCHOR};
  overlay::OverlayStyle style;
};

// Throws std::runtime_error when the file cannot be read or parsed.
SessionConfig LoadSessionConfig(const std::string& path);

// Every key is optional. Relative detector paths are resolved against
// `base_dir`. Throws std::invalid_argument on out-of-range values.
SessionConfig ParseSessionConfig(const nlohmann::json& j, const std::string& base_dir = "");

// "client_<epoch-ms>"
std::string GenerateClientId();

spdlog::level::level_enum ParseLogLevel(const std::string& name);

}  // namespace arlink::session
