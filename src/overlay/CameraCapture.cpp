#include "arlink/overlay/CameraCapture.h"

#include <spdlog/spdlog.h>

namespace arlink::overlay {

CameraCapture::CameraCapture(const CameraConfig& config) {
  if (!capture_.open(config.device_index)) {
    throw CameraError("Failed to open camera device " + std::to_string(config.device_index));
  }
  capture_.set(cv::CAP_PROP_FRAME_WIDTH, config.width);
  capture_.set(cv::CAP_PROP_FRAME_HEIGHT, config.height);
  capture_.set(cv::CAP_PROP_FPS, config.fps);

  frame_size_ = cv::Size(static_cast<int>(capture_.get(cv::CAP_PROP_FRAME_WIDTH)),
                         static_cast<int>(capture_.get(cv::CAP_PROP_FRAME_HEIGHT)));
  if (frame_size_.width <= 0 || frame_size_.height <= 0) {
    capture_.release();
    throw CameraError("Camera device " + std::to_string(config.device_index) +
                      " reported no frame size");
  }
  spdlog::info("Camera {} opened at {}x{}", config.device_index, frame_size_.width,
               frame_size_.height);
}

CameraCapture::~CameraCapture() {
  if (capture_.isOpened()) {
    capture_.release();
    spdlog::debug("Camera released");
  }
}

bool CameraCapture::Read(cv::Mat& frame) {
  if (!capture_.isOpened()) {
    return false;
  }
  if (!capture_.read(frame) || frame.empty()) {
    spdlog::warn("Camera returned no frame");
    return false;
  }
  return true;
}

}  // namespace arlink::overlay
