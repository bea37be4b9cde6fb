#pragma once

#include <stdexcept>
#include <string>

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

namespace arlink::overlay {

class CameraError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Anything that yields display frames.
class FrameSource {
 public:
  virtual ~FrameSource() = default;

  // False when no frame is available right now.
  virtual bool Read(cv::Mat& frame) = 0;
  [[nodiscard]] virtual cv::Size frame_size() const = 0;
};

struct CameraConfig {
  int device_index{0};
  int width{1280};
  int height{720};
  double fps{30.0};
};

// Exclusive handle on a capture device, released on destruction.
class CameraCapture : public FrameSource {
 public:
  // Throws CameraError when the device cannot be opened.
  explicit CameraCapture(const CameraConfig& config);
  ~CameraCapture() override;

  CameraCapture(const CameraCapture&) = delete;
  CameraCapture& operator=(const CameraCapture&) = delete;

  bool Read(cv::Mat& frame) override;
  [[nodiscard]] cv::Size frame_size() const override { return frame_size_; }

 private:
  cv::VideoCapture capture_;
  cv::Size frame_size_;
};

}  // namespace arlink::overlay
