#pragma once

#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/dnn.hpp>

#include "arlink/tracking/DetectionTypes.h"

namespace arlink::tracking {

// In-process object detector. Implementations may throw on inference errors;
// DetectorFusion treats a throw as a failed cycle.
class ObjectDetector {
 public:
  virtual ~ObjectDetector() = default;

  virtual std::vector<ObjectCandidate> Detect(const cv::Mat& frame, double timestamp_ms) = 0;
};

struct LocalDetectorConfig {
  std::string model_path{"models/ssd_mobilenet_v2_coco.pb"};
  std::string config_path{"models/ssd_mobilenet_v2_coco.pbtxt"};
  std::string labels_path{"models/coco_labels.txt"};
  double score_threshold{0.25};
  int max_results{10};
  int input_width{300};
  int input_height{300};
  std::string running_mode{"video"};            // "video": timestamps must increase
};

// OpenCV DNN detector for SSD-style networks ([1,1,N,7] output rows of
// image_id, class_id, score, x1, y1, x2, y2 with normalized coordinates).
class DnnObjectDetector : public ObjectDetector {
 public:
  // Throws std::runtime_error when the network or label file cannot be loaded.
  explicit DnnObjectDetector(LocalDetectorConfig config);

  std::vector<ObjectCandidate> Detect(const cv::Mat& frame, double timestamp_ms) override;

  [[nodiscard]] const LocalDetectorConfig& config() const noexcept { return config_; }
  [[nodiscard]] const std::vector<std::string>& labels() const noexcept { return labels_; }

 private:
  std::string LabelFor(int class_id) const;

  LocalDetectorConfig config_;
  cv::dnn::Net net_;
  std::vector<std::string> labels_;
  double last_timestamp_ms_{-1.0};
};

std::vector<std::string> LoadLabels(const std::string& path);

}  // namespace arlink::tracking
