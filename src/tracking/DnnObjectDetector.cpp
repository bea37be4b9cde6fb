#include "arlink/tracking/ObjectDetector.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace arlink::tracking {

namespace {

constexpr int kSsdRowWidth = 7;

}  // namespace

std::vector<std::string> LoadLabels(const std::string& path) {
  std::ifstream ifs(path);
  if (!ifs.good()) {
    throw std::runtime_error("Failed to open label file: " + path);
  }
  std::vector<std::string> labels;
  std::string line;
  while (std::getline(ifs, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    labels.push_back(line);
  }
  return labels;
}

DnnObjectDetector::DnnObjectDetector(LocalDetectorConfig config) : config_(std::move(config)) {
  try {
    net_ = cv::dnn::readNet(config_.model_path, config_.config_path);
  } catch (const cv::Exception& ex) {
    throw std::runtime_error("Failed to load detector model '" + config_.model_path +
                             "': " + ex.what());
  }
  if (net_.empty()) {
    throw std::runtime_error("Detector model is empty: " + config_.model_path);
  }
  labels_ = LoadLabels(config_.labels_path);
  spdlog::info("Object detector loaded ({} labels, threshold {:.2f}, max {} results)",
               labels_.size(), config_.score_threshold, config_.max_results);
}

std::string DnnObjectDetector::LabelFor(int class_id) const {
  if (class_id < 0 || class_id >= static_cast<int>(labels_.size())) {
    return "class_" + std::to_string(class_id);
  }
  return labels_[static_cast<size_t>(class_id)];
}

std::vector<ObjectCandidate> DnnObjectDetector::Detect(const cv::Mat& frame,
                                                       double timestamp_ms) {
  if (frame.empty()) {
    throw std::invalid_argument("DnnObjectDetector: empty frame");
  }
  if (config_.running_mode == "video") {
    if (timestamp_ms <= last_timestamp_ms_) {
      throw std::invalid_argument("DnnObjectDetector: timestamps must increase in video mode");
    }
    last_timestamp_ms_ = timestamp_ms;
  }

  cv::Mat blob = cv::dnn::blobFromImage(frame, 1.0,
                                        cv::Size(config_.input_width, config_.input_height),
                                        cv::Scalar(), true, false);
  net_.setInput(blob);
  cv::Mat output = net_.forward();

  if (output.dims != 4 || output.size[3] != kSsdRowWidth) {
    throw std::runtime_error("DnnObjectDetector: unexpected output shape");
  }
  cv::Mat rows(output.size[2], output.size[3], CV_32F, output.ptr<float>());

  std::vector<ObjectCandidate> candidates;
  const float frame_w = static_cast<float>(frame.cols);
  const float frame_h = static_cast<float>(frame.rows);
  for (int i = 0; i < rows.rows; ++i) {
    const float score = rows.at<float>(i, 2);
    if (score < config_.score_threshold) {
      continue;
    }
    const float x1 = std::clamp(rows.at<float>(i, 3), 0.0F, 1.0F) * frame_w;
    const float y1 = std::clamp(rows.at<float>(i, 4), 0.0F, 1.0F) * frame_h;
    const float x2 = std::clamp(rows.at<float>(i, 5), 0.0F, 1.0F) * frame_w;
    const float y2 = std::clamp(rows.at<float>(i, 6), 0.0F, 1.0F) * frame_h;

    ObjectCandidate candidate;
    candidate.category = LabelFor(static_cast<int>(rows.at<float>(i, 1)));
    candidate.score = score;
    candidate.bbox = cv::Rect2f(x1, y1, x2 - x1, y2 - y1);
    candidates.push_back(std::move(candidate));
  }

  std::sort(candidates.begin(), candidates.end(),
            [](const ObjectCandidate& a, const ObjectCandidate& b) { return a.score > b.score; });
  if (config_.max_results > 0 && candidates.size() > static_cast<size_t>(config_.max_results)) {
    candidates.resize(static_cast<size_t>(config_.max_results));
  }
  return candidates;
}

}  // namespace arlink::tracking
