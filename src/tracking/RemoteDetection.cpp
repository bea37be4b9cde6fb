#include "arlink/tracking/VisionClient.h"

#include <stdexcept>
#include <vector>

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace arlink::tracking {

namespace {

cv::Point2f parsePoint(const nlohmann::json& j) {
  return cv::Point2f(j.value("x", 0.0F), j.value("y", 0.0F));
}

}  // namespace

RemoteDetectionReply ParseRemoteReply(const nlohmann::json& j) {
  RemoteDetectionReply reply;
  reply.detected = j.value("detected", false);
  reply.confidence = j.value("confidence", 0.0);
  if (j.contains("bbox") && j["bbox"].is_object()) {
    const auto& bbox = j["bbox"];
    reply.bbox = cv::Rect2f(bbox.value("x", 0.0F), bbox.value("y", 0.0F),
                            bbox.value("width", 0.0F), bbox.value("height", 0.0F));
  }
  if (j.contains("parts") && j["parts"].is_object()) {
    for (const auto& [name, point] : j["parts"].items()) {
      if (point.is_object()) {
        reply.parts[name] = parsePoint(point);
      }
    }
  }
  return reply;
}

std::optional<DetectionBox> RescaleToNative(const RemoteDetectionReply& reply,
                                            cv::Size downsample_size,
                                            cv::Size native_size,
                                            const std::string& category) {
  if (!reply.detected) {
    return std::nullopt;
  }
  if (downsample_size.width <= 0 || downsample_size.height <= 0) {
    throw std::invalid_argument("Downsample size must be positive");
  }
  const float scale_x =
      static_cast<float>(native_size.width) / static_cast<float>(downsample_size.width);
  const float scale_y =
      static_cast<float>(native_size.height) / static_cast<float>(downsample_size.height);

  DetectionBox box;
  box.origin = cv::Point2f(reply.bbox.x * scale_x, reply.bbox.y * scale_y);
  box.size = cv::Size2f(reply.bbox.width * scale_x, reply.bbox.height * scale_y);
  box.category = category;
  box.confidence = reply.confidence;
  box.source = DetectionSource::REMOTE;
  for (const auto& [name, point] : reply.parts) {
    box.parts[name] = cv::Point2f(point.x * scale_x, point.y * scale_y);
  }
  if (!IsValid(box)) {
    return std::nullopt;
  }
  return box;
}

std::string Base64Encode(const std::vector<unsigned char>& data) {
  using namespace boost::archive::iterators;
  using Base64Iterator =
      base64_from_binary<transform_width<std::vector<unsigned char>::const_iterator, 6, 8>>;
  std::string encoded(Base64Iterator(data.begin()), Base64Iterator(data.end()));
  encoded.append((3 - data.size() % 3) % 3, '=');
  return encoded;
}

std::string EncodeFrameForRemote(const cv::Mat& frame, cv::Size downsample_size,
                                 int jpeg_quality) {
  if (frame.empty()) {
    throw std::invalid_argument("Cannot encode an empty frame");
  }
  cv::Mat resized;
  cv::resize(frame, resized, downsample_size, 0.0, 0.0, cv::INTER_AREA);

  std::vector<unsigned char> jpeg;
  const std::vector<int> params{cv::IMWRITE_JPEG_QUALITY, jpeg_quality};
  if (!cv::imencode(".jpg", resized, jpeg, params)) {
    throw std::runtime_error("JPEG encoding failed");
  }
  return Base64Encode(jpeg);
}

}  // namespace arlink::tracking
