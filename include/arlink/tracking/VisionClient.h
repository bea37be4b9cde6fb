#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>

#include "arlink/tracking/DetectionTypes.h"

namespace arlink::tracking {

// Reply of the remote vision service, in downsampled frame coordinates.
struct RemoteDetectionReply {
  bool detected{false};
  cv::Rect2f bbox;
  double confidence{0.0};
  std::map<std::string, cv::Point2f> parts;      // "cap", "middle", "bottom"
};

// Throws nlohmann::json::exception on type errors in present fields.
RemoteDetectionReply ParseRemoteReply(const nlohmann::json& j);

// Scales the reply by (native/downsample) on each axis. Returns nothing when
// the service found no target or the box is degenerate.
std::optional<DetectionBox> RescaleToNative(const RemoteDetectionReply& reply,
                                            cv::Size downsample_size,
                                            cv::Size native_size,
                                            const std::string& category = "bottle");

// Downsamples, JPEG-encodes and base64-encodes a frame for upload.
std::string EncodeFrameForRemote(const cv::Mat& frame, cv::Size downsample_size,
                                 int jpeg_quality);

std::string Base64Encode(const std::vector<unsigned char>& data);

// Asynchronous remote detection call. The callback runs on the caller's
// execution context, with either a reply or a non-empty error message.
class VisionClient {
 public:
  using ReplyCallback =
      std::function<void(std::optional<RemoteDetectionReply> reply, const std::string& error)>;

  virtual ~VisionClient() = default;

  virtual void DetectAsync(std::string image_base64, ReplyCallback callback) = 0;
};

}  // namespace arlink::tracking
