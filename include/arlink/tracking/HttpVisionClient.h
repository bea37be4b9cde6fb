#pragma once

#include <chrono>
#include <string>

#include <boost/asio/io_context.hpp>

#include "arlink/tracking/VisionClient.h"

namespace arlink::tracking {

struct HttpVisionConfig {
  std::string host{"localhost"};
  std::string port{"8000"};
  std::string target{"/detect-bottle"};
  std::string mode{"full"};                      // "full" (with parts) or "fast"
  std::chrono::milliseconds timeout{15000};
};

// Posts {"image", "mode"} to the vision endpoint. Every call opens its own
// connection, so calls may overlap and complete in any order.
class HttpVisionClient : public VisionClient {
 public:
  HttpVisionClient(boost::asio::io_context& io, HttpVisionConfig config);

  void DetectAsync(std::string image_base64, ReplyCallback callback) override;

  [[nodiscard]] const HttpVisionConfig& config() const noexcept { return config_; }

 private:
  boost::asio::io_context& io_;
  HttpVisionConfig config_;
};

}  // namespace arlink::tracking
