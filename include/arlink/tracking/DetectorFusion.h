#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <opencv2/core.hpp>

#include "arlink/tracking/DetectionTypes.h"
#include "arlink/tracking/ObjectDetector.h"
#include "arlink/tracking/TargetSelector.h"
#include "arlink/tracking/VisionClient.h"

namespace arlink::tracking {

enum class StrategyKind {
  LOCAL,   // in-process detector, once per display frame
  REMOTE   // remote vision service on a fixed cadence
};

const char* ToString(StrategyKind kind);

struct RemoteStrategyConfig {
  std::chrono::milliseconds interval{2000};
  int downsample_width{640};
  int downsample_height{480};
  int jpeg_quality{80};
  std::string category{"bottle"};               // category reported for remote boxes
};

struct FusionConfig {
  TargetFilterConfig filter;
  RemoteStrategyConfig remote;
  StrategyKind initial_strategy{StrategyKind::LOCAL};
};

// Locates the target in the video feed with one of two strategies. All work
// runs on the given io_context; results are published through the result
// callback, one per completed cycle.
class DetectorFusion {
 public:
  using ResultCallback = std::function<void(const CycleResult&)>;

  DetectorFusion(boost::asio::io_context& io, ObjectDetector& local_detector,
                 VisionClient& vision_client, FusionConfig config);
  ~DetectorFusion();

  DetectorFusion(const DetectorFusion&) = delete;
  DetectorFusion& operator=(const DetectorFusion&) = delete;

  void SetResultCallback(ResultCallback callback);

  void Start();
  void Stop();

  // Stops the current strategy's scheduled work before activating the next.
  void SetStrategy(StrategyKind kind);
  void ToggleStrategy();

  // Feeds the latest display frame. Under the local strategy this schedules a
  // detection cycle unless one is already pending. Under the remote strategy
  // the first frame after activation issues the request activation skipped.
  void OnDisplayFrame(const cv::Mat& frame, double timestamp_ms);

  // Runs one local cycle synchronously. Never throws.
  CycleResult RunLocalCycle(const cv::Mat& frame, double timestamp_ms);

  [[nodiscard]] StrategyKind strategy() const noexcept { return strategy_; }
  [[nodiscard]] bool running() const noexcept { return running_; }
  [[nodiscard]] const FusionConfig& config() const noexcept { return config_; }
  [[nodiscard]] std::uint64_t remote_requests_issued() const noexcept {
    return remote_requests_issued_;
  }
  [[nodiscard]] std::uint64_t stale_replies_dropped() const noexcept {
    return stale_replies_dropped_;
  }

 private:
  void activate();
  void deactivate();
  void scheduleRemoteTick(std::uint64_t epoch);
  void issueRemoteRequest();
  void handleRemoteReply(std::uint64_t epoch, cv::Size native_size,
                         std::optional<RemoteDetectionReply> reply, const std::string& error);
  bool isCurrent(std::uint64_t epoch, StrategyKind kind) const;
  void publish(const CycleResult& result);

  boost::asio::io_context& io_;
  ObjectDetector& local_detector_;
  VisionClient& vision_client_;
  FusionConfig config_;
  ResultCallback on_result_;

  StrategyKind strategy_;
  bool running_{false};
  std::uint64_t epoch_{0};                       // bumped on every switch/stop
  bool local_cycle_pending_{false};
  bool remote_request_owed_{false};               // request skipped for lack of a frame
  boost::asio::steady_timer remote_timer_;

  cv::Mat latest_frame_;
  double latest_timestamp_ms_{0.0};
  std::uint64_t remote_requests_issued_{0};
  std::uint64_t stale_replies_dropped_{0};
};

}  // namespace arlink::tracking
