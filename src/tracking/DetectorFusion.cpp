#include "arlink/tracking/DetectorFusion.h"

#include <spdlog/spdlog.h>

#include <utility>

#include <boost/asio/post.hpp>

namespace arlink::tracking {

const char* ToString(StrategyKind kind) {
  switch (kind) {
    case StrategyKind::LOCAL:
      return "local";
    case StrategyKind::REMOTE:
      return "remote";
  }
  return "unknown";
}

DetectorFusion::DetectorFusion(boost::asio::io_context& io, ObjectDetector& local_detector,
                               VisionClient& vision_client, FusionConfig config)
    : io_(io),
      local_detector_(local_detector),
      vision_client_(vision_client),
      config_(std::move(config)),
      strategy_(config_.initial_strategy),
      remote_timer_(io) {}

DetectorFusion::~DetectorFusion() {
  Stop();
}

void DetectorFusion::SetResultCallback(ResultCallback callback) {
  on_result_ = std::move(callback);
}

void DetectorFusion::Start() {
  if (running_) {
    return;
  }
  running_ = true;
  spdlog::info("Detector fusion started ({} strategy)", ToString(strategy_));
  activate();
}

void DetectorFusion::Stop() {
  if (!running_) {
    return;
  }
  deactivate();
  running_ = false;
  spdlog::info("Detector fusion stopped");
}

void DetectorFusion::SetStrategy(StrategyKind kind) {
  if (kind == strategy_) {
    return;
  }
  if (running_) {
    deactivate();
  }
  spdlog::info("Detection strategy {} -> {}", ToString(strategy_), ToString(kind));
  strategy_ = kind;
  if (running_) {
    activate();
  }
}

void DetectorFusion::ToggleStrategy() {
  SetStrategy(strategy_ == StrategyKind::LOCAL ? StrategyKind::REMOTE : StrategyKind::LOCAL);
}

void DetectorFusion::activate() {
  ++epoch_;
  if (strategy_ == StrategyKind::REMOTE) {
    issueRemoteRequest();
    scheduleRemoteTick(epoch_);
  }
}

void DetectorFusion::deactivate() {
  // In-flight remote requests are not cancelled; their replies fail the epoch
  // check and are dropped.
  ++epoch_;
  remote_timer_.cancel();
  local_cycle_pending_ = false;
  remote_request_owed_ = false;
}

bool DetectorFusion::isCurrent(std::uint64_t epoch, StrategyKind kind) const {
  return running_ && strategy_ == kind && epoch == epoch_;
}

void DetectorFusion::OnDisplayFrame(const cv::Mat& frame, double timestamp_ms) {
  if (frame.empty()) {
    return;
  }
  frame.copyTo(latest_frame_);
  latest_timestamp_ms_ = timestamp_ms;

  if (running_ && strategy_ == StrategyKind::REMOTE && remote_request_owed_) {
    // Activation happened before the first frame.
    remote_request_owed_ = false;
    issueRemoteRequest();
    return;
  }
  if (!running_ || strategy_ != StrategyKind::LOCAL || local_cycle_pending_) {
    return;
  }
  local_cycle_pending_ = true;
  const std::uint64_t epoch = epoch_;
  boost::asio::post(io_, [this, epoch]() {
    if (!isCurrent(epoch, StrategyKind::LOCAL)) {
      return;
    }
    local_cycle_pending_ = false;
    publish(RunLocalCycle(latest_frame_, latest_timestamp_ms_));
  });
}

CycleResult DetectorFusion::RunLocalCycle(const cv::Mat& frame, double timestamp_ms) {
  CycleResult result;
  result.source = DetectionSource::LOCAL;
  try {
    const auto candidates = local_detector_.Detect(frame, timestamp_ms);
    result.box = SelectTarget(candidates, config_.filter, DetectionSource::LOCAL);
  } catch (const std::exception& ex) {
    spdlog::warn("Local detection failed: {}", ex.what());
    result.box.reset();
    result.failed = true;
  }
  return result;
}

void DetectorFusion::scheduleRemoteTick(std::uint64_t epoch) {
  remote_timer_.expires_after(config_.remote.interval);
  remote_timer_.async_wait([this, epoch](const boost::system::error_code& ec) {
    if (ec || !isCurrent(epoch, StrategyKind::REMOTE)) {
      return;
    }
    issueRemoteRequest();
    scheduleRemoteTick(epoch);
  });
}

void DetectorFusion::issueRemoteRequest() {
  if (latest_frame_.empty()) {
    spdlog::debug("Remote detection deferred until the first frame");
    remote_request_owed_ = true;
    return;
  }

  const cv::Size downsample(config_.remote.downsample_width, config_.remote.downsample_height);
  const cv::Size native = latest_frame_.size();
  std::string image;
  try {
    image = EncodeFrameForRemote(latest_frame_, downsample, config_.remote.jpeg_quality);
  } catch (const std::exception& ex) {
    spdlog::warn("Remote detection failed to encode frame: {}", ex.what());
    CycleResult result;
    result.source = DetectionSource::REMOTE;
    result.failed = true;
    publish(result);
    return;
  }

  ++remote_requests_issued_;
  const std::uint64_t epoch = epoch_;
  vision_client_.DetectAsync(
      std::move(image),
      [this, epoch, native](std::optional<RemoteDetectionReply> reply, const std::string& error) {
        handleRemoteReply(epoch, native, std::move(reply), error);
      });
}

void DetectorFusion::handleRemoteReply(std::uint64_t epoch, cv::Size native_size,
                                       std::optional<RemoteDetectionReply> reply,
                                       const std::string& error) {
  if (!isCurrent(epoch, StrategyKind::REMOTE)) {
    ++stale_replies_dropped_;
    spdlog::debug("Dropping stale remote detection reply");
    return;
  }

  CycleResult result;
  result.source = DetectionSource::REMOTE;
  if (!reply) {
    spdlog::warn("Remote detection failed: {}", error.empty() ? "no reply" : error);
    result.failed = true;
    publish(result);
    return;
  }

  const cv::Size downsample(config_.remote.downsample_width, config_.remote.downsample_height);
  try {
    result.box = RescaleToNative(*reply, downsample, native_size, config_.remote.category);
  } catch (const std::exception& ex) {
    spdlog::warn("Remote detection reply rejected: {}", ex.what());
    result.failed = true;
  }
  publish(result);
}

void DetectorFusion::publish(const CycleResult& result) {
  if (on_result_) {
    on_result_(result);
  }
}

}  // namespace arlink::tracking
