#include <chrono>
#include <iostream>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <opencv2/core.hpp>

#include "arlink/tracking/DetectorFusion.h"
#include "test_utils.h"

using namespace arlink::tracking;
using namespace arlink::test;

namespace {

struct Harness {
  explicit Harness(FusionConfig config = {})
      : fusion(io, detector, vision, std::move(config)) {
    fusion.SetResultCallback([this](const CycleResult& result) { results.push_back(result); });
  }

  boost::asio::io_context io;
  FakeObjectDetector detector;
  FakeVisionClient vision;
  DetectorFusion fusion;
  std::vector<CycleResult> results;
};

FusionConfig remoteConfig(std::chrono::milliseconds interval = std::chrono::milliseconds(2000)) {
  FusionConfig config;
  config.initial_strategy = StrategyKind::REMOTE;
  config.remote.interval = interval;
  return config;
}

bool testLocalCycleCoalescing() {
  std::cout << "Test: Local strategy runs at most one pending cycle\n";

  Harness h;
  h.detector.pushCandidates({{"bottle", 0.8, cv::Rect2f(10, 10, 50, 100)}});
  h.fusion.Start();

  h.fusion.OnDisplayFrame(makeFrame(), 1.0);
  h.fusion.OnDisplayFrame(makeFrame(), 2.0);
  h.fusion.OnDisplayFrame(makeFrame(), 3.0);
  h.io.poll();

  if (h.detector.calls != 1 || h.results.size() != 1) {
    std::cerr << "  FAIL: Expected one cycle, got " << h.detector.calls << "\n";
    return false;
  }
  // The cycle uses the latest frame.
  if (!nearlyEqual(h.detector.timestamps.front(), 3.0)) {
    std::cerr << "  FAIL: Cycle did not use the latest frame\n";
    return false;
  }
  if (!IsValid(h.results[0].box) || h.results[0].failed ||
      h.results[0].source != DetectionSource::LOCAL) {
    std::cerr << "  FAIL: Expected a valid local box\n";
    return false;
  }
  std::cout << "  PASS\n\n";
  return true;
}

bool testLocalFailureMarksCycle() {
  std::cout << "Test: Detector exception yields a failed cycle without a box\n";

  Harness h;
  h.detector.pushFailure();
  CycleResult result = h.fusion.RunLocalCycle(makeFrame(), 1.0);
  if (!result.failed || result.box.has_value()) {
    std::cerr << "  FAIL: Exception not surfaced as failure\n";
    return false;
  }
  std::cout << "  PASS\n\n";
  return true;
}

bool testRemoteImmediateRequestAndRescale() {
  std::cout << "Test: Remote strategy requests immediately and rescales the reply\n";

  Harness h(remoteConfig());
  h.fusion.OnDisplayFrame(makeFrame(1280, 720), 1.0);
  h.fusion.Start();

  if (h.vision.images.size() != 1 || h.fusion.remote_requests_issued() != 1) {
    std::cerr << "  FAIL: Expected an immediate request\n";
    return false;
  }
  if (h.detector.calls != 0) {
    std::cerr << "  FAIL: Local detector ran under remote strategy\n";
    return false;
  }

  h.vision.complete(0, makeReply(100, 100, 64, 48));
  if (h.results.size() != 1 || !IsValid(h.results[0].box)) {
    std::cerr << "  FAIL: Reply not published\n";
    return false;
  }
  const auto& box = *h.results[0].box;
  // 640x480 -> 1280x720 scales by (2, 1.5).
  if (!nearlyEqual(box.origin, cv::Point2f(200, 150)) || !nearlyEqual(box.size.width, 128.0) ||
      !nearlyEqual(box.size.height, 72.0)) {
    std::cerr << "  FAIL: Unexpected box (" << box.origin.x << "," << box.origin.y << ")\n";
    return false;
  }
  std::cout << "  PASS\n\n";
  return true;
}

bool testRemoteActivationBeforeFirstFrame() {
  std::cout << "Test: Remote activation without a frame requests on the first frame\n";

  Harness h(remoteConfig());
  h.fusion.Start();
  if (!h.vision.images.empty()) {
    std::cerr << "  FAIL: Request issued without a frame\n";
    return false;
  }

  h.fusion.OnDisplayFrame(makeFrame(1280, 720), 1.0);
  if (h.vision.images.size() != 1 || h.fusion.remote_requests_issued() != 1) {
    std::cerr << "  FAIL: Expected the deferred request on the first frame, got "
              << h.vision.images.size() << "\n";
    return false;
  }
  h.fusion.OnDisplayFrame(makeFrame(1280, 720), 2.0);
  if (h.vision.images.size() != 1) {
    std::cerr << "  FAIL: Later frames must wait for the timer\n";
    return false;
  }

  h.vision.complete(0, makeReply(100, 100, 64, 48));
  if (h.results.size() != 1 || !IsValid(h.results[0].box)) {
    std::cerr << "  FAIL: Deferred reply not published\n";
    return false;
  }
  h.fusion.Stop();
  std::cout << "  PASS\n\n";
  return true;
}

bool testRemoteFailure() {
  std::cout << "Test: Remote error and detected=false are distinguished\n";

  Harness h(remoteConfig());
  h.fusion.OnDisplayFrame(makeFrame(), 1.0);
  h.fusion.Start();
  h.vision.complete(0, std::nullopt, "connect: refused");
  if (h.results.size() != 1 || !h.results[0].failed) {
    std::cerr << "  FAIL: Network error not marked failed\n";
    return false;
  }

  h.fusion.SetStrategy(StrategyKind::LOCAL);
  h.fusion.SetStrategy(StrategyKind::REMOTE);
  RemoteDetectionReply nothing;
  h.vision.complete(1, nothing);
  if (h.results.size() != 2 || h.results[1].failed || h.results[1].box.has_value()) {
    std::cerr << "  FAIL: detected=false should be a plain miss\n";
    return false;
  }
  std::cout << "  PASS\n\n";
  return true;
}

bool testStaleReplyAfterSwitch() {
  std::cout << "Test: Replies arriving after a strategy switch are dropped\n";

  Harness h(remoteConfig());
  h.fusion.OnDisplayFrame(makeFrame(), 1.0);
  h.fusion.Start();
  h.fusion.SetStrategy(StrategyKind::LOCAL);

  h.vision.complete(0, makeReply(10, 10, 20, 20));
  if (!h.results.empty()) {
    std::cerr << "  FAIL: Stale reply was published\n";
    return false;
  }
  if (h.fusion.stale_replies_dropped() != 1) {
    std::cerr << "  FAIL: Stale reply not counted\n";
    return false;
  }

  // Same kind again: the old request still belongs to a previous activation.
  h.fusion.SetStrategy(StrategyKind::REMOTE);
  h.fusion.Stop();
  h.vision.complete(1, makeReply(10, 10, 20, 20));
  if (!h.results.empty() || h.fusion.stale_replies_dropped() != 2) {
    std::cerr << "  FAIL: Reply after Stop() was published\n";
    return false;
  }
  std::cout << "  PASS\n\n";
  return true;
}

bool testSwitchCancelsRemoteTimer() {
  std::cout << "Test: Switching to local stops the remote cadence\n";

  Harness h(remoteConfig(std::chrono::milliseconds(5)));
  h.fusion.OnDisplayFrame(makeFrame(), 1.0);
  h.fusion.Start();
  h.io.run_for(std::chrono::milliseconds(40));
  const auto issued = h.vision.images.size();
  if (issued < 2) {
    std::cerr << "  FAIL: Remote cadence did not tick (" << issued << ")\n";
    return false;
  }

  h.fusion.SetStrategy(StrategyKind::LOCAL);
  h.io.restart();
  h.io.run_for(std::chrono::milliseconds(30));
  if (h.vision.images.size() != issued) {
    std::cerr << "  FAIL: Remote requests continued after switch\n";
    return false;
  }
  std::cout << "  PASS\n\n";
  return true;
}

bool testOutOfOrderRepliesLastArrivalWins() {
  std::cout << "Test: Overlapping remote replies publish in arrival order\n";

  Harness h(remoteConfig(std::chrono::milliseconds(5)));
  h.fusion.OnDisplayFrame(makeFrame(640, 480), 1.0);
  h.fusion.Start();
  h.io.run_for(std::chrono::milliseconds(20));
  if (h.vision.pending.size() < 2) {
    std::cerr << "  FAIL: Expected overlapping requests\n";
    return false;
  }

  h.vision.complete(1, makeReply(50, 50, 10, 10));
  h.vision.complete(0, makeReply(5, 5, 10, 10));
  if (h.results.size() != 2) {
    std::cerr << "  FAIL: Expected both replies published\n";
    return false;
  }
  if (!nearlyEqual(h.results.back().box->origin, cv::Point2f(5, 5))) {
    std::cerr << "  FAIL: Last arrival should be the latest result\n";
    return false;
  }
  h.fusion.Stop();
  std::cout << "  PASS\n\n";
  return true;
}

}  // namespace

int main() {
  std::cout << "=== DetectorFusion Unit Tests ===\n\n";

  int passed = 0;
  int total = 0;

  auto run_test = [&](auto test_func, const char* name) {
    total++;
    if (test_func()) {
      passed++;
    } else {
      std::cerr << "FAILED: " << name << "\n\n";
    }
  };

  run_test(testLocalCycleCoalescing, "Local Cycle Coalescing");
  run_test(testLocalFailureMarksCycle, "Local Failure");
  run_test(testRemoteImmediateRequestAndRescale, "Remote Immediate Request");
  run_test(testRemoteActivationBeforeFirstFrame, "Remote Activation Before First Frame");
  run_test(testRemoteFailure, "Remote Failure");
  run_test(testStaleReplyAfterSwitch, "Stale Reply After Switch");
  run_test(testSwitchCancelsRemoteTimer, "Switch Cancels Timer");
  run_test(testOutOfOrderRepliesLastArrivalWins, "Out-of-order Replies");

  std::cout << "=== Test Summary ===\n";
  std::cout << "Passed: " << passed << " / " << total << "\n";

  return (passed == total) ? 0 : 1;
}
