#include <iostream>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>

#include "arlink/tracking/TargetSelector.h"
#include "arlink/tracking/VisionClient.h"
#include "test_utils.h"

using namespace arlink::tracking;
using namespace arlink::test;

namespace {

bool testAllowListFilter() {
  std::cout << "Test: Non-target categories are discarded regardless of score\n";

  std::vector<ObjectCandidate> candidates{
      {"person", 0.9, cv::Rect2f(0, 0, 100, 200)},
      {"bottle", 0.4, cv::Rect2f(10, 20, 30, 80)},
      {"chair", 0.95, cv::Rect2f(200, 200, 100, 100)},
  };
  auto box = SelectTarget(candidates, TargetFilterConfig{});
  if (!box) {
    std::cerr << "  FAIL: Expected a bottle box\n";
    return false;
  }
  if (box->category != "bottle" || !nearlyEqual(box->confidence, 0.4)) {
    std::cerr << "  FAIL: Selected " << box->category << "@" << box->confidence << "\n";
    return false;
  }
  if (!nearlyEqual(box->origin, cv::Point2f(10, 20)) || !nearlyEqual(box->size.width, 30.0)) {
    std::cerr << "  FAIL: Box geometry not copied\n";
    return false;
  }
  std::cout << "  PASS\n\n";
  return true;
}

bool testHighestScoringTargetWins() {
  std::cout << "Test: Highest-scoring allow-listed candidate wins, ties keep order\n";

  std::vector<ObjectCandidate> candidates{
      {"cup", 0.6, cv::Rect2f(0, 0, 10, 10)},
      {"wine glass", 0.8, cv::Rect2f(1, 1, 10, 10)},
      {"bottle", 0.8, cv::Rect2f(2, 2, 10, 10)},
  };
  auto box = SelectTarget(candidates, TargetFilterConfig{});
  if (!box || box->category != "wine glass") {
    std::cerr << "  FAIL: Expected the earlier of the tied candidates\n";
    return false;
  }
  std::cout << "  PASS\n\n";
  return true;
}

bool testThresholdAndCap() {
  std::cout << "Test: Score threshold and result cap apply before the allow-list\n";

  TargetFilterConfig config;
  config.max_results = 2;
  std::vector<ObjectCandidate> candidates{
      {"person", 0.9, cv::Rect2f(0, 0, 10, 10)},
      {"chair", 0.85, cv::Rect2f(0, 0, 10, 10)},
      {"bottle", 0.7, cv::Rect2f(0, 0, 10, 10)},
  };
  if (SelectTarget(candidates, config)) {
    std::cerr << "  FAIL: Bottle ranked below the cap must not be seen\n";
    return false;
  }

  config.max_results = 10;
  std::vector<ObjectCandidate> weak{{"bottle", 0.2, cv::Rect2f(0, 0, 10, 10)}};
  if (SelectTarget(weak, config)) {
    std::cerr << "  FAIL: Candidate under threshold was selected\n";
    return false;
  }
  std::cout << "  PASS\n\n";
  return true;
}

bool testDegenerateBoxIgnored() {
  std::cout << "Test: Zero-width candidates are not a detection\n";

  std::vector<ObjectCandidate> candidates{{"bottle", 0.9, cv::Rect2f(5, 5, 0, 40)}};
  if (SelectTarget(candidates, TargetFilterConfig{})) {
    std::cerr << "  FAIL: Degenerate box selected\n";
    return false;
  }
  if (IsValid(makeBox(0, 0, 0, 10)) || !IsValid(makeBox(0, 0, 1, 1))) {
    std::cerr << "  FAIL: IsValid disagrees with the size rule\n";
    return false;
  }
  std::cout << "  PASS\n\n";
  return true;
}

bool testRescaleToNative() {
  std::cout << "Test: Remote box rescaled from downsample to native resolution\n";

  RemoteDetectionReply reply = makeReply(160, 120, 50, 50);
  reply.parts["cap"] = cv::Point2f(185, 125);
  auto box = RescaleToNative(reply, cv::Size(320, 240), cv::Size(1280, 720));
  if (!box) {
    std::cerr << "  FAIL: Expected a rescaled box\n";
    return false;
  }
  std::cout << "  Box: (" << box->origin.x << "," << box->origin.y << "," << box->size.width
            << "," << box->size.height << ")\n";
  if (!nearlyEqual(box->origin, cv::Point2f(640, 360)) || !nearlyEqual(box->size.width, 200.0) ||
      !nearlyEqual(box->size.height, 150.0)) {
    std::cerr << "  FAIL: Expected (640,360,200,150)\n";
    return false;
  }
  if (!nearlyEqual(box->parts.at("cap"), cv::Point2f(740, 375))) {
    std::cerr << "  FAIL: Part not rescaled\n";
    return false;
  }
  if (box->source != DetectionSource::REMOTE || box->category != "bottle") {
    std::cerr << "  FAIL: Remote box metadata wrong\n";
    return false;
  }

  reply.detected = false;
  if (RescaleToNative(reply, cv::Size(320, 240), cv::Size(1280, 720))) {
    std::cerr << "  FAIL: detected=false must yield no box\n";
    return false;
  }
  try {
    (void)RescaleToNative(makeReply(0, 0, 1, 1), cv::Size(0, 240), cv::Size(1280, 720));
    std::cerr << "  FAIL: Zero downsample size accepted\n";
    return false;
  } catch (const std::invalid_argument&) {
  }
  std::cout << "  PASS\n\n";
  return true;
}

bool testParseRemoteReply() {
  std::cout << "Test: Remote reply parsing\n";

  auto j = nlohmann::json::parse(R"({
    "detected": true,
    "bbox": {"x": 10, "y": 20, "width": 30, "height": 40},
    "confidence": 0.75,
    "parts": {"cap": {"x": 25, "y": 22}, "bottom": {"x": 25, "y": 58}}
  })");
  RemoteDetectionReply reply = ParseRemoteReply(j);
  if (!reply.detected || !nearlyEqual(reply.bbox.width, 30.0) ||
      !nearlyEqual(reply.confidence, 0.75) || reply.parts.size() != 2) {
    std::cerr << "  FAIL: Reply fields not parsed\n";
    return false;
  }
  RemoteDetectionReply empty = ParseRemoteReply(nlohmann::json::parse(R"({"detected": false})"));
  if (empty.detected) {
    std::cerr << "  FAIL: detected=false parsed as detected\n";
    return false;
  }
  std::cout << "  PASS\n\n";
  return true;
}

bool testEncodeFrameForRemote() {
  std::cout << "Test: Frame encoding produces base64 JPEG\n";

  std::string encoded = EncodeFrameForRemote(makeFrame(1280, 720), cv::Size(640, 480), 80);
  // JPEG SOI marker 0xFFD8FF encodes to "/9j/".
  if (encoded.rfind("/9j/", 0) != 0 || encoded.size() % 4 != 0) {
    std::cerr << "  FAIL: Not a base64 JPEG payload\n";
    return false;
  }
  if (Base64Encode({'M', 'a'}) != "TWE=" || Base64Encode({'M', 'a', 'n'}) != "TWFu") {
    std::cerr << "  FAIL: Base64 padding wrong\n";
    return false;
  }
  std::cout << "  PASS\n\n";
  return true;
}

}  // namespace

int main() {
  std::cout << "=== Target Selection Unit Tests ===\n\n";

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

  run_test(testAllowListFilter, "Allow-list Filter");
  run_test(testHighestScoringTargetWins, "Highest Score Wins");
  run_test(testThresholdAndCap, "Threshold and Cap");
  run_test(testDegenerateBoxIgnored, "Degenerate Box");
  run_test(testRescaleToNative, "Rescale To Native");
  run_test(testParseRemoteReply, "Parse Remote Reply");
  run_test(testEncodeFrameForRemote, "Encode Frame");

  std::cout << "=== Test Summary ===\n";
  std::cout << "Passed: " << passed << " / " << total << "\n";

  return (passed == total) ? 0 : 1;
}
