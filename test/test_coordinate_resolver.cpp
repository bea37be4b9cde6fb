#include <iostream>
#include <optional>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "arlink/overlay/CalibrationTable.h"
#include "arlink/overlay/CoordinateResolver.h"
#include "arlink/overlay/OverlayRenderer.h"
#include "test_utils.h"

using namespace arlink;
using namespace arlink::overlay;
using namespace arlink::test;

namespace {

sync::Annotation makeAnnotation(const std::string& id, double x, double y, double z,
                                const std::string& label) {
  sync::Annotation annotation;
  annotation.id = id;
  annotation.position = cv::Point3d(x, y, z);
  annotation.label = label;
  return annotation;
}

bool testCapAnchor() {
  std::cout << "Test: 'Cap marker' resolves to the cap anchor\n";

  CalibrationTable table({{"cap", {}, {0.5, 0.15}}}, AnchorPoint{0.5, 0.5});
  CoordinateResolver resolver(table, ModelBounds{});
  auto pixel = resolver.Resolve(makeAnnotation("a1", 0, 0, 0, "Cap marker"),
                                makeBox(100, 50, 200, 400));
  if (!pixel) {
    std::cerr << "  FAIL: No pixel position\n";
    return false;
  }
  std::cout << "  Pixel: (" << pixel->x << ", " << pixel->y << ")\n";
  if (!nearlyEqual(*pixel, cv::Point2f(200, 110))) {
    std::cerr << "  FAIL: Expected (200, 110)\n";
    return false;
  }
  std::cout << "  PASS\n\n";
  return true;
}

bool testClassification() {
  std::cout << "Test: Default table keyword classification\n";

  const CalibrationTable table = CalibrationTable::Default();
  struct Case {
    const char* label;
    std::optional<std::string> category;
  };
  const Case cases[] = {
      {"Bottle TOP", std::string("cap")},   {"center line", std::string("middle")},
      {"Body scan", std::string("middle")}, {"the base", std::string("bottom")},
      {"random note", std::nullopt},
  };
  for (const auto& c : cases) {
    if (table.Classify(c.label) != c.category) {
      std::cerr << "  FAIL: '" << c.label << "' misclassified\n";
      return false;
    }
  }
  // Table order decides: "cap" comes before "bottom".
  if (table.Classify("cap at the bottom") != std::optional<std::string>("cap")) {
    std::cerr << "  FAIL: First match must win\n";
    return false;
  }
  std::cout << "  PASS\n\n";
  return true;
}

bool testCategoryTagWins() {
  std::cout << "Test: Explicit category tag overrides the label\n";

  CoordinateResolver resolver(CalibrationTable::Default(), ModelBounds{});
  auto annotation = makeAnnotation("a1", 0, 0, 0, "cap");
  annotation.category = "bottom";
  auto pixel = resolver.Resolve(annotation, makeBox(0, 0, 100, 100));
  if (!pixel || !nearlyEqual(pixel->y, 85.0)) {
    std::cerr << "  FAIL: Tag not honoured\n";
    return false;
  }
  std::cout << "  PASS\n\n";
  return true;
}

bool testLinearFallback() {
  std::cout << "Test: Linear mapping inverts the vertical axis\n";

  ModelBounds bounds;
  bounds.min_y = -1.0;
  bounds.max_y = 1.0;
  const auto box = std::optional<tracking::DetectionBox>(makeBox(0, 0, 100, 200));

  auto top = ResolveLinear(makeAnnotation("a", 0, 1, 0, "x"), box, bounds);
  auto bottom = ResolveLinear(makeAnnotation("b", 0, -1, 0, "x"), box, bounds);
  if (!top || !bottom || !nearlyEqual(top->y, 0.0) || !nearlyEqual(bottom->y, 200.0)) {
    std::cerr << "  FAIL: Expected y=0 for max and y=200 for min\n";
    return false;
  }
  if (!nearlyEqual(top->x, 50.0)) {
    std::cerr << "  FAIL: x=0 should map to the box centre\n";
    return false;
  }

  CoordinateResolver linear(CalibrationTable::Default(), bounds, UnmatchedPolicy::LINEAR);
  auto unmatched = linear.Resolve(makeAnnotation("c", 0.5, 0, 0, "note"), box);
  if (!unmatched || !nearlyEqual(*unmatched, cv::Point2f(100, 100))) {
    std::cerr << "  FAIL: Unmatched label should use the linear mapping\n";
    return false;
  }

  CoordinateResolver anchored(CalibrationTable::Default(), bounds);
  auto defaulted = anchored.Resolve(makeAnnotation("d", 0.5, 0, 0, "note"), box);
  if (!defaulted || !nearlyEqual(*defaulted, cv::Point2f(50, 30))) {
    std::cerr << "  FAIL: Unmatched label should use the default anchor\n";
    return false;
  }
  std::cout << "  PASS\n\n";
  return true;
}

bool testNoBoxSuppression() {
  std::cout << "Test: No box or zero-width box yields no markers\n";

  CoordinateResolver resolver(CalibrationTable::Default(), ModelBounds{});
  const std::vector<sync::Annotation> annotations{makeAnnotation("a", 0, 0, 0, "cap"),
                                                  makeAnnotation("b", 0, 0, 0, "note")};
  if (!resolver.ResolveAll(annotations, std::nullopt).empty()) {
    std::cerr << "  FAIL: Markers without a box\n";
    return false;
  }
  if (!resolver.ResolveAll(annotations, makeBox(10, 10, 0, 50)).empty() ||
      resolver.Resolve(annotations[0], makeBox(10, 10, 0, 50))) {
    std::cerr << "  FAIL: Markers for a zero-width box\n";
    return false;
  }
  auto markers = resolver.ResolveAll(annotations, makeBox(10, 10, 100, 100));
  if (markers.size() != 2 || markers[0].id != "a" || markers[1].id != "b") {
    std::cerr << "  FAIL: Markers missing or out of order\n";
    return false;
  }
  std::cout << "  PASS\n\n";
  return true;
}

bool testTableLoading() {
  std::cout << "Test: Calibration table and bounds validation\n";

  auto j = nlohmann::json::parse(R"({
    "entries": [{"category": "neck", "keywords": ["Neck", "shoulder"], "x": 0.5, "y": 0.3}],
    "default_anchor": {"x": 0.5, "y": 0.6}
  })");
  CalibrationTable table = CalibrationTable::FromJson(j);
  if (table.entries().size() != 1 || table.Classify("SHOULDER mark") != std::string("neck") ||
      !nearlyEqual(table.default_anchor().y, 0.6)) {
    std::cerr << "  FAIL: Table not loaded\n";
    return false;
  }

  auto bad = nlohmann::json::parse(R"({"entries": [{"category": "cap", "x": 1.5, "y": 0.1}]})");
  try {
    (void)CalibrationTable::FromJson(bad);
    std::cerr << "  FAIL: Anchor outside [0,1] accepted\n";
    return false;
  } catch (const std::invalid_argument&) {
  }

  ModelBounds flat;
  flat.max_y = flat.min_y;
  try {
    ValidateModelBounds(flat);
    std::cerr << "  FAIL: Degenerate bounds accepted\n";
    return false;
  } catch (const std::invalid_argument&) {
  }
  std::cout << "  PASS\n\n";
  return true;
}

bool testHudStrings() {
  std::cout << "Test: Overlay status strings\n";

  if (MarkerCountText(3) != "3 STRUCTURE(S) IDENTIFIED") {
    std::cerr << "  FAIL: Marker count text\n";
    return false;
  }
  if (DetectionStatusText(makeBox(0, 0, 10, 10, "bottle", 0.873)) != "bottle (87%)" ||
      DetectionStatusText(std::nullopt) != "Ready") {
    std::cerr << "  FAIL: Detection status text\n";
    return false;
  }
  if (TrackingHudText(std::nullopt) != "INITIALIZING" ||
      std::string(StrategyHudText(tracking::StrategyKind::REMOTE)) != "AI VISION") {
    std::cerr << "  FAIL: HUD text\n";
    return false;
  }

  OverlayRenderer renderer;
  cv::Mat frame = makeFrame();
  const cv::Mat original = frame.clone();
  OverlayFrameState state;
  state.box = makeBox(100, 100, 80, 200);
  state.markers.push_back({"a", "cap", cv::Point2f(140, 130)});
  renderer.Draw(frame, state);
  if (cv::norm(frame, original, cv::NORM_L1) == 0.0) {
    std::cerr << "  FAIL: Nothing drawn\n";
    return false;
  }
  std::cout << "  PASS\n\n";
  return true;
}

}  // namespace

int main() {
  std::cout << "=== CoordinateResolver Unit Tests ===\n\n";

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

  run_test(testCapAnchor, "Cap Anchor");
  run_test(testClassification, "Classification");
  run_test(testCategoryTagWins, "Category Tag Wins");
  run_test(testLinearFallback, "Linear Fallback");
  run_test(testNoBoxSuppression, "No-box Suppression");
  run_test(testTableLoading, "Table Loading");
  run_test(testHudStrings, "HUD Strings");

  std::cout << "=== Test Summary ===\n";
  std::cout << "Passed: " << passed << " / " << total << "\n";

  return (passed == total) ? 0 : 1;
}
