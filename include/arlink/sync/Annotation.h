#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>

namespace arlink::sync {

struct Annotation {
  std::string id;                                // unique within a session
  cv::Point3d position;                          // model space
  std::string label;
  std::optional<std::string> category;           // anchor category tag
};

// {"id", "position": [x, y, z], "label", "category"?}
nlohmann::json ToJson(const Annotation& annotation);

// Integer ids (legacy clients) are converted to strings. Throws
// std::invalid_argument when the id or position is missing or malformed.
Annotation AnnotationFromJson(const nlohmann::json& j);

}  // namespace arlink::sync
