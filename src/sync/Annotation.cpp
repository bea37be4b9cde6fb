#include "arlink/sync/Annotation.h"

#include <cstdint>
#include <stdexcept>

namespace arlink::sync {

namespace {

std::optional<std::string> idFromJson(const nlohmann::json& value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_number_integer()) {
    return std::to_string(value.get<std::int64_t>());
  }
  if (value.is_number_unsigned()) {
    return std::to_string(value.get<std::uint64_t>());
  }
  return std::nullopt;
}

cv::Point3d positionFromJson(const nlohmann::json& value) {
  if (value.is_array() && value.size() == 3) {
    return cv::Point3d(value[0].get<double>(), value[1].get<double>(), value[2].get<double>());
  }
  if (value.is_object()) {
    return cv::Point3d(value.value("x", 0.0), value.value("y", 0.0), value.value("z", 0.0));
  }
  throw std::invalid_argument("Annotation position must be [x, y, z]");
}

}  // namespace

nlohmann::json ToJson(const Annotation& annotation) {
  nlohmann::json j;
  j["id"] = annotation.id;
  j["position"] = {annotation.position.x, annotation.position.y, annotation.position.z};
  j["label"] = annotation.label;
  if (annotation.category) {
    j["category"] = *annotation.category;
  }
  return j;
}

Annotation AnnotationFromJson(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw std::invalid_argument("Annotation must be a JSON object");
  }
  Annotation annotation;

  auto id_it = j.find("id");
  std::optional<std::string> id;
  if (id_it != j.end()) {
    id = idFromJson(*id_it);
  }
  if (!id || id->empty()) {
    throw std::invalid_argument("Annotation id missing or not a string/integer");
  }
  annotation.id = *id;

  auto position_it = j.find("position");
  if (position_it == j.end()) {
    throw std::invalid_argument("Annotation position missing");
  }
  try {
    annotation.position = positionFromJson(*position_it);
  } catch (const nlohmann::json::exception& ex) {
    throw std::invalid_argument(std::string("Annotation position malformed: ") + ex.what());
  }

  auto label_it = j.find("label");
  if (label_it != j.end() && label_it->is_string()) {
    annotation.label = label_it->get<std::string>();
  }
  auto category_it = j.find("category");
  if (category_it != j.end() && category_it->is_string()) {
    annotation.category = category_it->get<std::string>();
  }
  return annotation;
}

}  // namespace arlink::sync
