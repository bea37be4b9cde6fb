#include "arlink/sync/SyncMessage.h"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace arlink::sync {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace

std::string EncodeMessage(const SyncMessage& message) {
  nlohmann::json j = std::visit(
      Overloaded{
          [](const AnnotationAdded& added) {
            return nlohmann::json{{"type", kAnnotationAddedType},
                                  {"annotation", ToJson(added.annotation)}};
          },
          [](const AnnotationRemoved& removed) {
            return nlohmann::json{{"type", kAnnotationRemovedType}, {"id", removed.id}};
          },
      },
      message);
  return j.dump();
}

std::optional<SyncMessage> DecodeMessage(const std::string& text) {
  nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    spdlog::debug("Ignoring non-JSON sync message");
    return std::nullopt;
  }
  auto type_it = j.find("type");
  if (type_it == j.end() || !type_it->is_string()) {
    return std::nullopt;
  }
  const std::string type = type_it->get<std::string>();

  if (type == kAnnotationAddedType) {
    auto annotation_it = j.find("annotation");
    if (annotation_it == j.end()) {
      return std::nullopt;
    }
    try {
      return AnnotationAdded{AnnotationFromJson(*annotation_it)};
    } catch (const std::invalid_argument& ex) {
      spdlog::debug("Ignoring malformed annotation_added: {}", ex.what());
      return std::nullopt;
    }
  }

  if (type == kAnnotationRemovedType) {
    auto id_it = j.find("id");
    if (id_it == j.end()) {
      return std::nullopt;
    }
    if (id_it->is_string()) {
      return AnnotationRemoved{id_it->get<std::string>()};
    }
    if (id_it->is_number_integer()) {
      return AnnotationRemoved{std::to_string(id_it->get<std::int64_t>())};
    }
    return std::nullopt;
  }

  return std::nullopt;
}

}  // namespace arlink::sync
