#pragma once

#include <optional>
#include <string>
#include <variant>

#include "arlink/sync/Annotation.h"

namespace arlink::sync {

inline constexpr const char* kAnnotationAddedType = "annotation_added";
inline constexpr const char* kAnnotationRemovedType = "annotation_removed";

struct AnnotationAdded {
  Annotation annotation;
};

struct AnnotationRemoved {
  std::string id;
};

using SyncMessage = std::variant<AnnotationAdded, AnnotationRemoved>;

std::string EncodeMessage(const SyncMessage& message);

// Returns nothing for invalid JSON, an unknown "type" or missing fields.
std::optional<SyncMessage> DecodeMessage(const std::string& text);

}  // namespace arlink::sync
