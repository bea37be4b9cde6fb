#include "arlink/sync/AnnotationStore.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <utility>

namespace arlink::sync {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace

AnnotationStore::AnnotationStore(SyncChannel& channel, std::string client_id)
    : channel_(channel), client_id_(std::move(client_id)) {
  channel_.SetMessageHandler([this](const std::string& text) { HandleIncoming(text); });
}

std::string AnnotationStore::NextId() {
  const auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();
  return client_id_ + ":" + std::to_string(epoch_ms) + ":" + std::to_string(++id_counter_);
}

bool AnnotationStore::Contains(const std::string& id) const {
  return std::any_of(annotations_.begin(), annotations_.end(),
                     [&id](const Annotation& annotation) { return annotation.id == id; });
}

Annotation AnnotationStore::Add(Annotation annotation) {
  if (annotation.id.empty()) {
    annotation.id = NextId();
  }
  if (annotation.id == kRemoveAllId) {
    throw std::invalid_argument("Annotation id '*' is reserved");
  }
  if (Contains(annotation.id)) {
    throw std::invalid_argument("Duplicate annotation id: " + annotation.id);
  }
  if (!annotation.category && classifier_) {
    annotation.category = classifier_(annotation.label);
  }

  insert(annotation);
  broadcast(AnnotationAdded{annotation});
  return annotation;
}

void AnnotationStore::Remove(const std::string& id) {
  if (id == kRemoveAllId) {
    // Local reset only; peers keep their copies.
    spdlog::info("Clearing {} annotations locally (not broadcast)", annotations_.size());
    clear();
    return;
  }
  erase(id);
  broadcast(AnnotationRemoved{id});
}

void AnnotationStore::ApplyRemote(const SyncMessage& message) {
  std::visit(Overloaded{
                 [this](const AnnotationAdded& added) {
                   Annotation annotation = added.annotation;
                   if (!annotation.category && classifier_) {
                     annotation.category = classifier_(annotation.label);
                   }
                   if (!insert(std::move(annotation))) {
                     spdlog::debug("Ignoring remote annotation with known id {}",
                                   added.annotation.id);
                   }
                 },
                 [this](const AnnotationRemoved& removed) {
                   if (removed.id == kRemoveAllId) {
                     clear();
                     return;
                   }
                   erase(removed.id);
                 },
             },
             message);
}

void AnnotationStore::HandleIncoming(const std::string& text) {
  auto message = DecodeMessage(text);
  if (!message) {
    return;
  }
  ApplyRemote(*message);
}

void AnnotationStore::SetChangeCallback(ChangeCallback callback) {
  on_change_ = std::move(callback);
}

void AnnotationStore::SetClassifier(Classifier classifier) {
  classifier_ = std::move(classifier);
}

bool AnnotationStore::insert(Annotation annotation) {
  if (Contains(annotation.id)) {
    return false;
  }
  annotations_.push_back(std::move(annotation));
  notifyChanged();
  return true;
}

bool AnnotationStore::erase(const std::string& id) {
  const auto before = annotations_.size();
  annotations_.erase(std::remove_if(annotations_.begin(), annotations_.end(),
                                    [&id](const Annotation& annotation) {
                                      return annotation.id == id;
                                    }),
                     annotations_.end());
  if (annotations_.size() == before) {
    return false;
  }
  notifyChanged();
  return true;
}

void AnnotationStore::clear() {
  annotations_.clear();
  notifyChanged();
}

void AnnotationStore::broadcast(const SyncMessage& message) {
  if (!channel_.IsOpen()) {
    spdlog::debug("Channel not open, mutation stays local");
    return;
  }
  channel_.Send(EncodeMessage(message));
}

void AnnotationStore::notifyChanged() {
  if (on_change_) {
    on_change_(annotations_.size());
  }
}

}  // namespace arlink::sync
