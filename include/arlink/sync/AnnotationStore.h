#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "arlink/sync/Annotation.h"
#include "arlink/sync/SyncChannel.h"
#include "arlink/sync/SyncMessage.h"

namespace arlink::sync {

// Passing this id to Remove() clears every annotation locally without telling
// the peers.
inline constexpr const char* kRemoveAllId = "*";

// Client-local replica of the session's annotations. Local mutations apply
// first and are then broadcast while the channel is open; remote mutations
// apply the same way and are never re-broadcast.
class AnnotationStore {
 public:
  using ChangeCallback = std::function<void(std::size_t size)>;
  using Classifier = std::function<std::optional<std::string>(const std::string& label)>;

  // Registers itself as the channel's message handler.
  AnnotationStore(SyncChannel& channel, std::string client_id);

  AnnotationStore(const AnnotationStore&) = delete;
  AnnotationStore& operator=(const AnnotationStore&) = delete;

  // Assigns an id when empty and a category tag when missing. Throws
  // std::invalid_argument on a duplicate id.
  Annotation Add(Annotation annotation);
  void Remove(const std::string& id);

  void ApplyRemote(const SyncMessage& message);
  void HandleIncoming(const std::string& text);

  void SetChangeCallback(ChangeCallback callback);
  void SetClassifier(Classifier classifier);

  [[nodiscard]] const std::vector<Annotation>& annotations() const noexcept { return annotations_; }
  [[nodiscard]] std::size_t size() const noexcept { return annotations_.size(); }
  [[nodiscard]] bool Contains(const std::string& id) const;
  [[nodiscard]] const std::string& client_id() const noexcept { return client_id_; }

  // client_id:epoch_ms:counter
  std::string NextId();

 private:
  bool insert(Annotation annotation);
  bool erase(const std::string& id);
  void clear();
  void broadcast(const SyncMessage& message);
  void notifyChanged();

  SyncChannel& channel_;
  std::string client_id_;
  std::vector<Annotation> annotations_;
  std::uint64_t id_counter_{0};
  ChangeCallback on_change_;
  Classifier classifier_;
};

}  // namespace arlink::sync
