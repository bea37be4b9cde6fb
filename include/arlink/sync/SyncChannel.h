#pragma once

#include <functional>
#include <string>

namespace arlink::sync {

enum class ChannelState {
  CONNECTING,
  OPEN,
  CLOSED
};

const char* ToString(ChannelState state);

// Persistent bidirectional text channel shared by the session participants.
class SyncChannel {
 public:
  using MessageHandler = std::function<void(const std::string& text)>;
  using StateHandler = std::function<void(ChannelState state)>;

  virtual ~SyncChannel() = default;

  [[nodiscard]] virtual bool IsOpen() const = 0;

  // Queues a text message. Messages sent while the channel is not open are
  // dropped by the implementation.
  virtual void Send(std::string text) = 0;

  virtual void SetMessageHandler(MessageHandler handler) = 0;
  virtual void SetStateHandler(StateHandler handler) = 0;
};

}  // namespace arlink::sync
