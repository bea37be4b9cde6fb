#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "arlink/sync/SyncChannel.h"

namespace arlink::sync {

struct ChannelConfig {
  std::string host{"localhost"};
  std::string port{"8000"};
  std::string path_prefix{"/ws/"};              // full path is prefix + client id
  std::chrono::milliseconds reconnect_delay{2000};
};

// WebSocket client to ws://host:port/ws/<client_id>. Reconnects a fixed delay
// after every close until Stop() is called. All handlers run on the
// io_context passed in.
class WebSocketChannel : public SyncChannel {
 public:
  WebSocketChannel(boost::asio::io_context& io, ChannelConfig config, std::string client_id);
  ~WebSocketChannel() override;

  WebSocketChannel(const WebSocketChannel&) = delete;
  WebSocketChannel& operator=(const WebSocketChannel&) = delete;

  void Start();
  void Stop();

  [[nodiscard]] bool IsOpen() const override { return state_ == ChannelState::OPEN; }
  void Send(std::string text) override;
  void SetMessageHandler(MessageHandler handler) override;
  void SetStateHandler(StateHandler handler) override;

  [[nodiscard]] ChannelState state() const noexcept { return state_; }
  [[nodiscard]] int connect_attempts() const noexcept { return connect_attempts_; }
  [[nodiscard]] std::string url() const;

 private:
  using Socket = boost::beast::websocket::stream<boost::beast::tcp_stream>;

  void connect();
  void onResolve(std::uint64_t generation, boost::beast::error_code ec,
                 boost::asio::ip::tcp::resolver::results_type results);
  void onConnect(std::uint64_t generation, boost::beast::error_code ec);
  void onHandshake(std::uint64_t generation, boost::beast::error_code ec);
  void doRead(std::uint64_t generation);
  void onRead(std::uint64_t generation, boost::beast::error_code ec, std::size_t bytes);
  void doWrite(std::uint64_t generation);
  void onWrite(std::uint64_t generation, boost::beast::error_code ec, std::size_t bytes);

  void handleClosed(std::uint64_t generation, const char* stage, boost::beast::error_code ec);
  void scheduleReconnect();
  void setState(ChannelState state);

  boost::asio::io_context& io_;
  ChannelConfig config_;
  std::string client_id_;

  boost::asio::ip::tcp::resolver resolver_;
  std::unique_ptr<Socket> socket_;
  boost::beast::flat_buffer read_buffer_;
  std::deque<std::string> outbox_;
  bool writing_{false};
  boost::asio::steady_timer reconnect_timer_;

  // Bumped on every new connection and on Stop(); completions carrying an
  // older generation are ignored.
  std::uint64_t generation_{0};
  bool running_{false};
  int connect_attempts_{0};
  ChannelState state_{ChannelState::CLOSED};

  MessageHandler on_message_;
  StateHandler on_state_;
};

}  // namespace arlink::sync
