#include "arlink/sync/WebSocketChannel.h"

#include <spdlog/spdlog.h>

#include <utility>

#include <boost/asio/buffer.hpp>

namespace arlink::sync {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

const char* ToString(ChannelState state) {
  switch (state) {
    case ChannelState::CONNECTING:
      return "CONNECTING";
    case ChannelState::OPEN:
      return "OPEN";
    case ChannelState::CLOSED:
      return "CLOSED";
  }
  return "UNKNOWN";
}

WebSocketChannel::WebSocketChannel(net::io_context& io, ChannelConfig config,
                                   std::string client_id)
    : io_(io),
      config_(std::move(config)),
      client_id_(std::move(client_id)),
      resolver_(io),
      reconnect_timer_(io) {}

WebSocketChannel::~WebSocketChannel() {
  on_message_ = nullptr;
  on_state_ = nullptr;
  Stop();
}

std::string WebSocketChannel::url() const {
  return "ws://" + config_.host + ":" + config_.port + config_.path_prefix + client_id_;
}

void WebSocketChannel::Start() {
  if (running_) {
    return;
  }
  running_ = true;
  connect();
}

void WebSocketChannel::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  ++generation_;
  reconnect_timer_.cancel();
  resolver_.cancel();
  if (socket_) {
    beast::error_code ec;
    beast::get_lowest_layer(*socket_).socket().close(ec);
    socket_.reset();
  }
  outbox_.clear();
  writing_ = false;
  setState(ChannelState::CLOSED);
}

void WebSocketChannel::Send(std::string text) {
  if (!IsOpen()) {
    spdlog::debug("Channel not open, dropping outgoing message");
    return;
  }
  outbox_.push_back(std::move(text));
  if (!writing_) {
    doWrite(generation_);
  }
}

void WebSocketChannel::SetMessageHandler(MessageHandler handler) {
  on_message_ = std::move(handler);
}

void WebSocketChannel::SetStateHandler(StateHandler handler) {
  on_state_ = std::move(handler);
}

void WebSocketChannel::connect() {
  const auto generation = ++generation_;
  ++connect_attempts_;
  socket_ = std::make_unique<Socket>(io_);
  read_buffer_.consume(read_buffer_.size());
  outbox_.clear();
  writing_ = false;
  setState(ChannelState::CONNECTING);

  spdlog::info("Connecting to {} (attempt {})", url(), connect_attempts_);
  resolver_.async_resolve(config_.host, config_.port,
                          [this, generation](beast::error_code ec,
                                             tcp::resolver::results_type results) {
                            onResolve(generation, ec, std::move(results));
                          });
}

void WebSocketChannel::onResolve(std::uint64_t generation, beast::error_code ec,
                                 tcp::resolver::results_type results) {
  if (generation != generation_) {
    return;
  }
  if (ec) {
    return handleClosed(generation, "resolve", ec);
  }
  beast::get_lowest_layer(*socket_).expires_after(std::chrono::seconds(10));
  beast::get_lowest_layer(*socket_).async_connect(
      results, [this, generation](beast::error_code connect_ec,
                                  tcp::resolver::results_type::endpoint_type) {
        onConnect(generation, connect_ec);
      });
}

void WebSocketChannel::onConnect(std::uint64_t generation, beast::error_code ec) {
  if (generation != generation_) {
    return;
  }
  if (ec) {
    return handleClosed(generation, "connect", ec);
  }
  beast::get_lowest_layer(*socket_).expires_never();
  socket_->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
  socket_->text(true);

  const std::string host = config_.host + ":" + config_.port;
  socket_->async_handshake(host, config_.path_prefix + client_id_,
                           [this, generation](beast::error_code handshake_ec) {
                             onHandshake(generation, handshake_ec);
                           });
}

void WebSocketChannel::onHandshake(std::uint64_t generation, beast::error_code ec) {
  if (generation != generation_) {
    return;
  }
  if (ec) {
    return handleClosed(generation, "handshake", ec);
  }
  spdlog::info("Connected to annotation channel {}", url());
  setState(ChannelState::OPEN);
  doRead(generation);
}

void WebSocketChannel::doRead(std::uint64_t generation) {
  socket_->async_read(read_buffer_,
                      [this, generation](beast::error_code ec, std::size_t bytes) {
                        onRead(generation, ec, bytes);
                      });
}

void WebSocketChannel::onRead(std::uint64_t generation, beast::error_code ec, std::size_t) {
  if (generation != generation_) {
    return;
  }
  if (ec) {
    return handleClosed(generation, "read", ec);
  }
  std::string text = beast::buffers_to_string(read_buffer_.data());
  read_buffer_.consume(read_buffer_.size());
  if (on_message_) {
    on_message_(text);
  }
  // The handler may have stopped the channel.
  if (generation == generation_) {
    doRead(generation);
  }
}

void WebSocketChannel::doWrite(std::uint64_t generation) {
  if (outbox_.empty()) {
    writing_ = false;
    return;
  }
  writing_ = true;
  socket_->async_write(net::buffer(outbox_.front()),
                       [this, generation](beast::error_code ec, std::size_t bytes) {
                         onWrite(generation, ec, bytes);
                       });
}

void WebSocketChannel::onWrite(std::uint64_t generation, beast::error_code ec, std::size_t) {
  if (generation != generation_) {
    return;
  }
  if (ec) {
    spdlog::error("Channel write failed: {}", ec.message());
    return handleClosed(generation, "write", ec);
  }
  outbox_.pop_front();
  doWrite(generation);
}

void WebSocketChannel::handleClosed(std::uint64_t generation, const char* stage,
                                    beast::error_code ec) {
  if (generation != generation_) {
    return;
  }
  ++generation_;
  if (ec == websocket::error::closed) {
    spdlog::info("Annotation channel closed by peer");
  } else {
    spdlog::warn("Annotation channel {} error: {}", stage, ec.message());
  }
  if (socket_) {
    beast::error_code close_ec;
    beast::get_lowest_layer(*socket_).socket().close(close_ec);
  }
  outbox_.clear();
  writing_ = false;
  setState(ChannelState::CLOSED);
  scheduleReconnect();
}

void WebSocketChannel::scheduleReconnect() {
  if (!running_) {
    return;
  }
  spdlog::info("Reconnecting in {} ms", config_.reconnect_delay.count());
  reconnect_timer_.expires_after(config_.reconnect_delay);
  reconnect_timer_.async_wait([this](beast::error_code ec) {
    if (ec == net::error::operation_aborted || !running_) {
      return;
    }
    connect();
  });
}

void WebSocketChannel::setState(ChannelState state) {
  if (state_ == state) {
    return;
  }
  state_ = state;
  spdlog::debug("Channel state -> {}", ToString(state));
  if (on_state_) {
    on_state_(state);
  }
}

}  // namespace arlink::sync
