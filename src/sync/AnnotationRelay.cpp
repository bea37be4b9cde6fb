#include "arlink/sync/AnnotationRelay.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <deque>
#include <utility>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

namespace arlink::sync {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

class RelaySession : public std::enable_shared_from_this<RelaySession> {
 public:
  RelaySession(tcp::socket socket, AnnotationRelay& relay)
      : ws_(std::move(socket)), relay_(relay) {}

  void Run() {
    http::async_read(ws_.next_layer(), buffer_, request_,
                     beast::bind_front_handler(&RelaySession::onRequest, shared_from_this()));
  }

  void Deliver(std::shared_ptr<const std::string> text) {
    outbox_.push_back(std::move(text));
    if (outbox_.size() == 1) {
      doWrite();
    }
  }

  void Close() {
    beast::error_code ec;
    beast::get_lowest_layer(ws_).socket().close(ec);
  }

  [[nodiscard]] const std::string& client_id() const noexcept { return client_id_; }

 private:
  void onRequest(beast::error_code ec, std::size_t) {
    if (ec) {
      spdlog::debug("Relay request read failed: {}", ec.message());
      return;
    }
    const std::string target(request_.target().data(), request_.target().size());
    const std::string& prefix = relay_.path_prefix();
    if (!websocket::is_upgrade(request_) || target.rfind(prefix, 0) != 0 ||
        target.size() <= prefix.size()) {
      spdlog::warn("Rejecting connection to '{}'", target);
      beast::error_code close_ec;
      ws_.next_layer().socket().shutdown(tcp::socket::shutdown_both, close_ec);
      return;
    }
    client_id_ = target.substr(prefix.size());
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.async_accept(request_,
                     beast::bind_front_handler(&RelaySession::onAccept, shared_from_this()));
  }

  void onAccept(beast::error_code ec) {
    if (ec) {
      spdlog::warn("Handshake with {} failed: {}", client_id_, ec.message());
      return;
    }
    relay_.Join(shared_from_this());
    doRead();
  }

  void doRead() {
    buffer_.consume(buffer_.size());
    ws_.async_read(buffer_, beast::bind_front_handler(&RelaySession::onRead, shared_from_this()));
  }

  void onRead(beast::error_code ec, std::size_t) {
    if (ec) {
      if (ec == websocket::error::closed) {
        spdlog::info("Client {} disconnected", client_id_);
      } else {
        spdlog::warn("Client {} read error: {}", client_id_, ec.message());
      }
      relay_.Leave(this);
      return;
    }
    relay_.Broadcast(this, beast::buffers_to_string(buffer_.data()));
    doRead();
  }

  void doWrite() {
    ws_.text(true);
    ws_.async_write(net::buffer(*outbox_.front()),
                    beast::bind_front_handler(&RelaySession::onWrite, shared_from_this()));
  }

  void onWrite(beast::error_code ec, std::size_t) {
    if (ec) {
      spdlog::warn("Dropping client {}: {}", client_id_, ec.message());
      outbox_.clear();
      relay_.Leave(this);
      return;
    }
    outbox_.pop_front();
    if (!outbox_.empty()) {
      doWrite();
    }
  }

  websocket::stream<beast::tcp_stream> ws_;
  AnnotationRelay& relay_;
  beast::flat_buffer buffer_;
  http::request<http::string_body> request_;
  std::deque<std::shared_ptr<const std::string>> outbox_;
  std::string client_id_;
};

AnnotationRelay::AnnotationRelay(net::io_context& io, const tcp::endpoint& endpoint,
                                 std::string path_prefix)
    : io_(io), acceptor_(io), path_prefix_(std::move(path_prefix)) {
  acceptor_.open(endpoint.protocol());
  acceptor_.set_option(net::socket_base::reuse_address(true));
  acceptor_.bind(endpoint);
  acceptor_.listen(net::socket_base::max_listen_connections);
}

AnnotationRelay::~AnnotationRelay() {
  Stop();
}

unsigned short AnnotationRelay::port() const {
  return acceptor_.local_endpoint().port();
}

void AnnotationRelay::Run() {
  if (running_) {
    return;
  }
  running_ = true;
  doAccept();
}

void AnnotationRelay::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  beast::error_code ec;
  acceptor_.close(ec);
  for (const auto& session : sessions_) {
    session->Close();
  }
  sessions_.clear();
}

void AnnotationRelay::doAccept() {
  acceptor_.async_accept(io_, [this](beast::error_code ec, tcp::socket socket) {
    if (ec) {
      if (ec == net::error::operation_aborted || !running_) {
        return;
      }
      spdlog::warn("Accept failed: {}", ec.message());
    } else {
      std::make_shared<RelaySession>(std::move(socket), *this)->Run();
    }
    doAccept();
  });
}

void AnnotationRelay::Join(const std::shared_ptr<RelaySession>& session) {
  sessions_.push_back(session);
  spdlog::info("Client {} connected ({} total)", session->client_id(), sessions_.size());
}

void AnnotationRelay::Leave(const RelaySession* session) {
  const auto before = sessions_.size();
  sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                 [session](const std::shared_ptr<RelaySession>& entry) {
                                   return entry.get() == session;
                                 }),
                  sessions_.end());
  if (sessions_.size() != before) {
    spdlog::info("Client {} left ({} remaining)", session->client_id(), sessions_.size());
  }
}

void AnnotationRelay::Broadcast(const RelaySession* sender, const std::string& text) {
  auto shared_text = std::make_shared<const std::string>(text);
  // Deliver() may drop a session synchronously; iterate over a snapshot.
  const auto recipients = sessions_;
  for (const auto& session : recipients) {
    if (session.get() != sender) {
      session->Deliver(shared_text);
    }
  }
}

}  // namespace arlink::sync
