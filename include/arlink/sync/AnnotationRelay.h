#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

namespace arlink::sync {

class RelaySession;

// WebSocket fan-out server for the annotation channel. Clients connect at
// <path_prefix><client_id>; every text message is forwarded to all other
// connected clients. A client whose write fails is dropped. All handlers run
// on the io_context passed in.
class AnnotationRelay {
 public:
  // Throws boost::system::system_error when the endpoint cannot be bound.
  AnnotationRelay(boost::asio::io_context& io, const boost::asio::ip::tcp::endpoint& endpoint,
                  std::string path_prefix = "/ws/");
  ~AnnotationRelay();

  AnnotationRelay(const AnnotationRelay&) = delete;
  AnnotationRelay& operator=(const AnnotationRelay&) = delete;

  void Run();
  // Closes the listener and every client connection.
  void Stop();

  void Join(const std::shared_ptr<RelaySession>& session);
  void Leave(const RelaySession* session);
  void Broadcast(const RelaySession* sender, const std::string& text);

  [[nodiscard]] unsigned short port() const;
  [[nodiscard]] std::size_t client_count() const noexcept { return sessions_.size(); }
  [[nodiscard]] const std::string& path_prefix() const noexcept { return path_prefix_; }

 private:
  void doAccept();

  boost::asio::io_context& io_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::string path_prefix_;
  std::vector<std::shared_ptr<RelaySession>> sessions_;
  bool running_{false};
};

}  // namespace arlink::sync
