#include "arlink/tracking/HttpVisionClient.h"

#include <spdlog/spdlog.h>

#include <memory>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <nlohmann/json.hpp>

namespace arlink::tracking {

namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

class DetectRequest : public std::enable_shared_from_this<DetectRequest> {
 public:
  DetectRequest(net::io_context& io, const HttpVisionConfig& config,
                VisionClient::ReplyCallback callback)
      : config_(config), resolver_(io), stream_(io), callback_(std::move(callback)) {}

  void Run(std::string body) {
    request_.version(11);
    request_.method(http::verb::post);
    request_.target(config_.target);
    request_.set(http::field::host, config_.host);
    request_.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    request_.set(http::field::content_type, "application/json");
    request_.body() = std::move(body);
    request_.prepare_payload();

    resolver_.async_resolve(config_.host, config_.port,
                            beast::bind_front_handler(&DetectRequest::onResolve,
                                                      shared_from_this()));
  }

 private:
  void onResolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (ec) {
      return fail("resolve", ec);
    }
    stream_.expires_after(config_.timeout);
    stream_.async_connect(results, beast::bind_front_handler(&DetectRequest::onConnect,
                                                             shared_from_this()));
  }

  void onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
    if (ec) {
      return fail("connect", ec);
    }
    stream_.expires_after(config_.timeout);
    http::async_write(stream_, request_,
                      beast::bind_front_handler(&DetectRequest::onWrite, shared_from_this()));
  }

  void onWrite(beast::error_code ec, std::size_t) {
    if (ec) {
      return fail("write", ec);
    }
    http::async_read(stream_, buffer_, response_,
                     beast::bind_front_handler(&DetectRequest::onRead, shared_from_this()));
  }

  void onRead(beast::error_code ec, std::size_t) {
    if (ec) {
      return fail("read", ec);
    }
    beast::error_code shutdown_ec;
    stream_.socket().shutdown(tcp::socket::shutdown_both, shutdown_ec);

    if (response_.result() != http::status::ok) {
      finish(std::nullopt, "HTTP status " + std::to_string(response_.result_int()));
      return;
    }

    std::optional<RemoteDetectionReply> reply;
    std::string error;
    try {
      reply = ParseRemoteReply(nlohmann::json::parse(response_.body()));
    } catch (const nlohmann::json::exception& ex) {
      error = std::string("invalid reply: ") + ex.what();
    }
    finish(std::move(reply), error);
  }

  void fail(const char* stage, beast::error_code ec) {
    finish(std::nullopt, std::string(stage) + ": " + ec.message());
  }

  void finish(std::optional<RemoteDetectionReply> reply, const std::string& error) {
    if (!callback_) {
      return;
    }
    auto callback = std::move(callback_);
    callback_ = nullptr;
    callback(std::move(reply), error);
  }

  HttpVisionConfig config_;
  tcp::resolver resolver_;
  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  http::request<http::string_body> request_;
  http::response<http::string_body> response_;
  VisionClient::ReplyCallback callback_;
};

}  // namespace

HttpVisionClient::HttpVisionClient(boost::asio::io_context& io, HttpVisionConfig config)
    : io_(io), config_(std::move(config)) {}

void HttpVisionClient::DetectAsync(std::string image_base64, ReplyCallback callback) {
  nlohmann::json body;
  body["image"] = std::move(image_base64);
  body["mode"] = config_.mode;

  spdlog::debug("Posting frame to http://{}:{}{}", config_.host, config_.port, config_.target);
  auto request = std::make_shared<DetectRequest>(io_, config_, std::move(callback));
  request->Run(body.dump());
}

}  // namespace arlink::tracking
