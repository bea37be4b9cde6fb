#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/signal_set.hpp>
#include <spdlog/spdlog.h>

#include "arlink/session/SessionConfig.h"
#include "arlink/sync/AnnotationRelay.h"

namespace net = boost::asio;

int main(int argc, char** argv) {
  unsigned short port = 8000;
  std::string address = "0.0.0.0";
  std::string log_level = "info";

  if (argc > 1 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help")) {
    std::cout << "Usage: " << argv[0] << " [port] [address] [log_level]\n";
    return 0;
  }
  if (argc > 1) {
    port = static_cast<unsigned short>(std::atoi(argv[1]));
  }
  if (argc > 2) {
    address = argv[2];
  }
  if (argc > 3) {
    log_level = argv[3];
  }
  spdlog::set_level(arlink::session::ParseLogLevel(log_level));

  try {
    net::io_context io;
    const net::ip::tcp::endpoint endpoint(net::ip::make_address(address), port);
    arlink::sync::AnnotationRelay relay(io, endpoint);
    relay.Run();

    net::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&io, &relay](const boost::system::error_code&, int) {
      relay.Stop();
      io.stop();
    });

    spdlog::info("Annotation relay listening on ws://{}:{}{}<client_id>", address, relay.port(),
                 relay.path_prefix());
    io.run();
    spdlog::info("Annotation relay stopped");
  } catch (const std::exception& e) {
    spdlog::error("Relay error: {}", e.what());
    return 1;
  }
  return 0;
}
