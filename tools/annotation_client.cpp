#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <spdlog/spdlog.h>

#include "arlink/overlay/CalibrationTable.h"
#include "arlink/session/SessionConfig.h"
#include "arlink/sync/AnnotationStore.h"
#include "arlink/sync/WebSocketChannel.h"

using namespace arlink;

namespace {

void printUsage(const char* program) {
  std::cerr << "Usage:\n"
            << "  " << program << " <host> <port> add <x> <y> <z> <label>\n"
            << "  " << program << " <host> <port> remove <id>\n"
            << "  " << program << " <host> <port> listen [seconds]\n";
}

void printAnnotations(const sync::AnnotationStore& store) {
  for (const auto& annotation : store.annotations()) {
    std::cout << sync::ToJson(annotation).dump() << "\n";
  }
  std::cout.flush();
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 4) {
    printUsage(argv[0]);
    return 1;
  }

  sync::ChannelConfig channel_config;
  channel_config.host = argv[1];
  channel_config.port = argv[2];
  const std::string command = argv[3];

  sync::Annotation pending;
  std::string remove_id;
  int listen_seconds = 0;
  if (command == "add") {
    if (argc < 8) {
      printUsage(argv[0]);
      return 1;
    }
    pending.position = cv::Point3d(std::atof(argv[4]), std::atof(argv[5]), std::atof(argv[6]));
    pending.label = argv[7];
  } else if (command == "remove") {
    if (argc < 5) {
      printUsage(argv[0]);
      return 1;
    }
    remove_id = argv[4];
  } else if (command == "listen") {
    if (argc > 4) {
      listen_seconds = std::atoi(argv[4]);
    }
  } else {
    printUsage(argv[0]);
    return 1;
  }

  const char* env_level = std::getenv("ARLINK_LOG_LEVEL");
  spdlog::set_level(session::ParseLogLevel(env_level != nullptr ? env_level : "warn"));

  try {
    boost::asio::io_context io;
    const std::string client_id = session::GenerateClientId();
    sync::WebSocketChannel channel(io, channel_config, client_id);
    sync::AnnotationStore store(channel, client_id);
    const auto table = overlay::CalibrationTable::Default();
    store.SetClassifier([&table](const std::string& label) { return table.Classify(label); });

    boost::asio::steady_timer done_timer(io);
    auto finish_after = [&](std::chrono::milliseconds delay) {
      done_timer.expires_after(delay);
      done_timer.async_wait([&](const boost::system::error_code& ec) {
        if (ec) {
          return;
        }
        channel.Stop();
        io.stop();
      });
    };

    bool done = false;
    channel.SetStateHandler([&](sync::ChannelState state) {
      if (state != sync::ChannelState::OPEN || done) {
        return;
      }
      done = command != "listen";
      if (command == "add") {
        const auto added = store.Add(pending);
        std::cout << added.id << "\n";
        finish_after(std::chrono::milliseconds(500));
      } else if (command == "remove") {
        store.Remove(remove_id);
        finish_after(std::chrono::milliseconds(500));
      } else if (listen_seconds > 0) {
        finish_after(std::chrono::seconds(listen_seconds));
      }
    });

    if (command == "listen") {
      store.SetChangeCallback([&store](std::size_t size) {
        std::cout << "-- " << size << " annotation(s)\n";
        printAnnotations(store);
      });
    }

    channel.Start();
    io.run();
    return 0;
  } catch (const std::exception& e) {
    spdlog::error("Error: {}", e.what());
    return 1;
  }
}
