#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <opencv2/highgui.hpp>
#include <spdlog/spdlog.h>

#include "arlink/overlay/CameraCapture.h"
#include "arlink/session/OverlaySession.h"
#include "arlink/session/SessionConfig.h"
#include "arlink/sync/WebSocketChannel.h"
#include "arlink/tracking/HttpVisionClient.h"
#include "arlink/tracking/ObjectDetector.h"

using namespace arlink;

int main(int argc, char** argv) {
  if (argc > 1 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help")) {
    std::cout << "Usage: " << argv[0] << " [session_config.json]\n"
              << "Keys: [V] toggle FAST / AI VISION  [C] clear annotations  [Q/ESC] quit\n";
    return 0;
  }

  try {
    session::SessionConfig config;
    if (argc > 1) {
      config = session::LoadSessionConfig(argv[1]);
    } else if (std::filesystem::exists("config/overlay_session.json")) {
      config = session::LoadSessionConfig("config/overlay_session.json");
    }
    spdlog::set_level(session::ParseLogLevel(config.log_level));

    const std::string client_id =
        config.client_id.empty() ? session::GenerateClientId() : config.client_id;

    boost::asio::io_context io;
    tracking::DnnObjectDetector detector(config.detector);
    tracking::HttpVisionClient vision(io, config.vision);
    sync::WebSocketChannel channel(io, config.channel, client_id);

    const std::string window_title = config.window_title;
    cv::namedWindow(window_title, cv::WINDOW_AUTOSIZE);

    session::OverlaySession* active_session = nullptr;
    auto camera_factory = [&config]() -> std::unique_ptr<overlay::FrameSource> {
      return std::make_unique<overlay::CameraCapture>(config.camera);
    };
    auto sink = [&window_title, &active_session, &io](const cv::Mat& frame) {
      cv::imshow(window_title, frame);
      const int key = cv::waitKey(1);
      if (key >= 0 && active_session != nullptr && !active_session->HandleKey(key & 0xFF)) {
        io.stop();
      }
    };

    session::OverlaySession overlay_session(io, config, detector, vision, channel, client_id,
                                            camera_factory, sink);
    active_session = &overlay_session;

    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&io](const boost::system::error_code&, int) { io.stop(); });

    channel.Start();
    overlay_session.Start();
    spdlog::info("Client {} running, channel {}", client_id, channel.url());

    io.run();

    overlay_session.Stop();
    channel.Stop();
    cv::destroyWindow(window_title);
    return 0;
  } catch (const std::exception& e) {
    spdlog::error("Error: {}", e.what());
    return 1;
  }
}
