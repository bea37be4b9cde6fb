#include "arlink/session/SessionConfig.h"

#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <stdexcept>

namespace arlink::session {

namespace {

std::string resolvePath(const std::string& path, const std::string& base_dir) {
  namespace fs = std::filesystem;
  if (path.empty() || base_dir.empty()) {
    return path;
  }
  fs::path path_obj(path);
  if (path_obj.is_absolute()) {
    return path;
  }
  return (fs::path(base_dir) / path_obj).lexically_normal().string();
}

void loadDetector(const nlohmann::json& j, tracking::LocalDetectorConfig& config) {
  auto load_string = [&j](const char* key, std::string& dst) {
    if (j.contains(key)) {
      dst = j[key].get<std::string>();
    }
  };
  auto load_int = [&j](const char* key, int& dst) {
    if (j.contains(key)) {
      dst = j[key].get<int>();
    }
  };
  auto load_double = [&j](const char* key, double& dst) {
    if (j.contains(key)) {
      dst = j[key].get<double>();
    }
  };

  load_string("model_path", config.model_path);
  load_string("config_path", config.config_path);
  load_string("labels_path", config.labels_path);
  load_string("running_mode", config.running_mode);
  load_double("score_threshold", config.score_threshold);
  load_int("max_results", config.max_results);
  load_int("input_width", config.input_width);
  load_int("input_height", config.input_height);
}

void loadFusion(const nlohmann::json& j, tracking::FusionConfig& config) {
  if (j.contains("target_categories")) {
    config.filter.target_categories = j["target_categories"].get<std::vector<std::string>>();
  }
  if (j.contains("initial_strategy")) {
    const auto strategy = j["initial_strategy"].get<std::string>();
    if (strategy == "local") {
      config.initial_strategy = tracking::StrategyKind::LOCAL;
    } else if (strategy == "remote") {
      config.initial_strategy = tracking::StrategyKind::REMOTE;
    } else {
      throw std::invalid_argument("Unknown initial_strategy: " + strategy);
    }
  }
  if (j.contains("remote")) {
    const auto& remote = j["remote"];
    if (remote.contains("interval_ms")) {
      config.remote.interval = std::chrono::milliseconds(remote["interval_ms"].get<int>());
    }
    config.remote.downsample_width = remote.value("downsample_width", config.remote.downsample_width);
    config.remote.downsample_height =
        remote.value("downsample_height", config.remote.downsample_height);
    config.remote.jpeg_quality = remote.value("jpeg_quality", config.remote.jpeg_quality);
    config.remote.category = remote.value("category", config.remote.category);
  }
  if (config.remote.interval.count() <= 0) {
    throw std::invalid_argument("detection.remote.interval_ms must be positive");
  }
  if (config.remote.jpeg_quality < 0 || config.remote.jpeg_quality > 100) {
    throw std::invalid_argument("detection.remote.jpeg_quality must be in [0,100]");
  }
}

void loadVision(const nlohmann::json& j, tracking::HttpVisionConfig& config) {
  config.host = j.value("host", config.host);
  if (j.contains("port")) {
    config.port = j["port"].is_string() ? j["port"].get<std::string>()
                                        : std::to_string(j["port"].get<int>());
  }
  config.target = j.value("target", config.target);
  config.mode = j.value("mode", config.mode);
  if (j.contains("timeout_ms")) {
    config.timeout = std::chrono::milliseconds(j["timeout_ms"].get<int>());
  }
}

void loadChannel(const nlohmann::json& j, sync::ChannelConfig& config) {
  config.host = j.value("host", config.host);
  if (j.contains("port")) {
    config.port = j["port"].is_string() ? j["port"].get<std::string>()
                                        : std::to_string(j["port"].get<int>());
  }
  config.path_prefix = j.value("path_prefix", config.path_prefix);
  if (j.contains("reconnect_delay_ms")) {
    config.reconnect_delay = std::chrono::milliseconds(j["reconnect_delay_ms"].get<int>());
  }
}

void loadBounds(const nlohmann::json& j, overlay::ModelBounds& bounds) {
  bounds.min_x = j.value("min_x", bounds.min_x);
  bounds.max_x = j.value("max_x", bounds.max_x);
  bounds.min_y = j.value("min_y", bounds.min_y);
  bounds.max_y = j.value("max_y", bounds.max_y);
  bounds.min_z = j.value("min_z", bounds.min_z);
  bounds.max_z = j.value("max_z", bounds.max_z);
  overlay::ValidateModelBounds(bounds);
}

}  // namespace

spdlog::level::level_enum ParseLogLevel(const std::string& name) {
  static const std::map<std::string, spdlog::level::level_enum> kLevels = {
      {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
      {"info", spdlog::level::info},   {"warn", spdlog::level::warn},
      {"error", spdlog::level::err},   {"critical", spdlog::level::critical}};
  auto it = kLevels.find(name);
  if (it == kLevels.end()) {
    spdlog::warn("Unknown log level '{}', fallback to 'info'", name);
    return spdlog::level::info;
  }
  return it->second;
}

std::string GenerateClientId() {
  const auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();
  return "client_" + std::to_string(epoch_ms);
}

SessionConfig ParseSessionConfig(const nlohmann::json& j, const std::string& base_dir) {
  SessionConfig config;
  if (!j.is_object()) {
    throw std::invalid_argument("Session config must be a JSON object");
  }

  // Type errors are reported with the key they came from.
  auto load_section = [&j](const char* key,
                           const std::function<void(const nlohmann::json&)>& load) {
    if (!j.contains(key)) {
      return;
    }
    try {
      load(j[key]);
    } catch (const nlohmann::json::exception& ex) {
      throw std::invalid_argument(std::string("Session config '") + key + "': " + ex.what());
    }
  };

  load_section("log_level",
               [&](const nlohmann::json& v) { config.log_level = v.get<std::string>(); });
  load_section("client_id",
               [&](const nlohmann::json& v) { config.client_id = v.get<std::string>(); });
  load_section("window_title",
               [&](const nlohmann::json& v) { config.window_title = v.get<std::string>(); });
  load_section("render_interval_ms", [&](const nlohmann::json& v) {
    config.render_interval = std::chrono::milliseconds(v.get<int>());
  });
  if (config.render_interval.count() <= 0) {
    throw std::invalid_argument("render_interval_ms must be positive");
  }

  load_section("camera", [&](const nlohmann::json& camera) {
    config.camera.device_index = camera.value("device_index", config.camera.device_index);
    config.camera.width = camera.value("width", config.camera.width);
    config.camera.height = camera.value("height", config.camera.height);
    config.camera.fps = camera.value("fps", config.camera.fps);
  });

  load_section("detector", [&](const nlohmann::json& v) { loadDetector(v, config.detector); });
  config.detector.model_path = resolvePath(config.detector.model_path, base_dir);
  config.detector.config_path = resolvePath(config.detector.config_path, base_dir);
  config.detector.labels_path = resolvePath(config.detector.labels_path, base_dir);

  // The post-inference filter shares the detector's threshold and cap.
  config.fusion.filter.score_threshold = config.detector.score_threshold;
  config.fusion.filter.max_results = config.detector.max_results;
  load_section("detection", [&](const nlohmann::json& v) { loadFusion(v, config.fusion); });

  load_section("vision_service", [&](const nlohmann::json& v) { loadVision(v, config.vision); });
  load_section("channel", [&](const nlohmann::json& v) { loadChannel(v, config.channel); });
  load_section("calibration", [&](const nlohmann::json& v) {
    config.calibration = overlay::CalibrationTable::FromJson(v);
  });
  load_section("model_bounds",
               [&](const nlohmann::json& v) { loadBounds(v, config.model_bounds); });
  load_section("unmatched_policy", [&](const nlohmann::json& v) {
    config.unmatched_policy = overlay::ParseUnmatchedPolicy(v.get<std::string>());
  });

  load_section("overlay", [&](const nlohmann::json& style) {
    config.style.marker_radius = style.value("marker_radius", config.style.marker_radius);
    config.style.font_scale = style.value("font_scale", config.style.font_scale);
    config.style.draw_box = style.value("draw_box", config.style.draw_box);
    config.style.draw_parts = style.value("draw_parts", config.style.draw_parts);
  });
  return config;
}

SessionConfig LoadSessionConfig(const std::string& path) {
  std::ifstream ifs(path);
  if (!ifs.good()) {
    throw std::runtime_error("Failed to open session config: " + path);
  }
  nlohmann::json j;
  try {
    ifs >> j;
  } catch (const nlohmann::json::exception& ex) {
    throw std::runtime_error("Failed to parse session config " + path + ": " + ex.what());
  }
  const auto base_dir = std::filesystem::absolute(path).parent_path().string();
  return ParseSessionConfig(j, base_dir);
}

}  // namespace arlink::session
