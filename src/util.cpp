#include "util.hpp"

#include <spdlog/fmt/fmt.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <stdexcept>
#include <vector>

AppConfig load_config(const std::string& path) {
  YAML::Node y = YAML::LoadFile(path);
  AppConfig c{};

  if (y["input"]) {
    auto in = y["input"];
    if (in["source"]) c.pipeline.source.uri = in["source"].as<std::string>();
    if (in["flip"]) c.pipeline.source.flip = in["flip"].as<bool>();
    if (in["fps"]) c.pipeline.source.fps = in["fps"].as<int>();
    if (in["skip_first_frames"])
      c.pipeline.source.skip_first_frames = in["skip_first_frames"].as<int>();
  }
  if (y["pipeline"]) {
    auto p = y["pipeline"];
    if (p["downscale_threshold"])
      c.pipeline.downscale_threshold = p["downscale_threshold"].as<int>();
    if (p["perf_window"]) c.pipeline.perf_window = p["perf_window"].as<size_t>();
    if (p["summary_interval_s"])
      c.pipeline.summary_interval_s = p["summary_interval_s"].as<int>();
  }

  if (y["model"]) {
    auto m = y["model"];
    if (m["style"]) c.model.style = m["style"].as<std::string>();
    if (m["model_dir"]) c.model.model_dir = m["model_dir"].as<std::string>();
    if (m["path"]) c.model.model_path = m["path"].as<std::string>();
    if (m["backend"]) c.model.backend = m["backend"].as<std::string>();
    if (m["target"]) c.model.target = m["target"].as<std::string>();
    if (m["input_width"]) c.model.input_width = m["input_width"].as<int>();
    if (m["input_height"]) c.model.input_height = m["input_height"].as<int>();
    if (m["swap_rb"]) c.model.swap_rb = m["swap_rb"].as<bool>();
  }
  c.pipeline.swap_rb = c.model.swap_rb;

  if (y["display"]) {
    auto d = y["display"];
    if (d["mode"]) c.pipeline.display_mode = parse_display_mode(d["mode"].as<std::string>());
    if (d["window_title"]) c.window.title = d["window_title"].as<std::string>();
    if (d["host"]) c.stream.host = d["host"].as<std::string>();
    if (d["port"]) c.stream.port = d["port"].as<int>();
    if (d["jpeg_quality"]) c.stream.jpeg_quality = d["jpeg_quality"].as<int>();
  }

  if (y["logging"] && y["logging"]["level"]) c.log_level = y["logging"]["level"].as<std::string>();

  validate_config(c);
  return c;
}

void validate_config(const AppConfig& c) {
  if (c.pipeline.source.uri.empty()) throw std::invalid_argument("input.source must not be empty");
  if (c.pipeline.source.fps <= 0) throw std::invalid_argument("input.fps must be positive");
  if (c.pipeline.source.skip_first_frames < 0)
    throw std::invalid_argument("input.skip_first_frames must not be negative");
  if (c.pipeline.downscale_threshold <= 0)
    throw std::invalid_argument("pipeline.downscale_threshold must be positive");
  if (c.pipeline.perf_window == 0)
    throw std::invalid_argument("pipeline.perf_window must be positive");
  if (c.model.input_width <= 0 || c.model.input_height <= 0)
    throw std::invalid_argument("model input size must be positive");
  if (c.stream.port < 0 || c.stream.port > 65535)
    throw std::invalid_argument(fmt::format("display.port {} out of range", c.stream.port));
  if (c.stream.jpeg_quality < 0 || c.stream.jpeg_quality > 100)
    throw std::invalid_argument("display.jpeg_quality must be within [0, 100]");
  static const std::vector<std::string> levels = {"trace", "debug", "info", "warn",
                                                  "warning", "error", "critical", "off"};
  if (std::find(levels.begin(), levels.end(), c.log_level) == levels.end())
    throw std::invalid_argument(fmt::format("unknown log level '{}'", c.log_level));
}

DisplayMode parse_display_mode(const std::string& name) {
  if (name == "popup") return DisplayMode::Popup;
  if (name == "inline") return DisplayMode::Inline;
  throw std::invalid_argument(fmt::format("unknown display mode '{}'", name));
}

SinkOptions sink_options(const AppConfig& config) {
  SinkOptions o;
  o.mode = config.pipeline.display_mode;
  o.window = config.window;
  o.stream = config.stream;
  return o;
}
