#pragma once
#include <string>

#include "frame_sink.hpp"
#include "inference.hpp"
#include "pipeline.hpp"
#include "types.hpp"

struct AppConfig {
  PipelineConfig pipeline;
  ModelConfig model;
  WindowSinkConfig window;
  StreamSinkConfig stream;
  std::string log_level{"info"};
};

AppConfig load_config(const std::string& path);

// Throws std::invalid_argument on out-of-range values.
void validate_config(const AppConfig& config);

DisplayMode parse_display_mode(const std::string& name);

SinkOptions sink_options(const AppConfig& config);
