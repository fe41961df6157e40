#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <CLI/CLI.hpp>
#include <atomic>
#include <csignal>
#include <iostream>
#include <string>

#include "errors.hpp"
#include "frame_sink.hpp"
#include "frame_source.hpp"
#include "inference.hpp"
#include "pipeline.hpp"
#include "util.hpp"

namespace {

std::atomic<PipelineLoop*> g_pipeline{nullptr};

void handle_signal(int /*sig*/) {
  PipelineLoop* p = g_pipeline.load();
  if (p) p->request_stop();
}

}  // namespace

int main(int argc, char** argv) {
  CLI::App cli_app{"StyleStream-RT: Real-time neural style transfer on live video"};

  std::string cfg_path;
  cli_app.add_option("-c,--config", cfg_path, "Configuration file path")->check(CLI::ExistingFile);

  std::string source, style, model_path, device, log_level;
  bool flip = false, popup = false, inline_mode = false, show_version = false;
  int skip = -1, fps = -1, port = -1;
  cli_app.add_option("-s,--source", source, "Camera index or video file/stream path");
  cli_app.add_flag("--flip", flip, "Mirror frames horizontally");
  auto* popup_flag = cli_app.add_flag("--popup", popup, "Show results in a popup window");
  cli_app.add_flag("--inline", inline_mode, "Serve results as an MJPEG stream")
      ->excludes(popup_flag);
  cli_app.add_option("--skip", skip, "Frames to skip at stream start")->check(CLI::NonNegativeNumber);
  cli_app.add_option("--fps", fps, "Target delivery frame rate")->check(CLI::PositiveNumber);
  cli_app.add_option("--style", style, "Style model name (mosaic, candy, rain-princess, ...)");
  cli_app.add_option("--model", model_path, "Explicit ONNX model path");
  cli_app.add_option("--device", device, "DNN target (cpu, opencl, cuda, ...)");
  cli_app.add_option("--port", port, "Stream server port (inline mode)")->check(CLI::Range(0, 65535));
  cli_app.add_option("--log-level", log_level, "trace, debug, info, warn, error, off");
  cli_app.add_flag("-v,--version", show_version, "Show version information");

  try {
    cli_app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return cli_app.exit(e);
  }

  if (show_version) {
    std::cout << "StyleStream-RT v1.0.0" << std::endl;
    std::cout << "Feed-forward style transfer with OpenCV DNN" << std::endl;
    return 0;
  }

  spdlog::set_pattern("[%H:%M:%S.%e] %^[%l]%$ %v");

  AppConfig app;
  try {
    if (!cfg_path.empty()) app = load_config(cfg_path);

    if (!source.empty()) app.pipeline.source.uri = source;
    if (flip) app.pipeline.source.flip = true;
    if (popup) app.pipeline.display_mode = DisplayMode::Popup;
    if (inline_mode) app.pipeline.display_mode = DisplayMode::Inline;
    if (skip >= 0) app.pipeline.source.skip_first_frames = skip;
    if (fps > 0) app.pipeline.source.fps = fps;
    if (!style.empty()) app.model.style = style;
    if (!model_path.empty()) app.model.model_path = model_path;
    if (!device.empty()) app.model.target = device;
    if (port >= 0) app.stream.port = port;
    if (!log_level.empty()) app.log_level = log_level;
    app.pipeline.swap_rb = app.model.swap_rb;

    validate_config(app);
  } catch (const YAML::Exception& e) {
    spdlog::error("Failed to parse config {}: {}", cfg_path, e.what());
    return 1;
  } catch (const std::invalid_argument& e) {
    spdlog::error("Invalid configuration: {}", e.what());
    return 1;
  }

  spdlog::set_level(spdlog::level::from_str(app.log_level));
  spdlog::info("StyleStream-RT starting (config: {})", cfg_path.empty() ? "<defaults>" : cfg_path);

  // One-time setup: bind the model to its device before any frame is pulled.
  std::unique_ptr<InferenceInvoker> invoker;
  try {
    invoker = createInvoker(app.model);
  } catch (const PipelineError& e) {
    spdlog::error("Model setup failed: {}", e.what());
    return RunResult{RunStatus::Failed, e.kind(), e.what(), 0}.exit_code();
  } catch (const std::invalid_argument& e) {
    spdlog::error("Model setup failed: {}", e.what());
    return 1;
  }

  auto source_ptr = std::make_unique<CaptureSource>(app.pipeline.source);
  auto sink = createFrameSink(sink_options(app));
  auto* stream_sink = dynamic_cast<MjpegStreamSink*>(sink.get());

  PipelineLoop pipe(app.pipeline, std::move(source_ptr), std::move(invoker), std::move(sink));
  if (stream_sink) stream_sink->set_stats_provider([&pipe] { return pipe.stats(); });

  g_pipeline.store(&pipe);
  std::signal(SIGINT, handle_signal);
  std::signal(SIGTERM, handle_signal);

  RunResult result = pipe.run();

  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
  g_pipeline.store(nullptr);

  switch (result.status) {
    case RunStatus::Completed:
      spdlog::info("Source ended. {} frames processed.", result.frames_processed);
      break;
    case RunStatus::Cancelled:
      spdlog::info("Stopped: {} ({} frames processed)", result.message, result.frames_processed);
      break;
    case RunStatus::Failed:
      spdlog::error("Pipeline failed with {}: {}", to_string(result.fault), result.message);
      break;
  }

  spdlog::info("Shutdown complete.");
  return result.exit_code();
}
