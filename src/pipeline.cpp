#include "pipeline.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <stdexcept>

#include "errors.hpp"
#include "overlay.hpp"
#include "postprocess.hpp"

using namespace std::chrono;

PipelineLoop::PipelineLoop(PipelineConfig cfg, std::unique_ptr<FrameSource> source,
                           std::unique_ptr<InferenceInvoker> invoker,
                           std::unique_ptr<FrameSink> sink)
    : cfg_(std::move(cfg)), source_(std::move(source)), invoker_(std::move(invoker)),
      sink_(std::move(sink)), tracker_(cfg_.perf_window) {
  if (!source_ || !invoker_ || !sink_) {
    throw std::invalid_argument("pipeline requires a source, an invoker and a sink");
  }
  if (cfg_.downscale_threshold <= 0) {
    throw std::invalid_argument("downscale threshold must be positive");
  }
  input_shape_ = invoker_->input_shape();
  if (input_shape_.n != 1 || input_shape_.c != 3 || input_shape_.h <= 0 || input_shape_.w <= 0) {
    throw std::invalid_argument(fmt::format("unsupported model input shape {}x{}x{}x{}",
                                            input_shape_.n, input_shape_.c, input_shape_.h,
                                            input_shape_.w));
  }
}

RunResult PipelineLoop::run() {
  if (state_.load() != PipelineState::Idle) {
    throw std::logic_error("pipeline is already running");
  }

  // Fresh per-run state
  tracker_ = PerformanceTracker(cfg_.perf_window);
  frames_ = 0;
  stop_requested_.store(false);
  last_summary_ = Clock::now();
  {
    std::lock_guard<std::mutex> g(stat_mu_);
    history_.clear();
    last_stats_ = StatSnapshot{};
  }

  RunResult result;
  transition(PipelineState::Starting);

  StepResult outcome;
  try {
    source_->start();
  } catch (const PipelineError& e) {
    outcome = {LoopSignal::Fault, e.kind(), e.what()};
  } catch (const std::exception& e) {
    outcome = {LoopSignal::Fault, FaultKind::SourceUnavailable, e.what()};
  }
  if (outcome.signal == LoopSignal::Continue) {
    try {
      sink_->open();
    } catch (const PipelineError& e) {
      outcome = {LoopSignal::Fault, e.kind(), e.what()};
    } catch (const std::exception& e) {
      outcome = {LoopSignal::Fault, FaultKind::SinkFailure, e.what()};
    }
  }

  if (outcome.signal == LoopSignal::Continue) {
    transition(PipelineState::Running);
    spdlog::info("Pipeline running (model input {}x{}, downscale above {}px, {} mode)",
                 input_shape_.w, input_shape_.h, cfg_.downscale_threshold,
                 to_string(cfg_.display_mode));
    while (outcome.signal == LoopSignal::Continue) {
      if (stop_requested_.load()) {
        spdlog::info("Interrupted");
        outcome = {LoopSignal::UserCancel, FaultKind::None, "Interrupted"};
        break;
      }
      outcome = step();
    }
  }

  switch (outcome.signal) {
    case LoopSignal::EndOfStream:
      transition(PipelineState::Stopping);
      result.status = RunStatus::Completed;
      break;
    case LoopSignal::UserCancel:
      transition(PipelineState::Stopping);
      result.status = RunStatus::Cancelled;
      break;
    case LoopSignal::Fault:
    case LoopSignal::Continue:
      spdlog::error("{}: {}", to_string(outcome.fault), outcome.message);
      transition(PipelineState::Failed);
      result.status = RunStatus::Failed;
      result.fault = outcome.fault;
      break;
  }
  result.message = outcome.message;

  release();
  if (frames_ > 0) log_summary(true);
  transition(PipelineState::Idle);

  result.frames_processed = frames_;
  spdlog::info("Pipeline finished: {} after {} frames", to_string(result.status), frames_);
  return result;
}

StepResult PipelineLoop::step() {
  try {
    std::optional<cv::Mat> raw = source_->next();
    if (!raw) return {LoopSignal::EndOfStream, FaultKind::None, "Source ended"};

    // Bound preprocessing/inference cost on large inputs.
    cv::Mat frame = downscaleToLimit(*raw, cfg_.downscale_threshold);
    cv::Mat input = preprocessFrame(frame, input_shape_.h, input_shape_.w, cfg_.swap_rb);

    cv::Mat output;
    auto t0 = Clock::now();
    try {
      output = invoker_->invoke(input);
    } catch (const PipelineError&) {
      throw;
    } catch (const std::exception& e) {
      throw InferenceFailure(e.what());
    }
    const double elapsed = duration<double>(Clock::now() - t0).count();

    cv::Mat result = postprocessFrame(frame, output, cfg_.swap_rb);

    tracker_.record(elapsed);
    frames_++;
    StyleViz::drawTelemetry(result,
                            StyleViz::telemetryText(tracker_.meanMillis(), tracker_.fps()));
    {
      std::lock_guard<std::mutex> g(stat_mu_);
      last_stats_ = tracker_.snapshot();
    }
    log_summary(false);

    SinkSignal signal = SinkSignal::None;
    try {
      signal = sink_->present(result);
    } catch (const PipelineError&) {
      throw;
    } catch (const std::exception& e) {
      throw SinkFailure(e.what());
    }
    if (signal == SinkSignal::StopRequested) {
      return {LoopSignal::UserCancel, FaultKind::None, "Stop requested by display"};
    }
    return {};
  } catch (const PipelineError& e) {
    return {LoopSignal::Fault, e.kind(), e.what()};
  } catch (const std::exception& e) {
    // Remaining faults come from frame conversion (resize, color conversion).
    return {LoopSignal::Fault, FaultKind::InvalidFrame, e.what()};
  }
}

void PipelineLoop::transition(PipelineState next) {
  PipelineState prev = state_.exchange(next);
  {
    std::lock_guard<std::mutex> g(stat_mu_);
    history_.push_back(next);
  }
  spdlog::debug("Pipeline state {} -> {}", to_string(prev), to_string(next));
}

void PipelineLoop::release() {
  try {
    source_->stop();
  } catch (const std::exception& e) {
    spdlog::error("Failed to release frame source: {}", e.what());
  }
  try {
    sink_->close();
  } catch (const std::exception& e) {
    spdlog::error("Failed to close frame sink: {}", e.what());
  }
}

void PipelineLoop::log_summary(bool force) {
  auto now = Clock::now();
  if (!force) {
    if (cfg_.summary_interval_s <= 0) return;
    if (duration_cast<seconds>(now - last_summary_).count() < cfg_.summary_interval_s) return;
  }

  StatSnapshot s = tracker_.snapshot();
  spdlog::info("=== PERFORMANCE SUMMARY ===");
  spdlog::info("Frames processed: {}", frames_);
  spdlog::info("Mean inference time: {:.3f}ms over last {} frames", s.mean_ms, s.window_size);
  spdlog::info("Inference FPS: {:.1f}", s.fps);
  spdlog::info("Inference p50/p95/p99: {:.3f}/{:.3f}/{:.3f}ms", s.p50_ms, s.p95_ms, s.p99_ms);
  last_summary_ = now;
}

std::vector<PipelineState> PipelineLoop::state_history() const {
  std::lock_guard<std::mutex> g(stat_mu_);
  return history_;
}

StatSnapshot PipelineLoop::stats() const {
  std::lock_guard<std::mutex> g(stat_mu_);
  return last_stats_;
}
