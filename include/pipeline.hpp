#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

#include "frame_sink.hpp"
#include "frame_source.hpp"
#include "inference.hpp"
#include "metrics.hpp"
#include "preprocess.hpp"
#include "types.hpp"

struct PipelineConfig {
  SourceConfig source;
  DisplayMode display_mode{DisplayMode::Popup};
  int downscale_threshold{kDefaultDownscaleThreshold};
  size_t perf_window{PerformanceTracker::kDefaultCapacity};
  bool swap_rb{true};
  int summary_interval_s{30};
};

// Single-threaded frame loop: source -> preprocess -> invoke -> postprocess -> sink.
class PipelineLoop {
public:
  PipelineLoop(PipelineConfig cfg, std::unique_ptr<FrameSource> source,
               std::unique_ptr<InferenceInvoker> invoker, std::unique_ptr<FrameSink> sink);

  // Blocks until end of stream, a stop request or a fatal fault. Source and sink are
  // released exactly once before returning.
  RunResult run();

  // Cooperative stop, observed at the next iteration boundary. Async-signal-safe.
  void request_stop() { stop_requested_.store(true); }

  PipelineState state() const { return state_.load(); }
  std::vector<PipelineState> state_history() const;
  StatSnapshot stats() const;
  const PipelineConfig& config() const { return cfg_; }

private:
  StepResult step();
  void transition(PipelineState next);
  void release();
  void log_summary(bool force);

  PipelineConfig cfg_;
  std::unique_ptr<FrameSource> source_;
  std::unique_ptr<InferenceInvoker> invoker_;
  std::unique_ptr<FrameSink> sink_;
  TensorShape input_shape_;

  PerformanceTracker tracker_;
  uint64_t frames_{0};
  TimePoint last_summary_{};

  std::atomic<bool> stop_requested_{false};
  std::atomic<PipelineState> state_{PipelineState::Idle};

  mutable std::mutex stat_mu_;
  StatSnapshot last_stats_{};
  std::vector<PipelineState> history_;
};
