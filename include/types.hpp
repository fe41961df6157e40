#pragma once
#include <chrono>
#include <cstdint>
#include <string>

using Clock = std::chrono::steady_clock;
using TimePoint = std::chrono::time_point<Clock>;

// NCHW shape of the model input, fixed once the model is bound.
struct TensorShape {
  int n{1};
  int c{3};
  int h{224};
  int w{224};
};

inline bool operator==(const TensorShape& a, const TensorShape& b) {
  return a.n == b.n && a.c == b.c && a.h == b.h && a.w == b.w;
}
inline bool operator!=(const TensorShape& a, const TensorShape& b) { return !(a == b); }

enum class DisplayMode { Popup, Inline };

enum class PipelineState { Idle, Starting, Running, Stopping, Failed };

enum class FaultKind { None, SourceUnavailable, InvalidFrame, InferenceFailure, SinkFailure };

// Outcome of one loop iteration.
enum class LoopSignal { Continue, EndOfStream, UserCancel, Fault };

struct StepResult {
  LoopSignal signal{LoopSignal::Continue};
  FaultKind fault{FaultKind::None};
  std::string message;
};

enum class RunStatus { Completed, Cancelled, Failed };

struct RunResult {
  RunStatus status{RunStatus::Completed};
  FaultKind fault{FaultKind::None};
  std::string message;
  uint64_t frames_processed{0};

  int exit_code() const {
    if (status != RunStatus::Failed) return 0;
    switch (fault) {
      case FaultKind::SourceUnavailable: return 2;
      case FaultKind::InvalidFrame: return 3;
      case FaultKind::InferenceFailure: return 4;
      case FaultKind::SinkFailure: return 5;
      case FaultKind::None: break;
    }
    return 1;
  }
};

inline const char* to_string(PipelineState s) {
  switch (s) {
    case PipelineState::Idle: return "Idle";
    case PipelineState::Starting: return "Starting";
    case PipelineState::Running: return "Running";
    case PipelineState::Stopping: return "Stopping";
    case PipelineState::Failed: return "Failed";
  }
  return "Unknown";
}

inline const char* to_string(FaultKind k) {
  switch (k) {
    case FaultKind::None: return "None";
    case FaultKind::SourceUnavailable: return "SourceUnavailable";
    case FaultKind::InvalidFrame: return "InvalidFrame";
    case FaultKind::InferenceFailure: return "InferenceFailure";
    case FaultKind::SinkFailure: return "SinkFailure";
  }
  return "Unknown";
}

inline const char* to_string(RunStatus s) {
  switch (s) {
    case RunStatus::Completed: return "Completed";
    case RunStatus::Cancelled: return "Cancelled";
    case RunStatus::Failed: return "Failed";
  }
  return "Unknown";
}

inline const char* to_string(DisplayMode m) {
  return m == DisplayMode::Popup ? "popup" : "inline";
}
