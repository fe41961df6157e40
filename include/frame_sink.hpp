#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <httplib.h>
#include <opencv2/core.hpp>

#include "metrics.hpp"
#include "types.hpp"

enum class SinkSignal { None, StopRequested };

// Display surface for finished frames.
class FrameSink {
public:
  virtual ~FrameSink() = default;

  virtual void open() = 0;
  virtual SinkSignal present(const cv::Mat& frame) = 0;
  // Idempotent; safe when open() was never called or failed.
  virtual void close() = 0;
};

struct WindowSinkConfig {
  std::string title = "Press ESC to Exit";
  int exit_key = 27;  // ESC
};

// Popup window. Reports a stop request on the exit key or when the window is closed.
class WindowSink : public FrameSink {
public:
  explicit WindowSink(WindowSinkConfig cfg = {});
  ~WindowSink() override;

  void open() override;
  SinkSignal present(const cv::Mat& frame) override;
  void close() override;

private:
  WindowSinkConfig cfg_;
  bool opened_{false};
};

struct StreamSinkConfig {
  std::string host = "0.0.0.0";
  int port = 8080;  // 0 picks a free port
  int jpeg_quality = 90;
};

// Inline display: JPEG-encodes each frame and serves it over HTTP as an MJPEG stream.
class MjpegStreamSink : public FrameSink {
public:
  explicit MjpegStreamSink(StreamSinkConfig cfg = {});
  ~MjpegStreamSink() override;

  void open() override;
  SinkSignal present(const cv::Mat& frame) override;
  void close() override;

  // Source of the /stats and /metrics payloads. Set before open().
  void set_stats_provider(std::function<StatSnapshot()> provider);

  int port() const { return bound_port_; }
  uint64_t frames_published() const { return seq_.load(); }

private:
  bool wait_for_frame(uint64_t& last_seq, std::vector<uchar>& jpeg);
  void register_routes();

  StreamSinkConfig cfg_;
  httplib::Server server_;
  std::thread server_thread_;
  int bound_port_{-1};
  bool opened_{false};

  std::function<StatSnapshot()> stats_provider_;

  std::mutex frame_mu_;
  std::condition_variable frame_cv_;
  std::vector<uchar> latest_jpeg_;
  std::atomic<uint64_t> seq_{0};
  bool closing_{false};
};

struct SinkOptions {
  DisplayMode mode = DisplayMode::Popup;
  WindowSinkConfig window;
  StreamSinkConfig stream;
};

std::unique_ptr<FrameSink> createFrameSink(const SinkOptions& options);
