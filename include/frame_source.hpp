#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

#include "types.hpp"

struct SourceConfig {
  std::string uri{"0"};  // device index or file/stream path
  bool flip{false};
  int fps{30};
  int skip_first_frames{0};
};

// Producer of BGR frames. next() returns nullopt once the stream is exhausted.
class FrameSource {
public:
  virtual ~FrameSource() = default;

  virtual void start() = 0;
  virtual std::optional<cv::Mat> next() = 0;
  virtual void stop() = 0;
};

// True when the identifier names a capture device rather than a path.
bool is_device_index(const std::string& uri);

class CaptureSource : public FrameSource {
public:
  explicit CaptureSource(SourceConfig cfg);
  ~CaptureSource() override;

  CaptureSource(const CaptureSource&) = delete;
  CaptureSource& operator=(const CaptureSource&) = delete;

  void start() override;
  std::optional<cv::Mat> next() override;
  void stop() override;

  bool is_open() const { return cap_.isOpened(); }
  double fps() const { return fps_; }
  uint64_t delivered() const { return delivered_; }

private:
  SourceConfig cfg_;
  cv::VideoCapture cap_;
  double fps_{0.0};
  TimePoint next_due_{};
  uint64_t delivered_{0};
  bool ended_{false};
};
