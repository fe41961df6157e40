#include "frame_source.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <thread>

#include "errors.hpp"

using namespace std::chrono;

bool is_device_index(const std::string& uri) {
  return !uri.empty() &&
         std::all_of(uri.begin(), uri.end(), [](unsigned char c) { return std::isdigit(c); });
}

CaptureSource::CaptureSource(SourceConfig cfg) : cfg_(std::move(cfg)) {}

CaptureSource::~CaptureSource() { stop(); }

void CaptureSource::start() {
  if (cap_.isOpened()) return;

  const bool camera = is_device_index(cfg_.uri);
  bool opened = false;
  try {
    opened = camera ? cap_.open(std::stoi(cfg_.uri)) : cap_.open(cfg_.uri);
  } catch (const cv::Exception& e) {
    spdlog::error("Capture backend error while opening '{}': {}", cfg_.uri, e.what());
    opened = false;
  }
  if (!opened || !cap_.isOpened()) {
    cap_.release();
    throw SourceUnavailable(fmt::format("Cannot open {} {}", camera ? "camera" : "video",
                                        cfg_.uri));
  }

  if (camera && cfg_.fps > 0) cap_.set(cv::CAP_PROP_FPS, cfg_.fps);

  // Never deliver faster than the source itself produces.
  double input_fps = cap_.get(cv::CAP_PROP_FPS);
  fps_ = cfg_.fps > 0 ? static_cast<double>(cfg_.fps) : 0.0;
  if (input_fps > 0.0 && (fps_ <= 0.0 || input_fps < fps_)) fps_ = input_fps;

  int skipped = 0;
  for (; skipped < cfg_.skip_first_frames; ++skipped) {
    if (!cap_.grab()) break;
  }
  if (skipped < cfg_.skip_first_frames) {
    spdlog::warn("Source '{}' ended while skipping ({} of {} frames)", cfg_.uri, skipped,
                 cfg_.skip_first_frames);
  }

  delivered_ = 0;
  ended_ = false;
  next_due_ = Clock::now();

  spdlog::info("Opened {} '{}' ({}x{} @ ~{:.1f} fps, skipped {} frames{})",
               camera ? "camera" : "video", cfg_.uri,
               static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_WIDTH)),
               static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_HEIGHT)), fps_, skipped,
               cfg_.flip ? ", flipped" : "");
}

std::optional<cv::Mat> CaptureSource::next() {
  if (!cap_.isOpened() || ended_) return std::nullopt;

  if (fps_ > 0.0) {
    auto now = Clock::now();
    if (now < next_due_) std::this_thread::sleep_until(next_due_);
    next_due_ = std::max(now, next_due_) +
                duration_cast<Clock::duration>(duration<double>(1.0 / fps_));
  }

  cv::Mat frame;
  try {
    if (!cap_.read(frame)) frame.release();
  } catch (const cv::Exception& e) {
    throw SourceUnavailable(fmt::format("Capture read failed on '{}': {}", cfg_.uri, e.what()));
  }

  if (frame.empty()) {
    ended_ = true;
    spdlog::info("Source ended after {} frames", delivered_);
    return std::nullopt;
  }

  if (cfg_.flip) cv::flip(frame, frame, 1);
  delivered_++;
  return frame;
}

void CaptureSource::stop() {
  if (cap_.isOpened()) {
    cap_.release();
    spdlog::debug("Released capture '{}'", cfg_.uri);
  }
}
