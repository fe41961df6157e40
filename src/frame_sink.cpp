#include "frame_sink.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <nlohmann/json.hpp>
#include <opencv2/highgui.hpp>
#include <opencv2/imgcodecs.hpp>

#include "errors.hpp"

// ---------------------------------------------------------------------------
// WindowSink

WindowSink::WindowSink(WindowSinkConfig cfg) : cfg_(std::move(cfg)) {}

WindowSink::~WindowSink() { close(); }

void WindowSink::open() {
  if (opened_) return;
  try {
    cv::namedWindow(cfg_.title, cv::WINDOW_GUI_NORMAL | cv::WINDOW_AUTOSIZE);
  } catch (const cv::Exception& e) {
    throw SinkFailure(fmt::format("cannot open window '{}': {}", cfg_.title, e.what()));
  }
  opened_ = true;
  spdlog::info("Opened display window '{}'", cfg_.title);
}

SinkSignal WindowSink::present(const cv::Mat& frame) {
  if (!opened_) throw SinkFailure("window is not open");
  if (frame.empty()) throw SinkFailure("cannot display an empty frame");

  int key = -1;
  try {
    cv::imshow(cfg_.title, frame);
    key = cv::waitKey(1);
    if (cv::getWindowProperty(cfg_.title, cv::WND_PROP_VISIBLE) < 1) {
      spdlog::info("Display window closed by user");
      return SinkSignal::StopRequested;
    }
  } catch (const cv::Exception& e) {
    throw SinkFailure(fmt::format("display failed: {}", e.what()));
  }

  if (key != -1 && (key & 0xFF) == cfg_.exit_key) {
    spdlog::info("Exit key pressed");
    return SinkSignal::StopRequested;
  }
  return SinkSignal::None;
}

void WindowSink::close() {
  if (!opened_) return;
  opened_ = false;
  try {
    cv::destroyWindow(cfg_.title);
    cv::waitKey(1);
  } catch (const cv::Exception& e) {
    spdlog::warn("Failed to destroy window '{}': {}", cfg_.title, e.what());
  }
}

// ---------------------------------------------------------------------------
// MjpegStreamSink

namespace {

const char* kIndexHtml =
    "<!DOCTYPE html><html><head><title>StyleStream-RT</title></head>"
    "<body style=\"margin:0;background:#000\">"
    "<img src=\"/stream\" style=\"display:block;margin:auto;max-width:100%\">"
    "</body></html>";

nlohmann::json to_json(const StatSnapshot& s) {
  return nlohmann::json{{"frames_total", s.frames_total}, {"window_size", s.window_size},
                        {"mean_ms", s.mean_ms},           {"fps", s.fps},
                        {"p50_ms", s.p50_ms},             {"p95_ms", s.p95_ms},
                        {"p99_ms", s.p99_ms},             {"valid", s.valid}};
}

}  // namespace

MjpegStreamSink::MjpegStreamSink(StreamSinkConfig cfg) : cfg_(std::move(cfg)) {
  register_routes();
}

MjpegStreamSink::~MjpegStreamSink() { close(); }

void MjpegStreamSink::set_stats_provider(std::function<StatSnapshot()> provider) {
  stats_provider_ = std::move(provider);
}

void MjpegStreamSink::register_routes() {
  server_.Get("/", [](const httplib::Request&, httplib::Response& res) {
    res.set_content(kIndexHtml, "text/html");
  });

  server_.Get("/healthz", [](const httplib::Request&, httplib::Response& res) {
    res.set_content("{\"status\":\"ok\"}", "application/json");
  });

  server_.Get("/frame.jpg", [this](const httplib::Request&, httplib::Response& res) {
    std::lock_guard<std::mutex> g(frame_mu_);
    if (latest_jpeg_.empty()) {
      res.status = 503;
      res.set_content("no frame yet", "text/plain");
      return;
    }
    res.set_content(reinterpret_cast<const char*>(latest_jpeg_.data()), latest_jpeg_.size(),
                    "image/jpeg");
  });

  server_.Get("/stream", [this](const httplib::Request&, httplib::Response& res) {
    res.set_chunked_content_provider(
        "multipart/x-mixed-replace; boundary=frame",
        [this, last_seq = uint64_t{0}](size_t /*offset*/, httplib::DataSink& sink) mutable {
          std::vector<uchar> jpeg;
          if (!wait_for_frame(last_seq, jpeg)) return false;
          const std::string header = fmt::format(
              "--frame\r\nContent-Type: image/jpeg\r\nContent-Length: {}\r\n\r\n", jpeg.size());
          return sink.write(header.data(), header.size()) &&
                 sink.write(reinterpret_cast<const char*>(jpeg.data()), jpeg.size()) &&
                 sink.write("\r\n", 2);
        });
  });

  server_.Get("/stats", [this](const httplib::Request&, httplib::Response& res) {
    StatSnapshot s = stats_provider_ ? stats_provider_() : StatSnapshot{};
    nlohmann::json j = to_json(s);
    j["frames_published"] = seq_.load();
    res.set_content(j.dump(2), "application/json");
  });

  server_.Get("/metrics", [this](const httplib::Request&, httplib::Response& res) {
    StatSnapshot s = stats_provider_ ? stats_provider_() : StatSnapshot{};
    res.set_content(prometheus_text(s), "text/plain; version=0.0.4");
  });
}

void MjpegStreamSink::open() {
  if (opened_) return;
  {
    std::lock_guard<std::mutex> g(frame_mu_);
    closing_ = false;
    latest_jpeg_.clear();
  }

  if (cfg_.port == 0) {
    bound_port_ = server_.bind_to_any_port(cfg_.host);
  } else {
    bound_port_ = server_.bind_to_port(cfg_.host, cfg_.port) ? cfg_.port : -1;
  }
  if (bound_port_ < 0) {
    throw SinkFailure(fmt::format("cannot bind stream server to {}:{}", cfg_.host, cfg_.port));
  }

  server_thread_ = std::thread([this] {
    if (!server_.listen_after_bind()) spdlog::warn("Stream server stopped listening");
  });
  // stop() is a no-op until the accept loop is running
  server_.wait_until_ready();
  opened_ = true;
  spdlog::info("Streaming on http://{}:{}/ (MJPEG at /stream)", cfg_.host, bound_port_);
}

SinkSignal MjpegStreamSink::present(const cv::Mat& frame) {
  if (!opened_) throw SinkFailure("stream sink is not open");
  if (frame.empty()) throw SinkFailure("cannot encode an empty frame");

  std::vector<uchar> encoded;
  try {
    if (!cv::imencode(".jpg", frame, encoded, {cv::IMWRITE_JPEG_QUALITY, cfg_.jpeg_quality})) {
      throw SinkFailure("JPEG encoding failed");
    }
  } catch (const cv::Exception& e) {
    throw SinkFailure(fmt::format("JPEG encoding failed: {}", e.what()));
  }

  {
    std::lock_guard<std::mutex> g(frame_mu_);
    latest_jpeg_.swap(encoded);
    seq_.fetch_add(1);
  }
  frame_cv_.notify_all();
  return SinkSignal::None;
}

bool MjpegStreamSink::wait_for_frame(uint64_t& last_seq, std::vector<uchar>& jpeg) {
  std::unique_lock<std::mutex> lk(frame_mu_);
  frame_cv_.wait(lk, [&] { return closing_ || (seq_.load() != last_seq && !latest_jpeg_.empty()); });
  if (closing_) return false;
  last_seq = seq_.load();
  jpeg = latest_jpeg_;
  return true;
}

void MjpegStreamSink::close() {
  if (!opened_) return;
  opened_ = false;
  {
    std::lock_guard<std::mutex> g(frame_mu_);
    closing_ = true;
  }
  frame_cv_.notify_all();
  server_.stop();
  if (server_thread_.joinable()) server_thread_.join();
  spdlog::info("Stream server on port {} stopped ({} frames published)", bound_port_,
               seq_.load());
}

// ---------------------------------------------------------------------------

std::unique_ptr<FrameSink> createFrameSink(const SinkOptions& options) {
  if (options.mode == DisplayMode::Popup) {
    return std::make_unique<WindowSink>(options.window);
  }
  return std::make_unique<MjpegStreamSink>(options.stream);
}
