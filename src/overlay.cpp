#include "overlay.hpp"

#include <spdlog/fmt/fmt.h>

#include <opencv2/imgproc.hpp>

namespace StyleViz {

std::string telemetryText(std::optional<double> mean_ms, std::optional<double> fps) {
  const std::string ms = mean_ms ? fmt::format("{:.1f}ms", *mean_ms) : std::string("n/a");
  const std::string rate = fps ? fmt::format("{:.1f} FPS", *fps) : std::string("n/a FPS");
  return fmt::format("Inference time: {} ({})", ms, rate);
}

double fontScaleFor(int frame_width) { return static_cast<double>(frame_width) / 1000.0; }

void drawTelemetry(cv::Mat& frame, const std::string& text) {
  if (frame.empty()) return;
  cv::putText(frame, text, cv::Point(20, 40), cv::FONT_HERSHEY_COMPLEX,
              fontScaleFor(frame.cols), cv::Scalar(0, 0, 255), 1, cv::LINE_AA);
}

}  // namespace StyleViz
