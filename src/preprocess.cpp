#include "preprocess.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <stdexcept>

#include <opencv2/dnn.hpp>
#include <opencv2/imgproc.hpp>

#include "errors.hpp"

namespace {

void validateFrame(const cv::Mat& frame) {
  if (frame.empty() || frame.rows <= 0 || frame.cols <= 0) {
    throw InvalidFrame("frame has zero-sized dimensions");
  }
  if (frame.channels() != 3) {
    throw InvalidFrame(fmt::format("expected 3 channels, got {}", frame.channels()));
  }
}

}  // namespace

cv::Mat preprocessFrame(const cv::Mat& frame, int target_h, int target_w, bool swap_rb) {
  validateFrame(frame);
  if (target_h <= 0 || target_w <= 0) {
    throw std::invalid_argument(
        fmt::format("invalid model input size {}x{}", target_w, target_h));
  }

  cv::Mat image;
  frame.convertTo(image, CV_32F);
  if (swap_rb) cv::cvtColor(image, image, cv::COLOR_BGR2RGB);
  cv::resize(image, image, cv::Size(target_w, target_h), 0, 0, cv::INTER_AREA);

  // HWC -> 1xCxHxW, no scaling, no mean subtraction.
  return cv::dnn::blobFromImage(image, 1.0, cv::Size(), cv::Scalar(), false, false, CV_32F);
}

cv::Mat downscaleToLimit(const cv::Mat& frame, int max_side) {
  if (frame.empty()) throw InvalidFrame("cannot downscale an empty frame");
  if (max_side <= 0) throw std::invalid_argument("downscale threshold must be positive");

  const int longest = std::max(frame.rows, frame.cols);
  if (longest <= max_side) return frame;

  const double scale = static_cast<double>(max_side) / static_cast<double>(longest);
  cv::Size dsize;
  if (frame.cols >= frame.rows) {
    dsize = cv::Size(max_side, std::max(1, cvRound(frame.rows * scale)));
  } else {
    dsize = cv::Size(std::max(1, cvRound(frame.cols * scale)), max_side);
  }

  cv::Mat resized;
  cv::resize(frame, resized, dsize, 0, 0, cv::INTER_AREA);
  return resized;
}
