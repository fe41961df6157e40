#include "postprocess.hpp"

#include <spdlog/fmt/fmt.h>

#include <vector>

#include <opencv2/imgproc.hpp>

#include "errors.hpp"

cv::Mat postprocessFrame(const cv::Mat& original, const cv::Mat& output, bool swap_rb) {
  if (original.empty()) throw InvalidFrame("original frame is empty");
  if (output.empty() || output.dims != 4) {
    throw InferenceFailure(fmt::format("model output must be a 4-D tensor, got {} dims",
                                       output.dims));
  }
  if (output.size[0] != 1 || output.size[1] != 3 || output.type() != CV_32F) {
    throw InferenceFailure(fmt::format("unexpected model output shape {}x{}x{}x{}",
                                       output.size[0], output.size[1], output.size[2],
                                       output.size[3]));
  }

  const int h = output.size[2];
  const int w = output.size[3];

  // Drop the batch axis and interleave the planes: CHW -> HWC.
  cv::Mat blob = output.isContinuous() ? output : output.clone();
  std::vector<cv::Mat> planes;
  planes.reserve(3);
  for (int c = 0; c < 3; ++c) {
    planes.emplace_back(h, w, CV_32F, const_cast<float*>(blob.ptr<float>(0, c)));
  }
  cv::Mat image;
  cv::merge(planes, image);

  cv::resize(image, image, original.size(), 0, 0, cv::INTER_CUBIC);

  cv::Mat result;
  image.convertTo(result, CV_8U);  // saturates to [0, 255]
  if (swap_rb) cv::cvtColor(result, result, cv::COLOR_RGB2BGR);
  return result;
}
