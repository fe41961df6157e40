#pragma once
#include <opencv2/core.hpp>

// Turn a 1x3xHxW float model output into an 8-bit BGR image with the size of `original`.
// `original` is only read for its dimensions.
cv::Mat postprocessFrame(const cv::Mat& original, const cv::Mat& output, bool swap_rb = true);
