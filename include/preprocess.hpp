#pragma once
#include <opencv2/core.hpp>

// Default bound on the longer frame edge before preprocessing.
constexpr int kDefaultDownscaleThreshold = 720;

// Convert a BGR 8-bit frame into a 1xCxHxW float blob for the style model.
// Values keep their 0-255 range. Throws InvalidFrame on empty or non 3-channel input.
cv::Mat preprocessFrame(const cv::Mat& frame, int target_h, int target_w, bool swap_rb = true);

// Uniformly shrink a frame so that its longer edge is at most max_side. Frames already
// within the limit are returned as-is.
cv::Mat downscaleToLimit(const cv::Mat& frame, int max_side = kDefaultDownscaleThreshold);
