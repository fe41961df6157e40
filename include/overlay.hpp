#pragma once
#include <optional>
#include <string>

#include <opencv2/core.hpp>

// Telemetry drawing on finished frames
namespace StyleViz {
    // "Inference time: 12.3ms (81.3 FPS)"; "n/a" for undefined values.
    std::string telemetryText(std::optional<double> mean_ms, std::optional<double> fps);

    // Font scale keeps the text at a constant fraction of the frame width.
    double fontScaleFor(int frame_width);

    void drawTelemetry(cv::Mat& frame, const std::string& text);
}
