#pragma once

#include <memory>
#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/dnn.hpp>

#include "types.hpp"

// Model setup configuration. Consumed once, before the pipeline starts.
struct ModelConfig {
    std::string style = "mosaic";
    std::string model_dir = "models";
    std::string model_path;  // overrides style/model_dir when set

    // OpenCV DNN execution settings
    std::string backend = "default";
    std::string target = "cpu";

    int input_width = 224;
    int input_height = 224;
    bool swap_rb = true;
};

// Compiled, device-bound model callable with a fixed input shape.
class InferenceInvoker {
public:
    virtual ~InferenceInvoker() = default;

    virtual cv::Mat invoke(const cv::Mat& input) = 0;
    virtual TensorShape input_shape() const = 0;
};

// cv::dnn based invoker bound to one network and one backend/target pair.
class DnnInvoker : public InferenceInvoker {
public:
    DnnInvoker(cv::dnn::Net net, TensorShape shape);

    cv::Mat invoke(const cv::Mat& input) override;
    TensorShape input_shape() const override { return shape_; }

private:
    cv::dnn::Net net_;
    TensorShape shape_;
};

// Styles published in the ONNX model zoo fast-neural-style family.
const std::vector<std::string>& availableStyles();

// Explicit model_path, or <model_dir>/<style>-9.onnx.
std::string resolveModelPath(const ModelConfig& config);

cv::dnn::Backend parseBackend(const std::string& name);
cv::dnn::Target parseTarget(const std::string& name);

// Setup phase: load the model file, bind it to the configured backend/target.
std::unique_ptr<InferenceInvoker> createInvoker(const ModelConfig& config);
