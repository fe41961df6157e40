#include "inference.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>

#include "errors.hpp"

namespace {

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

}  // namespace

DnnInvoker::DnnInvoker(cv::dnn::Net net, TensorShape shape)
    : net_(std::move(net)), shape_(shape) {
  if (net_.empty()) {
    throw InferenceFailure("cannot bind an empty network");
  }
}

cv::Mat DnnInvoker::invoke(const cv::Mat& input) {
  if (input.dims != 4 || input.type() != CV_32F || input.size[0] != shape_.n ||
      input.size[1] != shape_.c || input.size[2] != shape_.h || input.size[3] != shape_.w) {
    throw InferenceFailure(fmt::format("input tensor does not match declared shape {}x{}x{}x{}",
                                       shape_.n, shape_.c, shape_.h, shape_.w));
  }

  try {
    net_.setInput(input);
    // forward() hands back a view of an internal buffer that the next call reuses
    return net_.forward().clone();
  } catch (const cv::Exception& e) {
    throw InferenceFailure(fmt::format("inference failed: {}", e.what()));
  }
}

const std::vector<std::string>& availableStyles() {
  static const std::vector<std::string> styles = {"mosaic", "candy", "rain-princess", "udnie",
                                                  "pointilism"};
  return styles;
}

std::string resolveModelPath(const ModelConfig& config) {
  if (!config.model_path.empty()) return config.model_path;

  const std::string style = lower(config.style);
  const auto& styles = availableStyles();
  if (std::find(styles.begin(), styles.end(), style) == styles.end()) {
    throw std::invalid_argument(fmt::format("unknown style '{}'", config.style));
  }
  return (std::filesystem::path(config.model_dir) / (style + "-9.onnx")).string();
}

cv::dnn::Backend parseBackend(const std::string& name) {
  const std::string n = lower(name);
  if (n == "default" || n == "auto") return cv::dnn::DNN_BACKEND_DEFAULT;
  if (n == "opencv") return cv::dnn::DNN_BACKEND_OPENCV;
  if (n == "openvino" || n == "inference_engine") return cv::dnn::DNN_BACKEND_INFERENCE_ENGINE;
  if (n == "cuda") return cv::dnn::DNN_BACKEND_CUDA;
  throw std::invalid_argument(fmt::format("unknown DNN backend '{}'", name));
}

cv::dnn::Target parseTarget(const std::string& name) {
  const std::string n = lower(name);
  if (n == "cpu" || n == "auto") return cv::dnn::DNN_TARGET_CPU;
  if (n == "opencl" || n == "gpu") return cv::dnn::DNN_TARGET_OPENCL;
  if (n == "opencl_fp16") return cv::dnn::DNN_TARGET_OPENCL_FP16;
  if (n == "cuda") return cv::dnn::DNN_TARGET_CUDA;
  if (n == "cuda_fp16") return cv::dnn::DNN_TARGET_CUDA_FP16;
  throw std::invalid_argument(fmt::format("unknown DNN target '{}'", name));
}

std::unique_ptr<InferenceInvoker> createInvoker(const ModelConfig& config) {
  if (config.input_width <= 0 || config.input_height <= 0) {
    throw std::invalid_argument("model input size must be positive");
  }

  const std::string path = resolveModelPath(config);
  const auto backend = parseBackend(config.backend);
  const auto target = parseTarget(config.target);

  if (!std::filesystem::exists(path)) {
    throw InferenceFailure(fmt::format("model file not found: {}", path));
  }

  cv::dnn::Net net;
  try {
    net = cv::dnn::readNet(path);
  } catch (const cv::Exception& e) {
    throw InferenceFailure(fmt::format("failed to load model {}: {}", path, e.what()));
  }
  if (net.empty()) {
    throw InferenceFailure(fmt::format("failed to load model {}", path));
  }

  net.setPreferableBackend(backend);
  net.setPreferableTarget(target);

  TensorShape shape{1, 3, config.input_height, config.input_width};
  spdlog::info("Loaded model {} (backend={}, target={}, input={}x{}x{}x{})", path,
               config.backend, config.target, shape.n, shape.c, shape.h, shape.w);

  return std::make_unique<DnnInvoker>(std::move(net), shape);
}
