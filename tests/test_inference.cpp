#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <opencv2/dnn.hpp>
#include <opencv2/opencv.hpp>
#include "errors.hpp"
#include "inference.hpp"
#include "preprocess.hpp"

namespace fs = std::filesystem;

class ModelSetupTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = fs::temp_directory_path() / "stylestream_model_tests";
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

    fs::path test_dir;
};

TEST_F(ModelSetupTest, DefaultConfig) {
    ModelConfig config;
    EXPECT_EQ(config.style, "mosaic");
    EXPECT_EQ(config.input_width, 224);
    EXPECT_EQ(config.input_height, 224);
    EXPECT_TRUE(config.swap_rb);
    EXPECT_EQ(resolveModelPath(config), (fs::path("models") / "mosaic-9.onnx").string());
}

TEST_F(ModelSetupTest, StyleSelectsZooFile) {
    ModelConfig config;
    config.model_dir = test_dir.string();
    config.style = "Rain-Princess";

    EXPECT_EQ(resolveModelPath(config), (test_dir / "rain-princess-9.onnx").string());
}

TEST_F(ModelSetupTest, ExplicitPathWins) {
    ModelConfig config;
    config.style = "not-a-style";
    config.model_path = "/opt/models/custom.onnx";

    EXPECT_EQ(resolveModelPath(config), "/opt/models/custom.onnx");
}

TEST_F(ModelSetupTest, UnknownStyleRejected) {
    ModelConfig config;
    config.style = "picasso";
    EXPECT_THROW(resolveModelPath(config), std::invalid_argument);
}

TEST_F(ModelSetupTest, AllPublishedStylesResolve) {
    ModelConfig config;
    for (const auto& style : availableStyles()) {
        config.style = style;
        EXPECT_NO_THROW(resolveModelPath(config)) << style;
    }
    EXPECT_EQ(availableStyles().size(), 5u);
}

TEST_F(ModelSetupTest, BackendAndTargetNames) {
    EXPECT_EQ(parseBackend("default"), cv::dnn::DNN_BACKEND_DEFAULT);
    EXPECT_EQ(parseBackend("OpenCV"), cv::dnn::DNN_BACKEND_OPENCV);
    EXPECT_EQ(parseBackend("openvino"), cv::dnn::DNN_BACKEND_INFERENCE_ENGINE);
    EXPECT_EQ(parseBackend("cuda"), cv::dnn::DNN_BACKEND_CUDA);
    EXPECT_THROW(parseBackend("tensorrt"), std::invalid_argument);

    EXPECT_EQ(parseTarget("CPU"), cv::dnn::DNN_TARGET_CPU);
    EXPECT_EQ(parseTarget("gpu"), cv::dnn::DNN_TARGET_OPENCL);
    EXPECT_EQ(parseTarget("opencl_fp16"), cv::dnn::DNN_TARGET_OPENCL_FP16);
    EXPECT_EQ(parseTarget("cuda_fp16"), cv::dnn::DNN_TARGET_CUDA_FP16);
    EXPECT_THROW(parseTarget("npu"), std::invalid_argument);
}

TEST_F(ModelSetupTest, MissingModelFileFailsSetup) {
    ModelConfig config;
    config.model_dir = test_dir.string();

    EXPECT_THROW(createInvoker(config), InferenceFailure);
}

TEST_F(ModelSetupTest, CorruptModelFileFailsSetup) {
    fs::path path = test_dir / "broken.onnx";
    {
        std::ofstream out(path, std::ios::binary);
        out << "definitely not a protobuf";
    }

    ModelConfig config;
    config.model_path = path.string();

    EXPECT_THROW(createInvoker(config), InferenceFailure);
}

TEST_F(ModelSetupTest, InvalidSettingsFailBeforeLoading) {
    ModelConfig config;
    config.model_path = (test_dir / "missing.onnx").string();

    config.backend = "bogus";
    EXPECT_THROW(createInvoker(config), std::invalid_argument);

    config.backend = "default";
    config.input_width = 0;
    EXPECT_THROW(createInvoker(config), std::invalid_argument);
}

class DnnInvokerTest : public ::testing::Test {
protected:
    // Single identity layer: output equals input
    static cv::dnn::Net identityNet() {
        cv::dnn::Net net;
        cv::dnn::LayerParams params;
        net.addLayerToPrev("identity", "Identity", params);
        net.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
        net.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
        return net;
    }
};

TEST_F(DnnInvokerTest, EmptyNetworkRejected) {
    EXPECT_THROW(DnnInvoker(cv::dnn::Net(), TensorShape{}), InferenceFailure);
}

TEST_F(DnnInvokerTest, ReportsDeclaredShape) {
    DnnInvoker invoker(identityNet(), TensorShape{1, 3, 64, 48});
    EXPECT_EQ(invoker.input_shape(), (TensorShape{1, 3, 64, 48}));
}

TEST_F(DnnInvokerTest, ShapeMismatchIsInferenceFailure) {
    DnnInvoker invoker(identityNet(), TensorShape{1, 3, 32, 32});

    cv::Mat frame(48, 64, CV_8UC3, cv::Scalar::all(50));
    cv::Mat wrong = preprocessFrame(frame, 16, 16);
    EXPECT_THROW(invoker.invoke(wrong), InferenceFailure);
    EXPECT_THROW(invoker.invoke(cv::Mat(32, 32, CV_32FC3)), InferenceFailure);
}

TEST_F(DnnInvokerTest, ForwardReturnsOwnedTensor) {
    DnnInvoker invoker(identityNet(), TensorShape{1, 3, 32, 32});

    cv::Mat frame(48, 64, CV_8UC3, cv::Scalar(10, 20, 30));
    cv::Mat input = preprocessFrame(frame, 32, 32);
    cv::Mat first = invoker.invoke(input);

    ASSERT_EQ(first.dims, 4);
    EXPECT_EQ(first.size[1], 3);
    EXPECT_EQ(first.size[2], 32);
    EXPECT_EQ(first.size[3], 32);
    EXPECT_NEAR(first.ptr<float>(0, 0)[0], 30.0f, 1e-3);

    // A second call must not overwrite the first result
    cv::Mat other = preprocessFrame(cv::Mat(48, 64, CV_8UC3, cv::Scalar::all(200)), 32, 32);
    invoker.invoke(other);
    EXPECT_NEAR(first.ptr<float>(0, 0)[0], 30.0f, 1e-3);
}
