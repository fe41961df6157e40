#include <gtest/gtest.h>
#include <cstdio>
#include <filesystem>
#include <opencv2/opencv.hpp>
#include "errors.hpp"
#include "frame_source.hpp"

namespace fs = std::filesystem;

class FrameSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        video_path = (fs::temp_directory_path() / "stylestream_source_test.avi").string();
        written = writeClip(video_path, 6);
    }

    void TearDown() override {
        std::remove(video_path.c_str());
    }

    // Frame i: left half gray level i*40, right half solid blue.
    static bool writeClip(const std::string& path, int frames) {
        cv::VideoWriter writer(path, cv::VideoWriter::fourcc('M', 'J', 'P', 'G'), 30.0,
                               cv::Size(64, 48));
        if (!writer.isOpened()) return false;
        for (int i = 0; i < frames; ++i) {
            cv::Mat frame(48, 64, CV_8UC3, cv::Scalar::all(i * 40));
            frame(cv::Rect(32, 0, 32, 48)).setTo(cv::Scalar(255, 0, 0));
            writer.write(frame);
        }
        writer.release();
        return true;
    }

    // Needs both an MJPG writer and a backend able to read it back
    bool clipAvailable() const {
        if (!written) return false;
        cv::VideoCapture probe(video_path);
        return probe.isOpened();
    }

    std::string video_path;
    bool written{false};
};

TEST_F(FrameSourceTest, DeviceIndexDetection) {
    EXPECT_TRUE(is_device_index("0"));
    EXPECT_TRUE(is_device_index("12"));
    EXPECT_FALSE(is_device_index(""));
    EXPECT_FALSE(is_device_index("-1"));
    EXPECT_FALSE(is_device_index("video.mp4"));
    EXPECT_FALSE(is_device_index("rtsp://cam/0"));
}

TEST_F(FrameSourceTest, MissingFileIsUnavailable) {
    SourceConfig cfg;
    cfg.uri = "/nonexistent/stylestream/clip.mp4";
    CaptureSource source(cfg);

    EXPECT_THROW(source.start(), SourceUnavailable);
    EXPECT_FALSE(source.is_open());
    EXPECT_FALSE(source.next().has_value());
}

TEST_F(FrameSourceTest, StopIsIdempotent) {
    SourceConfig cfg;
    cfg.uri = video_path;
    CaptureSource source(cfg);

    EXPECT_NO_THROW(source.stop());  // never started
    EXPECT_NO_THROW(source.stop());
}

TEST_F(FrameSourceTest, DeliversAllFramesThenEnds) {
    if (!clipAvailable()) GTEST_SKIP() << "No MJPG capture support for " << video_path;

    SourceConfig cfg;
    cfg.uri = video_path;
    cfg.fps = 1000;
    CaptureSource source(cfg);
    source.start();
    ASSERT_TRUE(source.is_open());
    EXPECT_LE(source.fps(), 1000.0);

    int count = 0;
    while (auto frame = source.next()) {
        EXPECT_EQ(frame->cols, 64);
        EXPECT_EQ(frame->rows, 48);
        EXPECT_EQ(frame->type(), CV_8UC3);
        count++;
    }
    EXPECT_EQ(count, 6);
    EXPECT_EQ(source.delivered(), 6u);
    EXPECT_FALSE(source.next().has_value());  // stays ended

    source.stop();
    source.stop();
    EXPECT_FALSE(source.is_open());
}

TEST_F(FrameSourceTest, SkipsLeadingFrames) {
    if (!clipAvailable()) GTEST_SKIP() << "No MJPG capture support for " << video_path;

    SourceConfig cfg;
    cfg.uri = video_path;
    cfg.fps = 1000;
    cfg.skip_first_frames = 2;
    CaptureSource source(cfg);
    source.start();

    auto first = source.next();
    ASSERT_TRUE(first.has_value());
    // Frame 2 has left-half gray level 80
    cv::Vec3b px = first->at<cv::Vec3b>(24, 8);
    EXPECT_NEAR(px[1], 80, 12);

    int count = 1;
    while (source.next()) count++;
    EXPECT_EQ(count, 4);
}

TEST_F(FrameSourceTest, SkipBeyondLengthEndsImmediately) {
    if (!clipAvailable()) GTEST_SKIP() << "No MJPG capture support for " << video_path;

    SourceConfig cfg;
    cfg.uri = video_path;
    cfg.skip_first_frames = 50;
    CaptureSource source(cfg);
    source.start();

    EXPECT_FALSE(source.next().has_value());
}

TEST_F(FrameSourceTest, FlipMirrorsHorizontally) {
    if (!clipAvailable()) GTEST_SKIP() << "No MJPG capture support for " << video_path;

    SourceConfig cfg;
    cfg.uri = video_path;
    cfg.fps = 1000;
    cfg.flip = true;
    CaptureSource source(cfg);
    source.start();

    auto frame = source.next();
    ASSERT_TRUE(frame.has_value());
    // Blue half moved to the left
    cv::Vec3b left = frame->at<cv::Vec3b>(24, 8);
    cv::Vec3b right = frame->at<cv::Vec3b>(24, 56);
    EXPECT_GT(left[0], 200);
    EXPECT_LT(left[2], 60);
    EXPECT_LT(right[0], 60);
}
