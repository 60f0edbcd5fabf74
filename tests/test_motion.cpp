#include "detector/motion_detector.h"
#include <gtest/gtest.h>
#include <opencv2/imgproc.hpp>

namespace {

cv::Mat blank(int w = 320, int h = 240) {
    return cv::Mat(h, w, CV_8UC3, cv::Scalar::all(0));
}

cv::Mat withSquare(const cv::Rect& r, int w = 320, int h = 240) {
    cv::Mat m = blank(w, h);
    cv::rectangle(m, r, cv::Scalar::all(255), cv::FILLED);
    return m;
}

MotionSettings settings() {
    MotionSettings s;
    s.minArea = 500;
    s.sensitivity = 7;
    s.maxWidth = 640;
    return s;
}

Zone leftHalf() {
    Zone z;
    z.id = "left";
    z.mode = ZoneMode::Motion;
    z.polygon = {{0.f, 0.f}, {0.5f, 0.f}, {0.5f, 1.f}, {0.f, 1.f}};
    return z;
}

}

TEST(MotionDetector, FirstFrameOnlySeedsBackground) {
    MotionDetector md(settings(), {});
    MotionResult r = md.processFrame(withSquare(cv::Rect(100, 100, 60, 60)));
    EXPECT_FALSE(r.candidate);
    EXPECT_FALSE(r.failedOpen);
}

TEST(MotionDetector, StaticSceneIsNotACandidate) {
    MotionDetector md(settings(), {});
    md.processFrame(blank());
    MotionResult r = md.processFrame(blank());
    EXPECT_FALSE(r.candidate);
    EXPECT_EQ(r.foregroundPixels, 0);
}

TEST(MotionDetector, NewObjectIsACandidate) {
    MotionDetector md(settings(), {});
    md.processFrame(blank());
    MotionResult r = md.processFrame(withSquare(cv::Rect(100, 80, 60, 60)));
    EXPECT_TRUE(r.candidate);
    ASSERT_FALSE(r.blobs.empty());
    const cv::Rect& b = r.blobs[0].bbox;
    EXPECT_TRUE(b.contains(cv::Point(130, 110)));
}

TEST(MotionDetector, SmallChangeBelowMinimumArea) {
    MotionSettings s = settings();
    s.minArea = 5000;
    MotionDetector md(s, {});
    md.processFrame(blank());
    MotionResult r = md.processFrame(withSquare(cv::Rect(150, 110, 4, 4)));
    EXPECT_FALSE(r.candidate);
}

TEST(MotionDetector, MotionOutsideZonesIsIgnored) {
    MotionDetector md(settings(), {leftHalf()});
    md.processFrame(blank());
    MotionResult r = md.processFrame(withSquare(cv::Rect(230, 80, 60, 60)));
    EXPECT_FALSE(r.candidate);
    EXPECT_GT(r.foregroundPixels, 0);
    EXPECT_EQ(r.zonePixels["left"], 0);
    EXPECT_TRUE(r.zoneBlobs["left"].empty());
}

TEST(MotionDetector, MotionInsideZoneReportsBlobs) {
    MotionDetector md(settings(), {leftHalf()});
    md.processFrame(blank());
    MotionResult r = md.processFrame(withSquare(cv::Rect(40, 80, 60, 60)));
    EXPECT_TRUE(r.candidate);
    EXPECT_GE(r.zonePixels["left"], r.minArea);
    EXPECT_EQ(r.zoneBlobs["left"].size(), 1u);
}

TEST(MotionDetector, BlobsAreInSourceCoordinates) {
    MotionDetector md(settings(), {});
    md.processFrame(blank(1280, 720));
    MotionResult r = md.processFrame(withSquare(cv::Rect(800, 300, 160, 160), 1280, 720));
    EXPECT_TRUE(r.candidate);
    ASSERT_FALSE(r.blobs.empty());
    EXPECT_TRUE(r.blobs[0].bbox.contains(cv::Point(880, 380)));
}

TEST(MotionDetector, MinimumAreaScalesWithSensitivityAndResolution) {
    MotionDetector md(settings(), {});
    EXPECT_EQ(md.effectiveMinArea(1.0), 285);
    EXPECT_EQ(md.effectiveMinArea(0.5), 71);

    MotionSettings s = settings();
    s.sensitivity = 10;
    MotionDetector sensitive(s, {});
    EXPECT_EQ(sensitive.effectiveMinArea(1.0), 71);
}
