#include "motion_detector.h"
#include "zones.h"
#include "supervisor/Logger.hpp"
#include <algorithm>
#include <opencv2/imgproc.hpp>

MotionDetector::MotionDetector(const MotionSettings& cfg, std::vector<Zone> z)
    : config(cfg), zones(std::move(z)) {}

void MotionDetector::updateConfig(const MotionSettings& cfg, std::vector<Zone> z) {
    config = cfg;
    zones = std::move(z);
    masks.clear();
    workSize = cv::Size();
}

void MotionDetector::reset() {
    backgroundInit = false;
    background.release();
}

int MotionDetector::effectiveMinArea(double scale) const {
    double area = config.minArea * scale * scale * (11 - config.sensitivity) / 7.0;
    return std::max(1, (int)area);
}

void MotionDetector::rebuildMasks(const cv::Size& size) {
    masks.clear();
    for (const Zone* z : enabledZones(zones)) {
        masks.emplace_back(z, zoneMask(*z, size));
    }
    workSize = size;
}

cv::Mat MotionDetector::detectMotion(const cv::Mat& gray) {
    cv::Mat blurred, diff, thresh, bg8;
    cv::GaussianBlur(gray, blurred, cv::Size(config.blurSize, config.blurSize), 0);

    if (!backgroundInit || background.size() != blurred.size()) {
        blurred.convertTo(background, CV_32F);
        backgroundInit = true;
        return cv::Mat::zeros(gray.size(), CV_8U);
    }

    background.convertTo(bg8, CV_8U);
    cv::absdiff(blurred, bg8, diff);
    cv::threshold(diff, thresh, config.pixelThreshold, 255, cv::THRESH_BINARY);
    cv::dilate(thresh, thresh, cv::Mat(), cv::Point(-1, -1), 2);

    cv::accumulateWeighted(blurred, background, config.learningRate);
    return thresh;
}

std::vector<MotionBlob> MotionDetector::extractBlobs(const cv::Mat& mask, double scale) {
    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(mask.clone(), contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

    std::vector<MotionBlob> blobs;
    for (const auto& c : contours) {
        cv::Rect r = cv::boundingRect(c);
        if (r.area() == 0) continue;
        double inv = 1.0 / scale;
        cv::Rect src((int)(r.x * inv), (int)(r.y * inv), (int)(r.width * inv), (int)(r.height * inv));
        blobs.push_back({src, cv::contourArea(c) * inv * inv});
    }
    return blobs;
}

MotionResult MotionDetector::processFrame(const cv::Mat& frame) {
    MotionResult result;
    if (frame.empty()) return result;

    try {
        double scale = frame.cols > config.maxWidth ? (double)config.maxWidth / frame.cols : 1.0;
        cv::Mat small, gray;
        if (scale < 1.0) cv::resize(frame, small, cv::Size(), scale, scale, cv::INTER_AREA);
        else small = frame;
        if (small.channels() == 3) cv::cvtColor(small, gray, cv::COLOR_BGR2GRAY);
        else gray = small;

        if (gray.size() != workSize) {
            rebuildMasks(gray.size());
            backgroundInit = false;
        }

        cv::Mat mask = detectMotion(gray);
        result.minArea = effectiveMinArea(scale);
        result.foregroundPixels = cv::countNonZero(mask);
        if (result.foregroundPixels == 0) return result;

        result.blobs = extractBlobs(mask, scale);

        if (masks.empty()) {
            result.candidate = result.foregroundPixels >= result.minArea;
            return result;
        }

        for (const auto& [zone, zmask] : masks) {
            cv::Mat inZone;
            cv::bitwise_and(mask, zmask, inZone);
            int px = cv::countNonZero(inZone);
            result.zonePixels[zone->id] = px;
            if (px >= result.minArea) result.candidate = true;
            if (px == 0) continue;
            for (const auto& b : result.blobs) {
                cv::Rect r((int)(b.bbox.x * scale), (int)(b.bbox.y * scale),
                           std::max(1, (int)(b.bbox.width * scale)), std::max(1, (int)(b.bbox.height * scale)));
                r = clampRect(r, inZone.size());
                if (r.area() > 0 && cv::countNonZero(inZone(r)) > 0) result.zoneBlobs[zone->id].push_back(b.bbox);
            }
        }
    } catch (const cv::Exception& e) {
        logWarn("Motion", std::string("pre-filter error, passing frame through: ") + e.what());
        result = MotionResult();
        result.candidate = true;
        result.failedOpen = true;
    }
    return result;
}
