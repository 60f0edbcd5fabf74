#pragma once
#include "object_detector.h"
#include "supervisor/Config.hpp"
#include <mutex>
#include <opencv2/dnn.hpp>

// YOLO (v5 / v8 export layouts) through OpenCV's DNN module.
class DnnDetector : public ObjectDetector {
public:
    DnnDetector(const DetectionSettings& cfg, int backend, int target);

    bool ready() const override { return loaded; }
    std::vector<Detection> detect(const cv::Mat& frameBgr, float confidence) override;

private:
    DetectionSettings settings;
    cv::dnn::Net net;
    bool loaded = false;
    std::mutex mtx;
};

// Thermal frames: CLAHE on luminance, returned as 3-channel BGR.
cv::Mat enhanceThermal(const cv::Mat& frame, const ThermalSettings& cfg);

// Aspect ratio (w/h) and minimum area filters.
std::vector<Detection> filterDetections(const std::vector<Detection>& dets, const cv::Size& frameSize,
                                        const DetectionSettings& cfg);
