#pragma once
#include <opencv2/core.hpp>
#include <string>
#include <vector>

struct Detection {
    int classId = -1;
    float confidence = 0;
    cv::Rect box;       // pixels of the frame passed to detect()
};

class ObjectDetector {
public:
    virtual ~ObjectDetector() = default;

    virtual bool ready() const = 0;

    // Person detections above `confidence`, after NMS.
    virtual std::vector<Detection> detect(const cv::Mat& frameBgr, float confidence) = 0;
};
