#pragma once
#include "supervisor/Config.hpp"
#include <map>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

struct MotionBlob {
    cv::Rect bbox;      // source frame coordinates
    double area;
};

struct MotionResult {
    bool candidate = false;
    bool failedOpen = false;     // processing error, treated as motion
    int foregroundPixels = 0;
    int minArea = 0;             // effective threshold at working resolution
    std::map<std::string, int> zonePixels;
    std::map<std::string, std::vector<cv::Rect>> zoneBlobs;
    std::vector<MotionBlob> blobs;
};

// Cheap pre-filter in front of inference: adaptive background difference on
// a downscaled grayscale frame, evaluated per enabled zone.
class MotionDetector {
public:
    MotionDetector(const MotionSettings& cfg, std::vector<Zone> zones);

    MotionResult processFrame(const cv::Mat& frame);
    void updateConfig(const MotionSettings& cfg, std::vector<Zone> zones);
    const MotionSettings& getConfig() const { return config; }
    void reset();

    int effectiveMinArea(double scale) const;

private:
    MotionSettings config;
    std::vector<Zone> zones;

    cv::Mat background;      // CV_32F accumulator
    bool backgroundInit = false;
    cv::Size workSize;
    std::vector<std::pair<const Zone*, cv::Mat>> masks;

    cv::Mat detectMotion(const cv::Mat& gray);
    std::vector<MotionBlob> extractBlobs(const cv::Mat& mask, double scale);
    void rebuildMasks(const cv::Size& size);
};
