#pragma once
#include "events/Event.hpp"
#include <string>
#include <vector>
#include <opencv2/core.hpp>

// Indices of `want` items spread evenly over [0, count).
std::vector<size_t> pickEvenly(size_t count, size_t want);

bool encodeJPEG(const cv::Mat& bgr, std::vector<uchar>& out, int quality = 85);

// 3x2 grid of 640x480 tiles with boxes and overlays drawn in.
cv::Mat composeCollage(const std::vector<SnapshotFrame>& frames, const std::vector<TimedBox>& boxes,
                       const std::string& cameraName, float confidence, int maxFrames);

bool writeCollage(const std::string& path, const cv::Mat& collage, int quality, uint64_t minBytes,
                  std::string& error);
