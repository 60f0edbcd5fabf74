#pragma once
#include "supervisor/Config.hpp"
#include <algorithm>
#include <opencv2/core.hpp>
#include <vector>

inline cv::Rect clampRect(const cv::Rect& r, const cv::Size& sz) {
    int x = std::max(0, r.x);
    int y = std::max(0, r.y);
    int w = std::min(r.x + r.width, sz.width) - x;
    int h = std::min(r.y + r.height, sz.height) - y;
    return cv::Rect(x, y, std::max(0, w), std::max(0, h));
}

// Ray casting; polygon in normalized coordinates.
bool pointInPolygon(float x, float y, const std::vector<ZonePoint>& polygon);

// Feet first (a person standing in the zone), then the box centre, then a
// 3x3 sample grid needing at least two points inside.
bool boxInZone(const cv::Rect& box, const cv::Size& frameSize, const Zone& zone);

// Filled polygon mask at the given size.
cv::Mat zoneMask(const Zone& zone, const cv::Size& size);

std::vector<const Zone*> enabledZones(const std::vector<Zone>& zones);
bool zoneWantsPerson(const Zone& z);
bool zoneWantsMotion(const Zone& z);
