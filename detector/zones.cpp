#include "zones.h"
#include <cmath>
#include <opencv2/imgproc.hpp>

bool pointInPolygon(float x, float y, const std::vector<ZonePoint>& polygon) {
    bool inside = false;
    size_t n = polygon.size();
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        const ZonePoint& a = polygon[i];
        const ZonePoint& b = polygon[j];
        if ((a.y > y) != (b.y > y) && x < (b.x - a.x) * (y - a.y) / (b.y - a.y) + a.x) {
            inside = !inside;
        }
    }
    return inside;
}

bool boxInZone(const cv::Rect& box, const cv::Size& frameSize, const Zone& zone) {
    if (zone.polygon.size() < 3 || frameSize.width <= 0 || frameSize.height <= 0) return false;
    const float w = (float)frameSize.width;
    const float h = (float)frameSize.height;
    const float x1 = box.x / w, y1 = box.y / h;
    const float x2 = (box.x + box.width) / w, y2 = (box.y + box.height) / h;
    const float bw = x2 - x1, bh = y2 - y1;

    const float priority[][2] = {
        {x1 + bw * 0.5f, y2},            // foot centre
        {x1 + bw * 0.25f, y2},           // left foot
        {x1 + bw * 0.75f, y2},           // right foot
        {x1 + bw * 0.5f, y1 + bh * 0.5f},
    };
    for (const auto& p : priority) {
        if (pointInPolygon(p[0], p[1], zone.polygon)) return true;
    }

    int inside = 0;
    for (float fy : {0.25f, 0.5f, 0.75f}) {
        for (float fx : {0.25f, 0.5f, 0.75f}) {
            if (pointInPolygon(x1 + bw * fx, y1 + bh * fy, zone.polygon) && ++inside >= 2) return true;
        }
    }
    return false;
}

cv::Mat zoneMask(const Zone& zone, const cv::Size& size) {
    cv::Mat mask = cv::Mat::zeros(size, CV_8U);
    std::vector<cv::Point> pts;
    for (const auto& p : zone.polygon) {
        pts.emplace_back((int)std::lround(p.x * (size.width - 1)), (int)std::lround(p.y * (size.height - 1)));
    }
    if (pts.size() >= 3) {
        std::vector<std::vector<cv::Point>> polys = {pts};
        cv::fillPoly(mask, polys, cv::Scalar(255));
    }
    return mask;
}

std::vector<const Zone*> enabledZones(const std::vector<Zone>& zones) {
    std::vector<const Zone*> out;
    for (const auto& z : zones) {
        if (z.enabled && z.polygon.size() >= 3) out.push_back(&z);
    }
    return out;
}

bool zoneWantsPerson(const Zone& z) {
    return z.mode == ZoneMode::Person || z.mode == ZoneMode::Both;
}

bool zoneWantsMotion(const Zone& z) {
    return z.mode == ZoneMode::Motion || z.mode == ZoneMode::Both;
}
