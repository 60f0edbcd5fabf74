#include "Collage.hpp"
#include "supervisor/AtomicFile.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

static const int TILE_W = 640;
static const int TILE_H = 480;
static const int GRID_COLS = 3;
static const int GRID_ROWS = 2;
static const int64_t BOX_MATCH_MS = 750;

std::vector<size_t> pickEvenly(size_t count, size_t want) {
    std::vector<size_t> out;
    if (count == 0 || want == 0) return out;
    if (count <= want) {
        for (size_t i = 0; i < count; i++) out.push_back(i);
        return out;
    }
    if (want == 1) return {count / 2};
    for (size_t i = 0; i < want; i++) {
        out.push_back((size_t)std::llround((double)i * (count - 1) / (want - 1)));
    }
    return out;
}

bool encodeJPEG(const cv::Mat& bgr, std::vector<uchar>& out, int quality) {
    if (bgr.empty()) return false;
    std::vector<int> params = {
        cv::IMWRITE_JPEG_QUALITY, std::clamp(quality, 50, 95)
    };
    return cv::imencode(".jpg", bgr, out, params);
}

static std::string clockText(int64_t ms) {
    time_t t = (time_t)(ms / 1000);
    struct tm tmBuf;
    localtime_r(&t, &tmBuf);
    char buf[32];
    strftime(buf, sizeof(buf), "%H:%M:%S", &tmBuf);
    return buf;
}

static void label(cv::Mat& img, const std::string& text, cv::Point org) {
    int baseline = 0;
    cv::Size sz = cv::getTextSize(text, cv::FONT_HERSHEY_SIMPLEX, 0.6, 2, &baseline);
    cv::rectangle(img, cv::Rect(org.x - 4, org.y - sz.height - 4, sz.width + 8, sz.height + baseline + 8),
                  cv::Scalar(0, 0, 0), cv::FILLED);
    cv::putText(img, text, org, cv::FONT_HERSHEY_SIMPLEX, 0.6, cv::Scalar(255, 255, 255), 2);
}

cv::Mat composeCollage(const std::vector<SnapshotFrame>& frames, const std::vector<TimedBox>& boxes,
                       const std::string& cameraName, float confidence, int maxFrames) {
    cv::Mat canvas(TILE_H * GRID_ROWS, TILE_W * GRID_COLS, CV_8UC3, cv::Scalar(0, 0, 0));
    auto picks = pickEvenly(frames.size(), (size_t)std::min(maxFrames, GRID_COLS * GRID_ROWS));

    for (size_t n = 0; n < picks.size(); n++) {
        const SnapshotFrame& f = frames[picks[n]];
        if (f.image.empty()) continue;

        cv::Mat tile;
        cv::resize(f.image, tile, cv::Size(TILE_W, TILE_H));
        if (tile.channels() == 1) cv::cvtColor(tile, tile, cv::COLOR_GRAY2BGR);

        // Nearest detection in time, if close enough.
        const TimedBox* best = nullptr;
        int64_t bestDist = BOX_MATCH_MS + 1;
        for (const auto& b : boxes) {
            int64_t d = std::llabs(b.timestampMs - f.timestampMs);
            if (d < bestDist) {
                bestDist = d;
                best = &b;
            }
        }
        if (best) {
            for (const auto& b : boxes) {
                if (b.timestampMs != best->timestampMs) continue;
                cv::Size ref = b.frameSize.area() > 0 ? b.frameSize : f.image.size();
                double sx = (double)TILE_W / ref.width;
                double sy = (double)TILE_H / ref.height;
                cv::Rect r((int)(b.box.x * sx), (int)(b.box.y * sy), (int)(b.box.width * sx), (int)(b.box.height * sy));
                cv::rectangle(tile, r & cv::Rect(0, 0, TILE_W, TILE_H), cv::Scalar(0, 0, 255), 2);
            }
        }

        label(tile, "Frame " + std::to_string(n + 1) + "/" + std::to_string(picks.size()), cv::Point(10, 28));
        label(tile, clockText(f.timestampMs), cv::Point(TILE_W - 110, 28));
        label(tile, cameraName, cv::Point(10, TILE_H - 14));
        char conf[32];
        snprintf(conf, sizeof(conf), "%.0f%%", (best ? best->confidence : confidence) * 100.0);
        label(tile, conf, cv::Point(TILE_W - 70, TILE_H - 14));

        int col = (int)n % GRID_COLS;
        int row = (int)n / GRID_COLS;
        tile.copyTo(canvas(cv::Rect(col * TILE_W, row * TILE_H, TILE_W, TILE_H)));
    }
    return canvas;
}

bool writeCollage(const std::string& path, const cv::Mat& collage, int quality, uint64_t minBytes,
                  std::string& error) {
    std::vector<uchar> jpeg;
    if (!encodeJPEG(collage, jpeg, quality)) {
        error = "jpeg encoding failed";
        return false;
    }
    return writeFileAtomic(path, jpeg.data(), jpeg.size(), minBytes, error);
}
