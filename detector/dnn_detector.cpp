#include "dnn_detector.h"
#include "zones.h"
#include "supervisor/Logger.hpp"
#include <opencv2/imgproc.hpp>

DnnDetector::DnnDetector(const DetectionSettings& cfg, int backend, int target) : settings(cfg) {
    if (cfg.modelPath.empty()) {
        logError("Detector", "no model_path configured");
        return;
    }
    try {
        net = cv::dnn::readNet(cfg.modelPath);
        net.setPreferableBackend(backend);
        net.setPreferableTarget(target);
        loaded = !net.empty();
        logInfo("Detector", "loaded " + cfg.modelPath + " (input " + std::to_string(cfg.inputSize) + ")");
    } catch (const cv::Exception& e) {
        logError("Detector", "cannot load " + cfg.modelPath + ": " + e.what());
    }
}

std::vector<Detection> DnnDetector::detect(const cv::Mat& frameBgr, float confidence) {
    std::vector<Detection> out;
    if (!loaded || frameBgr.empty()) return out;

    const int inputSize = settings.inputSize;
    cv::Mat output;
    try {
        cv::Mat blob = cv::dnn::blobFromImage(frameBgr, 1.0 / 255.0, cv::Size(inputSize, inputSize),
                                              cv::Scalar(), true, false);
        std::lock_guard<std::mutex> lock(mtx);
        net.setInput(blob);
        output = net.forward();
    } catch (const cv::Exception& e) {
        logError("Detector", std::string("inference failed: ") + e.what());
        return out;
    }

    // [1, rows, dims] (v5) or [1, dims, rows] (v8)
    if (output.dims != 3) return out;
    int rows = output.size[1];
    int dims = output.size[2];
    bool channelFirst = false;
    if (dims > rows) {
        std::swap(rows, dims);
        channelFirst = true;
    }
    const float* data = reinterpret_cast<const float*>(output.data);
    const bool hasObjectness = !channelFirst;   // v8 exports drop the objectness column
    const int classStart = hasObjectness ? 5 : 4;
    const int classes = dims - classStart;
    if (classes <= settings.personClassId) return out;

    const float scaleX = (float)frameBgr.cols / inputSize;
    const float scaleY = (float)frameBgr.rows / inputSize;

    std::vector<cv::Rect> boxes;
    std::vector<float> scores;
    for (int i = 0; i < rows; ++i) {
        auto item = [&](int idx) -> float {
            return channelFirst ? data[idx * rows + i] : data[i * dims + idx];
        };
        const float objectness = hasObjectness ? item(4) : 1.0f;
        const float score = objectness * item(classStart + settings.personClassId);
        if (score < confidence) continue;

        // Person must also be the best class for this row.
        bool best = true;
        for (int c = 0; c < classes && best; ++c) {
            if (c != settings.personClassId && item(classStart + c) > item(classStart + settings.personClassId)) {
                best = false;
            }
        }
        if (!best) continue;

        const float cx = item(0), cy = item(1), w = item(2), h = item(3);
        cv::Rect box((int)((cx - 0.5f * w) * scaleX), (int)((cy - 0.5f * h) * scaleY),
                     (int)(w * scaleX), (int)(h * scaleY));
        boxes.push_back(clampRect(box, frameBgr.size()));
        scores.push_back(score);
    }

    std::vector<int> keep;
    cv::dnn::NMSBoxes(boxes, scores, confidence, settings.nmsThreshold, keep);
    for (int idx : keep) {
        if (boxes[idx].area() == 0) continue;
        out.push_back({settings.personClassId, scores[idx], boxes[idx]});
    }
    return out;
}

cv::Mat enhanceThermal(const cv::Mat& frame, const ThermalSettings& cfg) {
    if (!cfg.claheEnabled || frame.empty()) return frame;
    cv::Mat gray, eq, bgr;
    if (frame.channels() == 3) cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
    else gray = frame;
    auto clahe = cv::createCLAHE(cfg.claheClipLimit, cv::Size(cfg.claheTileSize, cfg.claheTileSize));
    clahe->apply(gray, eq);
    cv::cvtColor(eq, bgr, cv::COLOR_GRAY2BGR);
    return bgr;
}

std::vector<Detection> filterDetections(const std::vector<Detection>& dets, const cv::Size& frameSize,
                                        const DetectionSettings& cfg) {
    std::vector<Detection> out;
    const double frameArea = (double)frameSize.area();
    for (const auto& d : dets) {
        if (d.box.height <= 0 || d.box.width <= 0) continue;
        double aspect = (double)d.box.width / d.box.height;
        if (aspect < cfg.aspectRatioMin || aspect > cfg.aspectRatioMax) continue;
        if (frameArea > 0 && d.box.area() / frameArea < cfg.minBoxAreaRatio) continue;
        out.push_back(d);
    }
    return out;
}
