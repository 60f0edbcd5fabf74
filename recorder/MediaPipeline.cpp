#include "MediaPipeline.hpp"
#include "Collage.hpp"
#include "supervisor/Logger.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <system_error>
#include <thread>

// Fragmented segments are flushed on keyframes; give the recorder a moment
// to write the tail of the window.
static const int64_t FLUSH_MARGIN_MS = 2000;

static int64_t wallClockMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch()).count();
}

MediaPipeline::MediaPipeline(MediaSettings settings, ClipExtractor& clipExtractor, RingReader ring)
    : cfg(std::move(settings)),
      clips(clipExtractor),
      ringReader(std::move(ring)),
      collagePool("CollagePool", cfg.collageWorkers, (size_t)cfg.queueLimit),
      clipPool("ClipPool", cfg.clipWorkers, (size_t)cfg.queueLimit) {}

MediaPipeline::~MediaPipeline() {
    shutdown();
}

void MediaPipeline::shutdown() {
    stopping = true;
    collagePool.shutdown();
    clipPool.shutdown();
}

std::string MediaPipeline::eventDir(const std::string& eventId) const {
    return cfg.root + "/" + eventId;
}

bool MediaPipeline::submit(const Event& ev) {
    std::error_code ec;
    std::filesystem::create_directories(eventDir(ev.id), ec);
    if (ec) {
        logError("Media", ev.id + ": cannot create " + eventDir(ev.id) + ": " + ec.message());
        return false;
    }
    if (!collagePool.submit([this, ev]() { runCollage(ev); })) return false;
    if (!clipPool.submit([this, ev]() { runClip(ev); })) {
        if (listener) {
            ClipOutcome outcome;
            outcome.error = "queue_full";
            listener->onClipDone(ev.ref(), outcome);
        }
    }
    return true;
}

void MediaPipeline::runCollage(const Event& ev) {
    std::vector<SnapshotFrame> frames;
    if (ringReader) {
        RingReadResult r = ringReader(ev.cameraId, ev.startMs, std::min(ev.endMs, wallClockMs()),
                                      (size_t)cfg.collageFrames);
        for (auto& f : r.frames) frames.push_back({f.timestampMs, std::move(f.image)});
    }
    if (frames.empty()) frames = ev.snapshots;

    std::string path = eventDir(ev.id) + "/collage.jpg";
    std::string error;
    bool ok = false;
    if (frames.empty()) {
        error = "no frames";
    } else {
        cv::Mat collage = composeCollage(frames, ev.boxes, ev.cameraName, ev.confidence, cfg.collageFrames);
        ok = writeCollage(path, collage, cfg.jpegQuality, cfg.minOutputBytes, error);
    }
    if (listener) listener->onCollageDone(ev.ref(), ok, ok ? path : std::string(), error);
}

bool MediaPipeline::waitForWindowEnd(int64_t endMs) {
    while (!stopping && wallClockMs() < endMs + FLUSH_MARGIN_MS) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    return !stopping;
}

void MediaPipeline::runClip(const Event& ev) {
    if (!waitForWindowEnd(ev.endMs)) {
        logInfo("Media", ev.id + ": shutting down before window end, extracting what exists");
    }

    cv::Mat still = ev.snapshots.empty() ? cv::Mat() : ev.snapshots.back().image;
    std::string clipPath = eventDir(ev.id) + "/clip.mp4";
    ClipResult r = clips.extract(ev.cameraId, ev.startMs, ev.endMs, still, clipPath);

    ClipOutcome outcome;
    outcome.ok = r.ok;
    outcome.source = toString(r.source);
    outcome.error = r.error;
    if (r.ok) {
        outcome.clipPath = clipPath;
        if (cfg.previewEnabled) {
            std::string previewPath = eventDir(ev.id) + "/preview.gif";
            EncodeResult p = clips.preview(clipPath, previewPath);
            if (p.ok) outcome.previewPath = previewPath;
            else logWarn("Media", ev.id + ": preview failed: " + p.error);
        }
    }
    if (listener) listener->onClipDone(ev.ref(), outcome);
}
