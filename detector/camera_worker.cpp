#include "camera_worker.h"
#include "dnn_detector.h"
#include "zones.h"
#include "events/EventLifecycle.hpp"
#include "recorder/RingBuffer.hpp"
#include "supervisor/Logger.hpp"
#include "supervisor/StatusBoard.hpp"
#include <algorithm>
#include <ctime>

static int64_t wallClockMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch()).count();
}

static const int64_t GATE_LOG_INTERVAL_MS = 30000;

void LatestFrameSlot::offer(Candidate c) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (closed) return;
        if (has) dropped++;
        slot = std::move(c);
        has = true;
    }
    cv.notify_one();
}

bool LatestFrameSlot::take(Candidate& out) {
    std::unique_lock<std::mutex> lock(mtx);
    cv.wait(lock, [&] { return has || closed; });
    if (closed) return false;
    out = std::move(slot);
    slot = Candidate();
    has = false;
    return true;
}

void LatestFrameSlot::close() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        closed = true;
        has = false;
        slot = Candidate();
    }
    cv.notify_all();
}

void LatestFrameSlot::reopen() {
    std::lock_guard<std::mutex> lock(mtx);
    closed = false;
}

uint64_t LatestFrameSlot::droppedCount() {
    std::lock_guard<std::mutex> lock(mtx);
    return dropped;
}

CameraWorker::CameraWorker(std::string camId, ConfigPtr config, FrameRingRegistry& ringRegistry,
                           EventLifecycleManager& lifecycle, StatusBoard* statusBoard,
                           std::unique_ptr<FrameSource> frameSource, DetectorFactory detectorFactory)
    : cameraId(std::move(camId)),
      rings(ringRegistry),
      events(lifecycle),
      status(statusBoard),
      source(std::move(frameSource)),
      makeDetector(std::move(detectorFactory)),
      active(std::move(config)) {
    if (const CameraSettings* cam = active ? active->camera(cameraId) : nullptr) {
        rebuildPipeline(*cam);
    }
}

CameraWorker::~CameraWorker() {
    stop();
}

ConfigPtr CameraWorker::activeConfig() {
    std::lock_guard<std::mutex> lock(cfgMtx);
    return active;
}

uint64_t CameraWorker::configVersion() {
    std::lock_guard<std::mutex> lock(cfgMtx);
    return active ? active->version : 0;
}

void CameraWorker::rebuildPipeline(const CameraSettings& cam) {
    if (!motion) motion = std::make_unique<MotionDetector>(cam.motion, cam.zones);
    else motion->updateConfig(cam.motion, cam.zones);

    if (!tracker) tracker = std::make_unique<SightingTracker>(cameraId, cam.detection.confirmFrames,
                                                              cam.detection.maxGapFrames);
    else tracker->setRule(cam.detection.confirmFrames, cam.detection.maxGapFrames);

    if ((!detector || cam.detection.modelPath != modelPath) && makeDetector) {
        detector = makeDetector(cam.detection);
        modelPath = cam.detection.modelPath;
    }
}

void CameraWorker::applyConfig(ConfigPtr config) {
    std::lock_guard<std::mutex> lock(cfgMtx);
    pending = std::move(config);
}

void CameraWorker::maybeApplyPending() {
    ConfigPtr next;
    {
        std::lock_guard<std::mutex> lock(cfgMtx);
        if (!pending) return;
        next = pending;
    }
    if ((tracker && !tracker->idle()) || !events.cameraIdle(cameraId)) return;

    const CameraSettings* cam = next->camera(cameraId);
    if (cam) rebuildPipeline(*cam);
    {
        std::lock_guard<std::mutex> lock(cfgMtx);
        active = next;
        if (pending == next) pending.reset();
    }
    if (status) status->setConfigVersion(cameraId, next->version);
    logInfo("Worker", cameraId + ": settings version " + std::to_string(next->version) + " in effect");
}

bool CameraWorker::start() {
    ConfigPtr cfg = activeConfig();
    const CameraSettings* cam = cfg ? cfg->camera(cameraId) : nullptr;
    if (!cam) {
        logError("Worker", cameraId + ": no settings");
        return false;
    }
    const RingSettings& r = cfg->global.ring;
    if (!rings.create(cameraId, (uint32_t)(r.seconds * r.outputFps), (uint32_t)r.maxWidth, (uint32_t)r.maxHeight)) {
        logError("Worker", cameraId + ": cannot create frame ring");
        return false;
    }
    if (status) status->setConfigVersion(cameraId, cfg->version);

    candidates.reopen();
    running = true;
    captureThread = std::thread([this]() { captureLoop(); });
    detectThread = std::thread([this]() { detectLoop(); });
    logInfo("Worker", cameraId + ": started");
    return true;
}

void CameraWorker::stop() {
    if (!running.exchange(false)) return;
    if (source) source->interrupt();
    if (captureThread.joinable()) captureThread.join();
    candidates.close();
    if (detectThread.joinable()) detectThread.join();
    if (source) source->close();
    rings.release(cameraId);
    if (status) status->setStream(cameraId, "down");
    logInfo("Worker", cameraId + ": stopped");
}

void CameraWorker::captureLoop() {
    using Clock = std::chrono::steady_clock;

    ConfigPtr cfg = activeConfig();
    StreamHealth health(cfg->global.stream);
    health.setListener([this](StreamState from, StreamState to) {
        logInfo("Capture", cameraId + ": " + toString(from) + " -> " + toString(to));
        if (status) {
            status->setStream(cameraId, toString(to));
            if (to == StreamState::Reconnecting) status->countReconnect(cameraId);
        }
    });
    if (status) status->setStream(cameraId, toString(health.state()));

    bool connected = false;
    std::string connectedUrl;
    int64_t lastSampleMs = 0;
    uint64_t frames = 0;

    while (running) {
        cfg = activeConfig();
        const CameraSettings* cam = cfg->camera(cameraId);
        if (!cam) break;
        health.updateSettings(cfg->global.stream);

        if (!connected) {
            if (!health.canAttempt(Clock::now())) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
                continue;
            }
            if (source->open(cam->restreamUrl, cfg->global.stream.openTimeoutMs)) {
                connected = true;
                connectedUrl = cam->restreamUrl;
                health.onConnected(Clock::now());
                if (status) status->setError(cameraId, "");
            } else if (running) {
                health.onConnectFailed(Clock::now());
                if (status) status->setError(cameraId, "connect failed");
                logWarn("Capture", cameraId + ": connect failed, retry in " +
                                       std::to_string(health.currentBackoffMs()) + " ms");
            }
            continue;
        }

        if (cam->restreamUrl != connectedUrl) {
            logInfo("Capture", cameraId + ": restream URL changed, reconnecting");
            source->close();
            connected = false;
            continue;
        }

        cv::Mat frame;
        if (source->read(frame) && !frame.empty()) {
            int64_t ts = wallClockMs();
            rings.write(cameraId, frame, ts);
            health.onFrame(Clock::now());
            if (status && (++frames % 25) == 1) status->setLastFrame(cameraId, ts);

            int64_t interval = 1000 / std::max(1, cam->detection.inferenceFps);
            if (ts - lastSampleMs >= interval) {
                lastSampleMs = ts;
                candidates.offer({std::move(frame), ts});
            }
        } else if (running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }

        if (health.tick(Clock::now())) {
            source->close();
            connected = false;
        }
    }
}

void CameraWorker::detectLoop() {
    Candidate c;
    while (candidates.take(c)) {
        maybeApplyPending();
        try {
            processCandidate(c);
        } catch (const std::exception& e) {
            logError("Detect", cameraId + ": frame dropped: " + e.what());
        }
    }
}

DetectionSource CameraWorker::resolveSource(DetectionSource configured, int64_t tsMs,
                                            const DetectionSettings& d) const {
    if (configured != DetectionSource::Auto) return configured;
    time_t t = (time_t)(tsMs / 1000);
    struct tm tmBuf;
    localtime_r(&t, &tmBuf);
    return (tmBuf.tm_hour >= d.sunriseHour && tmBuf.tm_hour < d.sunsetHour) ? DetectionSource::Color
                                                                            : DetectionSource::Thermal;
}

void CameraWorker::gateLog(const std::string& reason, const std::string& msg) {
    int64_t now = wallClockMs();
    auto it = gateLogAt.find(reason);
    if (it != gateLogAt.end() && now - it->second < GATE_LOG_INTERVAL_MS) return;
    gateLogAt[reason] = now;
    logInfo("Detect", cameraId + ": " + msg);
}

void CameraWorker::processCandidate(const Candidate& c) {
    ConfigPtr cfg = activeConfig();
    const CameraSettings* cam = cfg ? cfg->camera(cameraId) : nullptr;
    if (!cam || !motion || !tracker || c.frame.empty()) return;
    const DetectionSettings& det = cam->detection;

    MotionResult m = motion->processFrame(c.frame);
    std::vector<const Zone*> zones = enabledZones(cam->zones);
    bool wantsPerson = zones.empty() ||
                       std::any_of(zones.begin(), zones.end(), [](const Zone* z) { return zoneWantsPerson(*z); });

    std::vector<Detection> dets;
    if (m.candidate && wantsPerson) {
        if (detector && detector->ready()) {
            DetectionSource src = resolveSource(cam->source, c.timestampMs, det);
            float threshold = det.confidenceThreshold;
            cv::Mat input = c.frame;
            if (src == DetectionSource::Thermal) {
                threshold = std::max(threshold, det.thermalConfidenceThreshold);
                input = enhanceThermal(c.frame, cfg->global.thermal);
            }
            dets = filterDetections(detector->detect(input, threshold), c.frame.size(), det);
        } else {
            gateLog("no_model", "inference skipped, detector not ready");
        }
    } else if (!m.candidate) {
        gateLog("no_motion", "frames skipped by motion pre-filter");
    }

    auto toBoxes = [&](const std::vector<Detection>& list) {
        std::vector<TimedBox> out;
        for (const auto& d : list) out.push_back({c.timestampMs, d.box, c.frame.size(), d.confidence});
        return out;
    };
    auto bestOf = [](const std::vector<TimedBox>& boxes) {
        float best = 0;
        for (const auto& b : boxes) best = std::max(best, b.confidence);
        return best;
    };

    std::vector<std::pair<std::string, Observation>> observations;
    if (zones.empty()) {
        Observation obs;
        obs.timestampMs = c.timestampMs;
        obs.hit = m.candidate && !dets.empty();
        if (obs.hit) obs.boxes = toBoxes(dets);
        observations.emplace_back("", std::move(obs));
    } else {
        for (const Zone* z : zones) {
            std::vector<Detection> inZone;
            for (const auto& d : dets) {
                if (boxInZone(d.box, c.frame.size(), *z)) inZone.push_back(d);
            }
            bool motionOk = m.failedOpen || m.zonePixels[z->id] >= m.minArea;
            bool personOk = !inZone.empty();

            Observation obs;
            obs.timestampMs = c.timestampMs;
            switch (z->mode) {
                case ZoneMode::Person: obs.hit = personOk; break;
                case ZoneMode::Motion: obs.hit = motionOk; break;
                case ZoneMode::Both: obs.hit = personOk && motionOk; break;
            }
            if (obs.hit) {
                if (z->mode == ZoneMode::Motion) {
                    for (const auto& r : m.zoneBlobs[z->id]) {
                        obs.boxes.push_back({c.timestampMs, r, c.frame.size(), 0.f});
                    }
                } else {
                    obs.boxes = toBoxes(inZone);
                }
            }
            observations.emplace_back(z->id, std::move(obs));
        }
    }

    for (auto& [key, obs] : observations) {
        if (obs.hit) {
            obs.confidence = bestOf(obs.boxes);
            obs.frame = c.frame;
        }
        auto confirmed = tracker->observe(key, obs);
        if (confirmed) {
            events.onSighting(*confirmed, cfg->global.event, cam->name, cfg->version);
        }
    }
}
