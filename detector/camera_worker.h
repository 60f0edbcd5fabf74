#pragma once
#include "frame_source.h"
#include "motion_detector.h"
#include "object_detector.h"
#include "sighting_tracker.h"
#include "stream_health.h"
#include "supervisor/Config.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

class FrameRingRegistry;
class EventLifecycleManager;
class StatusBoard;

struct Candidate {
    cv::Mat frame;
    int64_t timestampMs = 0;
};

// Single-slot mailbox: the producer overwrites, never waits.
class LatestFrameSlot {
    std::mutex mtx;
    std::condition_variable cv;
    Candidate slot;
    bool has = false;
    bool closed = false;
    uint64_t dropped = 0;

public:
    void offer(Candidate c);
    // Blocks until a frame is available; false once closed.
    bool take(Candidate& out);
    void close();
    void reopen();
    uint64_t droppedCount();
};

// Capture thread + detection thread of one camera.
class CameraWorker {
public:
    using DetectorFactory = std::function<std::unique_ptr<ObjectDetector>(const DetectionSettings&)>;

    CameraWorker(std::string cameraId, ConfigPtr config, FrameRingRegistry& rings, EventLifecycleManager& events,
                 StatusBoard* status, std::unique_ptr<FrameSource> source, DetectorFactory detectorFactory);
    ~CameraWorker();

    bool start();
    // Stops capture, lets detection finish its current frame, joins both,
    // then releases the camera's ring.
    void stop();

    // Applied once the camera has no active sighting and no event in flight.
    void applyConfig(ConfigPtr config);
    uint64_t configVersion();

    // One sampled frame through pre-filter, inference and the sighting rule.
    void processCandidate(const Candidate& c);

    const std::string& id() const { return cameraId; }

private:
    void captureLoop();
    void detectLoop();
    void maybeApplyPending();
    void rebuildPipeline(const CameraSettings& cam);
    ConfigPtr activeConfig();
    DetectionSource resolveSource(DetectionSource configured, int64_t tsMs, const DetectionSettings& d) const;
    void gateLog(const std::string& reason, const std::string& msg);

    std::string cameraId;
    FrameRingRegistry& rings;
    EventLifecycleManager& events;
    StatusBoard* status;
    std::unique_ptr<FrameSource> source;
    DetectorFactory makeDetector;

    std::mutex cfgMtx;
    ConfigPtr active;
    ConfigPtr pending;

    // Owned by the detection thread.
    std::unique_ptr<MotionDetector> motion;
    std::unique_ptr<ObjectDetector> detector;
    std::unique_ptr<SightingTracker> tracker;
    std::string modelPath;
    std::map<std::string, int64_t> gateLogAt;

    LatestFrameSlot candidates;
    std::atomic<bool> running{false};
    std::thread captureThread;
    std::thread detectThread;
};
