#pragma once
#include "Config.hpp"
#include "StatusBoard.hpp"
#include "detector/camera_worker.h"
#include "events/EventLifecycle.hpp"
#include "recorder/RingBuffer.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <string>

class JsonlEventSink;
class OutboxNotifier;
class EventDB;
class CommandApprovalGate;
class RetentionManager;
class RecorderSupervisor;
class ClipExtractor;
class MediaPipeline;

// Owns every per-camera worker and the shared services behind them.
class EdgeSupervisor {
public:
    using Clock = std::chrono::steady_clock;
    using SourceFactory = std::function<std::unique_ptr<FrameSource>(const StreamSettings&)>;

    explicit EdgeSupervisor(ConfigStore& store);
    ~EdgeSupervisor();

    // Replaces the capture source and detector used for new workers.
    void setSourceFactory(SourceFactory f) { makeSource = std::move(f); }
    void setDetectorFactory(CameraWorker::DetectorFactory f) { makeDetector = std::move(f); }

    bool start();
    void stop();

    // Re-reads the settings file and hands the new snapshot to each worker.
    void reload();

    // Status document and periodic disk check. Called from the main loop.
    void tick(Clock::time_point now);

    StatusBoard& statusBoard() { return status; }
    EventLifecycleManager& lifecycle() { return events; }

private:
    void startCamera(const CameraSettings& cam);
    void stopCamera(const std::string& cameraId);

    ConfigStore& store;
    ConfigPtr cfg;

    StatusBoard status;
    FrameRingRegistry rings;
    EventLifecycleManager events;

    std::unique_ptr<JsonlEventSink> streamSink;
    std::unique_ptr<EventDB> eventDb;
    std::unique_ptr<OutboxNotifier> outbox;
    std::unique_ptr<CommandApprovalGate> approvalGate;
    std::unique_ptr<RetentionManager> retention;
    std::unique_ptr<RecorderSupervisor> recorder;
    std::unique_ptr<ClipExtractor> clips;
    std::unique_ptr<MediaPipeline> media;

    SourceFactory makeSource;
    CameraWorker::DetectorFactory makeDetector;
    std::map<std::string, std::unique_ptr<CameraWorker>> workers;

    Clock::time_point lastStatusWrite;
    Clock::time_point lastDiskCheck;
    bool started = false;
};
