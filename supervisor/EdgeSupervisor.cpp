#include "EdgeSupervisor.hpp"
#include "Logger.hpp"
#include "detector/detector_factory.h"
#include "detector/ffmpeg_source.h"
#include "events/ApprovalCommand.hpp"
#include "events/EventDB.hpp"
#include "events/JsonlSink.hpp"
#include "recorder/ClipExtractor.hpp"
#include "recorder/MediaPipeline.hpp"
#include "recorder/RecorderSupervisor.hpp"
#include "recorder/Retention.hpp"
#include <set>

static const auto DISK_CHECK_INTERVAL = std::chrono::seconds(30);

EdgeSupervisor::EdgeSupervisor(ConfigStore& configStore)
    : store(configStore),
      makeSource([](const StreamSettings& s) {
          return std::unique_ptr<FrameSource>(new FfmpegSource(s.transport, s.readTimeoutMs));
      }),
      makeDetector(createDetector) {}

EdgeSupervisor::~EdgeSupervisor() {
    stop();
}

bool EdgeSupervisor::start() {
    cfg = store.current();
    if (!cfg) {
        logError("Supervisor", "no settings loaded");
        return false;
    }
    const GlobalSettings& g = cfg->global;

    streamSink = std::make_unique<JsonlEventSink>(g.event.streamPath);
    events.addSink(streamSink.get());

    eventDb = std::make_unique<EventDB>();
    if (eventDb->open(g.event.dbPath)) {
        events.addSink(eventDb.get());
        for (const auto& cam : cfg->cameras) {
            for (const auto& [zoneId, createdMs] : eventDb->lastEventTimes(cam.id)) {
                events.seedCooldown(cam.id, zoneId, createdMs, g.event);
            }
        }
    } else {
        logWarn("Supervisor", "event database unavailable, continuing with the JSON stream only");
    }

    outbox = std::make_unique<OutboxNotifier>(g.event.outboxPath);
    events.setNotifier(outbox.get());

    if (g.approval.enabled) {
        approvalGate = std::make_unique<CommandApprovalGate>(g.approval.command,
                                                             std::chrono::seconds(g.approval.timeoutSeconds));
        events.setApprovalGate(approvalGate.get());
    }

    retention = std::make_unique<RetentionManager>(g.recorder.root, g.recorder);
    retention->setMedia(g.media);
    recorder = std::make_unique<RecorderSupervisor>(g.recorder, *retention, &status);

    auto ringReader = [this](const std::string& cameraId, int64_t startMs, int64_t endMs, size_t maxFrames) {
        return rings.readRange(cameraId, startMs, endMs, maxFrames);
    };
    clips = std::make_unique<ClipExtractor>(g.media, g.recorder.root, g.recorder.segmentSeconds);
    clips->setRingReader(ringReader);
    media = std::make_unique<MediaPipeline>(g.media, *clips, ringReader);
    media->setListener(&events);
    events.setMediaGenerator(media.get());

    for (const auto& cam : cfg->cameras) {
        if (cam.enabled) startCamera(cam);
    }
    if (g.recorder.enabled) recorder->startMonitor();

    lastStatusWrite = Clock::time_point();
    lastDiskCheck = Clock::now();
    started = true;
    logInfo("Supervisor", "running " + std::to_string(workers.size()) + " camera(s), settings version " +
                              std::to_string(cfg->version));
    return true;
}

void EdgeSupervisor::startCamera(const CameraSettings& cam) {
    auto worker = std::make_unique<CameraWorker>(cam.id, cfg, rings, events, &status,
                                                 makeSource(cfg->global.stream), makeDetector);
    if (!worker->start()) {
        status.setError(cam.id, "worker start failed");
        return;
    }
    workers[cam.id] = std::move(worker);
    if (cfg->global.recorder.enabled && !recorder->start(cam.id, cam.restreamUrl)) {
        logWarn("Supervisor", cam.id + ": recorder did not start, monitor will retry");
    }
}

void EdgeSupervisor::stopCamera(const std::string& cameraId) {
    auto it = workers.find(cameraId);
    if (it != workers.end()) {
        it->second->stop();
        workers.erase(it);
    }
    recorder->stop(cameraId);
    status.remove(cameraId);
}

void EdgeSupervisor::reload() {
    if (!started) return;
    ConfigPtr next = store.reload();
    if (!next || next == cfg) {
        logInfo("Supervisor", "settings unchanged");
        return;
    }
    ConfigPtr prev = cfg;
    cfg = next;

    const GlobalSettings& g = next->global;
    Logger::instance().setLevel(parseLogLevel(g.logging.level));
    retention->updateSettings(g.recorder);
    retention->setMedia(g.media);
    recorder->updateSettings(g.recorder);

    std::set<std::string> wanted;
    for (const auto& cam : next->cameras) {
        if (!cam.enabled) continue;
        wanted.insert(cam.id);
        auto it = workers.find(cam.id);
        if (it == workers.end()) {
            startCamera(cam);
            continue;
        }
        it->second->applyConfig(next);

        const CameraSettings* old = prev->camera(cam.id);
        if (g.recorder.enabled && old && old->restreamUrl != cam.restreamUrl) {
            recorder->stop(cam.id);
            recorder->start(cam.id, cam.restreamUrl);
        }
    }

    std::vector<std::string> gone;
    for (const auto& [id, worker] : workers) {
        if (!wanted.count(id)) gone.push_back(id);
    }
    for (const auto& id : gone) {
        logInfo("Supervisor", id + ": removed from settings");
        stopCamera(id);
    }
    logInfo("Supervisor", "settings version " + std::to_string(next->version) + " published");
}

void EdgeSupervisor::tick(Clock::time_point now) {
    if (!started) return;
    const GlobalSettings& g = cfg->global;

    if (now - lastDiskCheck >= DISK_CHECK_INTERVAL) {
        lastDiskCheck = now;
        DiskUsageSample usage = retention->sample();
        status.setDiskPercent(usage.percent);
        if (retention->overLimit(usage)) {
            logWarn("Supervisor", "disk usage " + std::to_string(usage.percent) + "%, enforcing retention");
            retention->enforceDiskLimit();
        }
        retention->enforceMediaAge(std::chrono::duration_cast<std::chrono::milliseconds>(
                                       std::chrono::system_clock::now().time_since_epoch()).count());
    }

    if (now - lastStatusWrite >= std::chrono::milliseconds(g.status.intervalMs)) {
        lastStatusWrite = now;
        if (!status.write(g.status.path)) logWarn("Supervisor", "status write failed: " + g.status.path);
    }
}

void EdgeSupervisor::stop() {
    if (!started) return;
    started = false;
    logInfo("Supervisor", "shutting down");

    for (auto& [id, worker] : workers) worker->stop();
    workers.clear();

    media->shutdown();
    recorder->stopMonitor();
    recorder->stopAll();
    if (!status.write(cfg->global.status.path)) logWarn("Supervisor", "final status write failed");
    logInfo("Supervisor", "stopped");
}
