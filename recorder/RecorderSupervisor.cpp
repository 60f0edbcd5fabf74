#include "RecorderSupervisor.hpp"
#include "Segmenter.hpp"
#include "supervisor/Logger.hpp"
#include "supervisor/StatusBoard.hpp"
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

const char* toString(RecorderState s) {
    switch (s) {
        case RecorderState::Stopped: return "stopped";
        case RecorderState::Recording: return "recording";
        case RecorderState::Restarting: return "restarting";
    }
    return "stopped";
}

static int64_t wallClockMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch()).count();
}

RecorderSupervisor::RecorderSupervisor(RecorderSettings settings, RetentionManager& retentionManager,
                                       StatusBoard* statusBoard)
    : cfg(std::move(settings)), retention(retentionManager), status(statusBoard) {
    builder = [this](const std::string&, const std::string& url, const std::string& dir) {
        std::lock_guard<std::mutex> lock(cfgMtx);
        return segmentCommand(cfg, url, dir);
    };
}

RecorderSupervisor::~RecorderSupervisor() {
    stopMonitor();
    stopAll();
}

std::vector<std::string> RecorderSupervisor::segmentCommand(const RecorderSettings& c, const std::string& url,
                                                            const std::string& dir) {
    std::vector<std::string> args = {c.encoderPath, "-hide_banner", "-loglevel", "error", "-nostdin"};
    if (url.rfind("rtsp", 0) == 0) {
        args.insert(args.end(), {"-rtsp_transport", "tcp"});
    }
    args.insert(args.end(), {
        "-i", url,
        "-map", "0:v",
        "-c", "copy",
        "-f", "segment",
        "-segment_time", std::to_string(c.segmentSeconds),
        "-segment_atclocktime", "1",
        "-reset_timestamps", "1",
        "-strftime", "1",
        "-segment_format", "mp4",
        "-segment_format_options", "movflags=+frag_keyframe+empty_moov+default_base_moof",
        segmentPattern(dir),
    });
    return args;
}

void RecorderSupervisor::setCommandBuilder(CommandBuilder b) {
    builder = std::move(b);
}

void RecorderSupervisor::updateSettings(const RecorderSettings& settings) {
    std::lock_guard<std::mutex> lock(cfgMtx);
    cfg = settings;
}

std::string RecorderSupervisor::cameraDir(const std::string& cameraId) const {
    std::lock_guard<std::mutex> lock(cfgMtx);
    return cfg.root + "/" + cameraId;
}

std::shared_ptr<RecorderSupervisor::Handle> RecorderSupervisor::handle(const std::string& cameraId, bool create) {
    std::lock_guard<std::mutex> lock(registryMtx);
    auto it = handles.find(cameraId);
    if (it != handles.end()) return it->second;
    if (!create) return nullptr;
    auto h = std::make_shared<Handle>();
    h->cameraId = cameraId;
    handles[cameraId] = h;
    return h;
}

void RecorderSupervisor::publish(Handle& h) {
    if (status) status->setRecorder(h.cameraId, toString(h.state), h.process.pid, (uint64_t)h.restarts);
}

bool RecorderSupervisor::spawnLocked(Handle& h) {
    std::string dir = cameraDir(h.cameraId);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        logError("Recorder", h.cameraId + ": cannot create " + dir + ": " + ec.message());
        return false;
    }

    h.process = Process();
    h.process.name = "recorder:" + h.cameraId;
    h.process.argv = builder(h.cameraId, h.url, dir);
    h.process.logPath = dir + ".log";
    if (!h.process.start()) {
        logError("Recorder", h.cameraId + ": failed to start encoder");
        return false;
    }
    h.alive.beat();
    logInfo("Recorder", h.cameraId + ": encoder started (pid " + std::to_string(h.process.pid) + ")");
    logDebug("Recorder", "[Exec] " + h.process.commandLine());
    return true;
}

bool RecorderSupervisor::start(const std::string& cameraId, const std::string& url) {
    retention.enforceDiskLimit();

    auto h = handle(cameraId, true);
    std::lock_guard<std::mutex> lock(h->mtx);
    h->url = url;
    h->wanted = true;
    if (h->state == RecorderState::Recording && h->process.isAlive()) return true;

    if (spawnLocked(*h)) {
        h->state = RecorderState::Recording;
    } else {
        h->state = RecorderState::Restarting;
        h->exitedAt = Clock::now();
    }
    publish(*h);
    return h->state == RecorderState::Recording;
}

void RecorderSupervisor::stop(const std::string& cameraId) {
    auto h = handle(cameraId, false);
    if (!h) return;

    int timeoutMs;
    {
        std::lock_guard<std::mutex> lock(cfgMtx);
        timeoutMs = cfg.stopTimeoutMs;
    }

    std::lock_guard<std::mutex> lock(h->mtx);
    h->wanted = false;
    if (h->process.pid > 0) {
        h->process.stop(std::chrono::milliseconds(timeoutMs));
        logInfo("Recorder", cameraId + ": encoder stopped");
    }
    h->state = RecorderState::Stopped;
    publish(*h);
}

bool RecorderSupervisor::restart(const std::string& cameraId) {
    auto h = handle(cameraId, false);
    if (!h) return false;
    std::string url;
    {
        std::lock_guard<std::mutex> lock(h->mtx);
        url = h->url;
    }
    stop(cameraId);
    return start(cameraId, url);
}

void RecorderSupervisor::stopAll() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(registryMtx);
        for (auto& [id, h] : handles) ids.push_back(id);
    }
    for (const auto& id : ids) stop(id);
}

bool RecorderSupervisor::isRecording(const std::string& cameraId) {
    auto h = handle(cameraId, false);
    if (!h) return false;
    std::lock_guard<std::mutex> lock(h->mtx);
    return h->state == RecorderState::Recording && h->process.isAlive();
}

RecorderState RecorderSupervisor::state(const std::string& cameraId) {
    auto h = handle(cameraId, false);
    if (!h) return RecorderState::Stopped;
    std::lock_guard<std::mutex> lock(h->mtx);
    return h->state;
}

pid_t RecorderSupervisor::pid(const std::string& cameraId) {
    auto h = handle(cameraId, false);
    if (!h) return -1;
    std::lock_guard<std::mutex> lock(h->mtx);
    return h->process.isAlive() ? h->process.pid : -1;
}

int RecorderSupervisor::restarts(const std::string& cameraId) {
    auto h = handle(cameraId, false);
    if (!h) return 0;
    std::lock_guard<std::mutex> lock(h->mtx);
    return h->restarts;
}

std::string RecorderSupervisor::newestSegmentName(const std::string& cameraId) const {
    int segSeconds;
    {
        std::lock_guard<std::mutex> lock(cfgMtx);
        segSeconds = cfg.segmentSeconds;
    }
    auto segments = listSegments(cameraDir(cameraId), segSeconds);
    return segments.empty() ? std::string() : segments.back().path;
}

void RecorderSupervisor::monitorOnce(Clock::time_point now) {
    RecorderSettings c;
    {
        std::lock_guard<std::mutex> lock(cfgMtx);
        c = cfg;
    }

    std::vector<std::shared_ptr<Handle>> list;
    {
        std::lock_guard<std::mutex> lock(registryMtx);
        for (auto& [id, h] : handles) list.push_back(h);
    }

    bool needDiskCheck = false;
    std::vector<std::string> rolled;

    for (auto& h : list) {
        // A camera busy in start/stop is skipped this round.
        std::unique_lock<std::mutex> lock(h->mtx, std::try_to_lock);
        if (!lock.owns_lock() || !h->wanted) continue;

        if (h->state == RecorderState::Recording) {
            if (h->process.isAlive()) {
                h->alive.beat(now);
            } else {
                logWarn("Recorder", h->cameraId + ": encoder exited (code " +
                                        std::to_string(h->process.exitCode()) + ")");
                h->state = RecorderState::Restarting;
                h->exitedAt = now;
                publish(*h);
            }
        }

        if (h->state == RecorderState::Restarting) {
            bool debounced = now - h->exitedAt >= std::chrono::milliseconds(c.restartDebounceMs);
            bool cooled = !h->everRestarted ||
                          now - h->lastRestartAt >= std::chrono::milliseconds(c.restartCooldownMs);
            if (debounced && cooled) {
                lock.unlock();
                retention.enforceDiskLimit();
                lock.lock();
                if (!h->wanted || h->state != RecorderState::Restarting) continue;

                h->lastRestartAt = now;
                h->everRestarted = true;
                h->restarts++;
                if (spawnLocked(*h)) {
                    h->state = RecorderState::Recording;
                    logInfo("Recorder", h->cameraId + ": restarted (" + std::to_string(h->restarts) + ")");
                } else {
                    h->exitedAt = now;
                }
                publish(*h);
            }
            continue;
        }

        std::string newest = newestSegmentName(h->cameraId);
        if (newest != h->newestSegment) {
            h->newestSegment = newest;
            rolled.push_back(h->cameraId);
            needDiskCheck = true;
        }
    }

    int64_t wallNow = wallClockMs();
    for (const auto& id : rolled) retention.enforceRolling(id, wallNow);
    if (needDiskCheck || retention.overLimit(retention.sample())) retention.enforceDiskLimit();
}

void RecorderSupervisor::startMonitor() {
    if (monitorRunning.exchange(true)) return;
    monitorThread = std::thread([this]() {
        while (monitorRunning) {
            monitorOnce(Clock::now());
            int pollMs;
            {
                std::lock_guard<std::mutex> lock(cfgMtx);
                pollMs = cfg.pollIntervalMs;
            }
            for (int waited = 0; waited < pollMs && monitorRunning; waited += 100) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        }
    });
}

void RecorderSupervisor::stopMonitor() {
    monitorRunning = false;
    if (monitorThread.joinable()) monitorThread.join();
}
