#pragma once
#include "Retention.hpp"
#include "supervisor/Config.hpp"
#include "supervisor/Heartbeat.hpp"
#include "supervisor/Process.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

class StatusBoard;

enum class RecorderState { Stopped, Recording, Restarting };
const char* toString(RecorderState s);

// Keeps one segmenting encoder process alive per camera.
class RecorderSupervisor {
public:
    using Clock = std::chrono::steady_clock;
    using CommandBuilder = std::function<std::vector<std::string>(
        const std::string& cameraId, const std::string& url, const std::string& cameraDir)>;

    RecorderSupervisor(RecorderSettings settings, RetentionManager& retention, StatusBoard* status = nullptr);
    ~RecorderSupervisor();

    void setCommandBuilder(CommandBuilder builder);
    void updateSettings(const RecorderSettings& settings);

    bool start(const std::string& cameraId, const std::string& url);
    // Blocks until the encoder is reaped.
    void stop(const std::string& cameraId);
    bool restart(const std::string& cameraId);
    void stopAll();

    bool isRecording(const std::string& cameraId);
    RecorderState state(const std::string& cameraId);
    pid_t pid(const std::string& cameraId);
    int restarts(const std::string& cameraId);

    void startMonitor();
    void stopMonitor();
    void monitorOnce(Clock::time_point now);

    std::string cameraDir(const std::string& cameraId) const;

    static std::vector<std::string> segmentCommand(const RecorderSettings& cfg, const std::string& url,
                                                   const std::string& cameraDir);

private:
    struct Handle {
        std::mutex mtx;
        std::string cameraId;
        std::string url;
        Process process;
        bool wanted = false;
        RecorderState state = RecorderState::Stopped;
        Heartbeat alive;
        Clock::time_point exitedAt;
        Clock::time_point lastRestartAt;
        bool everRestarted = false;
        int restarts = 0;
        std::string newestSegment;
    };

    std::shared_ptr<Handle> handle(const std::string& cameraId, bool create);
    bool spawnLocked(Handle& h);
    void publish(Handle& h);
    std::string newestSegmentName(const std::string& cameraId) const;

    RecorderSettings cfg;
    mutable std::mutex cfgMtx;
    RetentionManager& retention;
    StatusBoard* status;
    CommandBuilder builder;

    std::mutex registryMtx;
    std::map<std::string, std::shared_ptr<Handle>> handles;

    std::atomic<bool> monitorRunning{false};
    std::thread monitorThread;
};
