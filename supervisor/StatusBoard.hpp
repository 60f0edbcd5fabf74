#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <sys/types.h>

struct CameraStatus {
    std::string stream = "connecting";
    std::string recorder = "stopped";
    int64_t lastFrameMs = 0;
    uint64_t reconnects = 0;
    uint64_t recorderRestarts = 0;
    pid_t recorderPid = -1;
    std::string lastError;
    uint64_t configVersion = 0;
};

// Aggregated per-camera state, rewritten atomically as a JSON document.
// Each camera has its own lock; the registry lock only guards the map.
class StatusBoard {
    struct Entry {
        std::mutex mtx;
        CameraStatus status;
    };

    mutable std::mutex registryMtx;
    std::map<std::string, std::shared_ptr<Entry>> entries;
    int diskPercent = -1;

    std::shared_ptr<Entry> entry(const std::string& cameraId);

public:
    void setStream(const std::string& cameraId, const std::string& state);
    void countReconnect(const std::string& cameraId);
    void setLastFrame(const std::string& cameraId, int64_t ts);
    void setRecorder(const std::string& cameraId, const std::string& state, pid_t pid, uint64_t restarts);
    void setError(const std::string& cameraId, const std::string& error);
    void setConfigVersion(const std::string& cameraId, uint64_t version);
    void setDiskPercent(int percent);
    void remove(const std::string& cameraId);

    CameraStatus get(const std::string& cameraId);
    std::string toJson();
    bool write(const std::string& path);
};
