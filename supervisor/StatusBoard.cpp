#include "StatusBoard.hpp"
#include "AtomicFile.hpp"
#include "Logger.hpp"
#include <ctime>
#include <filesystem>
#include <vector>
#include <nlohmann/json.hpp>

std::shared_ptr<StatusBoard::Entry> StatusBoard::entry(const std::string& cameraId) {
    std::lock_guard<std::mutex> lock(registryMtx);
    auto& e = entries[cameraId];
    if (!e) e = std::make_shared<Entry>();
    return e;
}

void StatusBoard::setStream(const std::string& cameraId, const std::string& state) {
    auto e = entry(cameraId);
    std::lock_guard<std::mutex> lock(e->mtx);
    e->status.stream = state;
}

void StatusBoard::countReconnect(const std::string& cameraId) {
    auto e = entry(cameraId);
    std::lock_guard<std::mutex> lock(e->mtx);
    e->status.reconnects++;
}

void StatusBoard::setLastFrame(const std::string& cameraId, int64_t ts) {
    auto e = entry(cameraId);
    std::lock_guard<std::mutex> lock(e->mtx);
    e->status.lastFrameMs = ts;
}

void StatusBoard::setRecorder(const std::string& cameraId, const std::string& state, pid_t pid, uint64_t restarts) {
    auto e = entry(cameraId);
    std::lock_guard<std::mutex> lock(e->mtx);
    e->status.recorder = state;
    e->status.recorderPid = pid;
    e->status.recorderRestarts = restarts;
}

void StatusBoard::setError(const std::string& cameraId, const std::string& error) {
    auto e = entry(cameraId);
    std::lock_guard<std::mutex> lock(e->mtx);
    e->status.lastError = error;
}

void StatusBoard::setConfigVersion(const std::string& cameraId, uint64_t version) {
    auto e = entry(cameraId);
    std::lock_guard<std::mutex> lock(e->mtx);
    e->status.configVersion = version;
}

void StatusBoard::setDiskPercent(int percent) {
    std::lock_guard<std::mutex> lock(registryMtx);
    diskPercent = percent;
}

void StatusBoard::remove(const std::string& cameraId) {
    std::lock_guard<std::mutex> lock(registryMtx);
    entries.erase(cameraId);
}

CameraStatus StatusBoard::get(const std::string& cameraId) {
    auto e = entry(cameraId);
    std::lock_guard<std::mutex> lock(e->mtx);
    return e->status;
}

std::string StatusBoard::toJson() {
    std::vector<std::pair<std::string, std::shared_ptr<Entry>>> copy;
    int disk;
    {
        std::lock_guard<std::mutex> lock(registryMtx);
        copy.assign(entries.begin(), entries.end());
        disk = diskPercent;
    }

    nlohmann::json doc;
    doc["ts"] = (long)time(nullptr);
    doc["disk_percent"] = disk;
    doc["cameras"] = nlohmann::json::object();
    for (auto& [id, e] : copy) {
        std::lock_guard<std::mutex> lock(e->mtx);
        const CameraStatus& s = e->status;
        doc["cameras"][id] = {
            {"stream", s.stream},
            {"recorder", s.recorder},
            {"last_frame_ts", s.lastFrameMs},
            {"reconnects", s.reconnects},
            {"recorder_restarts", s.recorderRestarts},
            {"recorder_pid", s.recorderPid},
            {"last_error", s.lastError},
            {"config_version", s.configVersion},
        };
    }
    return doc.dump();
}

bool StatusBoard::write(const std::string& path) {
    std::error_code ec;
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);
    if (!writeFileAtomic(path, toJson() + "\n")) {
        logWarn("Status", "cannot write " + path);
        return false;
    }
    return true;
}
