#pragma once
#include "EventSink.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

struct StoredEvent {
    std::string id;
    std::string cameraId;
    std::string zoneId;
    int64_t startMs = 0;
    int64_t endMs = 0;
    int64_t createdMs = 0;
    double confidence = 0;
    std::string mediaState;
    std::string approval;
    std::string collagePath;
    std::string clipPath;
    std::string previewPath;
    std::string reason;
};

// Durable event table; every published state is upserted.
class EventDB : public EventSink {
    sqlite3* db = nullptr;
    std::mutex mtx;

public:
    EventDB() = default;
    ~EventDB();
    EventDB(const EventDB&) = delete;
    EventDB& operator=(const EventDB&) = delete;

    bool open(const std::string& path);
    void publish(const Event& ev) override;

    std::optional<StoredEvent> get(const std::string& id);
    std::vector<StoredEvent> byCamera(const std::string& cameraId, int64_t fromMs, int64_t toMs);
    // Creation time of the newest event of each zone of a camera.
    std::map<std::string, int64_t> lastEventTimes(const std::string& cameraId);
};
