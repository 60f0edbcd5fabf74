#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

enum class DetectionSource { Thermal, Color, Auto };
enum class ZoneMode { Person, Motion, Both };

const char* toString(DetectionSource s);
const char* toString(ZoneMode m);

struct ZonePoint {
    float x = 0;   // normalized [0,1]
    float y = 0;
};

struct Zone {
    std::string id;
    std::string name;
    ZoneMode mode = ZoneMode::Person;
    bool enabled = true;
    std::vector<ZonePoint> polygon;
};

struct StreamSettings {
    std::string transport = "tcp";
    int openTimeoutMs = 10000;
    int readTimeoutMs = 5000;
    int staleDebounceMs = 3000;
    int reconnectCooldownMs = 8000;
    int backoffInitialMs = 1000;
    int backoffMaxMs = 30000;
    int downAfterFailures = 10;
};

struct MotionSettings {
    int sensitivity = 7;          // 1..10
    int minArea = 500;            // source-resolution pixels
    int maxWidth = 640;
    int pixelThreshold = 25;
    double learningRate = 0.01;
    int blurSize = 21;
};

struct DetectionSettings {
    std::string modelPath;
    int inputSize = 640;
    int inferenceFps = 5;
    int personClassId = 0;
    float confidenceThreshold = 0.25f;
    float thermalConfidenceThreshold = 0.35f;
    float nmsThreshold = 0.45f;
    double aspectRatioMin = 0.2;
    double aspectRatioMax = 1.2;
    double minBoxAreaRatio = 0.0005;
    int confirmFrames = 2;        // K
    int maxGapFrames = 2;         // G
    int sunriseHour = 6;
    int sunsetHour = 20;
};

struct ThermalSettings {
    bool claheEnabled = true;
    double claheClipLimit = 2.0;
    int claheTileSize = 8;
};

struct EventSettings {
    int cooldownSeconds = 30;
    double minEventDuration = 0.0;   // 0 = a confirmation is enough
    double pendingExpirySeconds = 3.0;
    double prebufferSeconds = 5.0;
    double postbufferSeconds = 5.0;
    std::string streamPath = "data/events.jsonl";
    std::string outboxPath = "data/outbox.jsonl";
    std::string dbPath = "data/events.db";
};

struct RingSettings {
    int seconds = 20;
    int outputFps = 15;
    int maxWidth = 1280;
    int maxHeight = 720;
};

struct RecorderSettings {
    bool enabled = true;
    std::string encoderPath = "ffmpeg";
    std::string root = "data/recordings";
    int segmentSeconds = 60;
    int retentionMinutes = 60;
    int pollIntervalMs = 2000;
    int restartDebounceMs = 3000;
    int restartCooldownMs = 15000;
    int stopTimeoutMs = 5000;
    int diskLimitPercent = 80;
    uint64_t maxTotalBytes = 0;   // 0 = percent only
};

struct MediaSettings {
    std::string encoderPath = "ffmpeg";
    std::string root = "data/media";
    int collageWorkers = 2;
    int clipWorkers = 1;
    int queueLimit = 32;
    uint64_t minOutputBytes = 1024;
    int encodeTimeoutSeconds = 120;
    int outputFps = 15;
    int outputWidth = 1280;
    int outputHeight = 720;
    int collageFrames = 5;
    int jpegQuality = 90;
    bool previewEnabled = true;
    int retentionDays = 7;
};

struct ApprovalSettings {
    bool enabled = false;
    std::string command;
    int timeoutSeconds = 30;
};

struct StatusSettings {
    std::string path = "data/status.json";
    int intervalMs = 2000;
};

struct LoggingSettings {
    std::string level = "info";
    std::string path;
};

struct CameraSettings {
    std::string id;
    std::string name;
    std::string restreamUrl;
    DetectionSource source = DetectionSource::Auto;
    bool enabled = true;
    std::vector<Zone> zones;
    // Resolved: global section with per-camera overrides applied.
    MotionSettings motion;
    DetectionSettings detection;
};

struct GlobalSettings {
    StreamSettings stream;
    MotionSettings motion;
    DetectionSettings detection;
    ThermalSettings thermal;
    EventSettings event;
    RingSettings ring;
    RecorderSettings recorder;
    MediaSettings media;
    ApprovalSettings approval;
    StatusSettings status;
    LoggingSettings logging;
};

struct ConfigSnapshot {
    uint64_t version = 0;
    GlobalSettings global;
    std::vector<CameraSettings> cameras;

    const CameraSettings* camera(const std::string& id) const;
};

using ConfigPtr = std::shared_ptr<const ConfigSnapshot>;

// Parses and validates a settings document. Throws ConfigError.
ConfigSnapshot parseConfig(const std::string& jsonText);
void validateGlobal(const GlobalSettings& g);
void validateCamera(const CameraSettings& c);
void validateZone(const Zone& z);

// Holds the current immutable snapshot; reload() publishes a new version.
class ConfigStore {
public:
    explicit ConfigStore(std::string path);

    // Throws ConfigError if the file is missing or invalid.
    ConfigPtr load();

    // Invalid global section -> nothing changes; an invalid camera keeps its
    // previous settings. Returns the snapshot in effect afterwards.
    ConfigPtr reload();

    ConfigPtr current() const;
    const std::string& path() const { return filePath; }

    // Same merge rules as reload() without touching the file system.
    ConfigPtr apply(const std::string& jsonText);

private:
    std::string filePath;
    mutable std::mutex mtx;
    ConfigPtr snapshot;
    uint64_t nextVersion = 1;
};
