#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include <nlohmann/json.hpp>

enum class MediaState { Pending, CollageReady, VideoReady, Failed };
enum class ApprovalState { NotRequired, Pending, Approved, Rejected, TimedOut };
enum class LifecycleState { Idle, Triggered, CoolingDown };

const char* toString(MediaState s);
const char* toString(ApprovalState s);
const char* toString(LifecycleState s);

struct TimedBox {
    int64_t timestampMs = 0;
    cv::Rect box;
    cv::Size frameSize;   // frame the box was measured on
    float confidence = 0;
};

struct SnapshotFrame {
    int64_t timestampMs = 0;
    cv::Mat image;
};

// A sighting that reached K hits, handed from detection to the lifecycle.
struct SightingConfirmation {
    std::string cameraId;
    std::string zoneId;            // "" for the camera-wide key
    int64_t firstSeenMs = 0;
    int64_t confirmedMs = 0;
    float bestConfidence = 0;
    std::vector<TimedBox> boxes;
    std::vector<SnapshotFrame> snapshots;
};

struct EventRef {
    std::string cameraId;
    std::string eventId;
};

struct Event {
    std::string id;
    std::string cameraId;
    std::string cameraName;
    std::string zoneId;
    int64_t startMs = 0;
    int64_t endMs = 0;
    int64_t createdMs = 0;
    float confidence = 0;
    int personCount = 0;
    MediaState media = MediaState::Pending;
    ApprovalState approval = ApprovalState::NotRequired;
    bool notified = false;
    std::string collagePath;
    std::string clipPath;
    std::string previewPath;
    std::string clipSource;
    std::string failureReason;
    uint64_t configVersion = 0;

    std::vector<TimedBox> boxes;
    std::vector<SnapshotFrame> snapshots;

    EventRef ref() const { return {cameraId, id}; }
    bool terminal() const { return media == MediaState::VideoReady || media == MediaState::Failed; }
};

nlohmann::json eventToJson(const Event& ev);
std::string makeEventId(const std::string& cameraId, int64_t createdMs, uint64_t seq);
