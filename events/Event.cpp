#include "Event.hpp"
#include <ctime>

const char* toString(MediaState s) {
    switch (s) {
        case MediaState::Pending: return "pending";
        case MediaState::CollageReady: return "collage_ready";
        case MediaState::VideoReady: return "video_ready";
        case MediaState::Failed: return "failed";
    }
    return "pending";
}

const char* toString(ApprovalState s) {
    switch (s) {
        case ApprovalState::NotRequired: return "not_required";
        case ApprovalState::Pending: return "pending";
        case ApprovalState::Approved: return "approved";
        case ApprovalState::Rejected: return "rejected";
        case ApprovalState::TimedOut: return "timed_out";
    }
    return "not_required";
}

const char* toString(LifecycleState s) {
    switch (s) {
        case LifecycleState::Idle: return "idle";
        case LifecycleState::Triggered: return "triggered";
        case LifecycleState::CoolingDown: return "cooling_down";
    }
    return "idle";
}

nlohmann::json eventToJson(const Event& ev) {
    nlohmann::json boxes = nlohmann::json::array();
    for (const auto& b : ev.boxes) {
        boxes.push_back({{"ts", b.timestampMs},
                         {"bbox", {b.box.x, b.box.y, b.box.width, b.box.height}},
                         {"confidence", b.confidence}});
    }
    return {
        {"id", ev.id},
        {"camera_id", ev.cameraId},
        {"camera_name", ev.cameraName},
        {"zone_id", ev.zoneId},
        {"start_ts", ev.startMs},
        {"end_ts", ev.endMs},
        {"created_ts", ev.createdMs},
        {"confidence", ev.confidence},
        {"person_count", ev.personCount},
        {"media_state", toString(ev.media)},
        {"approval", toString(ev.approval)},
        {"notified", ev.notified},
        {"collage", ev.collagePath},
        {"clip", ev.clipPath},
        {"preview", ev.previewPath},
        {"clip_source", ev.clipSource},
        {"reason", ev.failureReason},
        {"config_version", ev.configVersion},
        {"detections", boxes},
    };
}

std::string makeEventId(const std::string& cameraId, int64_t createdMs, uint64_t seq) {
    time_t t = (time_t)(createdMs / 1000);
    struct tm tmBuf;
    localtime_r(&t, &tmBuf);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y%m%d-%H%M%S", &tmBuf);
    return cameraId + "-" + buf + "-" + std::to_string(seq);
}
