#pragma once
#include "events/Event.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

struct Observation {
    bool hit = false;
    int64_t timestampMs = 0;
    float confidence = 0;
    std::vector<TimedBox> boxes;
    cv::Mat frame;       // kept as a snapshot on hits
};

// Temporal consistency per key (zone id, or "" camera-wide): K hits confirm,
// more than G consecutive misses discard.
class SightingTracker {
public:
    SightingTracker(std::string cameraId, int confirmFrames, int maxGapFrames);

    void setRule(int confirmFrames, int maxGapFrames);

    std::optional<SightingConfirmation> observe(const std::string& key, const Observation& obs);

    bool active(const std::string& key) const { return sightings.count(key) > 0; }
    bool idle() const { return sightings.empty(); }
    int hits(const std::string& key) const;
    void reset() { sightings.clear(); }

private:
    struct Sighting {
        int hits = 0;
        int gaps = 0;
        int64_t firstSeenMs = 0;
        float best = 0;
        std::vector<TimedBox> boxes;
        std::vector<SnapshotFrame> frames;
    };

    static const size_t MAX_SNAPSHOTS = 8;

    std::string cameraId;
    int k;
    int g;
    std::map<std::string, Sighting> sightings;
};
