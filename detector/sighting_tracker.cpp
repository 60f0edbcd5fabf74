#include "sighting_tracker.h"
#include <algorithm>

SightingTracker::SightingTracker(std::string camId, int confirmFrames, int maxGapFrames)
    : cameraId(std::move(camId)), k(std::max(1, confirmFrames)), g(std::max(0, maxGapFrames)) {}

void SightingTracker::setRule(int confirmFrames, int maxGapFrames) {
    k = std::max(1, confirmFrames);
    g = std::max(0, maxGapFrames);
}

int SightingTracker::hits(const std::string& key) const {
    auto it = sightings.find(key);
    return it == sightings.end() ? 0 : it->second.hits;
}

std::optional<SightingConfirmation> SightingTracker::observe(const std::string& key, const Observation& obs) {
    auto it = sightings.find(key);

    if (!obs.hit) {
        if (it == sightings.end()) return std::nullopt;
        if (++it->second.gaps > g) sightings.erase(it);
        return std::nullopt;
    }

    if (it == sightings.end()) {
        it = sightings.emplace(key, Sighting()).first;
        it->second.firstSeenMs = obs.timestampMs;
    }
    Sighting& s = it->second;
    s.hits++;
    s.gaps = 0;
    s.best = std::max(s.best, obs.confidence);
    s.boxes.insert(s.boxes.end(), obs.boxes.begin(), obs.boxes.end());
    if (!obs.frame.empty()) {
        if (s.frames.size() >= MAX_SNAPSHOTS) s.frames.erase(s.frames.begin() + 1);
        s.frames.push_back({obs.timestampMs, obs.frame});
    }

    if (s.hits < k) return std::nullopt;

    SightingConfirmation c;
    c.cameraId = cameraId;
    c.zoneId = key;
    c.firstSeenMs = s.firstSeenMs;
    c.confirmedMs = obs.timestampMs;
    c.bestConfidence = s.best;
    c.boxes = std::move(s.boxes);
    c.snapshots = std::move(s.frames);
    sightings.erase(it);
    return c;
}
