#include "EventLifecycle.hpp"
#include "supervisor/Logger.hpp"
#include <algorithm>

void EventLifecycleManager::addSink(EventSink* sink) {
    if (sink) sinks.push_back(sink);
}

std::shared_ptr<EventLifecycleManager::CameraBook> EventLifecycleManager::book(const std::string& cameraId) {
    std::lock_guard<std::mutex> lock(registryMtx);
    auto& cb = cameras[cameraId];
    if (!cb) cb = std::make_shared<CameraBook>();
    return cb;
}

void EventLifecycleManager::publish(const Event& ev) {
    for (auto* s : sinks) s->publish(ev);
}

void EventLifecycleManager::seedCooldown(const std::string& cameraId, const std::string& zoneId,
                                         int64_t lastEventMs, const EventSettings& cfg) {
    auto cb = book(cameraId);
    std::lock_guard<std::mutex> lock(cb->mtx);
    ZoneBook& zone = cb->zones[zoneId];
    if (zone.hasEvent && zone.lastEventMs >= lastEventMs) return;
    zone.hasEvent = true;
    zone.lastEventMs = lastEventMs;
    zone.cooldownMs = (int64_t)cfg.cooldownSeconds * 1000;
}

std::optional<Event> EventLifecycleManager::onSighting(const SightingConfirmation& s, const EventSettings& cfg,
                                                       const std::string& cameraName, uint64_t configVersion) {
    auto cb = book(s.cameraId);
    Event ev;
    {
        std::lock_guard<std::mutex> lock(cb->mtx);
        ZoneBook& zone = cb->zones[s.zoneId];
        const int64_t now = s.confirmedMs;
        const int64_t cooldownMs = (int64_t)cfg.cooldownSeconds * 1000;

        if (zone.hasEvent && now - zone.lastEventMs < cooldownMs) {
            logDebug("Events", s.cameraId + "/" + (s.zoneId.empty() ? "*" : s.zoneId) +
                                   ": confirmation suppressed by cooldown");
            return std::nullopt;
        }

        const int64_t expiryMs = (int64_t)(cfg.pendingExpirySeconds * 1000);
        if (zone.pendingStartMs < 0 || now - zone.pendingLastMs > expiryMs) {
            zone.pendingStartMs = s.firstSeenMs;
        }
        zone.pendingLastMs = now;
        if (now - zone.pendingStartMs < (int64_t)(cfg.minEventDuration * 1000)) {
            return std::nullopt;
        }
        const int64_t firstSeen = std::min(zone.pendingStartMs, s.firstSeenMs);
        zone.pendingStartMs = -1;
        zone.pendingLastMs = -1;

        ev.cameraId = s.cameraId;
        ev.cameraName = cameraName;
        ev.zoneId = s.zoneId;
        ev.createdMs = now;
        ev.id = makeEventId(s.cameraId, now, ++cb->seq);
        ev.startMs = firstSeen - (int64_t)(cfg.prebufferSeconds * 1000);
        ev.endMs = now + (int64_t)(cfg.postbufferSeconds * 1000);
        ev.confidence = s.bestConfidence;
        ev.configVersion = configVersion;
        ev.snapshots = s.snapshots;
        for (const auto& b : s.boxes) {
            if (b.timestampMs >= ev.startMs && b.timestampMs <= ev.endMs) ev.boxes.push_back(b);
        }
        std::map<int64_t, int> perFrame;
        for (const auto& b : ev.boxes) perFrame[b.timestampMs]++;
        for (const auto& [ts, n] : perFrame) ev.personCount = std::max(ev.personCount, n);

        zone.hasEvent = true;
        zone.lastEventMs = now;
        zone.cooldownMs = cooldownMs;

        if (ev.boxes.empty()) {
            ev.media = MediaState::Failed;
            ev.failureReason = "no_person_detections";
        } else {
            ev.media = MediaState::Pending;
            ev.approval = approval ? ApprovalState::Pending : ApprovalState::NotRequired;
            zone.liveEventId = ev.id;
            cb->live[ev.id].ev = ev;
        }
    }

    logInfo("Events", ev.id + " created (zone '" + ev.zoneId + "', confidence " +
                          std::to_string(ev.confidence) + ", " + std::to_string(ev.boxes.size()) + " boxes)");
    publish(ev);

    if (ev.media == MediaState::Failed) {
        logInfo("Events", ev.id + ": media skipped, no person detections in window");
        return ev;
    }
    if (!media || !media->submit(ev)) {
        failMedia(ev.ref(), media ? "queue_full" : "no_media_generator");
    }
    return ev;
}

void EventLifecycleManager::failMedia(const EventRef& ref, const std::string& reason) {
    auto cb = book(ref.cameraId);
    Event copy;
    {
        std::lock_guard<std::mutex> lock(cb->mtx);
        auto it = cb->live.find(ref.eventId);
        if (it == cb->live.end()) return;
        it->second.ev.media = MediaState::Failed;
        it->second.ev.failureReason = reason;
        it->second.ev.approval = ApprovalState::NotRequired;
        it->second.collageDone = it->second.clipDone = true;
        copy = it->second.ev;
        retireIfDone(*cb, ref.eventId);
    }
    logWarn("Events", ref.eventId + ": media failed (" + reason + ")");
    publish(copy);
}

void EventLifecycleManager::retireIfDone(CameraBook& cb, const std::string& eventId) {
    auto it = cb.live.find(eventId);
    if (it == cb.live.end()) return;
    const LiveEvent& le = it->second;
    if (le.collageDone && le.clipDone && le.ev.approval != ApprovalState::Pending) {
        for (auto& [zid, zone] : cb.zones) {
            if (zone.liveEventId == eventId) zone.liveEventId.clear();
        }
        cb.live.erase(it);
    }
}

void EventLifecycleManager::onCollageDone(const EventRef& ref, bool ok, const std::string& path,
                                          const std::string& error) {
    auto cb = book(ref.cameraId);
    Event copy;
    bool gate = false;
    bool notifyNow = false;
    {
        std::lock_guard<std::mutex> lock(cb->mtx);
        auto it = cb->live.find(ref.eventId);
        if (it == cb->live.end()) return;
        LiveEvent& le = it->second;
        le.collageDone = true;
        if (ok) {
            le.ev.collagePath = path;
            if (le.ev.media == MediaState::Pending) le.ev.media = MediaState::CollageReady;
            gate = approval && le.ev.approval == ApprovalState::Pending;
        } else {
            le.collageFailed = true;
            if (le.ev.failureReason.empty()) le.ev.failureReason = "collage: " + error;
            if (le.ev.media == MediaState::VideoReady) le.ev.media = MediaState::Failed;
            // Nothing to gate on.
            if (le.ev.approval == ApprovalState::Pending) le.ev.approval = ApprovalState::NotRequired;
            if (le.clipDone && !le.ev.notified) {
                le.ev.notified = true;
                notifyNow = true;
            }
        }
        copy = le.ev;
        if (!ok) retireIfDone(*cb, ref.eventId);
    }
    publish(copy);
    if (!ok) {
        logWarn("Events", ref.eventId + ": collage failed: " + error);
        if (notifyNow && notifier) notifier->notify(copy);
        return;
    }

    ApprovalState decision = ApprovalState::NotRequired;
    if (gate) {
        decision = approval->evaluate(copy, path);
        logInfo("Events", ref.eventId + ": approval " + toString(decision));
    }

    bool notify = false;
    {
        std::lock_guard<std::mutex> lock(cb->mtx);
        auto it = cb->live.find(ref.eventId);
        if (it == cb->live.end()) return;
        Event& ev = it->second.ev;
        if (gate) ev.approval = decision;
        if (ev.approval != ApprovalState::Rejected && !ev.notified) {
            ev.notified = true;
            notify = true;
        }
        copy = ev;
        retireIfDone(*cb, ref.eventId);
    }
    if (gate || notify) publish(copy);
    if (notify && notifier) notifier->notify(copy);
}

void EventLifecycleManager::onClipDone(const EventRef& ref, const ClipOutcome& outcome) {
    auto cb = book(ref.cameraId);
    Event copy;
    bool notify = false;
    {
        std::lock_guard<std::mutex> lock(cb->mtx);
        auto it = cb->live.find(ref.eventId);
        if (it == cb->live.end()) return;
        LiveEvent& le = it->second;
        Event& ev = le.ev;
        le.clipDone = true;
        ev.clipSource = outcome.source;
        if (outcome.ok) {
            ev.clipPath = outcome.clipPath;
            ev.previewPath = outcome.previewPath;
        }
        if (outcome.ok && !le.collageFailed) {
            ev.media = MediaState::VideoReady;
        } else {
            ev.media = MediaState::Failed;
            if (!outcome.ok) ev.failureReason = "clip: " + outcome.error;
        }
        // Collage never arrived (or failed): notify at terminal state instead.
        if (le.collageDone && !ev.notified && ev.approval != ApprovalState::Rejected &&
            ev.approval != ApprovalState::Pending && le.collageFailed) {
            ev.notified = true;
            notify = true;
        }
        copy = ev;
        retireIfDone(*cb, ref.eventId);
    }
    logInfo("Events", ref.eventId + ": media " + toString(copy.media) +
                          (copy.clipSource.empty() ? "" : " (clip from " + copy.clipSource + ")"));
    publish(copy);
    if (notify && notifier) notifier->notify(copy);
}

LifecycleState EventLifecycleManager::zoneState(const std::string& cameraId, const std::string& zoneId,
                                                int64_t nowMs) {
    auto cb = book(cameraId);
    std::lock_guard<std::mutex> lock(cb->mtx);
    auto it = cb->zones.find(zoneId);
    if (it == cb->zones.end() || !it->second.hasEvent) return LifecycleState::Idle;
    const ZoneBook& z = it->second;
    if (!z.liveEventId.empty()) {
        auto le = cb->live.find(z.liveEventId);
        if (le != cb->live.end() && !le->second.ev.terminal()) return LifecycleState::Triggered;
    }
    if (nowMs - z.lastEventMs < z.cooldownMs) return LifecycleState::CoolingDown;
    return LifecycleState::Idle;
}

bool EventLifecycleManager::cameraIdle(const std::string& cameraId) {
    auto cb = book(cameraId);
    std::lock_guard<std::mutex> lock(cb->mtx);
    return cb->live.empty();
}

std::optional<Event> EventLifecycleManager::find(const EventRef& ref) {
    auto cb = book(ref.cameraId);
    std::lock_guard<std::mutex> lock(cb->mtx);
    auto it = cb->live.find(ref.eventId);
    if (it == cb->live.end()) return std::nullopt;
    return it->second.ev;
}

size_t EventLifecycleManager::liveCount(const std::string& cameraId) {
    auto cb = book(cameraId);
    std::lock_guard<std::mutex> lock(cb->mtx);
    return cb->live.size();
}
