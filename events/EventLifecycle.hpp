#pragma once
#include "Event.hpp"
#include "EventSink.hpp"
#include "supervisor/Config.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Turns confirmed sightings into events and drives each event's media and
// approval states. All state of a camera sits behind that camera's lock.
class EventLifecycleManager : public MediaListener {
public:
    EventLifecycleManager() = default;

    void addSink(EventSink* sink);
    void setNotifier(NotificationSink* sink) { notifier = sink; }
    void setMediaGenerator(MediaGenerator* gen) { media = gen; }
    void setApprovalGate(ApprovalGate* gate) { approval = gate; }

    // Returns the event created by this confirmation, if any.
    std::optional<Event> onSighting(const SightingConfirmation& s, const EventSettings& cfg,
                                    const std::string& cameraName, uint64_t configVersion);

    // Restores the cooldown of a zone from an event created before a restart.
    void seedCooldown(const std::string& cameraId, const std::string& zoneId, int64_t lastEventMs,
                      const EventSettings& cfg);

    void onCollageDone(const EventRef& ref, bool ok, const std::string& path, const std::string& error) override;
    void onClipDone(const EventRef& ref, const ClipOutcome& outcome) override;

    LifecycleState zoneState(const std::string& cameraId, const std::string& zoneId, int64_t nowMs);
    // True when the camera has no event whose media is still in flight.
    bool cameraIdle(const std::string& cameraId);
    std::optional<Event> find(const EventRef& ref);
    size_t liveCount(const std::string& cameraId);

private:
    struct ZoneBook {
        bool hasEvent = false;
        int64_t lastEventMs = 0;
        int64_t cooldownMs = 0;
        int64_t pendingStartMs = -1;
        int64_t pendingLastMs = -1;
        std::string liveEventId;
    };

    struct LiveEvent {
        Event ev;
        bool collageDone = false;
        bool clipDone = false;
        bool collageFailed = false;
    };

    struct CameraBook {
        std::mutex mtx;
        uint64_t seq = 0;
        std::map<std::string, ZoneBook> zones;
        std::map<std::string, LiveEvent> live;
    };

    std::shared_ptr<CameraBook> book(const std::string& cameraId);
    void publish(const Event& ev);
    void failMedia(const EventRef& ref, const std::string& reason);
    // Drops a finished event from memory. Caller holds the camera lock.
    void retireIfDone(CameraBook& cb, const std::string& eventId);

    std::mutex registryMtx;
    std::map<std::string, std::shared_ptr<CameraBook>> cameras;

    std::vector<EventSink*> sinks;
    NotificationSink* notifier = nullptr;
    MediaGenerator* media = nullptr;
    ApprovalGate* approval = nullptr;
};
