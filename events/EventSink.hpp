#pragma once
#include "Event.hpp"
#include <string>

// Receives every event state change.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void publish(const Event& ev) = 0;
};

// Downstream notification (delivery itself is external).
class NotificationSink {
public:
    virtual ~NotificationSink() = default;
    virtual void notify(const Event& ev) = 0;
};

// Accept/reject decision on a finished collage. Blocking, bounded by its
// own timeout; TimedOut means "proceed ungated".
class ApprovalGate {
public:
    virtual ~ApprovalGate() = default;
    virtual ApprovalState evaluate(const Event& ev, const std::string& collagePath) = 0;
};

struct ClipOutcome {
    bool ok = false;
    std::string clipPath;
    std::string previewPath;
    std::string source;
    std::string error;
};

class MediaListener {
public:
    virtual ~MediaListener() = default;
    virtual void onCollageDone(const EventRef& ref, bool ok, const std::string& path, const std::string& error) = 0;
    virtual void onClipDone(const EventRef& ref, const ClipOutcome& outcome) = 0;
};

class MediaGenerator {
public:
    virtual ~MediaGenerator() = default;
    // False if the work could not be queued.
    virtual bool submit(const Event& ev) = 0;
};
