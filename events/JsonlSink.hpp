#pragma once
#include "EventSink.hpp"
#include <mutex>
#include <string>

// Appends one JSON object per line.
class JsonlWriter {
    std::string path;
    std::mutex mtx;

public:
    explicit JsonlWriter(std::string filePath) : path(std::move(filePath)) {}
    bool append(const std::string& line);
    const std::string& filePath() const { return path; }
};

class JsonlEventSink : public EventSink {
    JsonlWriter writer;

public:
    explicit JsonlEventSink(const std::string& path) : writer(path) {}
    void publish(const Event& ev) override;
};

// Outbox consumed by the external notifier.
class OutboxNotifier : public NotificationSink {
    JsonlWriter writer;

public:
    explicit OutboxNotifier(const std::string& path) : writer(path) {}
    void notify(const Event& ev) override;
};
