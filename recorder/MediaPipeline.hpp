#pragma once
#include "ClipExtractor.hpp"
#include "WorkerPool.hpp"
#include "events/EventSink.hpp"
#include "supervisor/Config.hpp"
#include <atomic>
#include <string>

// Two fixed pools: collages (fast, feed notifications) and clips (slow,
// wait for the post-buffer and run the encoder).
class MediaPipeline : public MediaGenerator {
public:
    using RingReader = ClipExtractor::RingReader;

    MediaPipeline(MediaSettings settings, ClipExtractor& clips, RingReader ring);
    ~MediaPipeline() override;

    void setListener(MediaListener* l) { listener = l; }
    bool submit(const Event& ev) override;

    // Drains queued jobs; clip jobs stop waiting for their window.
    void shutdown();

    std::string eventDir(const std::string& eventId) const;

private:
    void runCollage(const Event& ev);
    void runClip(const Event& ev);
    bool waitForWindowEnd(int64_t endMs);

    MediaSettings cfg;
    ClipExtractor& clips;
    RingReader ringReader;
    MediaListener* listener = nullptr;
    std::atomic<bool> stopping{false};
    WorkerPool collagePool;
    WorkerPool clipPool;
};
