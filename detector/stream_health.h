#pragma once
#include "supervisor/Config.hpp"
#include "supervisor/Heartbeat.hpp"
#include <chrono>
#include <functional>

enum class StreamState { Connecting, Streaming, Stale, Reconnecting, Down };
const char* toString(StreamState s);

// Connection state machine of one camera. Time is passed in so the
// transitions are deterministic.
class StreamHealth {
public:
    using Clock = std::chrono::steady_clock;
    using Listener = std::function<void(StreamState from, StreamState to)>;

    explicit StreamHealth(const StreamSettings& cfg);

    void setListener(Listener l) { listener = std::move(l); }
    void updateSettings(const StreamSettings& cfg) { settings = cfg; }

    bool canAttempt(Clock::time_point now) const { return now >= nextAttempt; }
    void onConnected(Clock::time_point now);
    void onConnectFailed(Clock::time_point now);
    void onFrame(Clock::time_point now);

    // Advances timers. True when the caller must drop the connection and
    // reconnect.
    bool tick(Clock::time_point now);

    StreamState state() const { return current; }
    int consecutiveFailures() const { return failures; }
    long long currentBackoffMs() const { return backoffMs; }
    uint64_t reconnectCount() const { return reconnects; }

private:
    void transition(StreamState next);

    StreamSettings settings;
    StreamState current = StreamState::Connecting;
    Heartbeat lastFrame;
    Clock::time_point nextAttempt{};
    Clock::time_point lastReconnect{};
    bool everReconnected = false;
    int failures = 0;
    long long backoffMs = 0;
    uint64_t reconnects = 0;
    Listener listener;
};
