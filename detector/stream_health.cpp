#include "stream_health.h"
#include <algorithm>

const char* toString(StreamState s) {
    switch (s) {
        case StreamState::Connecting: return "connecting";
        case StreamState::Streaming: return "streaming";
        case StreamState::Stale: return "stale";
        case StreamState::Reconnecting: return "reconnecting";
        case StreamState::Down: return "down";
    }
    return "connecting";
}

StreamHealth::StreamHealth(const StreamSettings& cfg) : settings(cfg) {}

void StreamHealth::transition(StreamState next) {
    if (next == current) return;
    StreamState prev = current;
    current = next;
    if (listener) listener(prev, next);
}

void StreamHealth::onConnected(Clock::time_point now) {
    failures = 0;
    backoffMs = 0;
    nextAttempt = now;
    lastFrame.beat(now);
    transition(StreamState::Streaming);
}

void StreamHealth::onConnectFailed(Clock::time_point now) {
    failures++;
    backoffMs = failures == 1 ? settings.backoffInitialMs
                              : std::min<long long>(backoffMs * 2, settings.backoffMaxMs);
    nextAttempt = now + std::chrono::milliseconds(backoffMs);
    if (failures >= settings.downAfterFailures) transition(StreamState::Down);
}

void StreamHealth::onFrame(Clock::time_point now) {
    lastFrame.beat(now);
    if (current == StreamState::Stale) transition(StreamState::Streaming);
}

bool StreamHealth::tick(Clock::time_point now) {
    if (current == StreamState::Streaming && lastFrame.expired(settings.staleDebounceMs, now)) {
        transition(StreamState::Stale);
    }
    if (current == StreamState::Stale) {
        bool cooled = !everReconnected ||
                      now - lastReconnect >= std::chrono::milliseconds(settings.reconnectCooldownMs);
        if (cooled) {
            everReconnected = true;
            lastReconnect = now;
            reconnects++;
            nextAttempt = now;
            transition(StreamState::Reconnecting);
            return true;
        }
    }
    return false;
}
