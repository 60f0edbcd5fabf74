#pragma once
#include <chrono>

struct Heartbeat {
    std::chrono::steady_clock::time_point last;
    bool valid = false;

    void beat() {
        beat(std::chrono::steady_clock::now());
    }

    void beat(std::chrono::steady_clock::time_point now) {
        last = now;
        valid = true;
    }

    long long ageMs(std::chrono::steady_clock::time_point now) const {
        if (!valid) return -1;
        return std::chrono::duration_cast<std::chrono::milliseconds>(now - last).count();
    }

    // Never-beaten counts as expired.
    bool expired(long long timeoutMs, std::chrono::steady_clock::time_point now) const {
        return !valid || ageMs(now) >= timeoutMs;
    }
};
