#include "detector/stream_health.h"
#include <gtest/gtest.h>

using Clock = StreamHealth::Clock;
using std::chrono::milliseconds;

namespace {

StreamSettings settings() {
    StreamSettings s;
    s.staleDebounceMs = 3000;
    s.reconnectCooldownMs = 8000;
    s.backoffInitialMs = 1000;
    s.backoffMaxMs = 4000;
    s.downAfterFailures = 4;
    return s;
}

struct Transitions {
    std::vector<std::pair<StreamState, StreamState>> seen;
    int count(StreamState to) const {
        int n = 0;
        for (const auto& t : seen) n += t.second == to;
        return n;
    }
};

}

TEST(StreamHealth, OutageShorterThanDebounceDoesNotReconnect) {
    StreamHealth h(settings());
    Transitions tr;
    h.setListener([&](StreamState a, StreamState b) { tr.seen.emplace_back(a, b); });

    auto t0 = Clock::now();
    h.onConnected(t0);
    for (int ms = 100; ms <= 2900; ms += 100) EXPECT_FALSE(h.tick(t0 + milliseconds(ms)));
    h.onFrame(t0 + milliseconds(2950));
    for (int ms = 3000; ms <= 5000; ms += 100) {
        h.onFrame(t0 + milliseconds(ms));
        EXPECT_FALSE(h.tick(t0 + milliseconds(ms)));
    }

    EXPECT_EQ(tr.count(StreamState::Reconnecting), 0);
    EXPECT_EQ(h.state(), StreamState::Streaming);
}

TEST(StreamHealth, OutageLongerThanDebounceReconnectsOnce) {
    StreamHealth h(settings());
    Transitions tr;
    h.setListener([&](StreamState a, StreamState b) { tr.seen.emplace_back(a, b); });

    auto t0 = Clock::now();
    h.onConnected(t0);
    int drops = 0;
    for (int ms = 100; ms <= 6000; ms += 100) drops += h.tick(t0 + milliseconds(ms));

    EXPECT_EQ(drops, 1);
    EXPECT_EQ(tr.count(StreamState::Stale), 1);
    EXPECT_EQ(tr.count(StreamState::Reconnecting), 1);
    EXPECT_EQ(h.reconnectCount(), 1u);

    h.onConnected(t0 + milliseconds(6100));
    EXPECT_EQ(h.state(), StreamState::Streaming);
}

TEST(StreamHealth, CooldownSpacesReconnects) {
    StreamHealth h(settings());
    auto t0 = Clock::now();
    h.onConnected(t0);
    EXPECT_TRUE(h.tick(t0 + milliseconds(3000)));

    // Reconnected, then stale again quickly.
    h.onConnected(t0 + milliseconds(3100));
    EXPECT_FALSE(h.tick(t0 + milliseconds(6200)));
    EXPECT_EQ(h.state(), StreamState::Stale);
    EXPECT_FALSE(h.tick(t0 + milliseconds(10000)));
    EXPECT_TRUE(h.tick(t0 + milliseconds(11000)));
    EXPECT_EQ(h.reconnectCount(), 2u);
}

TEST(StreamHealth, FrameDuringStaleRestoresStreaming) {
    StreamHealth h(settings());
    auto t0 = Clock::now();
    h.onConnected(t0);
    EXPECT_TRUE(h.tick(t0 + milliseconds(3000)));
    h.onConnected(t0 + milliseconds(3100));
    EXPECT_FALSE(h.tick(t0 + milliseconds(6200)));
    ASSERT_EQ(h.state(), StreamState::Stale);
    h.onFrame(t0 + milliseconds(6300));
    EXPECT_EQ(h.state(), StreamState::Streaming);
}

TEST(StreamHealth, FailedConnectsBackOffThenGoDown) {
    StreamHealth h(settings());
    auto t0 = Clock::now();
    EXPECT_TRUE(h.canAttempt(t0));

    h.onConnectFailed(t0);
    EXPECT_EQ(h.currentBackoffMs(), 1000);
    EXPECT_FALSE(h.canAttempt(t0 + milliseconds(999)));
    EXPECT_TRUE(h.canAttempt(t0 + milliseconds(1000)));

    h.onConnectFailed(t0 + milliseconds(1000));
    EXPECT_EQ(h.currentBackoffMs(), 2000);
    h.onConnectFailed(t0 + milliseconds(3000));
    EXPECT_EQ(h.currentBackoffMs(), 4000);
    EXPECT_NE(h.state(), StreamState::Down);
    h.onConnectFailed(t0 + milliseconds(7000));
    EXPECT_EQ(h.currentBackoffMs(), 4000);
    EXPECT_EQ(h.state(), StreamState::Down);

    h.onConnected(t0 + milliseconds(11000));
    EXPECT_EQ(h.state(), StreamState::Streaming);
    EXPECT_EQ(h.consecutiveFailures(), 0);
}
