#include "detector/sighting_tracker.h"
#include <gtest/gtest.h>

static Observation hit(int64_t ts, float conf = 0.8f) {
    Observation o;
    o.hit = true;
    o.timestampMs = ts;
    o.confidence = conf;
    o.boxes.push_back({ts, cv::Rect(10, 10, 20, 60), cv::Size(640, 480), conf});
    o.frame = cv::Mat(48, 64, CV_8UC3, cv::Scalar::all(0));
    return o;
}

static Observation miss(int64_t ts) {
    Observation o;
    o.timestampMs = ts;
    return o;
}

TEST(SightingTracker, SingleGapWithinToleranceConfirms) {
    SightingTracker t("cam1", 3, 1);
    EXPECT_FALSE(t.observe("", hit(0)));
    EXPECT_FALSE(t.observe("", miss(200)));
    EXPECT_FALSE(t.observe("", hit(400)));
    auto c = t.observe("", hit(600, 0.9f));
    ASSERT_TRUE(c);
    EXPECT_EQ(c->cameraId, "cam1");
    EXPECT_EQ(c->firstSeenMs, 0);
    EXPECT_EQ(c->confirmedMs, 600);
    EXPECT_FLOAT_EQ(c->bestConfidence, 0.9f);
    EXPECT_EQ(c->boxes.size(), 3u);
    EXPECT_EQ(c->snapshots.size(), 3u);
    EXPECT_TRUE(t.idle());
}

TEST(SightingTracker, TwoConsecutiveMissesDiscard) {
    SightingTracker t("cam1", 3, 1);
    EXPECT_FALSE(t.observe("", hit(0)));
    EXPECT_FALSE(t.observe("", miss(200)));
    EXPECT_FALSE(t.observe("", miss(400)));
    EXPECT_FALSE(t.active(""));
    EXPECT_FALSE(t.observe("", hit(600)));
    EXPECT_EQ(t.hits(""), 1);
}

TEST(SightingTracker, KeysAreIndependent) {
    SightingTracker t("cam1", 2, 0);
    EXPECT_FALSE(t.observe("door", hit(0)));
    EXPECT_FALSE(t.observe("yard", hit(0)));
    EXPECT_FALSE(t.observe("yard", miss(100)));
    EXPECT_FALSE(t.active("yard"));
    auto c = t.observe("door", hit(200));
    ASSERT_TRUE(c);
    EXPECT_EQ(c->zoneId, "door");
}

TEST(SightingTracker, MissWithoutSightingIsIgnored) {
    SightingTracker t("cam1", 2, 2);
    EXPECT_FALSE(t.observe("", miss(0)));
    EXPECT_TRUE(t.idle());
}

TEST(SightingTracker, SnapshotsAreBounded) {
    SightingTracker t("cam1", 20, 0);
    for (int i = 0; i < 19; i++) t.observe("", hit(i * 100));
    auto c = t.observe("", hit(1900));
    ASSERT_TRUE(c);
    EXPECT_EQ(c->snapshots.size(), 8u);
    EXPECT_EQ(c->snapshots.front().timestampMs, 0);
    EXPECT_EQ(c->snapshots.back().timestampMs, 1900);
}

TEST(SightingTracker, RuleChangeAppliesToNextObservation) {
    SightingTracker t("cam1", 5, 0);
    t.observe("", hit(0));
    t.setRule(2, 0);
    EXPECT_TRUE(t.observe("", hit(100)));
}
