#include "detector/zones.h"
#include <gtest/gtest.h>

static Zone rectZone(const std::string& id, float x1, float y1, float x2, float y2,
                     ZoneMode mode = ZoneMode::Person) {
    Zone z;
    z.id = id;
    z.mode = mode;
    z.polygon = {{x1, y1}, {x2, y1}, {x2, y2}, {x1, y2}};
    return z;
}

TEST(Zones, PointInPolygon) {
    std::vector<ZonePoint> tri = {{0.f, 0.f}, {1.f, 0.f}, {0.f, 1.f}};
    EXPECT_TRUE(pointInPolygon(0.2f, 0.2f, tri));
    EXPECT_FALSE(pointInPolygon(0.8f, 0.8f, tri));
    EXPECT_FALSE(pointInPolygon(-0.1f, 0.5f, tri));
}

TEST(Zones, FeetInsideCountsEvenIfHeadIsOutside) {
    Zone ground = rectZone("ground", 0.f, 0.6f, 1.f, 1.f);
    cv::Size frame(100, 100);
    EXPECT_TRUE(boxInZone(cv::Rect(40, 20, 20, 60), frame, ground));
    EXPECT_FALSE(boxInZone(cv::Rect(40, 5, 20, 40), frame, ground));
}

TEST(Zones, GridFallbackNeedsTwoPoints) {
    cv::Size frame(100, 100);
    Zone band = rectZone("band", 0.f, 0.3f, 1.f, 0.45f);
    EXPECT_TRUE(boxInZone(cv::Rect(40, 20, 20, 60), frame, band));

    Zone sliver = rectZone("sliver", 0.44f, 0.3f, 0.46f, 0.4f);
    EXPECT_FALSE(boxInZone(cv::Rect(40, 20, 20, 60), frame, sliver));
}

TEST(Zones, DegenerateZoneMatchesNothing) {
    Zone z;
    z.polygon = {{0.f, 0.f}, {1.f, 1.f}};
    EXPECT_FALSE(boxInZone(cv::Rect(0, 0, 100, 100), cv::Size(100, 100), z));
}

TEST(Zones, MaskCoversPolygon) {
    cv::Mat m = zoneMask(rectZone("c", 0.25f, 0.25f, 0.75f, 0.75f), cv::Size(100, 100));
    ASSERT_EQ(m.type(), CV_8U);
    EXPECT_EQ(m.at<uchar>(50, 50), 255);
    EXPECT_EQ(m.at<uchar>(5, 5), 0);
    EXPECT_EQ(m.at<uchar>(95, 95), 0);
}

TEST(Zones, EnabledZonesSkipsDisabledAndDegenerate) {
    std::vector<Zone> zones = {rectZone("a", 0, 0, 1, 1), rectZone("b", 0, 0, 1, 1), Zone()};
    zones[1].enabled = false;
    auto out = enabledZones(zones);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0]->id, "a");
}

TEST(Zones, ModeQualifiers) {
    EXPECT_TRUE(zoneWantsPerson(rectZone("p", 0, 0, 1, 1, ZoneMode::Person)));
    EXPECT_FALSE(zoneWantsMotion(rectZone("p", 0, 0, 1, 1, ZoneMode::Person)));
    EXPECT_TRUE(zoneWantsMotion(rectZone("m", 0, 0, 1, 1, ZoneMode::Motion)));
    EXPECT_TRUE(zoneWantsPerson(rectZone("b", 0, 0, 1, 1, ZoneMode::Both)));
    EXPECT_TRUE(zoneWantsMotion(rectZone("b", 0, 0, 1, 1, ZoneMode::Both)));
}

TEST(Zones, ClampRect) {
    cv::Rect r = clampRect(cv::Rect(-10, 90, 30, 30), cv::Size(100, 100));
    EXPECT_EQ(r, cv::Rect(0, 90, 20, 10));
    EXPECT_EQ(clampRect(cv::Rect(200, 200, 5, 5), cv::Size(100, 100)).area(), 0);
}
