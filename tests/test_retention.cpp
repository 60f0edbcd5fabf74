#include "recorder/Retention.hpp"
#include "recorder/Segmenter.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <thread>
#include <unistd.h>
#include <utime.h>

namespace fs = std::filesystem;

namespace {

class RetentionTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = fs::temp_directory_path() / ("tdv_retention_" + std::to_string(getpid()));
        mediaRoot = fs::temp_directory_path() / ("tdv_retention_media_" + std::to_string(getpid()));
        fs::remove_all(root);
        fs::remove_all(mediaRoot);
        fs::create_directories(root);
        fs::create_directories(mediaRoot);
        media.root = mediaRoot.string();
        media.retentionDays = 7;
        now = (int64_t)time(nullptr) * 1000;
        cfg.segmentSeconds = 60;
        cfg.retentionMinutes = 60;
        cfg.diskLimitPercent = 80;
    }
    void TearDown() override {
        fs::remove_all(root);
        fs::remove_all(mediaRoot);
    }

    void addSegment(const std::string& cam, int64_t startMs, size_t bytes = 100) {
        fs::create_directories(root / cam);
        std::ofstream((root / cam / segmentFileName(startMs)).string()) << std::string(bytes, 's');
    }

    // An event directory with all three outputs, last touched at modifiedMs.
    void addEvent(const std::string& id, int64_t modifiedMs) {
        fs::path d = mediaRoot / id;
        fs::create_directories(d);
        for (const char* name : {"clip.mp4", "preview.gif", "collage.jpg", ".clip.mp4.tmp"}) {
            std::ofstream((d / name).string()) << "media";
        }
        struct utimbuf t;
        t.actime = t.modtime = (time_t)(modifiedMs / 1000);
        utime(d.c_str(), &t);
    }

    bool hasEvent(const std::string& id) const { return fs::exists(mediaRoot / id); }

    size_t count(const std::string& cam) const { return listSegments((root / cam).string(), 60).size(); }

    size_t total() const {
        size_t n = 0;
        for (const auto& e : fs::directory_iterator(root)) {
            if (e.is_directory()) n += listSegments(e.path().string(), 60).size();
        }
        return n;
    }

    fs::path root;
    fs::path mediaRoot;
    int64_t now = 0;
    RecorderSettings cfg;
    MediaSettings media;
};

}

TEST_F(RetentionTest, RollingWindowDropsExpiredSegments) {
    const int64_t minute = 60000;
    addSegment("cam1", now - 180 * minute);
    addSegment("cam1", now - 120 * minute);
    addSegment("cam1", now - 10 * minute);
    addSegment("cam1", now - 1 * minute);

    RetentionManager rm(root.string(), cfg);
    EXPECT_EQ(rm.enforceRolling("cam1", now), 2);
    auto left = listSegments((root / "cam1").string(), 60);
    ASSERT_EQ(left.size(), 2u);
    EXPECT_EQ(left.front().startMs, now / 1000 * 1000 - 10 * minute);
}

TEST_F(RetentionTest, RollingWindowKeepsNewestSegment) {
    const int64_t minute = 60000;
    addSegment("cam1", now - 300 * minute);
    addSegment("cam1", now - 200 * minute);

    RetentionManager rm(root.string(), cfg);
    EXPECT_EQ(rm.enforceRolling("cam1", now), 1);
    EXPECT_EQ(count("cam1"), 1u);
}

TEST_F(RetentionTest, DiskLimitTrimsEveryContributingCamera) {
    const int64_t minute = 60000;
    for (int i = 0; i < 3; i++) addSegment("cam1", now - (10 - i) * minute);
    for (int i = 0; i < 2; i++) addSegment("cam2", now - (10 - i) * minute);

    RetentionManager rm(root.string(), cfg);
    rm.setUsageProbe([this] {
        DiskUsageSample s;
        s.percent = total() > 3 ? 90 : 40;
        return s;
    });

    EXPECT_TRUE(rm.overLimit(rm.sample()));
    EXPECT_EQ(rm.enforceDiskLimit(), 2);
    EXPECT_EQ(count("cam1"), 2u);
    EXPECT_EQ(count("cam2"), 1u);
    EXPECT_FALSE(rm.overLimit(rm.sample()));
}

TEST_F(RetentionTest, ByteBudgetRepeatsUntilBelowLimit) {
    const int64_t minute = 60000;
    for (int i = 0; i < 3; i++) addSegment("cam1", now - (10 - i) * minute);
    addSegment("cam2", now - 5 * minute);

    cfg.maxTotalBytes = 250;
    RetentionManager rm(root.string(), cfg);
    rm.setUsageProbe([this] {
        DiskUsageSample s;
        s.percent = 10;
        s.usedBytes = directorySizeBytes(root.string());
        return s;
    });

    EXPECT_EQ(rm.enforceDiskLimit(), 2);
    EXPECT_EQ(count("cam1"), 1u);
    EXPECT_EQ(count("cam2"), 1u);
}

TEST_F(RetentionTest, StopsWhenOnlyActiveSegmentsRemain) {
    addSegment("cam1", now);
    addSegment("cam2", now);

    RetentionManager rm(root.string(), cfg);
    rm.setUsageProbe([] {
        DiskUsageSample s;
        s.percent = 99;
        return s;
    });
    EXPECT_EQ(rm.enforceDiskLimit(), 0);
    EXPECT_EQ(total(), 2u);
}

TEST_F(RetentionTest, UnknownUsageIsNotOverLimit) {
    RetentionManager rm(root.string(), cfg);
    DiskUsageSample unknown;
    EXPECT_FALSE(rm.overLimit(unknown));
    DiskUsageSample full;
    full.percent = 80;
    EXPECT_TRUE(rm.overLimit(full));
}

TEST_F(RetentionTest, ExpiredEventMediaIsRemoved) {
    const int64_t day = 24 * 3600 * 1000LL;
    addEvent("cam1-old", now - 10 * day);
    addEvent("cam1-week", now - 6 * day);
    addEvent("cam1-new", now);

    RetentionManager rm(root.string(), cfg);
    rm.setMedia(media);
    EXPECT_EQ(rm.enforceMediaAge(now), 1);
    EXPECT_FALSE(hasEvent("cam1-old"));
    EXPECT_TRUE(hasEvent("cam1-week"));
    EXPECT_TRUE(hasEvent("cam1-new"));
    EXPECT_EQ(rm.enforceMediaAge(now), 0);
}

TEST_F(RetentionTest, DeletingEventMediaRemovesDirectory) {
    addEvent("cam1-a", now);
    EXPECT_TRUE(deleteEventMedia((mediaRoot / "cam1-a").string()));
    EXPECT_FALSE(hasEvent("cam1-a"));
    EXPECT_TRUE(deleteEventMedia((mediaRoot / "missing").string()));
}

TEST_F(RetentionTest, FullDiskTrimsOldestEventMediaWithSegments) {
    const int64_t minute = 60000;
    addSegment("cam1", now - 10 * minute);
    addSegment("cam1", now - 9 * minute);
    addEvent("cam1-old", now - 60 * minute);
    addEvent("cam1-new", now - 5 * minute);

    RetentionManager rm(root.string(), cfg);
    rm.setMedia(media);
    rm.setUsageProbe([this] {
        size_t events = 0;
        for (const auto& e : fs::directory_iterator(mediaRoot)) events += e.is_directory();
        DiskUsageSample s;
        s.percent = total() + events > 2 ? 90 : 40;
        return s;
    });

    EXPECT_EQ(rm.enforceDiskLimit(), 2);
    EXPECT_EQ(count("cam1"), 1u);
    EXPECT_FALSE(hasEvent("cam1-old"));
    EXPECT_TRUE(hasEvent("cam1-new"));
}

TEST_F(RetentionTest, RecordingsBudgetLeavesEventMediaAlone) {
    const int64_t minute = 60000;
    for (int i = 0; i < 3; i++) addSegment("cam1", now - (10 - i) * minute);
    addEvent("cam1-old", now - 60 * minute);

    cfg.maxTotalBytes = 150;
    RetentionManager rm(root.string(), cfg);
    rm.setMedia(media);
    rm.setUsageProbe([this] {
        DiskUsageSample s;
        s.percent = 10;
        s.usedBytes = directorySizeBytes(root.string());
        return s;
    });

    EXPECT_EQ(rm.enforceDiskLimit(), 2);
    EXPECT_EQ(count("cam1"), 1u);
    EXPECT_TRUE(hasEvent("cam1-old"));
}

TEST_F(RetentionTest, SettingsUpdateWhileSampling) {
    RetentionManager rm(root.string(), cfg);
    rm.setUsageProbe([] {
        DiskUsageSample s;
        s.percent = 85;
        return s;
    });
    std::atomic<bool> stop{false};
    std::thread reader([&] {
        while (!stop) rm.overLimit(rm.sample());
    });
    for (int i = 0; i < 500; i++) {
        RecorderSettings next = cfg;
        next.diskLimitPercent = i % 2 ? 90 : 80;
        rm.updateSettings(next);
    }
    stop = true;
    reader.join();
    // Last update set the limit to 90.
    EXPECT_FALSE(rm.overLimit(rm.sample()));
}
