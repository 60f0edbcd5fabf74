#include "detector/camera_worker.h"
#include "events/EventLifecycle.hpp"
#include "recorder/RingBuffer.hpp"
#include "supervisor/StatusBoard.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <cstdint>
#include <thread>
#include <unistd.h>
#include <opencv2/imgproc.hpp>

namespace {

const cv::Rect PERSON(100, 60, 40, 120);

cv::Mat blank() {
    return cv::Mat(240, 320, CV_8UC3, cv::Scalar::all(0));
}

cv::Mat withPerson() {
    cv::Mat m = blank();
    cv::rectangle(m, PERSON, cv::Scalar::all(255), cv::FILLED);
    return m;
}

// Reports a person wherever the frame is bright.
class BrightBoxDetector : public ObjectDetector {
public:
    bool loaded = true;
    bool ready() const override { return loaded; }
    std::vector<Detection> detect(const cv::Mat& frame, float) override {
        std::vector<Detection> out;
        cv::Mat gray;
        cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
        if (cv::countNonZero(gray > 128) > 0) out.push_back({0, 0.9f, cv::boundingRect(gray > 128)});
        return out;
    }
};

// Inference that always fails, as a broken model would.
class FailingDetector : public ObjectDetector {
public:
    explicit FailingDetector(std::atomic<int>& counter) : calls(counter) {}
    bool ready() const override { return true; }
    std::vector<Detection> detect(const cv::Mat&, float) override {
        calls++;
        CV_Error(cv::Error::StsError, "layer shape mismatch");
        return {};
    }

private:
    std::atomic<int>& calls;
};

class ScriptedSource : public FrameSource {
public:
    std::atomic<int> opens{0};
    bool open(const std::string&, int) override {
        opens++;
        return true;
    }
    bool read(cv::Mat& frame) override {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        frame = (++n % 2) ? blank() : withPerson();
        return true;
    }
    void close() override {}
    void interrupt() override {}

private:
    int n = 0;
};

struct CountingMedia : MediaGenerator {
    std::vector<Event> submitted;
    bool submit(const Event& ev) override {
        submitted.push_back(ev);
        return true;
    }
};

ConfigPtr makeConfig(const std::string& cameraJson, uint64_t version = 1) {
    std::string doc = R"({
      "detection": {"confirm_frames": 2, "max_gap_frames": 1, "inference_fps": 10},
      "event": {"min_event_duration": 0, "cooldown_seconds": 30},
      "ring": {"seconds": 2, "output_fps": 10, "max_width": 320, "max_height": 240},
      "cameras": [)" + cameraJson + "]}";
    auto snap = std::make_shared<ConfigSnapshot>(parseConfig(doc));
    snap->version = version;
    return snap;
}

std::string cameraId(const std::string& base) {
    return base + "_" + std::to_string(getpid());
}

class CameraWorkerTest : public ::testing::Test {
protected:
    void SetUp() override { lifecycle.setMediaGenerator(&media); }

    std::unique_ptr<CameraWorker> makeWorker(const std::string& id, ConfigPtr cfg, bool detectorReady = true) {
        return std::make_unique<CameraWorker>(
            id, cfg, rings, lifecycle, &status, std::make_unique<ScriptedSource>(),
            [detectorReady](const DetectionSettings&) {
                auto d = std::make_unique<BrightBoxDetector>();
                d->loaded = detectorReady;
                return std::unique_ptr<ObjectDetector>(std::move(d));
            });
    }

    FrameRingRegistry rings;
    EventLifecycleManager lifecycle;
    StatusBoard status;
    CountingMedia media;
};

}

TEST_F(CameraWorkerTest, ConsecutivePersonFramesRaiseOneEvent) {
    std::string id = cameraId("worker_person");
    auto cfg = makeConfig(R"({"id": ")" + id + R"(", "restream_url": "rtsp://relay/x", "detection_source": "color"})");
    auto worker = makeWorker(id, cfg);

    int64_t ts = 1700000000000;
    worker->processCandidate({blank(), ts});
    worker->processCandidate({withPerson(), ts + 100});
    EXPECT_TRUE(media.submitted.empty());
    worker->processCandidate({withPerson(), ts + 200});
    ASSERT_EQ(media.submitted.size(), 1u);

    const Event& ev = media.submitted[0];
    EXPECT_EQ(ev.cameraId, id);
    EXPECT_EQ(ev.zoneId, "");
    EXPECT_FLOAT_EQ(ev.confidence, 0.9f);
    ASSERT_FALSE(ev.boxes.empty());
    EXPECT_EQ(ev.boxes[0].box, PERSON);
    EXPECT_FALSE(ev.snapshots.empty());

    // Cooldown: the sighting continues but no second event.
    worker->processCandidate({withPerson(), ts + 300});
    worker->processCandidate({withPerson(), ts + 400});
    EXPECT_EQ(media.submitted.size(), 1u);
}

TEST_F(CameraWorkerTest, StaticSceneNeverReachesInference) {
    std::string id = cameraId("worker_static");
    auto cfg = makeConfig(R"({"id": ")" + id + R"(", "restream_url": "rtsp://relay/x", "detection_source": "color"})");
    auto worker = makeWorker(id, cfg);

    int64_t ts = 1700000000000;
    // The person is part of the background from the first frame.
    for (int i = 0; i < 10; i++) worker->processCandidate({withPerson(), ts + i * 100});
    EXPECT_TRUE(media.submitted.empty());
}

TEST_F(CameraWorkerTest, PersonOutsideZoneIsIgnored) {
    std::string id = cameraId("worker_zone");
    auto cfg = makeConfig(R"({"id": ")" + id + R"(", "restream_url": "rtsp://relay/x", "detection_source": "color",
        "zones": [{"id": "right", "mode": "person", "polygon": [[0.6, 0], [1, 0], [1, 1], [0.6, 1]]}]})");
    auto worker = makeWorker(id, cfg);

    int64_t ts = 1700000000000;
    worker->processCandidate({blank(), ts});
    for (int i = 1; i <= 4; i++) worker->processCandidate({withPerson(), ts + i * 100});
    EXPECT_TRUE(media.submitted.empty());
}

TEST_F(CameraWorkerTest, MotionZoneConfirmsWithoutDetector) {
    std::string id = cameraId("worker_motion");
    auto cfg = makeConfig(R"({"id": ")" + id + R"(", "restream_url": "rtsp://relay/x", "detection_source": "color",
        "zones": [{"id": "left", "mode": "motion", "polygon": [[0, 0], [0.5, 0], [0.5, 1], [0, 1]]}]})");
    auto worker = makeWorker(id, cfg, false);

    int64_t ts = 1700000000000;
    worker->processCandidate({blank(), ts});
    worker->processCandidate({withPerson(), ts + 100});
    worker->processCandidate({withPerson(), ts + 200});
    ASSERT_EQ(media.submitted.size(), 1u);
    EXPECT_EQ(media.submitted[0].zoneId, "left");
    EXPECT_FALSE(media.submitted[0].boxes.empty());
}

TEST_F(CameraWorkerTest, RunsCaptureAndAppliesNewSettings) {
    std::string id = cameraId("worker_live");
    std::string cam = R"({"id": ")" + id + R"(", "restream_url": "rtsp://relay/x", "detection_source": "color"})";
    auto worker = makeWorker(id, makeConfig(cam, 1), false);

    ASSERT_TRUE(worker->start());
    EXPECT_TRUE(rings.get(id));

    worker->applyConfig(makeConfig(cam, 2));
    for (int i = 0; i < 100 && worker->configVersion() != 2; i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    EXPECT_EQ(worker->configVersion(), 2u);
    EXPECT_EQ(status.get(id).stream, "streaming");
    EXPECT_GT(rings.readRange(id, 0, INT64_MAX).frames.size(), 0u);

    worker->stop();
    EXPECT_FALSE(rings.get(id));
    EXPECT_EQ(status.get(id).stream, "down");
}

TEST_F(CameraWorkerTest, InferenceErrorsDoNotStopTheWorker) {
    std::string id = cameraId("worker_failing");
    std::string cam = R"({"id": ")" + id + R"(", "restream_url": "rtsp://relay/x", "detection_source": "color"})";
    std::atomic<int> calls{0};
    auto worker = std::make_unique<CameraWorker>(
        id, makeConfig(cam), rings, lifecycle, &status, std::make_unique<ScriptedSource>(),
        [&calls](const DetectionSettings&) { return std::unique_ptr<ObjectDetector>(new FailingDetector(calls)); });

    ASSERT_TRUE(worker->start());
    for (int i = 0; i < 150 && calls < 3; i++) std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_GE(calls.load(), 3);
    EXPECT_TRUE(media.submitted.empty());
    worker->stop();
    EXPECT_EQ(status.get(id).stream, "down");
}

TEST(LatestFrameSlot, KeepsOnlyNewestFrame) {
    LatestFrameSlot slot;
    slot.offer({cv::Mat(), 1});
    slot.offer({cv::Mat(), 2});
    slot.offer({cv::Mat(), 3});
    Candidate c;
    ASSERT_TRUE(slot.take(c));
    EXPECT_EQ(c.timestampMs, 3);
    EXPECT_EQ(slot.droppedCount(), 2u);

    slot.close();
    EXPECT_FALSE(slot.take(c));
}
