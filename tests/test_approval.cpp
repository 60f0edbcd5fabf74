#include "events/ApprovalCommand.hpp"
#include "events/EventDB.hpp"
#include "events/JsonlSink.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

class TempDir {
public:
    TempDir() {
        path = fs::temp_directory_path() / ("tdv_events_" + std::to_string(getpid()) + "_" + std::to_string(counter++));
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
    std::string file(const std::string& name) const { return (path / name).string(); }

    std::string script(const std::string& name, const std::string& body) const {
        std::string p = file(name);
        std::ofstream(p) << "#!/bin/sh\n" << body << "\n";
        chmod(p.c_str(), 0755);
        return p;
    }

private:
    fs::path path;
    static int counter;
};
int TempDir::counter = 0;

Event sampleEvent() {
    Event ev;
    ev.id = "cam1-20240101-120000-1";
    ev.cameraId = "cam1";
    ev.cameraName = "Gate";
    ev.startMs = 1000;
    ev.endMs = 9000;
    ev.confidence = 0.8f;
    ev.boxes.push_back({2000, cv::Rect(1, 2, 3, 4), cv::Size(640, 480), 0.8f});
    return ev;
}

std::vector<nlohmann::json> readLines(const std::string& path) {
    std::vector<nlohmann::json> out;
    std::ifstream f(path);
    std::string line;
    while (std::getline(f, line)) out.push_back(nlohmann::json::parse(line));
    return out;
}

}

TEST(CommandApproval, ExitCodesMapToDecisions) {
    TempDir dir;
    Event ev = sampleEvent();
    CommandApprovalGate accept(dir.script("accept.sh", "exit 0"), std::chrono::seconds(5));
    CommandApprovalGate reject(dir.script("reject.sh", "exit 1"), std::chrono::seconds(5));
    CommandApprovalGate broken(dir.script("broken.sh", "exit 3"), std::chrono::seconds(5));

    EXPECT_EQ(accept.evaluate(ev, "/tmp/c.jpg"), ApprovalState::Approved);
    EXPECT_EQ(reject.evaluate(ev, "/tmp/c.jpg"), ApprovalState::Rejected);
    EXPECT_EQ(broken.evaluate(ev, "/tmp/c.jpg"), ApprovalState::TimedOut);
}

TEST(CommandApproval, ReceivesCollagePathAndEventId) {
    TempDir dir;
    std::string out = dir.file("args.txt");
    CommandApprovalGate gate(dir.script("echo.sh", "echo \"$1 $2\" > " + out), std::chrono::seconds(5));
    Event ev = sampleEvent();
    EXPECT_EQ(gate.evaluate(ev, "/data/c.jpg"), ApprovalState::Approved);

    std::ifstream f(out);
    std::string line;
    std::getline(f, line);
    EXPECT_EQ(line, "/data/c.jpg " + ev.id);
}

TEST(CommandApproval, SlowCommandTimesOut) {
    TempDir dir;
    CommandApprovalGate gate(dir.script("slow.sh", "sleep 30"), std::chrono::seconds(1));
    auto started = std::chrono::steady_clock::now();
    EXPECT_EQ(gate.evaluate(sampleEvent(), "/tmp/c.jpg"), ApprovalState::TimedOut);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
}

TEST(JsonlSinks, EventStreamAndOutboxAppendOneObjectPerLine) {
    TempDir dir;
    JsonlEventSink stream(dir.file("nested/events.jsonl"));
    OutboxNotifier outbox(dir.file("outbox.jsonl"));

    Event ev = sampleEvent();
    stream.publish(ev);
    ev.media = MediaState::CollageReady;
    stream.publish(ev);
    outbox.notify(ev);

    auto events = readLines(dir.file("nested/events.jsonl"));
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0]["type"], "event");
    EXPECT_EQ(events[0]["media_state"], "pending");
    EXPECT_EQ(events[1]["media_state"], "collage_ready");
    EXPECT_EQ(events[1]["detections"].size(), 1u);

    auto notes = readLines(dir.file("outbox.jsonl"));
    ASSERT_EQ(notes.size(), 1u);
    EXPECT_EQ(notes[0]["type"], "notification");
    EXPECT_EQ(notes[0]["id"], ev.id);
    EXPECT_FALSE(notes[0].contains("detections"));
}

TEST(EventDB, UpsertKeepsLatestState) {
    TempDir dir;
    EventDB db;
    ASSERT_TRUE(db.open(dir.file("events.db")));

    Event ev = sampleEvent();
    db.publish(ev);
    ev.media = MediaState::VideoReady;
    ev.clipPath = "/media/clip.mp4";
    db.publish(ev);

    auto stored = db.get(ev.id);
    ASSERT_TRUE(stored);
    EXPECT_EQ(stored->mediaState, "video_ready");
    EXPECT_EQ(stored->clipPath, "/media/clip.mp4");
    EXPECT_EQ(stored->cameraId, "cam1");

    EXPECT_EQ(db.byCamera("cam1", 0, 5000).size(), 1u);
    EXPECT_TRUE(db.byCamera("cam1", 10000, 20000).empty());
    EXPECT_TRUE(db.byCamera("cam2", 0, 5000).empty());
    EXPECT_FALSE(db.get("missing"));
}

TEST(EventDB, LastEventTimesPerZone) {
    TempDir dir;
    EventDB db;
    ASSERT_TRUE(db.open(dir.file("events.db")));

    Event a = sampleEvent();
    a.id = "cam1-a";
    a.zoneId = "door";
    a.createdMs = 1000;
    Event b = a;
    b.id = "cam1-b";
    b.createdMs = 9000;
    Event c = a;
    c.id = "cam1-c";
    c.zoneId = "";
    c.createdMs = 4000;
    Event other = a;
    other.id = "cam2-a";
    other.cameraId = "cam2";
    other.createdMs = 50000;
    for (const auto& ev : {a, b, c, other}) db.publish(ev);

    auto last = db.lastEventTimes("cam1");
    ASSERT_EQ(last.size(), 2u);
    EXPECT_EQ(last["door"], 9000);
    EXPECT_EQ(last[""], 4000);
    EXPECT_EQ(db.get("cam1-b")->createdMs, 9000);
    EXPECT_TRUE(db.lastEventTimes("cam3").empty());
}
