#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

struct RingFrame {
    uint64_t seq = 0;
    int64_t timestampMs = 0;
    cv::Mat image;            // owned copy, BGR
};

struct RingReadResult {
    std::vector<RingFrame> frames;   // sequence (= timestamp) order
    bool truncated = false;          // requested start predates retained horizon
};

struct RingHeader;

// Fixed-capacity frame ring in POSIX shared memory. Slots are fixed size and
// indexed by seq % capacity; every copy in or out happens under the ring's
// process-shared mutex, so readers never observe a half-written slot.
class SharedFrameRing {
public:
    ~SharedFrameRing();
    SharedFrameRing(const SharedFrameRing&) = delete;
    SharedFrameRing& operator=(const SharedFrameRing&) = delete;

    // Owner side. An orphaned object from a previous run is replaced.
    static std::unique_ptr<SharedFrameRing> create(const std::string& cameraId, uint32_t capacity,
                                                   uint32_t maxWidth, uint32_t maxHeight);
    // Reader side in another process. Returns nullptr if no ring exists.
    static std::unique_ptr<SharedFrameRing> attach(const std::string& cameraId);

    static std::string shmName(const std::string& cameraId);

    // Returns the sequence number assigned to the frame, -1 if rejected.
    // Timestamps are clamped so they never decrease.
    int64_t write(const cv::Mat& frame, int64_t timestampMs);
    // maxFrames > 0 copies at most that many frames, spread evenly over the range.
    RingReadResult readRange(int64_t startMs, int64_t endMs, size_t maxFrames = 0);
    bool latest(RingFrame& out);

    uint32_t capacity() const;
    uint64_t written();
    const std::string& cameraId() const { return camId; }

private:
    SharedFrameRing() = default;

    std::string camId;
    std::string name;
    bool owner = false;
    void* base = nullptr;
    size_t mappedBytes = 0;
    RingHeader* header = nullptr;

    uint8_t* slotAt(uint64_t seq) const;
    void copyOut(const uint8_t* slot, RingFrame& out) const;
};

// camera id -> ring. The map lock is never held during a frame copy.
class FrameRingRegistry {
    std::mutex mtx;
    std::map<std::string, std::shared_ptr<SharedFrameRing>> rings;

public:
    std::shared_ptr<SharedFrameRing> create(const std::string& cameraId, uint32_t capacity,
                                            uint32_t maxWidth, uint32_t maxHeight);
    std::shared_ptr<SharedFrameRing> get(const std::string& cameraId);
    void release(const std::string& cameraId);

    int64_t write(const std::string& cameraId, const cv::Mat& frame, int64_t timestampMs);
    RingReadResult readRange(const std::string& cameraId, int64_t startMs, int64_t endMs, size_t maxFrames = 0);
};
