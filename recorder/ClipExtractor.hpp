#pragma once
#include "MediaEncoder.hpp"
#include "RingBuffer.hpp"
#include "Segmenter.hpp"
#include "supervisor/Config.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

struct ClipPlanEntry {
    std::string path;
    std::optional<double> inpoint;    // seconds into the file
    std::optional<double> outpoint;
};

struct ClipPlan {
    std::vector<ClipPlanEntry> entries;
    double coveredSeconds = 0;
};

// Orders the overlapping segments and trims the first and last so that
// adjacent files join exactly at their boundary.
ClipPlan planClip(const std::vector<Segment>& segments, int64_t startMs, int64_t endMs);
std::string concatList(const ClipPlan& plan);

enum class ClipSource { None, Recording, RingBuffer, SingleFrame };
const char* toString(ClipSource s);

struct ClipResult {
    bool ok = false;
    ClipSource source = ClipSource::None;
    bool truncated = false;
    std::string error;
};

// Produces an event clip from recordings, falling back to the frame ring,
// then to a single still frame.
class ClipExtractor {
public:
    using RingReader = std::function<RingReadResult(const std::string& cameraId, int64_t startMs, int64_t endMs,
                                                    size_t maxFrames)>;

    ClipExtractor(MediaSettings media, std::string recordingsRoot, int segmentSeconds);

    void setRingReader(RingReader reader) { ringReader = std::move(reader); }

    ClipResult extract(const std::string& cameraId, int64_t startMs, int64_t endMs, const cv::Mat& snapshot,
                       const std::string& outPath);

    EncodeResult fromRecordings(const std::string& cameraId, int64_t startMs, int64_t endMs,
                                const std::string& outPath);
    EncodeResult fromFrames(const std::vector<RingFrame>& frames, const std::string& outPath);
    EncodeResult fromStill(const cv::Mat& frame, const std::string& outPath);
    EncodeResult preview(const std::string& clipPath, const std::string& outPath);

private:
    std::vector<std::string> outputArgs() const;

    MediaSettings cfg;
    std::string root;
    int segmentSeconds;
    MediaEncoder encoder;
    RingReader ringReader;
};
