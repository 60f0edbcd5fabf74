#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct Segment {
    std::string path;
    int64_t startMs = 0;
    int64_t endMs = 0;
    uint64_t bytes = 0;
};

// <dir>/%Y%m%d_%H%M%S.mp4, local time of the segment start.
std::string segmentPattern(const std::string& cameraDir);
std::string segmentFileName(int64_t startMs);
std::optional<int64_t> parseSegmentStart(const std::string& fileName);

// Segments of one camera directory, oldest first. A segment ends where the
// next one starts; the newest one is assumed to run for segmentSeconds.
std::vector<Segment> listSegments(const std::string& cameraDir, int segmentSeconds);

std::vector<Segment> overlappingSegments(const std::vector<Segment>& segments, int64_t startMs, int64_t endMs);
