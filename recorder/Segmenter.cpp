#include "Segmenter.hpp"
#include <algorithm>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

std::string segmentPattern(const std::string& cameraDir) {
    return cameraDir + "/%Y%m%d_%H%M%S.mp4";
}

std::string segmentFileName(int64_t startMs) {
    time_t t = (time_t)(startMs / 1000);
    struct tm tmBuf;
    localtime_r(&t, &tmBuf);
    char buf[64];
    strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S.mp4", &tmBuf);
    return buf;
}

std::optional<int64_t> parseSegmentStart(const std::string& fileName) {
    // 20240131_235959.mp4
    if (fileName.size() != 19 || fileName.compare(15, 4, ".mp4") != 0 || fileName[8] != '_') {
        return std::nullopt;
    }
    struct tm tmBuf = {};
    int n = sscanf(fileName.c_str(), "%4d%2d%2d_%2d%2d%2d", &tmBuf.tm_year, &tmBuf.tm_mon, &tmBuf.tm_mday,
                   &tmBuf.tm_hour, &tmBuf.tm_min, &tmBuf.tm_sec);
    if (n != 6) return std::nullopt;
    if (tmBuf.tm_mon < 1 || tmBuf.tm_mon > 12 || tmBuf.tm_mday < 1 || tmBuf.tm_mday > 31) return std::nullopt;
    tmBuf.tm_year -= 1900;
    tmBuf.tm_mon -= 1;
    tmBuf.tm_isdst = -1;
    time_t t = mktime(&tmBuf);
    if (t == (time_t)-1) return std::nullopt;
    return (int64_t)t * 1000;
}

std::vector<Segment> listSegments(const std::string& cameraDir, int segmentSeconds) {
    std::vector<Segment> out;
    std::error_code ec;
    for (fs::directory_iterator it(cameraDir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code fileEc;
        if (!it->is_regular_file(fileEc)) continue;
        auto start = parseSegmentStart(it->path().filename().string());
        if (!start) continue;
        Segment s;
        s.path = it->path().string();
        s.startMs = *start;
        s.bytes = it->file_size(fileEc);
        out.push_back(std::move(s));
    }
    std::sort(out.begin(), out.end(), [](const Segment& a, const Segment& b) { return a.startMs < b.startMs; });
    for (size_t i = 0; i < out.size(); i++) {
        int64_t nominal = out[i].startMs + (int64_t)segmentSeconds * 1000;
        out[i].endMs = (i + 1 < out.size()) ? std::min(out[i + 1].startMs, nominal) : nominal;
    }
    return out;
}

std::vector<Segment> overlappingSegments(const std::vector<Segment>& segments, int64_t startMs, int64_t endMs) {
    std::vector<Segment> out;
    for (const auto& s : segments) {
        if (s.startMs < endMs && s.endMs > startMs) out.push_back(s);
    }
    return out;
}
