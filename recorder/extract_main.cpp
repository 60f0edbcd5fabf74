#include "ClipExtractor.hpp"
#include "RingBuffer.hpp"
#include "supervisor/Config.hpp"
#include "supervisor/Logger.hpp"
#include <cstdlib>
#include <iostream>
#include <string>

/* Offline clip extraction: recordings first, then the daemon's frame ring
   when it is running on this host. */
int main(int argc, char* argv[]) {
    if (argc < 6) {
        std::cout << "Usage: tdv_extract <config> <camera_id> <from_ms> <to_ms> <output.mp4>\n";
        std::cout << "Example: tdv_extract /etc/tdv/edge.json cam1 1700000000000 1700000030000 /tmp/clip.mp4\n";
        return 1;
    }

    std::string configPath = argv[1];
    std::string cameraId = argv[2];
    int64_t from = 0;
    int64_t to = 0;
    try {
        from = std::stoll(argv[3]);
        to = std::stoll(argv[4]);
    } catch (const std::exception&) {
        std::cerr << "[Extract] from/to must be epoch milliseconds\n";
        return 1;
    }
    std::string output = argv[5];
    if (to <= from) {
        std::cerr << "[Extract] empty range\n";
        return 1;
    }

    ConfigPtr cfg;
    try {
        ConfigStore store(configPath);
        cfg = store.load();
    } catch (const ConfigError& e) {
        std::cerr << "[Config] " << e.what() << "\n";
        return 1;
    }
    if (const char* level = getenv("TDV_LOG_LEVEL")) Logger::instance().setLevel(parseLogLevel(level));

    const GlobalSettings& g = cfg->global;
    ClipExtractor extractor(g.media, g.recorder.root, g.recorder.segmentSeconds);

    std::shared_ptr<SharedFrameRing> ring = SharedFrameRing::attach(cameraId);
    cv::Mat still;
    if (ring) {
        logInfo("Extract", "attached to frame ring " + SharedFrameRing::shmName(cameraId));
        extractor.setRingReader([ring](const std::string&, int64_t startMs, int64_t endMs, size_t maxFrames) {
            return ring->readRange(startMs, endMs, maxFrames);
        });
        RingFrame last;
        if (ring->latest(last)) still = last.image;
    }

    ClipResult r = extractor.extract(cameraId, from, to, still, output);
    if (!r.ok) {
        std::cerr << "[Extract] failed: " << r.error << "\n";
        return 1;
    }
    std::cout << "[Extract] " << output << " from " << toString(r.source)
              << (r.truncated ? " (truncated)" : "") << "\n";
    return 0;
}
