#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

struct Process;

struct EncodeResult {
    bool ok = false;
    int exitCode = -1;
    uint64_t bytes = 0;
    std::string error;
};

// Runs the external encoder into a hidden temporary file and promotes it
// only when the encoder exited 0 and the output reached minBytes.
// "{out}" in the argument list is replaced with the temporary path.
class MediaEncoder {
    std::string binary;
    uint64_t minBytes;
    std::chrono::seconds timeout;

    EncodeResult finish(Process& p, const std::string& tmp, const std::string& finalPath);

public:
    MediaEncoder(std::string encoderBinary, uint64_t minOutputBytes, std::chrono::seconds limit)
        : binary(std::move(encoderBinary)), minBytes(minOutputBytes), timeout(limit) {}

    EncodeResult run(const std::vector<std::string>& args, const std::string& finalPath);

    // Streams BGR frames (all the same size) to the encoder's stdin.
    EncodeResult runWithFrames(const std::vector<std::string>& args, const std::vector<cv::Mat>& frames,
                               const std::string& finalPath);

    uint64_t minimumBytes() const { return minBytes; }
};
