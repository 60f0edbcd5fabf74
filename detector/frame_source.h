#pragma once
#include <opencv2/core.hpp>
#include <string>

class FrameSource {
public:
    virtual ~FrameSource() = default;

    // Bounded by timeoutMs; false on failure (retryable).
    virtual bool open(const std::string& url, int timeoutMs) = 0;

    // Next decoded BGR frame. Bounded by the read timeout given at open.
    virtual bool read(cv::Mat& frame) = 0;

    virtual void close() = 0;

    // Aborts a blocked open/read from another thread.
    virtual void interrupt() = 0;
};
