#pragma once
#include "frame_source.h"
#include <atomic>
#include <chrono>
#include <cstdint>

struct AVFormatContext;
struct AVCodecContext;
struct AVFrame;
struct AVPacket;
struct SwsContext;

// Relay restream decoded in-process with libavformat/libavcodec.
class FfmpegSource : public FrameSource {
public:
    FfmpegSource(std::string transport, int readTimeoutMs);
    ~FfmpegSource() override;

    bool open(const std::string& url, int timeoutMs) override;
    bool read(cv::Mat& frame) override;
    void close() override;
    void interrupt() override { abortRequested = true; }

private:
    static int interruptCallback(void* opaque);
    void armDeadline(int timeoutMs);
    bool convert(cv::Mat& out);

    std::string transport;
    int readTimeoutMs;
    std::atomic<bool> abortRequested{false};
    std::atomic<int64_t> deadlineNs{0};

    AVFormatContext* fmt = nullptr;
    AVCodecContext* codec = nullptr;
    AVFrame* frame = nullptr;
    AVPacket* packet = nullptr;
    SwsContext* sws = nullptr;
    int videoStream = -1;
    int swsW = 0, swsH = 0, swsFmt = -1;
};
