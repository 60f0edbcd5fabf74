#include "ClipExtractor.hpp"
#include "supervisor/Logger.hpp"
#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <unistd.h>
#include <opencv2/imgproc.hpp>

const char* toString(ClipSource s) {
    switch (s) {
        case ClipSource::None: return "";
        case ClipSource::Recording: return "recording";
        case ClipSource::RingBuffer: return "ring_buffer";
        case ClipSource::SingleFrame: return "single_frame";
    }
    return "";
}

ClipPlan planClip(const std::vector<Segment>& segments, int64_t startMs, int64_t endMs) {
    ClipPlan plan;
    auto overlap = overlappingSegments(segments, startMs, endMs);
    for (size_t i = 0; i < overlap.size(); i++) {
        const Segment& s = overlap[i];
        if (!std::filesystem::exists(s.path)) {
            logWarn("Clip", "missing segment: " + s.path);
            continue;
        }
        ClipPlanEntry e;
        e.path = s.path;
        int64_t from = std::max(startMs, s.startMs);
        int64_t to = std::min(endMs, s.endMs);
        if (from > s.startMs) e.inpoint = (from - s.startMs) / 1000.0;
        if (to < s.endMs) e.outpoint = (to - s.startMs) / 1000.0;
        plan.coveredSeconds += (to - from) / 1000.0;
        plan.entries.push_back(std::move(e));
    }
    return plan;
}

static std::string quoteConcatPath(const std::string& path) {
    std::string out = "'";
    for (char c : path) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    return out + "'";
}

std::string concatList(const ClipPlan& plan) {
    std::string out = "ffconcat version 1.0\n";
    char buf[64];
    for (const auto& e : plan.entries) {
        out += "file " + quoteConcatPath(e.path) + "\n";
        if (e.inpoint) {
            snprintf(buf, sizeof(buf), "inpoint %.3f\n", *e.inpoint);
            out += buf;
        }
        if (e.outpoint) {
            snprintf(buf, sizeof(buf), "outpoint %.3f\n", *e.outpoint);
            out += buf;
        }
    }
    return out;
}

ClipExtractor::ClipExtractor(MediaSettings media, std::string recordingsRoot, int segSeconds)
    : cfg(std::move(media)),
      root(std::move(recordingsRoot)),
      segmentSeconds(segSeconds),
      encoder(cfg.encoderPath, cfg.minOutputBytes, std::chrono::seconds(cfg.encodeTimeoutSeconds)) {}

std::vector<std::string> ClipExtractor::outputArgs() const {
    std::string w = std::to_string(cfg.outputWidth);
    std::string h = std::to_string(cfg.outputHeight);
    return {
        "-an",
        "-vf", "fps=" + std::to_string(cfg.outputFps) + ",scale=" + w + ":" + h +
                   ":force_original_aspect_ratio=decrease,pad=" + w + ":" + h + ":(ow-iw)/2:(oh-ih)/2",
        "-c:v", "libx264", "-preset", "veryfast", "-pix_fmt", "yuv420p",
        "-movflags", "+faststart",
        "-f", "mp4", "{out}",
    };
}

EncodeResult ClipExtractor::fromRecordings(const std::string& cameraId, int64_t startMs, int64_t endMs,
                                           const std::string& outPath) {
    EncodeResult r;
    auto segments = listSegments(root + "/" + cameraId, segmentSeconds);
    ClipPlan plan = planClip(segments, startMs, endMs);
    if (plan.entries.empty()) {
        r.error = "no recording covers the window";
        return r;
    }

    std::string listPath = std::filesystem::path(outPath).parent_path().string() + "/.concat_" +
                           std::to_string(getpid()) + "_" + std::to_string(startMs) + ".txt";
    {
        std::ofstream f(listPath);
        if (!f) {
            r.error = "cannot write concat list";
            return r;
        }
        f << concatList(plan);
    }

    std::vector<std::string> args = {"-hide_banner", "-loglevel", "error", "-y",
                                     "-f", "concat", "-safe", "0", "-i", listPath};
    auto out = outputArgs();
    args.insert(args.end(), out.begin(), out.end());
    r = encoder.run(args, outPath);
    unlink(listPath.c_str());
    return r;
}

EncodeResult ClipExtractor::fromFrames(const std::vector<RingFrame>& frames, const std::string& outPath) {
    EncodeResult r;
    if (frames.empty()) {
        r.error = "no frames";
        return r;
    }
    const cv::Size size = frames.front().image.size();
    std::vector<cv::Mat> images;
    images.reserve(frames.size());
    for (const auto& f : frames) {
        if (f.image.size() == size) {
            images.push_back(f.image);
        } else {
            cv::Mat scaled;
            cv::resize(f.image, scaled, size);
            images.push_back(scaled);
        }
    }

    double fps = cfg.outputFps;
    if (frames.size() > 1) {
        double span = (frames.back().timestampMs - frames.front().timestampMs) / 1000.0;
        if (span > 0) fps = std::clamp((frames.size() - 1) / span, 1.0, 30.0);
    }
    char rate[32];
    snprintf(rate, sizeof(rate), "%.3f", fps);

    std::vector<std::string> args = {"-hide_banner", "-loglevel", "error", "-y",
                                     "-f", "rawvideo", "-pixel_format", "bgr24",
                                     "-video_size", std::to_string(size.width) + "x" + std::to_string(size.height),
                                     "-framerate", rate, "-i", "-"};
    auto out = outputArgs();
    args.insert(args.end(), out.begin(), out.end());
    return encoder.runWithFrames(args, images, outPath);
}

EncodeResult ClipExtractor::fromStill(const cv::Mat& frame, const std::string& outPath) {
    EncodeResult r;
    if (frame.empty()) {
        r.error = "no snapshot";
        return r;
    }
    cv::Mat bgr = frame;
    if (frame.channels() == 1) cv::cvtColor(frame, bgr, cv::COLOR_GRAY2BGR);

    // Two seconds of the same frame.
    std::vector<RingFrame> frames;
    int count = cfg.outputFps * 2;
    int64_t step = 1000 / cfg.outputFps;
    for (int i = 0; i < count; i++) {
        RingFrame f;
        f.timestampMs = i * step;
        f.image = bgr;
        frames.push_back(f);
    }
    return fromFrames(frames, outPath);
}

EncodeResult ClipExtractor::preview(const std::string& clipPath, const std::string& outPath) {
    std::vector<std::string> args = {"-hide_banner", "-loglevel", "error", "-y", "-i", clipPath,
                                     "-vf", "fps=4,scale=480:-1:flags=lanczos", "-loop", "0",
                                     "-f", "gif", "{out}"};
    return encoder.run(args, outPath);
}

ClipResult ClipExtractor::extract(const std::string& cameraId, int64_t startMs, int64_t endMs,
                                  const cv::Mat& snapshot, const std::string& outPath) {
    ClipResult result;

    EncodeResult r = fromRecordings(cameraId, startMs, endMs, outPath);
    if (r.ok) {
        result.ok = true;
        result.source = ClipSource::Recording;
        return result;
    }
    logWarn("Clip", cameraId + ": recording unusable (" + r.error + "), trying frame ring");

    if (ringReader) {
        // No more frames than the output rate can use.
        size_t limit = (size_t)(std::max<int64_t>(endMs - startMs, 0) / 1000 + 1) * cfg.outputFps;
        RingReadResult frames = ringReader(cameraId, startMs, endMs, limit);
        result.truncated = frames.truncated;
        if (!frames.frames.empty()) {
            r = fromFrames(frames.frames, outPath);
            if (r.ok) {
                result.ok = true;
                result.source = ClipSource::RingBuffer;
                return result;
            }
            logWarn("Clip", cameraId + ": ring clip failed (" + r.error + ")");
        }
    }

    r = fromStill(snapshot, outPath);
    if (r.ok) {
        result.ok = true;
        result.source = ClipSource::SingleFrame;
        return result;
    }
    result.error = r.error;
    return result;
}
