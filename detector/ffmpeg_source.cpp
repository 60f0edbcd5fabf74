extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/imgutils.h>
#include <libswscale/swscale.h>
}
#include "ffmpeg_source.h"
#include "supervisor/Logger.hpp"
#include <mutex>

static int64_t steadyNs() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
               std::chrono::steady_clock::now().time_since_epoch()).count();
}

static std::string avError(int err) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(err, buf, sizeof(buf));
    return buf;
}

FfmpegSource::FfmpegSource(std::string transportName, int readTimeout)
    : transport(std::move(transportName)), readTimeoutMs(readTimeout) {
    static std::once_flag once;
    std::call_once(once, []() {
        av_log_set_level(AV_LOG_ERROR);
        avformat_network_init();
    });
}

FfmpegSource::~FfmpegSource() {
    close();
}

int FfmpegSource::interruptCallback(void* opaque) {
    auto* self = static_cast<FfmpegSource*>(opaque);
    if (self->abortRequested) return 1;
    return steadyNs() > self->deadlineNs.load() ? 1 : 0;
}

void FfmpegSource::armDeadline(int timeoutMs) {
    deadlineNs = steadyNs() + (int64_t)timeoutMs * 1000000;
}

bool FfmpegSource::open(const std::string& url, int timeoutMs) {
    close();
    abortRequested = false;

    fmt = avformat_alloc_context();
    if (!fmt) return false;
    fmt->interrupt_callback.callback = &FfmpegSource::interruptCallback;
    fmt->interrupt_callback.opaque = this;

    AVDictionary* opts = nullptr;
    if (url.rfind("rtsp", 0) == 0) av_dict_set(&opts, "rtsp_transport", transport.c_str(), 0);
    av_dict_set(&opts, "rw_timeout", std::to_string((int64_t)readTimeoutMs * 1000).c_str(), 0);

    armDeadline(timeoutMs);
    int ret = avformat_open_input(&fmt, url.c_str(), nullptr, &opts);
    av_dict_free(&opts);
    if (ret < 0) {
        logWarn("Decoder", "open " + url + " failed: " + avError(ret));
        fmt = nullptr;   // freed by avformat_open_input on failure
        return false;
    }

    armDeadline(timeoutMs);
    if (avformat_find_stream_info(fmt, nullptr) < 0) {
        logWarn("Decoder", "no stream info for " + url);
        close();
        return false;
    }

    videoStream = av_find_best_stream(fmt, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (videoStream < 0) {
        logWarn("Decoder", "no video stream found in " + url);
        close();
        return false;
    }

    AVCodecParameters* par = fmt->streams[videoStream]->codecpar;
    const AVCodec* dec = avcodec_find_decoder(par->codec_id);
    if (!dec) {
        logWarn("Decoder", std::string("no decoder for ") + avcodec_get_name(par->codec_id));
        close();
        return false;
    }
    codec = avcodec_alloc_context3(dec);
    if (!codec || avcodec_parameters_to_context(codec, par) < 0 || avcodec_open2(codec, dec, nullptr) < 0) {
        logWarn("Decoder", "cannot open decoder");
        close();
        return false;
    }

    frame = av_frame_alloc();
    packet = av_packet_alloc();
    if (!frame || !packet) {
        close();
        return false;
    }
    logInfo("Decoder", "opened " + url + " (" + std::to_string(par->width) + "x" + std::to_string(par->height) +
                           " " + avcodec_get_name(par->codec_id) + ")");
    return true;
}

bool FfmpegSource::convert(cv::Mat& out) {
    if (!sws || swsW != frame->width || swsH != frame->height || swsFmt != frame->format) {
        sws_freeContext(sws);
        sws = sws_getContext(frame->width, frame->height, (AVPixelFormat)frame->format, frame->width,
                             frame->height, AV_PIX_FMT_BGR24, SWS_BILINEAR, nullptr, nullptr, nullptr);
        swsW = frame->width;
        swsH = frame->height;
        swsFmt = frame->format;
        if (!sws) return false;
    }
    out.create(frame->height, frame->width, CV_8UC3);
    uint8_t* dst[4] = {out.data, nullptr, nullptr, nullptr};
    int dstStride[4] = {(int)out.step[0], 0, 0, 0};
    sws_scale(sws, frame->data, frame->linesize, 0, frame->height, dst, dstStride);
    return true;
}

bool FfmpegSource::read(cv::Mat& out) {
    if (!fmt || !codec) return false;

    while (!abortRequested) {
        int ret = avcodec_receive_frame(codec, frame);
        if (ret == 0) {
            bool ok = convert(out);
            av_frame_unref(frame);
            return ok;
        }
        if (ret != AVERROR(EAGAIN)) return false;

        armDeadline(readTimeoutMs);
        ret = av_read_frame(fmt, packet);
        if (ret < 0) {
            if (ret != AVERROR_EXIT) logDebug("Decoder", "read failed: " + avError(ret));
            return false;
        }
        if (packet->stream_index == videoStream) {
            ret = avcodec_send_packet(codec, packet);
            if (ret < 0 && ret != AVERROR(EAGAIN)) {
                logDebug("Decoder", "decode error: " + avError(ret));
            }
        }
        av_packet_unref(packet);
    }
    return false;
}

void FfmpegSource::close() {
    if (sws) {
        sws_freeContext(sws);
        sws = nullptr;
    }
    if (packet) av_packet_free(&packet);
    if (frame) av_frame_free(&frame);
    if (codec) avcodec_free_context(&codec);
    if (fmt) avformat_close_input(&fmt);
    videoStream = -1;
    swsW = swsH = 0;
    swsFmt = -1;
}
