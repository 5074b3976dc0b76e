#pragma once
// FFmpegUtils.hpp - RAII handles and error helpers for the FFmpeg C API

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavdevice/avdevice.h>
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libavutil/imgutils.h>
#include <libavutil/opt.h>
#include <libswresample/swresample.h>
#include <libswscale/swscale.h>
}

#include <memory>
#include <string>

namespace smu {

struct AVFormatContextDeleter {
    void operator()(AVFormatContext* ctx) const {
        avformat_free_context(ctx);
    }
};

// For contexts opened with avformat_open_input
struct AVInputContextDeleter {
    void operator()(AVFormatContext* ctx) const {
        avformat_close_input(&ctx);
    }
};

struct AVCodecContextDeleter {
    void operator()(AVCodecContext* ctx) const {
        avcodec_free_context(&ctx);
    }
};

struct AVFrameDeleter {
    void operator()(AVFrame* frame) const {
        av_frame_free(&frame);
    }
};

struct AVPacketDeleter {
    void operator()(AVPacket* packet) const {
        av_packet_free(&packet);
    }
};

struct AVIOContextDeleter {
    void operator()(AVIOContext* ctx) const {
        if (ctx) {
            av_freep(&ctx->buffer);
        }
        avio_context_free(&ctx);
    }
};

struct SwsContextDeleter {
    void operator()(SwsContext* ctx) const {
        sws_freeContext(ctx);
    }
};

struct SwrContextDeleter {
    void operator()(SwrContext* ctx) const {
        swr_free(&ctx);
    }
};

using AVFormatContextPtr = std::unique_ptr<AVFormatContext, AVFormatContextDeleter>;
using AVInputContextPtr = std::unique_ptr<AVFormatContext, AVInputContextDeleter>;
using AVCodecContextPtr = std::unique_ptr<AVCodecContext, AVCodecContextDeleter>;
using AVFramePtr = std::unique_ptr<AVFrame, AVFrameDeleter>;
using AVPacketPtr = std::unique_ptr<AVPacket, AVPacketDeleter>;
using AVIOContextPtr = std::unique_ptr<AVIOContext, AVIOContextDeleter>;
using SwsContextPtr = std::unique_ptr<SwsContext, SwsContextDeleter>;
using SwrContextPtr = std::unique_ptr<SwrContext, SwrContextDeleter>;

inline std::string ffmpegError(int errnum) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {};
    av_strerror(errnum, buf, sizeof(buf));
    return buf;
}

} // namespace smu
