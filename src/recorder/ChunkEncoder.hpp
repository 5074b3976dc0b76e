/**
 * @file ChunkEncoder.hpp
 * @brief FFmpeg encoder and muxer writing into memory.
 *
 * Wraps libavcodec/libavformat for one channel. Muxed bytes land in an
 * in-memory AVIO sink and are handed out by takeOutput(), so the caller can
 * slice the container stream into chunks at any cadence. Concatenating every
 * slice in order yields a complete file.
 *
 * @section Dependencies
 * - FFmpeg (libavcodec, libavformat, libswscale, libswresample)
 *
 * @section Patterns
 * - Wrapper/Adapter: Wraps C-style FFmpeg API in a C++ class.
 * - RAII: Manages FFmpeg resources via smart pointers (AVFramePtr, etc.).
 */

#pragma once
#include <QByteArray>
#include <vector>
#include "EncodingProfile.hpp"
#include "FFmpegUtils.hpp"
#include "capture/MediaStream.hpp"
#include "util/Result.hpp"

struct AVAudioFifo;

namespace smu {

struct ChunkEncoderSettings {
    EncodingProfile profile;
    std::chrono::milliseconds timeslice{100};

    bool video{false};
    u32 width{0};
    u32 height{0};
    u32 fps{30};
    u32 videoBitrate{5000000};

    bool audio{false};
    u32 sampleRate{48000};
    u32 channels{1};
    u32 audioBitrate{128000};
};

class ChunkEncoder {
public:
    ChunkEncoder();
    ~ChunkEncoder();

    ChunkEncoder(const ChunkEncoder&) = delete;
    ChunkEncoder& operator=(const ChunkEncoder&) = delete;

    Result<void> init(const ChunkEncoderSettings& settings);
    void cleanup();

    // ptsUs is the presentation time relative to recording start
    Result<void> encodeVideo(const VideoFrame& frame, i64 ptsUs);
    Result<void> encodeAudio(const f32* samples, usize frames);

    // Drains the encoders and writes the container trailer
    Result<void> finish();

    // Bytes muxed since the previous call
    QByteArray takeOutput();

    bool hasVideo() const {
        return videoCodecCtx_ != nullptr;
    }
    bool hasAudio() const {
        return audioCodecCtx_ != nullptr;
    }

private:
    Result<void> initVideoStream(const ChunkEncoderSettings& settings);
    Result<void> initAudioStream(const ChunkEncoderSettings& settings);

    Result<void> encodeFrame(AVCodecContext* ctx, AVStream* stream,
                             AVFrame* frame);
    Result<void> drainAudioFifo(bool flushAll);

#if LIBAVFORMAT_VERSION_MAJOR >= 61
    static int writeCallback(void* opaque, const uint8_t* buf, int size);
#else
    static int writeCallback(void* opaque, uint8_t* buf, int size);
#endif

    AVFormatContextPtr formatCtx_;
    AVIOContextPtr ioCtx_;
    AVCodecContextPtr videoCodecCtx_;
    AVCodecContextPtr audioCodecCtx_;
    AVStream* videoStream_{nullptr};
    AVStream* audioStream_{nullptr};

    SwsContext* swsCtx_{nullptr};
    SwrContextPtr swrCtx_;
    AVAudioFifo* audioFifo_{nullptr};

    AVFramePtr videoFrame_;
    AVFramePtr audioFrame_;
    AVPacketPtr packet_;

    u32 inputChannels_{1};
    i64 lastVideoPts_{-1};
    i64 audioSamplesWritten_{0};
    bool headerWritten_{false};

    QByteArray pending_;
};

} // namespace smu
