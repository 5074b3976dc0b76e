#include "ChunkEncoder.hpp"
#include <algorithm>
#include <libavcodec/version.h>
#include "core/Logger.hpp"

extern "C" {
#include <libavutil/audio_fifo.h>
}

#if LIBAVCODEC_VERSION_MAJOR >= 60
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#endif

namespace smu {

namespace {
constexpr int kIoBufferSize = 32 * 1024;
constexpr AVRational kMicroseconds{1, 1000000};

int pickSampleRate(const AVCodec* codec, int wanted) {
    if (!codec->supported_samplerates)
        return wanted;
    int best = 0;
    for (const int* r = codec->supported_samplerates; *r; ++r) {
        if (*r == wanted)
            return wanted;
        if (*r > best)
            best = *r;
    }
    return best > 0 ? best : wanted;
}
} // namespace

ChunkEncoder::ChunkEncoder() = default;

ChunkEncoder::~ChunkEncoder() {
    cleanup();
}

#if LIBAVFORMAT_VERSION_MAJOR >= 61
int ChunkEncoder::writeCallback(void* opaque, const uint8_t* buf, int size) {
#else
int ChunkEncoder::writeCallback(void* opaque, uint8_t* buf, int size) {
#endif
    auto* self = static_cast<ChunkEncoder*>(opaque);
    self->pending_.append(reinterpret_cast<const char*>(buf), size);
    return size;
}

Result<void> ChunkEncoder::init(const ChunkEncoderSettings& settings) {
    cleanup();

    AVFormatContext* ctx = nullptr;
    int ret = avformat_alloc_output_context2(
            &ctx, nullptr, settings.profile.container.c_str(), nullptr);
    formatCtx_.reset(ctx);

    if (ret < 0 || !formatCtx_) {
        return Result<void>::err("Failed to create " +
                                         settings.profile.container +
                                         " muxer: " + ffmpegError(ret),
                                 ErrorCode::EncodingUnsupported);
    }

    auto* ioBuffer = static_cast<unsigned char*>(av_malloc(kIoBufferSize));
    if (!ioBuffer)
        return Result<void>::err("Failed to allocate IO buffer",
                                 ErrorCode::RecorderFault);
    ioCtx_.reset(avio_alloc_context(ioBuffer,
                                    kIoBufferSize,
                                    1,
                                    this,
                                    nullptr,
                                    &ChunkEncoder::writeCallback,
                                    nullptr));
    if (!ioCtx_) {
        av_free(ioBuffer);
        return Result<void>::err("Failed to allocate IO context",
                                 ErrorCode::RecorderFault);
    }
    formatCtx_->pb = ioCtx_.get();
    formatCtx_->flags |= AVFMT_FLAG_CUSTOM_IO;

    if (settings.video && settings.profile.hasVideo()) {
        if (auto result = initVideoStream(settings); !result) {
            return result;
        }
    }

    if (settings.audio) {
        if (auto result = initAudioStream(settings); !result) {
            return result;
        }
    }

    if (!videoStream_ && !audioStream_) {
        return Result<void>::err("No encodable track in stream",
                                 ErrorCode::RecorderFault);
    }

    AVDictionary* opts = nullptr;
    if (settings.profile.container == "mp4") {
        // The output is never seekable, so the moov atom must come first
        av_dict_set(&opts, "movflags", "frag_keyframe+empty_moov+default_base_moof", 0);
    } else if (settings.profile.container == "webm" ||
               settings.profile.container == "matroska") {
        av_dict_set(&opts,
                    "cluster_time_limit",
                    std::to_string(settings.timeslice.count()).c_str(),
                    0);
    }
    ret = avformat_write_header(formatCtx_.get(), &opts);
    av_dict_free(&opts);

    if (ret < 0) {
        return Result<void>::err("Failed to write header: " + ffmpegError(ret),
                                 ErrorCode::RecorderFault);
    }
    headerWritten_ = true;

    packet_.reset(av_packet_alloc());
    if (!packet_) {
        return Result<void>::err("Failed to allocate packet",
                                 ErrorCode::RecorderFault);
    }

    LOG_DEBUG("Encoder ready: {} (video={}, audio={})",
              settings.profile.mimeType,
              videoStream_ != nullptr,
              audioStream_ != nullptr);
    return Result<void>::ok();
}

void ChunkEncoder::cleanup() {
    packet_.reset();
    videoFrame_.reset();
    audioFrame_.reset();
    if (swsCtx_) {
        sws_freeContext(swsCtx_);
        swsCtx_ = nullptr;
    }
    swrCtx_.reset();
    if (audioFifo_) {
        av_audio_fifo_free(audioFifo_);
        audioFifo_ = nullptr;
    }
    videoCodecCtx_.reset();
    audioCodecCtx_.reset();
    formatCtx_.reset();
    ioCtx_.reset();

    videoStream_ = nullptr;
    audioStream_ = nullptr;
    lastVideoPts_ = -1;
    audioSamplesWritten_ = 0;
    headerWritten_ = false;
}

Result<void> ChunkEncoder::initVideoStream(
        const ChunkEncoderSettings& settings) {
    const AVCodec* codec = avcodec_find_encoder_by_name(
            settings.profile.videoEncoder.c_str());
    if (!codec) {
        return Result<void>::err("Video encoder not found: " +
                                         settings.profile.videoEncoder,
                                 ErrorCode::EncodingUnsupported);
    }

    videoStream_ = avformat_new_stream(formatCtx_.get(), nullptr);
    if (!videoStream_)
        return Result<void>::err("Failed to create video stream",
                                 ErrorCode::RecorderFault);

    videoCodecCtx_.reset(avcodec_alloc_context3(codec));
    if (!videoCodecCtx_)
        return Result<void>::err("Failed to allocate video codec context",
                                 ErrorCode::RecorderFault);

    videoCodecCtx_->width = static_cast<int>(settings.width & ~1u);
    videoCodecCtx_->height = static_cast<int>(settings.height & ~1u);
    videoCodecCtx_->time_base =
            AVRational{1, static_cast<int>(settings.fps)};
    videoCodecCtx_->framerate =
            AVRational{static_cast<int>(settings.fps), 1};
    videoCodecCtx_->pix_fmt = AV_PIX_FMT_YUV420P;
    videoCodecCtx_->gop_size = static_cast<int>(settings.fps * 2);
    videoCodecCtx_->max_b_frames = 0;
    videoCodecCtx_->bit_rate = settings.videoBitrate;

    if (formatCtx_->oformat->flags & AVFMT_GLOBALHEADER) {
        videoCodecCtx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
    }

    AVDictionary* opts = nullptr;
    if (settings.profile.videoEncoder == "libx264") {
        av_dict_set(&opts, "preset", "ultrafast", 0);
        av_dict_set(&opts, "tune", "zerolatency", 0);
    } else if (settings.profile.videoEncoder.starts_with("libvpx")) {
        av_dict_set(&opts, "deadline", "realtime", 0);
        av_dict_set(&opts, "cpu-used", "8", 0);
    }

    int ret = avcodec_open2(videoCodecCtx_.get(), codec, &opts);
    av_dict_free(&opts);

    if (ret < 0) {
        return Result<void>::err("Failed to open video codec: " +
                                         ffmpegError(ret),
                                 ErrorCode::RecorderFault);
    }

    avcodec_parameters_from_context(videoStream_->codecpar,
                                    videoCodecCtx_.get());
    videoStream_->time_base = videoCodecCtx_->time_base;

    videoFrame_.reset(av_frame_alloc());
    if (!videoFrame_)
        return Result<void>::err("Failed to allocate video frame",
                                 ErrorCode::RecorderFault);
    videoFrame_->format = videoCodecCtx_->pix_fmt;
    videoFrame_->width = videoCodecCtx_->width;
    videoFrame_->height = videoCodecCtx_->height;
    if (av_frame_get_buffer(videoFrame_.get(), 0) < 0)
        return Result<void>::err("Failed to allocate video frame buffer",
                                 ErrorCode::RecorderFault);

    return Result<void>::ok();
}

Result<void> ChunkEncoder::initAudioStream(
        const ChunkEncoderSettings& settings) {
    const AVCodec* codec = avcodec_find_encoder_by_name(
            settings.profile.audioEncoder.c_str());
    if (!codec) {
        if (videoStream_) {
            LOG_WARN("Audio encoder {} not found, recording video only",
                     settings.profile.audioEncoder);
            return Result<void>::ok();
        }
        return Result<void>::err("Audio encoder not found: " +
                                         settings.profile.audioEncoder,
                                 ErrorCode::EncodingUnsupported);
    }

    audioStream_ = avformat_new_stream(formatCtx_.get(), nullptr);
    if (!audioStream_)
        return Result<void>::err("Failed to create audio stream",
                                 ErrorCode::RecorderFault);

    audioCodecCtx_.reset(avcodec_alloc_context3(codec));
    if (!audioCodecCtx_)
        return Result<void>::err("Failed to allocate audio codec context",
                                 ErrorCode::RecorderFault);

    inputChannels_ = settings.channels;
    int outRate = pickSampleRate(codec, static_cast<int>(settings.sampleRate));

    audioCodecCtx_->sample_rate = outRate;
    audioCodecCtx_->bit_rate = settings.audioBitrate;

    AVChannelLayout layout;
    av_channel_layout_default(&layout, static_cast<int>(settings.channels));
    av_channel_layout_copy(&audioCodecCtx_->ch_layout, &layout);

    audioCodecCtx_->sample_fmt =
            codec->sample_fmts ? codec->sample_fmts[0] : AV_SAMPLE_FMT_FLTP;
    audioCodecCtx_->time_base = AVRational{1, outRate};

    if (formatCtx_->oformat->flags & AVFMT_GLOBALHEADER) {
        audioCodecCtx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
    }

    int ret = avcodec_open2(audioCodecCtx_.get(), codec, nullptr);
    if (ret < 0) {
        return Result<void>::err("Failed to open audio codec: " +
                                         ffmpegError(ret),
                                 ErrorCode::RecorderFault);
    }

    avcodec_parameters_from_context(audioStream_->codecpar,
                                    audioCodecCtx_.get());
    audioStream_->time_base = audioCodecCtx_->time_base;

    int frameSize = audioCodecCtx_->frame_size > 0
                            ? audioCodecCtx_->frame_size
                            : 1024;

    audioFrame_.reset(av_frame_alloc());
    if (!audioFrame_)
        return Result<void>::err("Failed to allocate audio frame",
                                 ErrorCode::RecorderFault);
    audioFrame_->format = audioCodecCtx_->sample_fmt;
    av_channel_layout_copy(&audioFrame_->ch_layout, &audioCodecCtx_->ch_layout);
    audioFrame_->sample_rate = audioCodecCtx_->sample_rate;
    audioFrame_->nb_samples = frameSize;
    if (av_frame_get_buffer(audioFrame_.get(), 0) < 0)
        return Result<void>::err("Failed to allocate audio frame buffer",
                                 ErrorCode::RecorderFault);

    SwrContext* s = nullptr;
    swr_alloc_set_opts2(&s,
                        &audioCodecCtx_->ch_layout,
                        audioCodecCtx_->sample_fmt,
                        audioCodecCtx_->sample_rate,
                        &layout,
                        AV_SAMPLE_FMT_FLT,
                        static_cast<int>(settings.sampleRate),
                        0,
                        nullptr);
    swrCtx_.reset(s);
    if (!swrCtx_ || swr_init(swrCtx_.get()) < 0)
        return Result<void>::err("Failed to initialize resampler",
                                 ErrorCode::RecorderFault);

    audioFifo_ = av_audio_fifo_alloc(audioCodecCtx_->sample_fmt,
                                     audioCodecCtx_->ch_layout.nb_channels,
                                     frameSize);
    if (!audioFifo_)
        return Result<void>::err("Failed to allocate audio FIFO",
                                 ErrorCode::RecorderFault);

    return Result<void>::ok();
}

Result<void> ChunkEncoder::encodeVideo(const VideoFrame& frame, i64 ptsUs) {
    if (!videoCodecCtx_ || !videoFrame_ || frame.data.empty())
        return Result<void>::ok();

    i64 pts = av_rescale_q(ptsUs, kMicroseconds, videoCodecCtx_->time_base);
    if (pts <= lastVideoPts_)
        return Result<void>::ok(); // faster than the encoder frame rate

    swsCtx_ = sws_getCachedContext(swsCtx_,
                                   static_cast<int>(frame.width),
                                   static_cast<int>(frame.height),
                                   AV_PIX_FMT_RGBA,
                                   videoCodecCtx_->width,
                                   videoCodecCtx_->height,
                                   videoCodecCtx_->pix_fmt,
                                   SWS_BILINEAR,
                                   nullptr,
                                   nullptr,
                                   nullptr);
    if (!swsCtx_)
        return Result<void>::err("Failed to create scaler",
                                 ErrorCode::RecorderFault);

    if (av_frame_make_writable(videoFrame_.get()) < 0)
        return Result<void>::err("Video frame not writable",
                                 ErrorCode::RecorderFault);

    const u8* srcData[1] = {frame.data.data()};
    int srcLinesize[1] = {static_cast<int>(frame.width * 4)};

    sws_scale(swsCtx_,
              srcData,
              srcLinesize,
              0,
              static_cast<int>(frame.height),
              videoFrame_->data,
              videoFrame_->linesize);

    videoFrame_->pts = pts;
    lastVideoPts_ = pts;

    return encodeFrame(videoCodecCtx_.get(), videoStream_, videoFrame_.get());
}

Result<void> ChunkEncoder::encodeAudio(const f32* samples, usize frames) {
    if (!audioCodecCtx_ || !samples || frames == 0)
        return Result<void>::ok();

    int outCount = swr_get_out_samples(swrCtx_.get(), static_cast<int>(frames));
    if (outCount <= 0)
        return Result<void>::ok();

    u8** converted = nullptr;
    int ret = av_samples_alloc_array_and_samples(
            &converted,
            nullptr,
            audioCodecCtx_->ch_layout.nb_channels,
            outCount,
            audioCodecCtx_->sample_fmt,
            0);
    if (ret < 0)
        return Result<void>::err("Failed to allocate audio samples",
                                 ErrorCode::RecorderFault);

    const u8* srcData[1] = {reinterpret_cast<const u8*>(samples)};
    int got = swr_convert(swrCtx_.get(),
                          converted,
                          outCount,
                          srcData,
                          static_cast<int>(frames));
    if (got > 0) {
        av_audio_fifo_write(audioFifo_, reinterpret_cast<void**>(converted),
                            got);
    }
    av_freep(&converted[0]);
    av_freep(&converted);

    if (got < 0) {
        LOG_WARN("Audio resample error: {}", ffmpegError(got));
        return Result<void>::ok();
    }

    return drainAudioFifo(false);
}

Result<void> ChunkEncoder::drainAudioFifo(bool flushAll) {
    const int frameSize = audioFrame_->nb_samples;

    while (av_audio_fifo_size(audioFifo_) >= frameSize ||
           (flushAll && av_audio_fifo_size(audioFifo_) > 0)) {
        if (av_frame_make_writable(audioFrame_.get()) < 0)
            return Result<void>::err("Audio frame not writable",
                                     ErrorCode::RecorderFault);

        int read = av_audio_fifo_read(
                audioFifo_, reinterpret_cast<void**>(audioFrame_->data),
                frameSize);
        if (read < frameSize) {
            // Pad the tail with silence so fixed-size encoders accept it
            av_samples_set_silence(audioFrame_->data,
                                   std::max(read, 0),
                                   frameSize - std::max(read, 0),
                                   audioCodecCtx_->ch_layout.nb_channels,
                                   audioCodecCtx_->sample_fmt);
        }

        audioFrame_->pts = audioSamplesWritten_;
        audioSamplesWritten_ += frameSize;

        if (auto res = encodeFrame(
                    audioCodecCtx_.get(), audioStream_, audioFrame_.get());
            !res) {
            return res;
        }
    }
    return Result<void>::ok();
}

Result<void> ChunkEncoder::finish() {
    if (!headerWritten_)
        return Result<void>::err("Encoder not initialized",
                                 ErrorCode::InvalidState);

    if (audioCodecCtx_) {
        if (auto res = drainAudioFifo(true); !res)
            return res;
    }

    for (auto [ctx, stream] :
         {std::pair{videoCodecCtx_.get(), videoStream_},
          std::pair{audioCodecCtx_.get(), audioStream_}}) {
        if (!ctx)
            continue;
        if (auto res = encodeFrame(ctx, stream, nullptr); !res)
            return res;
    }

    int ret = av_write_trailer(formatCtx_.get());
    headerWritten_ = false;
    if (ret < 0) {
        return Result<void>::err("Failed to write trailer: " +
                                         ffmpegError(ret),
                                 ErrorCode::RecorderFault);
    }
    avio_flush(formatCtx_->pb);
    return Result<void>::ok();
}

QByteArray ChunkEncoder::takeOutput() {
    if (formatCtx_ && formatCtx_->pb)
        avio_flush(formatCtx_->pb);
    QByteArray out;
    out.swap(pending_);
    return out;
}

Result<void> ChunkEncoder::encodeFrame(AVCodecContext* ctx,
                                       AVStream* stream,
                                       AVFrame* frame) {
    int ret = avcodec_send_frame(ctx, frame);
    if (ret < 0 && ret != AVERROR_EOF)
        return Result<void>::err("Encoder rejected frame: " + ffmpegError(ret),
                                 ErrorCode::RecorderFault);

    while (true) {
        ret = avcodec_receive_packet(ctx, packet_.get());
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF)
            break;
        if (ret < 0)
            return Result<void>::err("Encoding failed: " + ffmpegError(ret),
                                     ErrorCode::RecorderFault);

        av_packet_rescale_ts(packet_.get(), ctx->time_base, stream->time_base);
        packet_->stream_index = stream->index;

        ret = av_interleaved_write_frame(formatCtx_.get(), packet_.get());
        if (ret < 0)
            return Result<void>::err("Failed to mux packet: " +
                                             ffmpegError(ret),
                                     ErrorCode::RecorderFault);
    }
    return Result<void>::ok();
}

} // namespace smu

#if LIBAVCODEC_VERSION_MAJOR >= 60
#pragma GCC diagnostic pop
#endif
