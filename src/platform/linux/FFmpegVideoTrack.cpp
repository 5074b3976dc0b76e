#include "FFmpegVideoTrack.hpp"
#include <algorithm>
#include "core/Logger.hpp"

namespace smu {

namespace {
std::pair<u32, u32> fitWithin(u32 w, u32 h, u32 maxW, u32 maxH) {
    if (w == 0 || h == 0)
        return {w, h};
    double scale = 1.0;
    if (maxW > 0 && w > maxW)
        scale = std::min(scale, static_cast<double>(maxW) / w);
    if (maxH > 0 && h > maxH)
        scale = std::min(scale, static_cast<double>(maxH) / h);
    auto outW = static_cast<u32>(w * scale) & ~1u;
    auto outH = static_cast<u32>(h * scale) & ~1u;
    return {std::max(outW, 2u), std::max(outH, 2u)};
}
} // namespace

FFmpegVideoTrack::FFmpegVideoTrack(VideoInputSpec spec)
    : VideoTrack(spec.label, 0, 0, spec.fps), spec_(std::move(spec)) {
}

FFmpegVideoTrack::~FFmpegVideoTrack() {
    stop();
}

Result<std::unique_ptr<FFmpegVideoTrack>> FFmpegVideoTrack::open(
        VideoInputSpec spec) {
    std::unique_ptr<FFmpegVideoTrack> track(
            new FFmpegVideoTrack(std::move(spec)));
    if (auto res = track->openInput(); !res) {
        return Result<std::unique_ptr<FFmpegVideoTrack>>::err(res.error());
    }
    track->thread_ = std::jthread(
            [t = track.get()](std::stop_token st) { t->captureLoop(st); });
    return Result<std::unique_ptr<FFmpegVideoTrack>>::ok(std::move(track));
}

int FFmpegVideoTrack::interruptCallback(void* opaque) {
    auto* self = static_cast<FFmpegVideoTrack*>(opaque);
    return (!self || !self->running_.load(std::memory_order_relaxed)) ? 1 : 0;
}

Result<void> FFmpegVideoTrack::openInput() {
    const AVInputFormat* fmt = av_find_input_format(spec_.format.c_str());
    if (!fmt) {
        return Result<void>::err("Input device not available: " + spec_.format,
                                 ErrorCode::DeviceError);
    }

    AVFormatContext* ctx = avformat_alloc_context();
    if (!ctx)
        return Result<void>::err("Failed to allocate input context",
                                 ErrorCode::DeviceError);
    ctx->interrupt_callback.callback = &FFmpegVideoTrack::interruptCallback;
    ctx->interrupt_callback.opaque = this;

    AVDictionary* opts = nullptr;
    for (const auto& [key, value] : spec_.options)
        av_dict_set(&opts, key.c_str(), value.c_str(), 0);

    // avformat_open_input frees ctx on failure
    int ret = avformat_open_input(&ctx, spec_.url.c_str(), fmt, &opts);
    av_dict_free(&opts);
    if (ret < 0) {
        return Result<void>::err("Failed to open " + spec_.format + " '" +
                                         spec_.url + "': " + ffmpegError(ret),
                                 ErrorCode::DeviceError);
    }
    inputCtx_.reset(ctx);

    ret = avformat_find_stream_info(inputCtx_.get(), nullptr);
    if (ret < 0) {
        return Result<void>::err("No stream info: " + ffmpegError(ret),
                                 ErrorCode::DeviceError);
    }

    const AVCodec* decoder = nullptr;
    streamIndex_ = av_find_best_stream(
            inputCtx_.get(), AVMEDIA_TYPE_VIDEO, -1, -1, &decoder, 0);
    if (streamIndex_ < 0 || !decoder) {
        return Result<void>::err("No video stream on " + spec_.url,
                                 ErrorCode::DeviceError);
    }

    decoderCtx_.reset(avcodec_alloc_context3(decoder));
    if (!decoderCtx_)
        return Result<void>::err("Failed to allocate decoder",
                                 ErrorCode::DeviceError);
    avcodec_parameters_to_context(
            decoderCtx_.get(), inputCtx_->streams[streamIndex_]->codecpar);
    ret = avcodec_open2(decoderCtx_.get(), decoder, nullptr);
    if (ret < 0) {
        return Result<void>::err("Failed to open decoder: " + ffmpegError(ret),
                                 ErrorCode::DeviceError);
    }

    auto [w, h] = fitWithin(static_cast<u32>(decoderCtx_->width),
                            static_cast<u32>(decoderCtx_->height),
                            spec_.maxWidth,
                            spec_.maxHeight);
    width_ = w;
    height_ = h;

    LOG_INFO("Opened {} '{}': {}x{} -> {}x{} @ {} fps",
             spec_.format,
             spec_.url,
             decoderCtx_->width,
             decoderCtx_->height,
             width_,
             height_,
             fps_);
    return Result<void>::ok();
}

void FFmpegVideoTrack::captureLoop(std::stop_token stopToken) {
    AVPacketPtr packet(av_packet_alloc());
    AVFramePtr decoded(av_frame_alloc());
    if (!packet || !decoded) {
        LOG_ERROR("{}: out of memory", label());
        return;
    }

    while (!stopToken.stop_requested()) {
        int ret = av_read_frame(inputCtx_.get(), packet.get());
        if (ret == AVERROR(EAGAIN))
            continue;
        if (ret < 0) {
            if (running_)
                LOG_WARN("{}: read ended: {}", label(), ffmpegError(ret));
            break;
        }

        if (packet->stream_index == streamIndex_ &&
            avcodec_send_packet(decoderCtx_.get(), packet.get()) >= 0) {
            while (avcodec_receive_frame(decoderCtx_.get(), decoded.get()) >=
                   0) {
                publish(decoded.get());
                av_frame_unref(decoded.get());
            }
        }
        av_packet_unref(packet.get());
    }
}

void FFmpegVideoTrack::publish(AVFrame* decoded) {
    swsCtx_ = sws_getCachedContext(swsCtx_,
                                   decoded->width,
                                   decoded->height,
                                   static_cast<AVPixelFormat>(decoded->format),
                                   static_cast<int>(width_),
                                   static_cast<int>(height_),
                                   AV_PIX_FMT_RGBA,
                                   SWS_BILINEAR,
                                   nullptr,
                                   nullptr,
                                   nullptr);
    if (!swsCtx_)
        return;

    VideoFrame frame;
    frame.width = width_;
    frame.height = height_;
    frame.captured = Clock::now();
    frame.data.resize(static_cast<usize>(width_) * height_ * 4);

    u8* dst[1] = {frame.data.data()};
    int dstLinesize[1] = {static_cast<int>(width_ * 4)};
    sws_scale(swsCtx_,
              decoded->data,
              decoded->linesize,
              0,
              decoded->height,
              dst,
              dstLinesize);

    frameCaptured.emitSignal(frame);
}

void FFmpegVideoTrack::onStop() {
    running_ = false;
    thread_.request_stop();
    if (thread_.joinable())
        thread_.join();

    decoderCtx_.reset();
    inputCtx_.reset();
    if (swsCtx_) {
        sws_freeContext(swsCtx_);
        swsCtx_ = nullptr;
    }
    LOG_DEBUG("{} closed", label());
}

} // namespace smu
