#include "FFmpegChannelRecorder.hpp"
#include <algorithm>
#include "core/Logger.hpp"

namespace smu {

void FFmpegChannelRecorder::InputQueue::pushFrame(const VideoFrame& frame) {
    std::lock_guard lock(mutex);
    if (!accepting)
        return;
    auto pts = std::chrono::duration_cast<Duration>(frame.captured - origin) -
               pausedTotal;
    if (pts.count() < 0)
        return;
    if (pending.frames.size() >= kMaxFrames) {
        pending.frames.erase(pending.frames.begin());
        ++droppedFrames;
    }
    pending.frames.push_back({frame, pts.count()});
    cv.notify_one();
}

void FFmpegChannelRecorder::InputQueue::pushSamples(const AudioBuffer& buffer) {
    std::lock_guard lock(mutex);
    if (!accepting)
        return;
    pending.samples.insert(
            pending.samples.end(), buffer.samples.begin(), buffer.samples.end());
    cv.notify_one();
}

void FFmpegChannelRecorder::InputQueue::pause(TimePoint now) {
    std::lock_guard lock(mutex);
    accepting = false;
    pausedAt = now;
}

void FFmpegChannelRecorder::InputQueue::resume(TimePoint now) {
    std::lock_guard lock(mutex);
    if (pausedAt) {
        pausedTotal += std::chrono::duration_cast<Duration>(now - *pausedAt);
        pausedAt.reset();
    }
    accepting = true;
}

void FFmpegChannelRecorder::InputQueue::close() {
    std::lock_guard lock(mutex);
    accepting = false;
    cv.notify_all();
}

FFmpegChannelRecorder::InputBatch
FFmpegChannelRecorder::InputQueue::waitAndTake(std::stop_token st,
                                               TimePoint deadline) {
    std::unique_lock lock(mutex);
    cv.wait_until(lock, st, deadline, [this] { return !pending.empty(); });
    InputBatch out;
    std::swap(out, pending);
    return out;
}

FFmpegChannelRecorder::InputBatch FFmpegChannelRecorder::InputQueue::takeAll() {
    std::lock_guard lock(mutex);
    InputBatch out;
    std::swap(out, pending);
    return out;
}

FFmpegChannelRecorder::FFmpegChannelRecorder(ChannelKind kind,
                                             MediaStream& stream,
                                             EncodingProfile profile,
                                             RecorderOptions options,
                                             QObject* parent)
    : RecorderPrimitive(parent),
      kind_(kind),
      stream_(stream),
      profile_(std::move(profile)),
      options_(options) {
}

FFmpegChannelRecorder::~FFmpegChannelRecorder() {
    disconnectTracks();
    if (queue_)
        queue_->close();
    thread_.request_stop();
    if (thread_.joinable())
        thread_.join();
}

ChunkEncoderSettings FFmpegChannelRecorder::encoderSettings(
        std::chrono::milliseconds timeslice) const {
    ChunkEncoderSettings s;
    s.profile = profile_;
    s.timeslice = timeslice;
    if (auto* video = stream_.videoTrack()) {
        s.video = true;
        s.width = video->width();
        s.height = video->height();
        s.fps = std::max(video->fps(), 1u);
        s.videoBitrate = options_.videoBitrate;
    }
    if (auto* audio = stream_.audioTrack()) {
        s.audio = true;
        s.sampleRate = audio->sampleRate();
        s.channels = audio->channels();
        s.audioBitrate = options_.audioBitrate;
    }
    return s;
}

void FFmpegChannelRecorder::connectTracks() {
    if (auto* video = stream_.videoTrack()) {
        videoSlot_ = video->frameCaptured.connect(
                [q = queue_](const VideoFrame& frame) { q->pushFrame(frame); });
    }
    if (auto* audio = stream_.audioTrack()) {
        audioSlot_ = audio->samplesCaptured.connect(
                [q = queue_](const AudioBuffer& buf) { q->pushSamples(buf); });
    }
}

void FFmpegChannelRecorder::disconnectTracks() {
    if (videoSlot_) {
        if (auto* video = stream_.videoTrack())
            video->frameCaptured.disconnect(*videoSlot_);
        videoSlot_.reset();
    }
    if (audioSlot_) {
        if (auto* audio = stream_.audioTrack())
            audio->samplesCaptured.disconnect(*audioSlot_);
        audioSlot_.reset();
    }
}

void FFmpegChannelRecorder::start(std::chrono::milliseconds timeslice) {
    if (state_ != RecorderState::Inactive || thread_.joinable())
        return;

    if (auto* audio = stream_.audioTrack())
        audioChannels_ = std::max(audio->channels(), 1u);

    queue_ = std::make_shared<InputQueue>();
    queue_->origin = Clock::now();
    queue_->accepting = true;
    connectTracks();

    state_ = RecorderState::Recording;
    thread_ = std::jthread(
            [this, timeslice](std::stop_token st) { encodeLoop(st, timeslice); });
    LOG_DEBUG("{} recorder started ({}, {} ms slices)",
              toString(kind_),
              profile_.mimeType,
              timeslice.count());
}

void FFmpegChannelRecorder::pause() {
    if (state_ != RecorderState::Recording)
        return;
    queue_->pause(Clock::now());
    state_ = RecorderState::Paused;
}

void FFmpegChannelRecorder::resume() {
    if (state_ != RecorderState::Paused)
        return;
    queue_->resume(Clock::now());
    state_ = RecorderState::Recording;
}

void FFmpegChannelRecorder::stop() {
    if (state_ == RecorderState::Inactive)
        return;
    state_ = RecorderState::Inactive;
    disconnectTracks();
    queue_->close();
    thread_.request_stop();
}

void FFmpegChannelRecorder::fault(const std::string& message) {
    if (faulted_)
        return;
    faulted_ = true;
    encoder_.cleanup();
    LOG_WARN("{} recorder fault: {}", toString(kind_), message);
    emit faulted(QString::fromStdString(message));
}

void FFmpegChannelRecorder::encodeBatch(InputBatch& batch) {
    if (faulted_)
        return;

    for (const auto& tf : batch.frames) {
        if (auto res = encoder_.encodeVideo(tf.frame, tf.ptsUs); !res) {
            fault(res.error().message);
            return;
        }
    }

    if (!batch.samples.empty()) {
        if (auto res = encoder_.encodeAudio(
                    batch.samples.data(), batch.samples.size() / audioChannels_);
            !res) {
            fault(res.error().message);
        }
    }
}

void FFmpegChannelRecorder::encodeLoop(std::stop_token stopToken,
                                       std::chrono::milliseconds timeslice) {
    LOG_DEBUG("{} encoding thread started", toString(kind_));

    if (auto res = encoder_.init(encoderSettings(timeslice)); !res) {
        fault(res.error().message);
    }

    auto nextSlice = Clock::now() + timeslice;
    while (!stopToken.stop_requested()) {
        auto batch = queue_->waitAndTake(stopToken, nextSlice);
        encodeBatch(batch);

        auto now = Clock::now();
        if (now >= nextSlice) {
            if (!faulted_) {
                auto chunk = encoder_.takeOutput();
                if (!chunk.isEmpty())
                    emit dataAvailable(chunk);
            }
            nextSlice += timeslice;
            if (nextSlice <= now)
                nextSlice = now + timeslice;
        }
    }

    // Stop requested: drain what was captured before the request
    auto rest = queue_->takeAll();
    encodeBatch(rest);

    if (!faulted_) {
        if (auto res = encoder_.finish(); !res) {
            fault(res.error().message);
        } else {
            emit dataAvailable(encoder_.takeOutput());
        }
    }
    encoder_.cleanup();

    if (queue_->droppedFrames > 0) {
        LOG_DEBUG("{} recorder dropped {} frames",
                  toString(kind_),
                  queue_->droppedFrames);
    }
    LOG_DEBUG("{} encoding thread finishing", toString(kind_));
    emit stopped();
}

bool FFmpegRecorderFactory::isEncodingSupported(
        const std::string& mimeType) const {
    return EncodingProfile::isSupportedByFFmpeg(mimeType);
}

Result<std::unique_ptr<RecorderPrimitive>> FFmpegRecorderFactory::create(
        ChannelKind kind,
        MediaStream& stream,
        const EncodingProfile& profile,
        const RecorderOptions& options) {
    if (!stream.videoTrack() && !stream.audioTrack()) {
        return Result<std::unique_ptr<RecorderPrimitive>>::err(
                "Stream has no tracks", ErrorCode::RecorderFault);
    }
    if (profile.hasVideo() && !stream.videoTrack()) {
        return Result<std::unique_ptr<RecorderPrimitive>>::err(
                "Video encoding requested for an audio-only stream",
                ErrorCode::RecorderFault);
    }
    std::unique_ptr<RecorderPrimitive> recorder =
            std::make_unique<FFmpegChannelRecorder>(
                    kind, stream, profile, options);
    return Result<std::unique_ptr<RecorderPrimitive>>::ok(std::move(recorder));
}

} // namespace smu
