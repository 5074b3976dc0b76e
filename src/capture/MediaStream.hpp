/**
 * @file MediaStream.hpp
 * @brief Live media tracks and the stream that owns them.
 *
 * A MediaTrack is one live source (video frames or audio samples) produced
 * by a device backend. A MediaStream groups the tracks acquired for one
 * channel and releases them exactly once.
 *
 * Frames and samples are delivered through Signals on the producing worker
 * thread. Consumers must not block in their slots.
 *
 * @section Patterns
 * - RAII: release() runs from the destructor if nobody called it.
 * - Template Method: stop() guards, onStop() does the device work.
 */

#pragma once
#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include "util/Signal.hpp"
#include "util/Types.hpp"

namespace smu {

struct VideoFrame {
    std::vector<u8> data; // RGBA, tightly packed
    u32 width{0};
    u32 height{0};
    TimePoint captured;
};

struct AudioBuffer {
    std::vector<f32> samples; // interleaved
    u32 channels{1};
    u32 sampleRate{48000};
    TimePoint captured;
};

class MediaTrack {
public:
    enum class Kind { Video, Audio };

    MediaTrack(Kind kind, std::string label);
    virtual ~MediaTrack() = default;

    MediaTrack(const MediaTrack&) = delete;
    MediaTrack& operator=(const MediaTrack&) = delete;

    Kind kind() const {
        return kind_;
    }
    const std::string& label() const {
        return label_;
    }
    bool isLive() const {
        return !stopped_.load();
    }

    // Idempotent; the device is released on the first call only
    void stop();

protected:
    virtual void onStop() = 0;

private:
    Kind kind_;
    std::string label_;
    std::atomic<bool> stopped_{false};
};

class VideoTrack : public MediaTrack {
public:
    VideoTrack(std::string label, u32 width, u32 height, u32 fps)
        : MediaTrack(Kind::Video, std::move(label)),
          width_(width),
          height_(height),
          fps_(fps) {
    }

    u32 width() const {
        return width_;
    }
    u32 height() const {
        return height_;
    }
    u32 fps() const {
        return fps_;
    }

    Signal<const VideoFrame&> frameCaptured;

protected:
    u32 width_;
    u32 height_;
    u32 fps_;
};

class AudioTrack : public MediaTrack {
public:
    AudioTrack(std::string label, u32 sampleRate, u32 channels)
        : MediaTrack(Kind::Audio, std::move(label)),
          sampleRate_(sampleRate),
          channels_(channels) {
    }

    u32 sampleRate() const {
        return sampleRate_;
    }
    u32 channels() const {
        return channels_;
    }

    Signal<const AudioBuffer&> samplesCaptured;

protected:
    u32 sampleRate_;
    u32 channels_;
};

class MediaStream {
public:
    MediaStream() = default;
    ~MediaStream();

    MediaStream(const MediaStream&) = delete;
    MediaStream& operator=(const MediaStream&) = delete;

    void addTrack(std::unique_ptr<MediaTrack> track);

    // Stops every track. Safe to call more than once.
    void release();
    bool isReleased() const {
        return released_;
    }

    VideoTrack* videoTrack() const;
    AudioTrack* audioTrack() const;
    const std::vector<std::unique_ptr<MediaTrack>>& tracks() const {
        return tracks_;
    }

private:
    std::vector<std::unique_ptr<MediaTrack>> tracks_;
    bool released_{false};
};

} // namespace smu
