/**
 * @file FFmpegChannelRecorder.hpp
 * @brief Recorder primitive backed by ChunkEncoder on a worker thread.
 *
 * Track signals push frames and samples into a shared input queue. The
 * encoding thread drains it, feeds ChunkEncoder and emits whatever was
 * muxed once per timeslice. While paused the queue refuses input, so
 * paused time never reaches the file.
 *
 * @section Patterns
 * - Producer-Consumer: capture threads produce, the encoding thread consumes.
 * - RAII: the encoding thread is a std::jthread joined on destruction.
 */

#pragma once
#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>
#include "ChunkEncoder.hpp"
#include "RecorderFactory.hpp"
#include "RecorderPrimitive.hpp"

namespace smu {

class FFmpegChannelRecorder : public RecorderPrimitive {
    Q_OBJECT

public:
    FFmpegChannelRecorder(ChannelKind kind,
                          MediaStream& stream,
                          EncodingProfile profile,
                          RecorderOptions options,
                          QObject* parent = nullptr);
    ~FFmpegChannelRecorder() override;

    void start(std::chrono::milliseconds timeslice) override;
    void pause() override;
    void resume() override;
    void stop() override;

    RecorderState state() const override {
        return state_.load();
    }
    QString mimeType() const override {
        return QString::fromStdString(profile_.mimeType);
    }

private:
    struct TimedFrame {
        VideoFrame frame;
        i64 ptsUs{0};
    };

    struct InputBatch {
        std::vector<TimedFrame> frames;
        std::vector<f32> samples;
        bool empty() const {
            return frames.empty() && samples.empty();
        }
    };

    // Shared with the track slots, which may outlive this recorder
    struct InputQueue {
        static constexpr usize kMaxFrames = 8;

        void pushFrame(const VideoFrame& frame);
        void pushSamples(const AudioBuffer& buffer);
        void pause(TimePoint now);
        void resume(TimePoint now);
        void close();
        InputBatch waitAndTake(std::stop_token st, TimePoint deadline);
        InputBatch takeAll();

        std::mutex mutex;
        std::condition_variable_any cv;
        TimePoint origin;
        Duration pausedTotal{0};
        std::optional<TimePoint> pausedAt;
        bool accepting{false};
        u64 droppedFrames{0};
        InputBatch pending;
    };

    void connectTracks();
    void disconnectTracks();
    ChunkEncoderSettings encoderSettings(std::chrono::milliseconds timeslice) const;

    void encodeLoop(std::stop_token stopToken,
                    std::chrono::milliseconds timeslice);
    void encodeBatch(InputBatch& batch);
    void fault(const std::string& message);

    ChannelKind kind_;
    MediaStream& stream_;
    EncodingProfile profile_;
    RecorderOptions options_;

    std::atomic<RecorderState> state_{RecorderState::Inactive};
    std::shared_ptr<InputQueue> queue_;
    std::optional<Signal<const VideoFrame&>::SlotId> videoSlot_;
    std::optional<Signal<const AudioBuffer&>::SlotId> audioSlot_;

    std::jthread thread_;
    ChunkEncoder encoder_;
    u32 audioChannels_{1};
    bool faulted_{false}; // encoding thread only
};

class FFmpegRecorderFactory : public RecorderFactory {
public:
    bool isEncodingSupported(const std::string& mimeType) const override;

    Result<std::unique_ptr<RecorderPrimitive>> create(
            ChannelKind kind,
            MediaStream& stream,
            const EncodingProfile& profile,
            const RecorderOptions& options) override;
};

} // namespace smu
