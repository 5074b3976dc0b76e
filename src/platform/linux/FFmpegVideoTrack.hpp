/**
 * @file FFmpegVideoTrack.hpp
 * @brief Video track fed by an FFmpeg input device (x11grab, v4l2).
 *
 * Opens the device through libavdevice, decodes on a capture thread and
 * publishes RGBA frames scaled to fit the requested bounds. The input's
 * interrupt callback watches the running flag so stop() never waits on a
 * blocked device read.
 *
 * @section Dependencies
 * - FFmpeg (libavdevice, libavformat, libavcodec, libswscale)
 */

#pragma once
#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include "capture/MediaStream.hpp"
#include "recorder/FFmpegUtils.hpp"
#include "util/Result.hpp"

namespace smu {

struct VideoInputSpec {
    std::string label;
    std::string format; // x11grab, v4l2
    std::string url;
    std::map<std::string, std::string> options;
    u32 fps{30};
    // Frames larger than this are scaled down, keeping aspect ratio
    u32 maxWidth{0};
    u32 maxHeight{0};
};

class FFmpegVideoTrack : public VideoTrack {
public:
    static Result<std::unique_ptr<FFmpegVideoTrack>> open(VideoInputSpec spec);
    ~FFmpegVideoTrack() override;

protected:
    void onStop() override;

private:
    explicit FFmpegVideoTrack(VideoInputSpec spec);

    Result<void> openInput();
    void captureLoop(std::stop_token stopToken);
    void publish(AVFrame* decoded);

    static int interruptCallback(void* opaque);

    VideoInputSpec spec_;
    std::atomic<bool> running_{true};

    AVInputContextPtr inputCtx_;
    AVCodecContextPtr decoderCtx_;
    int streamIndex_{-1};
    SwsContext* swsCtx_{nullptr};

    std::jthread thread_;
};

} // namespace smu
