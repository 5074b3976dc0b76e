#include "LinuxMediaBackend.hpp"
#include <QGuiApplication>
#include <QScreen>
#include <cstdlib>
#include <mutex>
#include "FFmpegVideoTrack.hpp"
#include "PulseAudioTrack.hpp"
#include "core/Logger.hpp"

namespace smu {

namespace {
std::string x11Display() {
    const char* env = std::getenv("DISPLAY");
    return (env && *env) ? env : ":0";
}
} // namespace

LinuxMediaBackend::LinuxMediaBackend() {
    static std::once_flag registered;
    std::call_once(registered, [] { avdevice_register_all(); });
}

CapabilityProfile LinuxMediaBackend::resolveProfile() {
    CapabilityProfile profile;
    profile.platformName = QGuiApplication::platformName().toStdString();
    const bool x11 = profile.platformName == "xcb";
    profile.fineGrainedDisplayConstraints = x11;
    profile.displayAudioSupported = x11;
    return profile;
}

Result<std::unique_ptr<MediaStream>> LinuxMediaBackend::openDisplay(
        const DisplayConstraints& constraints) {
    VideoInputSpec spec;
    spec.label = "display";
    spec.format = "x11grab";
    spec.fps = constraints.fps;
    spec.options["framerate"] = std::to_string(constraints.fps);
    spec.options["draw_mouse"] = "1";
    spec.maxWidth = constraints.maxWidth.value_or(0);
    spec.maxHeight = constraints.maxHeight.value_or(0);

    if (!constraints.surface) {
        spec.url = x11Display();
    } else if (*constraints.surface == DisplayIntent::Window) {
        if (!targetWindow_) {
            return Result<std::unique_ptr<MediaStream>>::err(
                    "No window to capture", ErrorCode::DeviceError);
        }
        spec.url = x11Display();
        spec.options["window_id"] =
                std::to_string(static_cast<u64>(targetWindow_->winId()));
    } else {
        QScreen* screen = QGuiApplication::primaryScreen();
        if (!screen) {
            return Result<std::unique_ptr<MediaStream>>::err(
                    "No screen to capture", ErrorCode::DeviceError);
        }
        auto geo = screen->geometry();
        auto ratio = screen->devicePixelRatio();
        auto w = static_cast<int>(geo.width() * ratio);
        auto h = static_cast<int>(geo.height() * ratio);
        spec.url = x11Display() + "+" + std::to_string(geo.x()) + "," +
                   std::to_string(geo.y());
        spec.options["video_size"] =
                std::to_string(w) + "x" + std::to_string(h);
    }

    auto video = FFmpegVideoTrack::open(std::move(spec));
    if (!video) {
        return Result<std::unique_ptr<MediaStream>>::err(video.error());
    }

    auto stream = std::make_unique<MediaStream>();
    stream->addTrack(std::move(*video));

    if (constraints.captureAudio) {
        // Desktop sound comes from the monitor of the default sink
        auto audio = PulseAudioTrack::open(
                "display-audio", {"default.monitor", "@DEFAULT_MONITOR@"},
                48000, 2);
        if (audio) {
            stream->addTrack(std::move(*audio));
        } else {
            LOG_WARN("Display audio unavailable: {}", audio.error().message);
        }
    }

    return Result<std::unique_ptr<MediaStream>>::ok(std::move(stream));
}

Result<std::unique_ptr<MediaStream>> LinuxMediaBackend::openMicrophone(
        const MicrophoneConstraints& constraints) {
    // The simple API records the raw source; no voice processing is applied
    auto audio = PulseAudioTrack::open("microphone",
                                       {constraints.device},
                                       constraints.sampleRate,
                                       constraints.channels);
    if (!audio) {
        return Result<std::unique_ptr<MediaStream>>::err(
                audio.error().message, ErrorCode::OptionalAcquisitionFailed);
    }
    auto stream = std::make_unique<MediaStream>();
    stream->addTrack(std::move(*audio));
    return Result<std::unique_ptr<MediaStream>>::ok(std::move(stream));
}

Result<std::unique_ptr<MediaStream>> LinuxMediaBackend::openCamera(
        const CameraConstraints& constraints) {
    VideoInputSpec spec;
    spec.label = "camera";
    spec.format = "v4l2";
    spec.url = constraints.device;
    spec.fps = constraints.fps;
    spec.options["video_size"] = std::to_string(constraints.width) + "x" +
                                 std::to_string(constraints.height);
    spec.options["framerate"] = std::to_string(constraints.fps);
    spec.maxWidth = constraints.width;
    spec.maxHeight = constraints.height;

    auto video = FFmpegVideoTrack::open(std::move(spec));
    if (!video) {
        return Result<std::unique_ptr<MediaStream>>::err(
                video.error().message, ErrorCode::OptionalAcquisitionFailed);
    }
    auto stream = std::make_unique<MediaStream>();
    stream->addTrack(std::move(*video));
    return Result<std::unique_ptr<MediaStream>>::ok(std::move(stream));
}

} // namespace smu
