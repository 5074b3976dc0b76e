#include "ChannelAcquirer.hpp"
#include <exception>
#include "core/Logger.hpp"

namespace smu {

namespace {
// Releases everything acquired so far unless the acquisition completes
class AcquisitionGuard {
public:
    explicit AcquisitionGuard(AcquiredStreams& streams) : streams_(streams) {
    }
    ~AcquisitionGuard() {
        if (!committed_)
            streams_.releaseAll();
    }
    void commit() {
        committed_ = true;
    }

private:
    AcquiredStreams& streams_;
    bool committed_{false};
};
} // namespace

void AcquiredStreams::releaseAll() {
    for (auto* stream : {display.get(), microphone.get(), camera.get()}) {
        if (stream)
            stream->release();
    }
}

ChannelAcquirer::ChannelAcquirer(MediaDeviceBackend& backend,
                                 AcquirerSettings settings)
    : backend_(backend), settings_(std::move(settings)) {
}

DisplayConstraints ChannelAcquirer::displayConstraintsFor(
        const CapabilityProfile& profile,
        DisplayIntent intent,
        const DisplayConfig& cfg) {
    DisplayConstraints c;
    c.fps = cfg.fps;
    if (profile.fineGrainedDisplayConstraints) {
        c.surface = intent;
        c.maxWidth = cfg.maxWidth;
        c.maxHeight = cfg.maxHeight;
    }
    c.captureAudio = profile.displayAudioSupported && cfg.captureAudio;
    return c;
}

MicrophoneConstraints ChannelAcquirer::microphoneConstraintsFor(
        const MicrophoneConfig& cfg) {
    MicrophoneConstraints c;
    c.device = cfg.device;
    c.sampleRate = cfg.sampleRate;
    c.channels = cfg.channels;
    return c;
}

CameraConstraints ChannelAcquirer::cameraConstraintsFor(
        const CameraConfig& cfg) {
    return {cfg.device, cfg.width, cfg.height, cfg.fps};
}

template <typename Open>
std::unique_ptr<MediaStream> ChannelAcquirer::tryOptional(ChannelKind kind,
                                                          Open&& open) {
    try {
        auto res = open();
        if (res)
            return std::move(*res);
        LOG_WARN("{} unavailable ({}): {}",
                 toString(kind),
                 toString(ErrorCode::OptionalAcquisitionFailed),
                 res.error().message);
    } catch (const std::exception& e) {
        LOG_WARN("{} unavailable ({}): {}",
                 toString(kind),
                 toString(ErrorCode::OptionalAcquisitionFailed),
                 e.what());
    }
    return nullptr;
}

Result<AcquiredStreams> ChannelAcquirer::acquire(
        const CaptureRequest& request) {
    AcquiredStreams streams;
    AcquisitionGuard guard(streams);

    streams.profile = backend_.resolveProfile();
    LOG_DEBUG("Capability profile '{}': fine-grained={}, display audio={}",
              streams.profile.platformName,
              streams.profile.fineGrainedDisplayConstraints,
              streams.profile.displayAudioSupported);

    auto constraints = displayConstraintsFor(
            streams.profile, request.displayIntent, settings_.display);

    std::string failure;
    try {
        auto res = backend_.openDisplay(constraints);
        if (res)
            streams.display = std::move(*res);
        else
            failure = res.error().message;
    } catch (const std::exception& e) {
        failure = e.what();
    }

    if (!streams.display) {
        LOG_ERROR("Display acquisition failed: {}", failure);
        return Result<AcquiredStreams>::err(
                "Display capture unavailable: " + failure,
                ErrorCode::MandatoryAcquisitionFailed);
    }

    if (request.wantMicrophone) {
        streams.microphone =
                tryOptional(ChannelKind::Microphone, [&] {
                    return backend_.openMicrophone(
                            microphoneConstraintsFor(settings_.microphone));
                });
    }

    if (request.wantCamera) {
        streams.camera = tryOptional(ChannelKind::Camera, [&] {
            return backend_.openCamera(cameraConstraintsFor(settings_.camera));
        });
    }

    LOG_INFO("Acquired display{}{}",
             streams.microphone ? " + microphone" : "",
             streams.camera ? " + camera" : "");

    guard.commit();
    return Result<AcquiredStreams>::ok(std::move(streams));
}

PermissionsResult ChannelAcquirer::probePermissions() {
    PermissionsResult result;

    auto mic = tryOptional(ChannelKind::Microphone, [&] {
        return backend_.openMicrophone(
                microphoneConstraintsFor(settings_.microphone));
    });
    result.hasMicrophone = mic != nullptr;
    if (mic)
        mic->release();

    auto cam = tryOptional(ChannelKind::Camera, [&] {
        return backend_.openCamera(cameraConstraintsFor(settings_.camera));
    });
    result.hasCamera = cam != nullptr;
    if (cam)
        cam->release();

    LOG_INFO("Permission probe: microphone={}, camera={}",
             result.hasMicrophone,
             result.hasCamera);
    return result;
}

} // namespace smu
