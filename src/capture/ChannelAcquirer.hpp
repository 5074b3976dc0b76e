/**
 * @file ChannelAcquirer.hpp
 * @brief Acquires the display, microphone and camera streams for a session.
 *
 * The display stream is mandatory: if it cannot be opened the whole
 * acquisition fails with MandatoryAcquisitionFailed and nothing stays open.
 * Microphone and camera are optional and attempted independently; any
 * failure, reported or thrown, leaves that channel absent.
 *
 * The capability profile is resolved once per acquisition and only shapes
 * the constraints that are requested.
 *
 * @section Dependencies
 * - MediaDeviceBackend
 * - ConfigData (display, microphone and camera sections)
 */

#pragma once
#include <memory>
#include "CaptureTypes.hpp"
#include "MediaDeviceBackend.hpp"
#include "MediaStream.hpp"
#include "core/ConfigData.hpp"
#include "util/Result.hpp"

namespace smu {

struct AcquirerSettings {
    DisplayConfig display;
    MicrophoneConfig microphone;
    CameraConfig camera;
};

struct AcquiredStreams {
    CapabilityProfile profile;
    std::unique_ptr<MediaStream> display;
    std::unique_ptr<MediaStream> microphone;
    std::unique_ptr<MediaStream> camera;

    void releaseAll();
};

class ChannelAcquirer {
public:
    ChannelAcquirer(MediaDeviceBackend& backend, AcquirerSettings settings);

    Result<AcquiredStreams> acquire(const CaptureRequest& request);

    // Opens and immediately releases the optional devices
    PermissionsResult probePermissions();

    void setSettings(AcquirerSettings settings) {
        settings_ = std::move(settings);
    }

    static DisplayConstraints displayConstraintsFor(
            const CapabilityProfile& profile,
            DisplayIntent intent,
            const DisplayConfig& cfg);
    static MicrophoneConstraints microphoneConstraintsFor(
            const MicrophoneConfig& cfg);
    static CameraConstraints cameraConstraintsFor(const CameraConfig& cfg);

private:
    template <typename Open>
    std::unique_ptr<MediaStream> tryOptional(ChannelKind kind, Open&& open);

    MediaDeviceBackend& backend_;
    AcquirerSettings settings_;
};

} // namespace smu
