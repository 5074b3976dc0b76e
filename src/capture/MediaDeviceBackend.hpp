/**
 * @file MediaDeviceBackend.hpp
 * @brief Platform seam for opening capture devices.
 *
 * The acquirer only talks to this interface. The Linux implementation lives
 * in platform/linux; tests substitute an in-memory fake.
 */

#pragma once
#include <memory>
#include "CaptureTypes.hpp"
#include "MediaStream.hpp"
#include "util/Result.hpp"

namespace smu {

class MediaDeviceBackend {
public:
    virtual ~MediaDeviceBackend() = default;

    virtual CapabilityProfile resolveProfile() = 0;

    virtual Result<std::unique_ptr<MediaStream>> openDisplay(
            const DisplayConstraints& constraints) = 0;
    virtual Result<std::unique_ptr<MediaStream>> openMicrophone(
            const MicrophoneConstraints& constraints) = 0;
    virtual Result<std::unique_ptr<MediaStream>> openCamera(
            const CameraConstraints& constraints) = 0;
};

} // namespace smu
