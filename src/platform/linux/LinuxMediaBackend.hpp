/**
 * @file LinuxMediaBackend.hpp
 * @brief Device backend for X11/Wayland desktops.
 *
 * Display capture uses FFmpeg's x11grab, display audio and microphone use
 * PulseAudio, the camera uses v4l2. The capability profile comes from the
 * Qt platform plugin: only xcb allows targeting a window and capturing the
 * sink monitor; every other platform gets the coarse request.
 *
 * @section Dependencies
 * - FFmpeg (libavdevice)
 * - PulseAudio (pulse-simple)
 * - Qt6 Gui (QGuiApplication, QScreen, QWindow)
 */

#pragma once
#include <QPointer>
#include <QWindow>
#include "capture/MediaDeviceBackend.hpp"

namespace smu {

class LinuxMediaBackend : public MediaDeviceBackend {
public:
    LinuxMediaBackend();

    // Window intent captures this window
    void setTargetWindow(QWindow* window) {
        targetWindow_ = window;
    }

    CapabilityProfile resolveProfile() override;

    Result<std::unique_ptr<MediaStream>> openDisplay(
            const DisplayConstraints& constraints) override;
    Result<std::unique_ptr<MediaStream>> openMicrophone(
            const MicrophoneConstraints& constraints) override;
    Result<std::unique_ptr<MediaStream>> openCamera(
            const CameraConstraints& constraints) override;

private:
    QPointer<QWindow> targetWindow_;
};

} // namespace smu
