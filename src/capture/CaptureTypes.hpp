/**
 * @file CaptureTypes.hpp
 * @brief Value types shared by acquisition, recording and dispatch.
 *
 * Channel kinds, the display intent, per-channel constraint shapes and the
 * capability profile that decides which shape is requested.
 */

#pragma once
#include <optional>
#include <string>
#include <string_view>
#include "util/Types.hpp"

namespace smu {

enum class ChannelKind { Display, Microphone, Camera };

enum class DisplayIntent { Window, Monitor };

constexpr std::string_view toString(ChannelKind kind) {
    switch (kind) {
    case ChannelKind::Display:
        return "Display";
    case ChannelKind::Microphone:
        return "Microphone";
    case ChannelKind::Camera:
        return "Camera";
    }
    return "Display";
}

constexpr std::string_view toString(DisplayIntent intent) {
    return intent == DisplayIntent::Window ? "Window" : "Monitor";
}

// Case-insensitive, accepts "Window"/"window" and "Monitor"/"monitor"
std::optional<DisplayIntent> parseDisplayIntent(std::string_view text);
std::optional<ChannelKind> parseChannelKind(std::string_view text);

// Video-producing channels record video encodings, the rest audio
constexpr bool isVideoChannel(ChannelKind kind) {
    return kind != ChannelKind::Microphone;
}

struct CaptureRequest {
    bool wantMicrophone{false};
    bool wantCamera{false};
    DisplayIntent displayIntent{DisplayIntent::Monitor};
};

// Resolved once per acquisition from the running platform
struct CapabilityProfile {
    bool fineGrainedDisplayConstraints{true};
    bool displayAudioSupported{true};
    std::string platformName;
};

struct DisplayConstraints {
    // Empty on coarse platforms: a bare "video" request
    std::optional<DisplayIntent> surface;
    std::optional<u32> maxWidth;
    std::optional<u32> maxHeight;
    u32 fps{30};
    bool captureAudio{false};
};

struct MicrophoneConstraints {
    std::string device{"default"};
    u32 sampleRate{48000};
    u32 channels{1};
    // Raw capture, no platform voice processing
    bool echoCancellation{false};
    bool noiseSuppression{false};
    bool autoGainControl{false};
};

struct CameraConstraints {
    std::string device{"/dev/video0"};
    u32 width{1280};
    u32 height{720};
    u32 fps{30};
};

struct PermissionsResult {
    bool hasMicrophone{false};
    bool hasCamera{false};
};

} // namespace smu
