/**
 * @file ConfigData.hpp
 * @brief Configuration data structures.
 *
 * POD structs holding configuration values, one per TOML section. Kept
 * apart from the logic classes so capture modules can take a section by
 * value without pulling in toml++.
 */

#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include "util/Types.hpp"

namespace smu {

namespace fs = std::filesystem;

// Session-wide recorder behaviour and encoding preferences
struct RecordingConfig {
    u32 chunkIntervalMs{100};
    u32 stopTimeoutMs{5000};
    bool wantMicrophone{true};
    bool wantCamera{false};
    std::vector<std::string> videoMimeTypes{"video/webm;codecs=vp9",
                                            "video/webm;codecs=vp8",
                                            "video/webm",
                                            "video/mp4"};
    std::vector<std::string> audioMimeTypes{"audio/webm;codecs=opus",
                                            "audio/webm",
                                            "audio/ogg;codecs=opus",
                                            "audio/mp4"};
};

struct DisplayConfig {
    std::string intent{"monitor"}; // monitor, window
    u32 maxWidth{1920};
    u32 maxHeight{1080};
    u32 fps{30};
    u32 bitrate{5000000};
    bool captureAudio{true};
};

struct MicrophoneConfig {
    std::string device{"default"};
    u32 sampleRate{48000};
    u32 channels{1};
    u32 bitrate{128000};
};

struct CameraConfig {
    std::string device{"/dev/video0"};
    u32 width{1280};
    u32 height{720};
    u32 fps{30};
    u32 bitrate{2000000};
};

// Interaction signal capture tuning
struct InteractionConfig {
    u32 flushIntervalMs{100};
    u32 moveThrottleMs{8};
    f32 velocitySmoothing{0.3f};
    u32 velocityOutlierMs{100};
    bool resetVelocityOnResume{false};
};

struct OutputConfig {
    bool saveToDisk{true};
    fs::path directory;
    bool embedPayloads{true};
};

} // namespace smu
