#include "ConfigParsers.hpp"
#include <algorithm>
#include "Logger.hpp"
#include "util/FileUtils.hpp"

namespace smu {

namespace {
template <typename T>
T get(const toml::table& tbl, std::string_view key, T defaultVal) {
    if (auto node = tbl[key]) {
        if constexpr (std::is_same_v<T, std::string>) {
            if (auto val = node.value<std::string>())
                return *val;
        } else if constexpr (std::is_same_v<T, bool>) {
            if (auto val = node.value<bool>())
                return *val;
        } else if constexpr (std::is_same_v<T, f32>) {
            if (auto val = node.value<double>())
                return static_cast<f32>(*val);
        } else if constexpr (std::is_integral_v<T>) {
            if (auto val = node.value<i64>())
                return static_cast<T>(std::max<i64>(*val, 0));
        }
    }
    return defaultVal;
}

std::vector<std::string> getStrings(const toml::table& tbl,
                                    std::string_view key,
                                    std::vector<std::string> defaultVal) {
    auto arr = tbl[key].as_array();
    if (!arr)
        return defaultVal;

    std::vector<std::string> out;
    for (const auto& node : *arr) {
        if (auto s = node.value<std::string>())
            out.push_back(*s);
    }
    return out;
}

toml::array toArray(const std::vector<std::string>& values) {
    toml::array arr;
    for (const auto& v : values)
        arr.push_back(v);
    return arr;
}
} // namespace

void ConfigParsers::parseRecording(const toml::table& tbl,
                                   RecordingConfig& cfg) {
    if (auto rec = tbl["recording"].as_table()) {
        cfg.chunkIntervalMs =
                std::clamp(get(*rec, "chunk_interval_ms", 100u), 10u, 10000u);
        cfg.stopTimeoutMs =
                std::clamp(get(*rec, "stop_timeout_ms", 5000u), 100u, 60000u);
        cfg.wantMicrophone = get(*rec, "want_microphone", true);
        cfg.wantCamera = get(*rec, "want_camera", false);
        cfg.videoMimeTypes = getStrings(
                *rec, "video_mime_types", RecordingConfig{}.videoMimeTypes);
        cfg.audioMimeTypes = getStrings(
                *rec, "audio_mime_types", RecordingConfig{}.audioMimeTypes);
    }
}

void ConfigParsers::parseDisplay(const toml::table& tbl, DisplayConfig& cfg) {
    if (auto disp = tbl["display"].as_table()) {
        auto intent = get(*disp, "intent", std::string("monitor"));
        if (intent != "monitor" && intent != "window") {
            LOG_WARN("Unknown display intent '{}', using monitor", intent);
            intent = "monitor";
        }
        cfg.intent = intent;
        // Encoders want even dimensions
        cfg.maxWidth =
                (std::clamp(get(*disp, "max_width", 1920u), 320u, 7680u) + 1) &
                ~1u;
        cfg.maxHeight =
                (std::clamp(get(*disp, "max_height", 1080u), 200u, 4320u) +
                 1) &
                ~1u;
        cfg.fps = std::clamp(get(*disp, "fps", 30u), 1u, 120u);
        cfg.bitrate =
                std::clamp(get(*disp, "bitrate", 5000000u), 100000u, 100000000u);
        cfg.captureAudio = get(*disp, "capture_audio", true);
    }
}

void ConfigParsers::parseMicrophone(const toml::table& tbl,
                                    MicrophoneConfig& cfg) {
    if (auto mic = tbl["microphone"].as_table()) {
        cfg.device = get(*mic, "device", std::string("default"));
        cfg.sampleRate =
                std::clamp(get(*mic, "sample_rate", 48000u), 8000u, 192000u);
        cfg.channels = std::clamp(get(*mic, "channels", 1u), 1u, 2u);
        cfg.bitrate =
                std::clamp(get(*mic, "bitrate", 128000u), 16000u, 512000u);
    }
}

void ConfigParsers::parseCamera(const toml::table& tbl, CameraConfig& cfg) {
    if (auto cam = tbl["camera"].as_table()) {
        cfg.device = get(*cam, "device", std::string("/dev/video0"));
        cfg.width =
                (std::clamp(get(*cam, "width", 1280u), 160u, 3840u) + 1) & ~1u;
        cfg.height =
                (std::clamp(get(*cam, "height", 720u), 120u, 2160u) + 1) & ~1u;
        cfg.fps = std::clamp(get(*cam, "fps", 30u), 1u, 120u);
        cfg.bitrate =
                std::clamp(get(*cam, "bitrate", 2000000u), 100000u, 50000000u);
    }
}

void ConfigParsers::parseInteraction(const toml::table& tbl,
                                     InteractionConfig& cfg) {
    if (auto sig = tbl["interaction"].as_table()) {
        cfg.flushIntervalMs =
                std::clamp(get(*sig, "flush_interval_ms", 100u), 10u, 5000u);
        cfg.moveThrottleMs =
                std::clamp(get(*sig, "move_throttle_ms", 8u), 0u, 1000u);
        cfg.velocitySmoothing =
                std::clamp(get(*sig, "velocity_smoothing", 0.3f), 0.0f, 1.0f);
        cfg.velocityOutlierMs =
                std::clamp(get(*sig, "velocity_outlier_ms", 100u), 1u, 5000u);
        cfg.resetVelocityOnResume =
                get(*sig, "reset_velocity_on_resume", false);
    }
}

void ConfigParsers::parseOutput(const toml::table& tbl, OutputConfig& cfg) {
    if (auto out = tbl["output"].as_table()) {
        cfg.saveToDisk = get(*out, "save_to_disk", true);
        cfg.directory = file::expandPath(
                get(*out, "directory", std::string("~/Videos/ScreenMu")));
        cfg.embedPayloads = get(*out, "embed_payloads", true);
    }
}

toml::table ConfigParsers::serialize(const RecordingConfig& recording,
                                     const DisplayConfig& display,
                                     const MicrophoneConfig& microphone,
                                     const CameraConfig& camera,
                                     const InteractionConfig& interaction,
                                     const OutputConfig& output,
                                     bool debug) {
    toml::table root;
    root.insert("general", toml::table{{"debug", debug}});

    root.insert("recording",
                toml::table{
                        {"chunk_interval_ms", (i64)recording.chunkIntervalMs},
                        {"stop_timeout_ms", (i64)recording.stopTimeoutMs},
                        {"want_microphone", recording.wantMicrophone},
                        {"want_camera", recording.wantCamera},
                        {"video_mime_types", toArray(recording.videoMimeTypes)},
                        {"audio_mime_types",
                         toArray(recording.audioMimeTypes)}});

    root.insert("display",
                toml::table{{"intent", display.intent},
                            {"max_width", (i64)display.maxWidth},
                            {"max_height", (i64)display.maxHeight},
                            {"fps", (i64)display.fps},
                            {"bitrate", (i64)display.bitrate},
                            {"capture_audio", display.captureAudio}});

    root.insert("microphone",
                toml::table{{"device", microphone.device},
                            {"sample_rate", (i64)microphone.sampleRate},
                            {"channels", (i64)microphone.channels},
                            {"bitrate", (i64)microphone.bitrate}});

    root.insert("camera",
                toml::table{{"device", camera.device},
                            {"width", (i64)camera.width},
                            {"height", (i64)camera.height},
                            {"fps", (i64)camera.fps},
                            {"bitrate", (i64)camera.bitrate}});

    root.insert(
            "interaction",
            toml::table{
                    {"flush_interval_ms", (i64)interaction.flushIntervalMs},
                    {"move_throttle_ms", (i64)interaction.moveThrottleMs},
                    {"velocity_smoothing",
                     (double)interaction.velocitySmoothing},
                    {"velocity_outlier_ms", (i64)interaction.velocityOutlierMs},
                    {"reset_velocity_on_resume",
                     interaction.resetVelocityOnResume}});

    root.insert("output",
                toml::table{{"save_to_disk", output.saveToDisk},
                            {"directory", output.directory.string()},
                            {"embed_payloads", output.embedPayloads}});

    return root;
}

} // namespace smu
