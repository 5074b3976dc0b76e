/**
 * @file Config.hpp
 * @brief Configuration management singleton.
 *
 * Thread-safe singleton for accessing and modifying application settings.
 * It delegates parsing to ConfigParsers and file I/O to ConfigLoader.
 *
 * @section Dependencies
 * - ConfigData
 * - ConfigLoader
 * - ConfigParsers
 *
 * @section Patterns
 * - Singleton: Global access point for configuration.
 * - Thread-Safe: Mutex-protected load and save.
 */

#pragma once
#include <mutex>
#include "ConfigData.hpp"
#include "util/Result.hpp"

namespace smu {

class Config {
public:
    static Config& instance();

    Result<void> load(const fs::path& path);
    Result<void> save(const fs::path& path) const;
    Result<void> loadDefault();

    // Restores built-in defaults for every section
    void reset();

    fs::path configPath() const {
        return configPath_;
    }
    bool debug() const {
        return debug_;
    }
    void setDebug(bool v) {
        debug_ = v;
        markDirty();
    }

    // Section accessors (const)
    const RecordingConfig& recording() const {
        return recording_;
    }
    const DisplayConfig& display() const {
        return display_;
    }
    const MicrophoneConfig& microphone() const {
        return microphone_;
    }
    const CameraConfig& camera() const {
        return camera_;
    }
    const InteractionConfig& interaction() const {
        return interaction_;
    }
    const OutputConfig& output() const {
        return output_;
    }

    // Section accessors (mutable)
    RecordingConfig& recording() {
        markDirty();
        return recording_;
    }
    DisplayConfig& display() {
        markDirty();
        return display_;
    }
    MicrophoneConfig& microphone() {
        markDirty();
        return microphone_;
    }
    CameraConfig& camera() {
        markDirty();
        return camera_;
    }
    InteractionConfig& interaction() {
        markDirty();
        return interaction_;
    }
    OutputConfig& output() {
        markDirty();
        return output_;
    }

    bool isDirty() const {
        return dirty_;
    }
    void markClean() {
        dirty_ = false;
    }

private:
    friend class ConfigLoader;

    Config() = default;
    void markDirty() {
        dirty_ = true;
    }

    fs::path configPath_;
    bool dirty_{false};
    bool debug_{false};

    RecordingConfig recording_;
    DisplayConfig display_;
    MicrophoneConfig microphone_;
    CameraConfig camera_;
    InteractionConfig interaction_;
    OutputConfig output_;

    mutable std::mutex mutex_;
};

#define CONFIG smu::Config::instance()

} // namespace smu
