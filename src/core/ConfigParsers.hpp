/**
 * @file ConfigParsers.hpp
 * @brief TOML parsing and serialization logic.
 *
 * Converts between toml++ tables and the configuration structs. Missing
 * keys keep their defaults; numeric values are clamped to workable ranges.
 *
 * @section Dependencies
 * - toml++
 * - ConfigData
 */

#pragma once
#include <toml++/toml.h>
#include "ConfigData.hpp"

namespace smu {

class ConfigParsers {
public:
    static void parseRecording(const toml::table& tbl, RecordingConfig& cfg);
    static void parseDisplay(const toml::table& tbl, DisplayConfig& cfg);
    static void parseMicrophone(const toml::table& tbl, MicrophoneConfig& cfg);
    static void parseCamera(const toml::table& tbl, CameraConfig& cfg);
    static void parseInteraction(const toml::table& tbl,
                                 InteractionConfig& cfg);
    static void parseOutput(const toml::table& tbl, OutputConfig& cfg);

    static toml::table serialize(const RecordingConfig& recording,
                                 const DisplayConfig& display,
                                 const MicrophoneConfig& microphone,
                                 const CameraConfig& camera,
                                 const InteractionConfig& interaction,
                                 const OutputConfig& output,
                                 bool debug);
};

} // namespace smu
