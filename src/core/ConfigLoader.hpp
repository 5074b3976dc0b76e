/**
 * @file ConfigLoader.hpp
 * @brief Configuration file I/O.
 *
 * Reads and writes configuration files. Writes go through a temporary file
 * and a rename so a crash never leaves a truncated config behind.
 *
 * @section Dependencies
 * - Config
 * - std::filesystem
 */

#pragma once
#include <filesystem>
#include "util/Result.hpp"

namespace smu {

class Config;

class ConfigLoader {
public:
    static Result<void> load(Config& config, const std::filesystem::path& path);
    static Result<void> save(const Config& config,
                             const std::filesystem::path& path);
    static Result<void> loadDefault(Config& config);
};

} // namespace smu
