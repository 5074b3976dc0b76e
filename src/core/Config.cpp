#include "Config.hpp"
#include "ConfigLoader.hpp"

namespace smu {

Config& Config::instance() {
    static Config instance;
    return instance;
}

Result<void> Config::load(const fs::path& path) {
    std::lock_guard lock(mutex_);
    configPath_ = path;
    return ConfigLoader::load(*this, path);
}

Result<void> Config::loadDefault() {
    std::lock_guard lock(mutex_);
    return ConfigLoader::loadDefault(*this);
}

Result<void> Config::save(const fs::path& path) const {
    std::lock_guard lock(mutex_);
    return ConfigLoader::save(*this, path);
}

void Config::reset() {
    std::lock_guard lock(mutex_);
    debug_ = false;
    recording_ = {};
    display_ = {};
    microphone_ = {};
    camera_ = {};
    interaction_ = {};
    output_ = {};
    dirty_ = false;
}

} // namespace smu
