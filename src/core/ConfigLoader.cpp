#include "ConfigLoader.hpp"
#include <sstream>
#include "Config.hpp"
#include "ConfigParsers.hpp"
#include "Logger.hpp"
#include "util/FileUtils.hpp"

namespace smu {

Result<void> ConfigLoader::load(Config& config, const fs::path& path) {
    try {
        auto tbl = toml::parse_file(path.string());

        if (auto gen = tbl["general"].as_table()) {
            config.setDebug((*gen)["debug"].value_or(false));
        }

        ConfigParsers::parseRecording(tbl, config.recording());
        ConfigParsers::parseDisplay(tbl, config.display());
        ConfigParsers::parseMicrophone(tbl, config.microphone());
        ConfigParsers::parseCamera(tbl, config.camera());
        ConfigParsers::parseInteraction(tbl, config.interaction());
        ConfigParsers::parseOutput(tbl, config.output());

        config.markClean();
        LOG_INFO("Config loaded from: {}", path.string());
        return Result<void>::ok();
    } catch (const toml::parse_error& err) {
        return Result<void>::err(std::string("Config parse error: ") +
                                         std::string(err.description()),
                                 ErrorCode::ConfigError);
    }
}

Result<void> ConfigLoader::loadDefault(Config& config) {
    auto configDir = file::configDir();
    auto defaultPath = configDir / "config.toml";

    if (fs::exists(defaultPath)) {
        config.configPath_ = defaultPath;
        return load(config, defaultPath);
    }

    fs::path systemDefault = fs::path(SCREENMU_DATA_DIR) / "config/default.toml";
    if (fs::exists(systemDefault)) {
        file::ensureDir(configDir);
        std::error_code ec;
        fs::copy_file(systemDefault, defaultPath, ec);
        if (!ec) {
            config.configPath_ = defaultPath;
            return load(config, defaultPath);
        }
    }

    LOG_WARN("No config file found, using built-in defaults");
    config.output().directory = file::expandPath("~/Videos/ScreenMu");
    config.configPath_ = defaultPath;
    if (!file::ensureDir(configDir)) {
        LOG_WARN("Cannot create config directory: {}", configDir.string());
        return Result<void>::ok();
    }
    if (auto res = save(config, defaultPath); !res) {
        LOG_WARN("{}", res.error().message);
    }
    return Result<void>::ok();
}

Result<void> ConfigLoader::save(const Config& config, const fs::path& path) {
    auto tbl = ConfigParsers::serialize(config.recording(),
                                        config.display(),
                                        config.microphone(),
                                        config.camera(),
                                        config.interaction(),
                                        config.output(),
                                        config.debug());
    std::ostringstream out;
    out << tbl;

    auto res = file::writeAtomic(path, out.str());
    if (!res) {
        LOG_ERROR("Failed to save config: {}", res.error().message);
        return Result<void>::err("Failed to save config: " +
                                         res.error().message,
                                 ErrorCode::ConfigError);
    }
    LOG_DEBUG("Config saved to: {}", path.string());
    return Result<void>::ok();
}

} // namespace smu
