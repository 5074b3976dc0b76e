#include "FileUtils.hpp"
#include <cstdlib>
#include <fstream>

namespace smu::file {

namespace {
fs::path xdgDir(const char* envVar, std::string_view homeFallback) {
    if (const char* xdg = std::getenv(envVar); xdg && *xdg) {
        return fs::path(xdg) / kAppDirName;
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return fs::path(home) / homeFallback / kAppDirName;
    }
    return fs::temp_directory_path() / kAppDirName;
}
} // namespace

fs::path configDir() {
    return xdgDir("XDG_CONFIG_HOME", ".config");
}

fs::path cacheDir() {
    return xdgDir("XDG_CACHE_HOME", ".cache");
}

fs::path dataDir() {
    return xdgDir("XDG_DATA_HOME", ".local/share");
}

bool ensureDir(const fs::path& dir) {
    std::error_code ec;
    if (fs::is_directory(dir, ec))
        return true;
    fs::create_directories(dir, ec);
    return !ec;
}

fs::path expandPath(std::string_view path) {
    std::string p(path);
    if (p.starts_with("~/")) {
        if (const char* home = std::getenv("HOME")) {
            p = std::string(home) + p.substr(1);
        }
    }
    return fs::path(p);
}

Result<void> writeAtomic(const fs::path& path, std::string_view contents) {
    fs::path tempPath = path;
    tempPath += ".tmp";
    {
        std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Result<void>::err("Failed to open " + tempPath.string(),
                                     ErrorCode::IoError);
        }
        out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        if (!out) {
            return Result<void>::err("Failed to write " + tempPath.string(),
                                     ErrorCode::IoError);
        }
    }
    std::error_code ec;
    fs::rename(tempPath, path, ec);
    if (ec) {
        fs::remove(tempPath, ec);
        return Result<void>::err("Failed to move " + tempPath.string() +
                                         " into place",
                                 ErrorCode::IoError);
    }
    return Result<void>::ok();
}

} // namespace smu::file
