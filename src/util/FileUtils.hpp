#pragma once
// FileUtils.hpp - XDG directory lookup and small filesystem helpers

#include <string>
#include <string_view>
#include "Result.hpp"
#include "Types.hpp"

namespace smu::file {

inline constexpr std::string_view kAppDirName = "screenmu-capture";

fs::path configDir();
fs::path cacheDir();
fs::path dataDir();

bool ensureDir(const fs::path& dir);

// Expands a leading "~/" to $HOME
fs::path expandPath(std::string_view path);

// Writes through a sibling ".tmp" file and renames it into place
Result<void> writeAtomic(const fs::path& path, std::string_view contents);

} // namespace smu::file
