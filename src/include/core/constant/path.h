#pragma once

#include <cstdlib>
#include <filesystem>

namespace shuttle::core {
namespace path {

inline const std::filesystem::path kLogDir = std::filesystem::temp_directory_path() / "CodeSoul"
                                             / "Shuttle" / "logs";

inline const std::filesystem::path kConfigDir =
#if defined(_WIN32) || defined(_WIN64)
    std::filesystem::path(std::getenv("APPDATA")) / "CodeSoul" / "Shuttle";
#else
    std::filesystem::path(std::getenv("HOME")) / ".config" / "CodeSoul" / "Shuttle";
#endif

} // namespace path
} // namespace shuttle::core
