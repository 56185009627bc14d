#pragma once

#include <string>
#include <filesystem>

namespace edgeguard {
namespace utils {

class PathUtils {
public:
    // Directory of the running executable, or the working directory if unknown
    static std::filesystem::path executableDir();

    // Absolute paths pass through; relative ones are anchored at executableDir()
    static std::filesystem::path resolve(const std::string& path);

    // Relative config paths are tried against the working directory first,
    // then next to the executable
    static std::filesystem::path locateConfig(const std::string& path);
};

} // namespace utils
} // namespace edgeguard
