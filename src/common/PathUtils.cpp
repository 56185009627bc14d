#include "common/PathUtils.h"

#include <system_error>

namespace edgeguard {
namespace utils {

std::filesystem::path PathUtils::executableDir() {
    std::error_code ec;
    const auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec || self.empty()) {
        return std::filesystem::current_path(ec);
    }
    return self.parent_path();
}

std::filesystem::path PathUtils::resolve(const std::string& path) {
    const std::filesystem::path p(path);
    if (p.empty() || p.is_absolute()) {
        return p;
    }
    return executableDir() / p;
}

std::filesystem::path PathUtils::locateConfig(const std::string& path) {
    const std::filesystem::path p(path);
    std::error_code ec;
    if (p.is_absolute() || std::filesystem::exists(p, ec)) {
        return p;
    }
    return executableDir() / p;
}

} // namespace utils
} // namespace edgeguard
