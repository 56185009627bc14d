#include "core/state/JsonStateFile.h"
#include "common/Logger.h"

#include <atomic>
#include <fstream>
#include <string>
#include <system_error>

namespace edgeguard {
namespace core {

namespace {
std::atomic<unsigned long long> temp_counter{0};

bool writeText(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        LOG_ERROR("State temp file could not be opened: {}", path.string());
        return false;
    }
    out << text;
    out.flush();
    if (!out) {
        LOG_ERROR("State temp file write failed: {}", path.string());
        return false;
    }
    return true;
}

// rename, or copy + remove where rename over an existing file is refused
bool replaceFile(const std::filesystem::path& from, const std::filesystem::path& to) {
    std::error_code ec;
    std::filesystem::rename(from, to, ec);
    if (!ec) {
        return true;
    }
    ec.clear();
    std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        LOG_ERROR("State file replace failed ({}): {}", to.string(), ec.message());
        return false;
    }
    std::filesystem::remove(from, ec);
    return true;
}
} // namespace

JsonStateFile::JsonStateFile(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {}

std::optional<nlohmann::json> JsonStateFile::load() const {
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        std::error_code ec;
        if (std::filesystem::exists(file_path_, ec)) {
            LOG_WARN("State file could not be opened: {}", file_path_.string());
        }
        return std::nullopt;
    }

    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("State file parse failed ({}): {}", file_path_.string(), e.what());
        return std::nullopt;
    }
}

bool JsonStateFile::save(const nlohmann::json& document) const {
    if (file_path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(file_path_.parent_path(), ec);
        if (ec) {
            LOG_ERROR("State dir create failed ({}): {}", file_path_.parent_path().string(), ec.message());
            return false;
        }
    }

    // Each write gets its own temp file so concurrent writers never share one
    auto tmp_path = file_path_;
    tmp_path += ".tmp." + std::to_string(++temp_counter);
    if (writeText(tmp_path, document.dump(2)) && replaceFile(tmp_path, file_path_)) {
        return true;
    }
    std::error_code ec;
    std::filesystem::remove(tmp_path, ec);
    return false;
}

} // namespace core
} // namespace edgeguard
