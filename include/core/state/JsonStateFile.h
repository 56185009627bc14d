#pragma once

#include <filesystem>
#include <optional>
#include <nlohmann/json.hpp>

namespace edgeguard {
namespace core {

// Whole-document JSON snapshot. Saves go through a uniquely named sibling
// .tmp file and a rename so readers never observe a half-written document.
class JsonStateFile {
public:
    explicit JsonStateFile(std::filesystem::path file_path);

    std::optional<nlohmann::json> load() const;
    bool save(const nlohmann::json& document) const;

    const std::filesystem::path& path() const { return file_path_; }

private:
    std::filesystem::path file_path_;
};

} // namespace core
} // namespace edgeguard
