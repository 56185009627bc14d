#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace edgeguard {
namespace core {

struct JournalEntry {
    std::uint64_t seq = 0;
    long long ts_ms = 0;
    std::string type;
    nlohmann::json payload = nlohmann::json::object();

    nlohmann::json toJson() const;
    // nullopt when the line has no positive seq
    static std::optional<JournalEntry> fromJson(const nlohmann::json& j);
};

// Append-only JSON-lines file. Sequence numbers continue from the highest
// seq found on disk when the journal is opened; damaged lines are skipped.
class JsonlJournal {
public:
    explicit JsonlJournal(std::filesystem::path file_path);

    // Returns the assigned seq, or 0 when the line could not be written.
    std::uint64_t append(const std::string& type, const nlohmann::json& payload, long long ts_ms);

    std::vector<JournalEntry> readFrom(std::uint64_t seq_inclusive) const;
    std::uint64_t lastSeq() const;

    const std::filesystem::path& path() const { return file_path_; }

private:
    // Calls visit for each readable entry; returns the number of skipped lines
    std::size_t scan(const std::function<void(JournalEntry&&)>& visit) const;

    std::filesystem::path file_path_;
    mutable std::mutex mutex_;
    std::uint64_t last_seq_ = 0;
};

} // namespace core
} // namespace edgeguard
