#include "core/state/JsonlJournal.h"
#include "common/Logger.h"

#include <algorithm>
#include <fstream>
#include <system_error>

namespace edgeguard {
namespace core {

nlohmann::json JournalEntry::toJson() const {
    return {{"seq", seq}, {"ts_ms", ts_ms}, {"type", type}, {"payload", payload}};
}

std::optional<JournalEntry> JournalEntry::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }
    JournalEntry entry;
    entry.seq = j.value("seq", static_cast<std::uint64_t>(0));
    if (entry.seq == 0) {
        return std::nullopt;
    }
    entry.ts_ms = j.value("ts_ms", 0LL);
    entry.type = j.value("type", std::string());
    entry.payload = j.value("payload", nlohmann::json::object());
    return entry;
}

JsonlJournal::JsonlJournal(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    const auto skipped = scan([this](JournalEntry&& entry) {
        last_seq_ = std::max(last_seq_, entry.seq);
    });
    if (skipped > 0) {
        LOG_WARN("Journal {}: skipped {} malformed line(s)", file_path_.string(), skipped);
    }
}

std::size_t JsonlJournal::scan(const std::function<void(JournalEntry&&)>& visit) const {
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return 0;
    }

    std::size_t skipped = 0;
    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        try {
            auto entry = JournalEntry::fromJson(nlohmann::json::parse(row));
            if (entry) {
                visit(std::move(*entry));
            } else {
                ++skipped;
            }
        } catch (const nlohmann::json::exception&) {
            ++skipped;
        }
    }
    return skipped;
}

std::uint64_t JsonlJournal::append(const std::string& type, const nlohmann::json& payload, long long ts_ms) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (file_path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(file_path_.parent_path(), ec);
    }

    JournalEntry entry;
    entry.seq = last_seq_ + 1;
    entry.ts_ms = ts_ms;
    entry.type = type;
    entry.payload = payload;

    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        LOG_ERROR("Journal could not be opened for append: {}", file_path_.string());
        return 0;
    }
    out << entry.toJson().dump() << '\n' << std::flush;
    if (!out) {
        LOG_ERROR("Journal append failed: {}", file_path_.string());
        return 0;
    }
    last_seq_ = entry.seq;
    return entry.seq;
}

std::vector<JournalEntry> JsonlJournal::readFrom(std::uint64_t seq_inclusive) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<JournalEntry> out;
    scan([&](JournalEntry&& entry) {
        if (entry.seq >= seq_inclusive) {
            out.push_back(std::move(entry));
        }
    });
    return out;
}

std::uint64_t JsonlJournal::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

} // namespace core
} // namespace edgeguard
