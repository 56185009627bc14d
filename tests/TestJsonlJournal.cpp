#include "core/state/JsonlJournal.h"
#include "core/state/JsonStateFile.h"

#include <filesystem>
#include <fstream>
#include <iostream>

int main() {
    const auto dir = std::filesystem::temp_directory_path() / "edgeguard_test_journal";
    std::filesystem::remove_all(dir);
    const auto path = dir / "nested" / "audit.jsonl";

    {
        edgeguard::core::JsonlJournal journal(path);
        if (journal.lastSeq() != 0) {
            std::cerr << "[TEST] new journal should start at 0, got " << journal.lastSeq() << "\n";
            return 1;
        }

        nlohmann::json first;
        first["strategy_id"] = "alpha";
        first["decision"] = "APPROVED";
        nlohmann::json second;
        second["strategy_id"] = "alpha";
        second["decision"] = "ENABLED";

        if (journal.append("approval", first, 1000) != 1) {
            std::cerr << "[TEST] append(first) should get seq 1\n";
            return 1;
        }
        if (journal.append("enable", second, 2000) != 2) {
            std::cerr << "[TEST] append(second) should get seq 2\n";
            return 1;
        }

        const auto rows = journal.readFrom(2);
        if (rows.size() != 1 || rows.front().type != "enable") {
            std::cerr << "[TEST] readFrom(2) should return the enable entry\n";
            return 1;
        }
        if (rows.front().payload["decision"] != "ENABLED" || rows.front().ts_ms != 2000) {
            std::cerr << "[TEST] unexpected payload: " << rows.front().payload.dump() << "\n";
            return 1;
        }
    }

    // A damaged line is skipped; numbering resumes after the highest seq
    {
        std::ofstream out(path, std::ios::app);
        out << "{ truncated\n";
    }
    {
        edgeguard::core::JsonlJournal journal(path);
        if (journal.lastSeq() != 2) {
            std::cerr << "[TEST] reopened journal should resume at 2, got " << journal.lastSeq() << "\n";
            return 1;
        }
        if (journal.append("disable", nlohmann::json::object(), 3000) != 3) {
            std::cerr << "[TEST] append after reopen should get seq 3\n";
            return 1;
        }
        if (journal.readFrom(1).size() != 3) {
            std::cerr << "[TEST] expected 3 readable entries\n";
            return 1;
        }
    }

    // Lines without a sequence number are not entries
    {
        if (edgeguard::core::JournalEntry::fromJson(nlohmann::json{{"type", "x"}})) {
            std::cerr << "[TEST] entry without seq should be rejected\n";
            return 1;
        }
        edgeguard::core::JournalEntry entry;
        entry.seq = 7;
        entry.type = "approval";
        const auto back = edgeguard::core::JournalEntry::fromJson(entry.toJson());
        if (!back || back->seq != 7 || back->type != "approval") {
            std::cerr << "[TEST] entry did not survive serialization\n";
            return 1;
        }
    }

    // State file: atomic save and load
    {
        edgeguard::core::JsonStateFile file(dir / "state" / "snapshot.json");
        if (file.load()) {
            std::cerr << "[TEST] missing state file should load as empty\n";
            return 1;
        }
        nlohmann::json doc;
        doc["value"] = 42;
        if (!file.save(doc)) {
            std::cerr << "[TEST] state save failed\n";
            return 1;
        }
        const auto loaded = file.load();
        if (!loaded || (*loaded)["value"] != 42) {
            std::cerr << "[TEST] state round trip failed\n";
            return 1;
        }
        for (const auto& entry : std::filesystem::directory_iterator(dir / "state")) {
            if (entry.path().filename() != "snapshot.json") {
                std::cerr << "[TEST] temporary file left behind: " << entry.path() << "\n";
                return 1;
            }
        }
    }

    std::filesystem::remove_all(dir);
    std::cout << "[TEST] JsonlJournal PASSED\n";
    return 0;
}
