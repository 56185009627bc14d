#include "backtest/AdmissionGate.h"

#include <cassert>
#include <filesystem>
#include <iostream>

using namespace edgeguard;

namespace {

std::vector<backtest::TradeRecord> winningTrades(int count) {
    std::vector<backtest::TradeRecord> out;
    for (int i = 0; i < count; ++i) {
        backtest::TradeRecord t;
        t.pnl = (i % 4 == 3) ? -5.0 : 10.0 + i;
        t.win = t.pnl > 0.0;
        out.push_back(t);
    }
    return out;
}

analytics::MarketState stateOf(analytics::MarketRegime regime, double confidence) {
    analytics::MarketState s;
    s.regime = regime;
    s.regime_confidence = confidence;
    return s;
}

} // namespace

int main() {
    const auto dir = std::filesystem::temp_directory_path() / "edgeguard_test_admission";
    std::filesystem::remove_all(dir);

    backtest::StrategyRegistry registry(dir);
    backtest::AdmissionGate gate(registry, dir / "admission_audit.jsonl");

    // Unknown strategy
    {
        const auto d = gate.requestApproval("ghost", "1", true, true);
        assert(!d.approved);
        assert(d.reason == "strategy not registered");
        assert(gate.auditLog().lastSeq() == 1);
    }

    // 40 trades, 75% winners: meets the default live requirements
    registry.updateFromTrades("alpha", "1", winningTrades(40));

    // Failed validation stages are listed before requirement failures
    {
        const auto d = gate.requestApproval("alpha", "1", false, false);
        assert(!d.approved);
        assert(d.failures.size() == 2);
        assert(d.failures[0] == "backtest validation failed");
        assert(d.failures[1] == "walk-forward validation failed");
        assert(d.reason == d.failures[0]);
        assert(!registry.get("alpha", "1")->approved_live);
    }

    // Approval
    {
        const auto d = gate.requestApproval("alpha", "1", true, true);
        if (!d.approved) {
            std::cerr << "[TEST] alpha should be approved, got: " << d.reason << "\n";
            return 1;
        }
        const auto m = registry.get("alpha", "1");
        assert(m->approved_live);
        assert(m->backtest_passed && m->walkforward_passed);
        assert(!m->live_enabled);
    }

    // Approved but not enabled
    {
        const auto d = gate.checkAdmission("alpha", "1");
        assert(!d.approved);
        assert(d.reason == "strategy approved but not enabled");
    }

    assert(gate.enableStrategy("alpha", "1"));

    // Runtime admission
    {
        assert(gate.checkAdmission("alpha", "1").approved);
        assert(gate.checkAdmission("alpha", "1", stateOf(analytics::MarketRegime::TRENDING_UP, 0.9)).approved);
        assert(gate.checkAdmission("alpha", "1", stateOf(analytics::MarketRegime::VOLATILE, 0.5)).approved);

        auto d = gate.checkAdmission("alpha", "1", stateOf(analytics::MarketRegime::VOLATILE, 0.9));
        assert(!d.approved);
        assert(d.reason == "market too volatile");

        d = gate.checkAdmission("alpha", "1", stateOf(analytics::MarketRegime::UNKNOWN, 0.0));
        assert(d.reason == "market regime unknown");

        d = gate.checkAdmission("ghost", "1");
        assert(!d.approved);
        assert(d.reason == "strategy ghost v1 not found in registry");

        assert(gate.checkAdmission("ghost", "1", std::nullopt, true).approved);
    }

    // A later rejection revokes approval and stops live trading
    {
        backtest::LiveRequirements strict;
        strict.min_trades = 100;
        const auto d = gate.requestApproval("alpha", "1", true, true, strict);
        assert(!d.approved);
        assert(d.reason == "trades 40 < 100");
        const auto m = registry.get("alpha", "1");
        assert(!m->approved_live);
        assert(!m->live_enabled);
        assert(gate.checkAdmission("alpha", "1").reason == "strategy not approved for live trading");
        assert(!gate.enableStrategy("alpha", "1"));
    }

    assert(gate.disableStrategy("alpha", "1", "manual stop"));
    assert(!gate.disableStrategy("ghost", "1"));

    // Audit trail is append-only with increasing seq
    {
        const auto entries = gate.auditLog().readFrom(1);
        // ghost, reject, approve, enable, reject, enable refused, disable, disable failed
        if (entries.size() != 8) {
            std::cerr << "[TEST] expected 8 audit entries, got " << entries.size() << "\n";
            return 1;
        }
        for (size_t i = 0; i < entries.size(); ++i) {
            assert(entries[i].seq == i + 1);
        }
        assert(entries[0].payload["decision"] == "REJECTED");
        assert(entries[2].type == "approval");
        assert(entries[2].payload["decision"] == "APPROVED");
        assert(entries[2].payload["metrics"]["total_trades"] == 40);
        assert(entries[3].type == "enable");
        assert(entries[3].payload["decision"] == "ENABLED");
        assert(entries[5].payload["decision"] == "ENABLE_REJECTED");
        assert(entries[6].type == "disable");
        assert(entries[6].payload["reason"] == "manual stop");
        assert(entries[7].payload["decision"] == "DISABLE_FAILED");
    }

    // Reopened journal continues the sequence
    {
        backtest::AdmissionGate reopened(registry, dir / "admission_audit.jsonl");
        assert(reopened.auditLog().lastSeq() == 8);
        reopened.requestApproval("alpha", "1", true, true);
        assert(reopened.auditLog().lastSeq() == 9);
        assert(reopened.statusReport().find("Audit entries: 9") != std::string::npos);
    }

    std::filesystem::remove_all(dir);
    std::cout << "[TEST] AdmissionGate PASSED\n";
    return 0;
}
