#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/Types.h"
#include "backtest/BacktestConfig.h"
#include "analytics/FailurePatternMiner.h"
#include "analytics/MarketStateClassifier.h"
#include "risk/RiskErrors.h"

namespace edgeguard {
namespace backtest {

enum class StrategyAction { HOLD, LONG, SHORT, CLOSE };

std::string toString(StrategyAction action);

struct StrategySignal {
    StrategyAction action = StrategyAction::HOLD;
    std::optional<double> size_notional;       // quote currency; default is capital * default_position_pct
    std::optional<double> stop_loss;           // absolute price
    std::optional<double> take_profit;         // absolute price
    std::optional<double> trailing_stop_pct;   // fraction of the best price since entry

    static StrategySignal hold() { return StrategySignal{}; }
};

// Called once per bar with the bar and its index in the series.
// Must be safe to call from several walk-forward windows at once.
using StrategyFunction = std::function<StrategySignal(const Candle&, std::size_t)>;

struct TradeRecord {
    std::string strategy_id;
    std::string version;
    TradeSide side = TradeSide::LONG;

    double entry_price = 0.0;
    double exit_price = 0.0;
    long long entry_time = 0;
    long long exit_time = 0;
    double quantity = 0.0;

    double pnl = 0.0;             // after fees
    double pnl_pct = 0.0;         // of entry notional
    bool win = false;
    std::string exit_reason;
    long long hold_ms = 0;
    std::size_t hold_bars = 0;

    // Market state at entry
    std::string regime = "UNKNOWN";
    double volatility = 0.0;
    double volume_ratio = 1.0;

    nlohmann::json toJson() const;
    analytics::TradeOutcome toOutcome() const;
};

struct BacktestMetrics {
    int total_trades = 0;
    int winning_trades = 0;
    int losing_trades = 0;
    double win_rate = 0.0;

    double total_pnl = 0.0;
    double avg_pnl = 0.0;
    double avg_win = 0.0;
    double avg_loss = 0.0;        // negative or zero
    double largest_win = 0.0;
    double largest_loss = 0.0;

    double profit_factor = 0.0;   // capped at 999
    double sharpe_ratio = 0.0;
    double max_drawdown = 0.0;    // quote currency
    double max_drawdown_pct = 0.0;  // of initial capital
    double avg_hold_ms = 0.0;

    double initial_capital = 0.0;
    double final_equity = 0.0;

    nlohmann::json toJson() const;
};

struct BacktestResult {
    bool passed = false;
    std::string reason;
    std::vector<std::string> failure_reasons;
    std::optional<risk::RiskError> error;

    BacktestMetrics metrics;
    std::map<std::string, int> exit_reason_counts;
    std::vector<TradeRecord> trades;
    std::size_t bars_processed = 0;
};

class BacktestEngine {
public:
    explicit BacktestEngine(BacktestConfig config,
                            std::string strategy_id = "strategy",
                            std::string version = "1");

    // Simulates the strategy over the series. Malformed input yields passed=false
    // with a SIMULATION error instead of throwing.
    BacktestResult run(const std::vector<Candle>& candles, const StrategyFunction& strategy);

    const BacktestConfig& config() const { return config_; }
    const std::string& strategyId() const { return strategy_id_; }
    const std::string& version() const { return version_; }

    // Most recent entry-time market state
    const std::optional<analytics::MarketState>& lastMarketState() const { return last_market_state_; }

    static BacktestMetrics computeMetrics(const std::vector<TradeRecord>& trades,
                                          double initial_capital,
                                          double max_drawdown);

    // Failing criteria in check order; empty means passed
    static std::vector<std::string> evaluateCriteria(const BacktestMetrics& metrics,
                                                     const BacktestConfig& config);

    static nlohmann::json toJson(const BacktestResult& result);
    static bool saveResult(const BacktestResult& result, const std::filesystem::path& dir);

private:
    struct Position {
        TradeSide side = TradeSide::LONG;
        double entry_price = 0.0;
        double quantity = 0.0;
        long long entry_time = 0;
        std::size_t entry_index = 0;
        double entry_fee = 0.0;
        std::optional<double> stop_loss;
        std::optional<double> take_profit;
        std::optional<double> trailing_stop_pct;
        double high_watermark = 0.0;
        double low_watermark = 0.0;
        analytics::MarketState entry_state;
    };

    // Returns the exit (price, reason) if a protective level fired on this bar
    std::optional<std::pair<double, std::string>> checkExitTriggers(Position& position,
                                                                    const Candle& candle) const;

    bool openPosition(TradeSide side, const StrategySignal& signal,
                      const std::vector<Candle>& candles, std::size_t index, double capital);

    TradeRecord closePosition(double raw_price, const Candle& candle, std::size_t index,
                              const std::string& reason);

    double entryFillPrice(TradeSide side, double price) const;
    double exitFillPrice(TradeSide side, double price) const;

    BacktestConfig config_;
    std::string strategy_id_;
    std::string version_;
    analytics::MarketStateClassifier classifier_;

    std::optional<Position> position_;
    std::optional<analytics::MarketState> last_market_state_;
};

} // namespace backtest
} // namespace edgeguard
