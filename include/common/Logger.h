#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace edgeguard {

// Process-wide logging. Until initialize() runs every call is a no-op,
// so library code and tests can log without setup.
class Logger {
public:
    static Logger& getInstance();

    // Console plus rotating edgeguard.log, and daily trades/decisions files.
    // Throws std::runtime_error when the sinks cannot be created.
    void initialize(const std::string& log_dir = "logs");
    void setLevel(const std::string& level);
    bool isInitialized() const { return main_logger_ != nullptr; }

    template<typename... Args>
    void log(spdlog::level::level_enum level, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->log(level, fmt, std::forward<Args>(args)...);
        }
    }

    // strategy,version,side,entry,exit,pnl,exit_reason
    void logTrade(const std::string& strategy_id, const std::string& version,
                  const std::string& side, double entry_price, double exit_price,
                  double pnl, const std::string& exit_reason);

    // symbol,state,multiplier,percentile,reason
    void logDecision(const std::string& symbol, const std::string& state,
                     double position_multiplier, double percentile,
                     const std::string& reason);

private:
    Logger() = default;

    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> trade_logger_;
    std::shared_ptr<spdlog::logger> decision_logger_;
};

#define LOG_DEBUG(...) edgeguard::Logger::getInstance().log(spdlog::level::debug, __VA_ARGS__)
#define LOG_INFO(...) edgeguard::Logger::getInstance().log(spdlog::level::info, __VA_ARGS__)
#define LOG_WARN(...) edgeguard::Logger::getInstance().log(spdlog::level::warn, __VA_ARGS__)
#define LOG_ERROR(...) edgeguard::Logger::getInstance().log(spdlog::level::err, __VA_ARGS__)

} // namespace edgeguard
