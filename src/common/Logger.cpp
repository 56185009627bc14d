#include "common/Logger.h"
#include "common/PathUtils.h"

#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <stdexcept>
#include <vector>

namespace edgeguard {

namespace {
constexpr std::size_t MAIN_LOG_BYTES = 10 * 1024 * 1024;
constexpr std::size_t MAIN_LOG_FILES = 3;

std::shared_ptr<spdlog::logger> dailyFile(const std::string& name,
                                          const std::filesystem::path& file,
                                          const std::string& pattern) {
    auto logger = spdlog::daily_logger_mt(name, file.string());
    logger->set_pattern(pattern);
    return logger;
}
} // namespace

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_dir) {
    if (main_logger_) {
        return;
    }

    const auto dir = utils::PathUtils::resolve(log_dir);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error("Log directory " + dir.string() + " unavailable: " + ec.message());
    }

    try {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");
        auto rotating = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (dir / "edgeguard.log").string(), MAIN_LOG_BYTES, MAIN_LOG_FILES);

        std::vector<spdlog::sink_ptr> sinks{console, rotating};
        auto main_logger = std::make_shared<spdlog::logger>("edgeguard", sinks.begin(), sinks.end());
        main_logger->set_level(spdlog::level::info);
        main_logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(main_logger);

        trade_logger_ = dailyFile("trades", dir / "trades.log", "%v");
        decision_logger_ = dailyFile("decisions", dir / "decisions.log", "[%Y-%m-%d %H:%M:%S.%e] %v");
        main_logger_ = main_logger;
    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Log init failed: ") + ex.what());
    }

    main_logger_->info("Logging to {}", dir.string());
}

void Logger::setLevel(const std::string& level) {
    if (main_logger_) {
        main_logger_->set_level(spdlog::level::from_str(level));
    }
}

void Logger::logTrade(const std::string& strategy_id, const std::string& version,
                      const std::string& side, double entry_price, double exit_price,
                      double pnl, const std::string& exit_reason) {
    if (!trade_logger_) {
        return;
    }
    trade_logger_->info("{},{},{},{:.8f},{:.8f},{:.2f},{}",
                        strategy_id, version, side, entry_price, exit_price, pnl, exit_reason);
}

void Logger::logDecision(const std::string& symbol, const std::string& state,
                         double position_multiplier, double percentile,
                         const std::string& reason) {
    if (!decision_logger_) {
        return;
    }
    decision_logger_->info("{},{},{:.2f},{:.3f},{}",
                           symbol, state, position_multiplier, percentile, reason);
}

} // namespace edgeguard
