#pragma once

#include <string>
#include <vector>

namespace signaldesk {
namespace engine {

// Service loop and signal lifecycle settings
struct EngineConfig {
    std::vector<std::string> symbols;

    // Cycle settings
    int analysis_interval_seconds;
    int error_backoff_seconds;
    int candle_limit;

    // Lifecycle settings
    double max_signal_lifetime_hours;
    int max_active_signals;
    int max_signals_per_symbol;
    int price_decimals;
    double recommended_risk_per_trade = 0.02;   // informational only
    int performance_window_days = 7;

    std::string data_dir;
    std::string market_data_base_url;

    EngineConfig()
        : symbols{"BTCUSDT", "ETHUSDT", "SOLUSDT", "BNBUSDT"}
        , analysis_interval_seconds(10)
        , error_backoff_seconds(30)
        , candle_limit(100)
        , max_signal_lifetime_hours(24.0)
        , max_active_signals(10)
        , max_signals_per_symbol(2)
        , price_decimals(2)
        , data_dir("data")
        , market_data_base_url("https://fapi.binance.com")
    {}

    // Throws std::invalid_argument
    void validate() const;
};

} // namespace engine
} // namespace signaldesk
