#include "engine/EngineConfig.h"

#include <stdexcept>

namespace signaldesk {
namespace engine {

void EngineConfig::validate() const {
    if (symbols.empty()) {
        throw std::invalid_argument("at least one symbol must be configured");
    }
    if (analysis_interval_seconds < 1) {
        throw std::invalid_argument("analysis_interval_seconds must be >= 1");
    }
    if (error_backoff_seconds < 0) {
        throw std::invalid_argument("error_backoff_seconds must not be negative");
    }
    if (candle_limit < 50) {
        throw std::invalid_argument("candle_limit must be >= 50");
    }
    if (max_signal_lifetime_hours <= 0.0) {
        throw std::invalid_argument("max_signal_lifetime_hours must be positive");
    }
    if (max_active_signals < 1 || max_signals_per_symbol < 1) {
        throw std::invalid_argument("active signal caps must be >= 1");
    }
    if (price_decimals < 0 || price_decimals > 10) {
        throw std::invalid_argument("price_decimals must be within [0, 10]");
    }
    if (recommended_risk_per_trade <= 0.0 || recommended_risk_per_trade > 1.0) {
        throw std::invalid_argument("recommended_risk_per_trade must be within (0, 1]");
    }
    if (performance_window_days < 1) {
        throw std::invalid_argument("performance_window_days must be >= 1");
    }
}

} // namespace engine
} // namespace signaldesk
