#include "strategy/StrategyConfig.h"

#include <array>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace signaldesk {
namespace strategy {

bool isValidTimeframe(const std::string& timeframe) {
    static const std::array<const char*, 11> kTimeframes = {
        "1m", "3m", "5m", "15m", "30m", "1h", "2h", "4h", "6h", "12h", "1d"
    };
    for (const auto* tf : kTimeframes) {
        if (timeframe == tf) {
            return true;
        }
    }
    return false;
}

void ScalpingStrategyConfig::validate() const {
    indicators.validate();

    const double total = weights.sum();
    if (std::abs(total - 1.0) > 0.01) {
        std::ostringstream oss;
        oss << "strategy weights must sum to 1.0, got " << total;
        throw std::invalid_argument(oss.str());
    }
    for (double w : {weights.ema_trend, weights.rsi_momentum, weights.bollinger,
                     weights.vwap, weights.volume, weights.price_action}) {
        if (w < 0.0) {
            throw std::invalid_argument("strategy weights must not be negative");
        }
    }

    if (min_confidence < 0.0 || min_confidence > 1.0) {
        throw std::invalid_argument("min_confidence must be within [0, 1]");
    }
    if (!isValidTimeframe(timeframe)) {
        throw std::invalid_argument("invalid timeframe: " + timeframe);
    }
    if (rsi_oversold < 0.0 || rsi_overbought > 100.0 || rsi_oversold >= rsi_overbought) {
        throw std::invalid_argument("rsi thresholds must satisfy 0 <= oversold < overbought <= 100");
    }
    if (stop_loss_multiplier <= 0.0 || take_profit_multiplier <= 0.0) {
        throw std::invalid_argument("ATR multipliers must be positive");
    }
    if (signal_cooldown_minutes < 0) {
        throw std::invalid_argument("signal_cooldown_minutes must not be negative");
    }
}

} // namespace strategy
} // namespace signaldesk
