#pragma once

#include "analytics/TechnicalIndicators.h"

namespace signaldesk {
namespace strategy {

// Component weights of the scalping score. Must sum to 1.0 (+/- 0.01).
struct SignalWeights {
    double ema_trend = 0.25;
    double rsi_momentum = 0.20;
    double bollinger = 0.15;
    double vwap = 0.15;
    double volume = 0.15;
    double price_action = 0.10;

    double sum() const {
        return ema_trend + rsi_momentum + bollinger + vwap + volume + price_action;
    }
};

struct ScalpingStrategyConfig {
    std::string timeframe = "1m";

    analytics::IndicatorConfig indicators;

    // RSI Thresholds
    double rsi_overbought = 70.0;
    double rsi_oversold = 30.0;

    // ATR multiples for protective levels
    double stop_loss_multiplier = 2.0;
    double take_profit_multiplier = 3.0;

    // Filters
    double min_confidence = 0.50;
    double min_volume_ratio = 1.5;
    double min_volatility = 0.02;       // minimum Bollinger width to score bands

    int signal_cooldown_minutes = 5;

    SignalWeights weights;

    // Throws std::invalid_argument
    void validate() const;
};

bool isValidTimeframe(const std::string& timeframe);

} // namespace strategy
} // namespace signaldesk
