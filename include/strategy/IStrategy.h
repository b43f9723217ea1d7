#pragma once

#include "common/Types.h"
#include "analytics/TechnicalIndicators.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace signaldesk {
namespace strategy {

// ATR based protective levels for a directional signal
struct ProtectiveLevels {
    double entry_price;
    double stop_loss;
    double take_profit;
    double atr;
    double risk_reward;     // |TP - entry| / |entry - SL|, 0 when the stop distance is 0

    ProtectiveLevels()
        : entry_price(0.0), stop_loss(0.0), take_profit(0.0), atr(0.0), risk_reward(0.0)
    {}
};

// Output of one analysis pass
struct AnalysisResult {
    SignalType type;
    double confidence;      // max(buy_score, sell_score); not clamped to 1.0
    double buy_score;
    double sell_score;
    std::optional<ProtectiveLevels> levels;     // set only for BUY/SELL
    std::string reason;

    AnalysisResult()
        : type(SignalType::HOLD), confidence(0.0), buy_score(0.0), sell_score(0.0)
    {}
};

struct StrategyInfo {
    std::string name;
    std::string description;
    std::string timeframe;      // 1m, 5m, 15m, 1h, 4h, 1d
};

class IStrategy {
public:
    virtual ~IStrategy() = default;

    virtual StrategyInfo getInfo() const = 0;

    // Periods the indicator pass must use for this strategy
    virtual const analytics::IndicatorConfig& indicatorConfig() const = 0;

    // Scores the latest snapshot of the window
    virtual AnalysisResult analyze(const analytics::IndicatorSeries& series) = 0;

    // Cooldown gate per (symbol, direction). Passing resets the timer.
    virtual bool validateSignal(const std::string& symbol, SignalType type, long long now_ms) = 0;
    bool validateSignal(const std::string& symbol, SignalType type) {
        return validateSignal(symbol, type, currentTimestampMs());
    }

    // Undo the last passing validateSignal for the key (emission was not committed)
    virtual void releaseSignal(const std::string& symbol, SignalType type) = 0;

    // Lowest confidence analyze() reports as BUY/SELL
    virtual double minConfidence() const = 0;

    // Informational units for a capital/risk budget; never enforced
    virtual double calculatePositionSize(double capital, double entry_price,
                                         double stop_loss, double risk_percent) const = 0;

    virtual nlohmann::json getStats() const = 0;
};

} // namespace strategy
} // namespace signaldesk
