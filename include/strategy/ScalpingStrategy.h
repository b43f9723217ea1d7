#pragma once

#include "strategy/IStrategy.h"
#include "strategy/StrategyConfig.h"
#include "strategy/SignalCooldownTracker.h"

namespace signaldesk {
namespace strategy {

// Running buy/sell totals of one analysis pass
struct ComponentScores {
    double buy = 0.0;
    double sell = 0.0;
};

// Weighted six-component scorer over the latest two indicator snapshots.
// Confidence is the larger side score; a HOLD is returned below
// min_confidence and on an exact tie.
class ScalpingStrategy : public IStrategy {
public:
    static constexpr size_t MIN_CANDLES = 50;

    static constexpr double CROSSOVER_BONUS = 0.05;
    static constexpr double RSI_NEUTRAL_LOW = 40.0;
    static constexpr double RSI_NEUTRAL_HIGH = 60.0;
    static constexpr double RSI_MIDPOINT = 50.0;
    static constexpr double VWAP_DEVIATION = 0.001;         // 0.1%
    static constexpr double PRICE_ACTION_THRESHOLD = 0.002; // 0.2%

    // Throws std::invalid_argument for an invalid configuration
    explicit ScalpingStrategy(const ScalpingStrategyConfig& config = ScalpingStrategyConfig());

    StrategyInfo getInfo() const override;
    const analytics::IndicatorConfig& indicatorConfig() const override { return config_.indicators; }

    AnalysisResult analyze(const analytics::IndicatorSeries& series) override;

    using IStrategy::validateSignal;
    bool validateSignal(const std::string& symbol, SignalType type, long long now_ms) override;
    void releaseSignal(const std::string& symbol, SignalType type) override;
    double minConfidence() const override { return config_.min_confidence; }

    double calculatePositionSize(double capital, double entry_price,
                                 double stop_loss, double risk_percent = 0.02) const override;

    nlohmann::json getStats() const override;

    // Protective levels from the ATR of the latest snapshot
    ProtectiveLevels calculateProtectiveLevels(SignalType type, double entry_price, double atr) const;

private:
    void scoreTrend(const analytics::IndicatorSnapshot& latest,
                    const analytics::IndicatorSnapshot& previous,
                    ComponentScores& scores) const;
    void scoreMomentum(const analytics::IndicatorSnapshot& latest, ComponentScores& scores) const;
    void scoreBands(const analytics::IndicatorSnapshot& latest, double close,
                    ComponentScores& scores) const;
    void scoreVwap(const analytics::IndicatorSnapshot& latest,
                   const analytics::IndicatorSnapshot& previous,
                   double close, double prev_close,
                   ComponentScores& scores) const;
    void scoreVolume(const analytics::IndicatorSnapshot& latest, ComponentScores& scores) const;
    void scorePriceAction(const analytics::IndicatorSnapshot& latest, ComponentScores& scores) const;

    ScalpingStrategyConfig config_;
    SignalCooldownTracker cooldown_;
};

} // namespace strategy
} // namespace signaldesk
