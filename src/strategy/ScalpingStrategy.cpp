#include "strategy/ScalpingStrategy.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>

namespace signaldesk {
namespace strategy {

ScalpingStrategy::ScalpingStrategy(const ScalpingStrategyConfig& config)
    : config_(config)
    , cooldown_(static_cast<long long>(config.signal_cooldown_minutes) * 60 * 1000)
{
    config_.validate();
    LOG_INFO("Scalping strategy initialized (timeframe {}, min confidence {:.2f}, cooldown {}m)",
             config_.timeframe, config_.min_confidence, config_.signal_cooldown_minutes);
}

StrategyInfo ScalpingStrategy::getInfo() const {
    StrategyInfo info;
    info.name = "Scalping Strategy";
    info.description = "EMA/RSI/Bollinger/VWAP/volume/price-action weighted scoring with ATR stops";
    info.timeframe = config_.timeframe;
    return info;
}

AnalysisResult ScalpingStrategy::analyze(const analytics::IndicatorSeries& series) {
    AnalysisResult result;

    if (series.size() < MIN_CANDLES || series.candles.size() != series.size()) {
        result.reason = "insufficient_data";
        LOG_DEBUG("[Scalping] not enough candles: {} < {}", series.size(), MIN_CANDLES);
        return result;
    }

    const auto& latest = series.snapshots.back();
    const auto& previous = series.snapshots[series.size() - 2];

    auto missing = analytics::TechnicalIndicators::missingIndicators(latest);
    if (!missing.empty()) {
        result.reason = "missing_indicators";
        LOG_WARN("[Scalping] data-quality gate: {} indicator(s) unavailable, first: {}",
                 missing.size(), missing.front());
        return result;
    }

    const double close = series.candles.back().close;
    const double prev_close = series.candles[series.size() - 2].close;

    ComponentScores scores;
    scoreTrend(latest, previous, scores);
    scoreMomentum(latest, scores);
    scoreBands(latest, close, scores);
    scoreVwap(latest, previous, close, prev_close, scores);
    scoreVolume(latest, scores);
    scorePriceAction(latest, scores);

    result.buy_score = scores.buy;
    result.sell_score = scores.sell;
    result.confidence = std::max(scores.buy, scores.sell);

    LOG_DEBUG("[Scalping] scores buy {:.3f} sell {:.3f} (RSI {:.1f}, width {:.4f}, vol x{:.2f})",
              scores.buy, scores.sell, latest.rsi, latest.bb_width, latest.volume_ratio);

    if (result.confidence < config_.min_confidence) {
        result.reason = "below_min_confidence";
        return result;
    }

    if (scores.buy > scores.sell) {
        result.type = SignalType::BUY;
    } else if (scores.sell > scores.buy) {
        result.type = SignalType::SELL;
    } else {
        result.reason = "tie";
        return result;
    }

    result.levels = calculateProtectiveLevels(result.type, close, latest.atr);
    result.reason = "scored";
    return result;
}

void ScalpingStrategy::scoreTrend(
    const analytics::IndicatorSnapshot& latest,
    const analytics::IndicatorSnapshot& previous,
    ComponentScores& scores
) const {
    const double weight = config_.weights.ema_trend;

    if (latest.ema_fast > latest.ema_slow) {
        scores.buy += weight;
        if (previous.ema_fast <= previous.ema_slow) {
            scores.buy += CROSSOVER_BONUS;
        }
    } else if (latest.ema_fast < latest.ema_slow) {
        scores.sell += weight;
        if (previous.ema_fast >= previous.ema_slow) {
            scores.sell += CROSSOVER_BONUS;
        }
    }
}

void ScalpingStrategy::scoreMomentum(const analytics::IndicatorSnapshot& latest, ComponentScores& scores) const {
    const double weight = config_.weights.rsi_momentum;
    const double rsi = latest.rsi;

    if (rsi < config_.rsi_oversold) {
        scores.buy += weight;
    } else if (rsi > config_.rsi_overbought) {
        scores.sell += weight;
    } else if (rsi <= RSI_NEUTRAL_LOW || rsi >= RSI_NEUTRAL_HIGH) {
        // Outside the 40-60 neutral band: half weight toward the midpoint side
        if (rsi < RSI_MIDPOINT) {
            scores.buy += weight * 0.5;
        } else {
            scores.sell += weight * 0.5;
        }
    }
}

void ScalpingStrategy::scoreBands(
    const analytics::IndicatorSnapshot& latest,
    double close,
    ComponentScores& scores
) const {
    if (latest.bb_width <= config_.min_volatility) {
        return;
    }

    if (close <= latest.bb_lower) {
        scores.buy += config_.weights.bollinger;
    } else if (close >= latest.bb_upper) {
        scores.sell += config_.weights.bollinger;
    }
}

void ScalpingStrategy::scoreVwap(
    const analytics::IndicatorSnapshot& latest,
    const analytics::IndicatorSnapshot& previous,
    double close,
    double prev_close,
    ComponentScores& scores
) const {
    const double weight = config_.weights.vwap;
    const double vwap = latest.vwap;

    if (close > vwap && prev_close <= previous.vwap) {
        scores.buy += weight;
    } else if (close < vwap && prev_close >= previous.vwap) {
        scores.sell += weight;
    } else if (close > vwap * (1.0 + VWAP_DEVIATION)) {
        scores.buy += weight * 0.5;
    } else if (close < vwap * (1.0 - VWAP_DEVIATION)) {
        scores.sell += weight * 0.5;
    }
}

void ScalpingStrategy::scoreVolume(const analytics::IndicatorSnapshot& latest, ComponentScores& scores) const {
    if (latest.volume_ratio <= config_.min_volume_ratio) {
        return;
    }

    // Volume confirms the side already ahead, never breaks a tie
    if (scores.buy > scores.sell) {
        scores.buy += config_.weights.volume;
    } else if (scores.sell > scores.buy) {
        scores.sell += config_.weights.volume;
    }
}

void ScalpingStrategy::scorePriceAction(const analytics::IndicatorSnapshot& latest, ComponentScores& scores) const {
    if (latest.price_change > PRICE_ACTION_THRESHOLD) {
        scores.buy += config_.weights.price_action;
    } else if (latest.price_change < -PRICE_ACTION_THRESHOLD) {
        scores.sell += config_.weights.price_action;
    }
}

ProtectiveLevels ScalpingStrategy::calculateProtectiveLevels(
    SignalType type,
    double entry_price,
    double atr
) const {
    ProtectiveLevels levels;
    levels.entry_price = entry_price;
    levels.atr = atr;

    const double stop_distance = atr * config_.stop_loss_multiplier;
    const double profit_distance = atr * config_.take_profit_multiplier;

    if (type == SignalType::BUY) {
        levels.stop_loss = entry_price - stop_distance;
        levels.take_profit = entry_price + profit_distance;
    } else if (type == SignalType::SELL) {
        levels.stop_loss = entry_price + stop_distance;
        levels.take_profit = entry_price - profit_distance;
    } else {
        levels.stop_loss = entry_price;
        levels.take_profit = entry_price;
    }

    const double risk = std::abs(entry_price - levels.stop_loss);
    const double reward = std::abs(levels.take_profit - entry_price);
    levels.risk_reward = risk > 0.0 ? reward / risk : 0.0;
    return levels;
}

bool ScalpingStrategy::validateSignal(const std::string& symbol, SignalType type, long long now_ms) {
    if (cooldown_.tryAcquire(symbol, type, now_ms)) {
        return true;
    }

    auto remaining = cooldown_.remainingMs(symbol, type, now_ms);
    LOG_INFO("{} - {} signal in cooldown ({:.1f}s left)",
             symbol, toString(type), remaining ? *remaining / 1000.0 : 0.0);
    return false;
}

void ScalpingStrategy::releaseSignal(const std::string& symbol, SignalType type) {
    cooldown_.release(symbol, type);
    LOG_DEBUG("{} - {} cooldown released", symbol, toString(type));
}

double ScalpingStrategy::calculatePositionSize(
    double capital,
    double entry_price,
    double stop_loss,
    double risk_percent
) const {
    const double price_risk = std::abs(entry_price - stop_loss);
    if (price_risk <= 0.0) {
        LOG_WARN("Position size requested with zero stop distance (entry {:.2f})", entry_price);
        return 0.0;
    }

    const double risk_amount = capital * risk_percent;
    return roundTo(risk_amount / price_risk, 3);
}

nlohmann::json ScalpingStrategy::getStats() const {
    const auto& ind = config_.indicators;
    const auto& w = config_.weights;
    return {
        {"strategy_name", getInfo().name},
        {"timeframe", config_.timeframe},
        {"indicators", {
            {"ema_fast", ind.ema_fast},
            {"ema_slow", ind.ema_slow},
            {"rsi_period", ind.rsi_period},
            {"bollinger_period", ind.bollinger_period},
            {"bollinger_std", ind.bollinger_std},
            {"atr_period", ind.atr_period},
            {"rsi_overbought", config_.rsi_overbought},
            {"rsi_oversold", config_.rsi_oversold}
        }},
        {"risk_management", {
            {"stop_loss_multiplier", config_.stop_loss_multiplier},
            {"take_profit_multiplier", config_.take_profit_multiplier},
            {"min_confidence", config_.min_confidence},
            {"signal_cooldown_minutes", config_.signal_cooldown_minutes}
        }},
        {"filters", {
            {"min_volume_ratio", config_.min_volume_ratio},
            {"min_volatility", config_.min_volatility}
        }},
        {"signal_weights", {
            {"ema_trend", w.ema_trend},
            {"rsi_momentum", w.rsi_momentum},
            {"bollinger", w.bollinger},
            {"vwap", w.vwap},
            {"volume", w.volume},
            {"price_action", w.price_action}
        }},
        {"tracked_cooldown_keys", cooldown_.size()}
    };
}

} // namespace strategy
} // namespace signaldesk
