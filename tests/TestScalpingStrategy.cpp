#include "strategy/ScalpingStrategy.h"
#include "TestFakes.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

using namespace signaldesk;
using signaldesk::analytics::IndicatorSeries;
using signaldesk::analytics::IndicatorSnapshot;
using signaldesk::strategy::ScalpingStrategy;
using signaldesk::strategy::ScalpingStrategyConfig;

namespace {
bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

// Snapshot that scores nothing on any component
IndicatorSnapshot neutralSnapshot(double close) {
    IndicatorSnapshot s;
    s.ema_fast = 100.0;
    s.ema_slow = 100.0;
    s.rsi = 50.0;
    s.bb_upper = close + 10.0;
    s.bb_middle = close;
    s.bb_lower = close - 10.0;
    s.bb_width = 0.01;
    s.vwap = close;
    s.volume_ma = 1000.0;
    s.volume_ratio = 1.0;
    s.true_range = 1.0;
    s.atr = 1.0;
    s.price_change = 0.0;
    s.price_change_ma = 0.0;
    s.momentum = 0.0;
    return s;
}

IndicatorSeries neutralSeries(size_t count = 60) {
    IndicatorSeries series;
    series.candles = testing::makeAscendingCandles(count);
    for (const auto& c : series.candles) {
        series.snapshots.push_back(neutralSnapshot(c.close));
    }
    return series;
}

IndicatorSnapshot& latest(IndicatorSeries& s) { return s.snapshots.back(); }
IndicatorSnapshot& previous(IndicatorSeries& s) { return s.snapshots[s.size() - 2]; }
}

int main() {
    ScalpingStrategy strategy;

    // Neutral window scores nothing
    {
        auto series = neutralSeries();
        auto r = strategy.analyze(series);
        assert(r.type == SignalType::HOLD);
        assert(near(r.buy_score, 0.0) && near(r.sell_score, 0.0));
        assert(!r.levels);
    }

    // BUY: fresh EMA cross, oversold RSI, volume surge on the last candle
    {
        auto series = neutralSeries();
        previous(series).ema_fast = 103.0;
        previous(series).ema_slow = 104.0;
        latest(series).ema_fast = 105.0;
        latest(series).ema_slow = 104.0;
        latest(series).rsi = 25.0;
        latest(series).volume_ratio = 2.0;

        auto r = strategy.analyze(series);
        assert(r.type == SignalType::BUY);
        assert(r.confidence >= 0.25 + 0.20 + 0.15);
        assert(near(r.buy_score, 0.25 + 0.05 + 0.20 + 0.15));
        assert(near(r.sell_score, 0.0));
        assert(r.levels);

        const double close = series.candles.back().close;
        assert(near(r.levels->entry_price, close));
        assert(r.levels->stop_loss < r.levels->entry_price);
        assert(r.levels->entry_price < r.levels->take_profit);
        assert(near(r.levels->stop_loss, close - 2.0));
        assert(near(r.levels->take_profit, close + 3.0));
        assert(near(r.levels->risk_reward, 1.5));
    }

    // SELL: bearish cross, overbought RSI, falling price
    {
        auto series = neutralSeries();
        previous(series).ema_fast = 104.0;
        previous(series).ema_slow = 104.0;
        latest(series).ema_fast = 103.0;
        latest(series).ema_slow = 104.0;
        latest(series).rsi = 75.0;
        latest(series).price_change = -0.003;

        auto r = strategy.analyze(series);
        assert(r.type == SignalType::SELL);
        assert(near(r.sell_score, 0.25 + 0.05 + 0.20 + 0.10));
        assert(r.levels);
        assert(r.levels->take_profit < r.levels->entry_price);
        assert(r.levels->entry_price < r.levels->stop_loss);
    }

    // Exact tie holds
    {
        ScalpingStrategyConfig config;
        config.min_confidence = 0.2;
        ScalpingStrategy low_bar(config);

        auto series = neutralSeries();
        const double close = series.candles.back().close;
        previous(series).ema_fast = 99.0;   // no crossover
        latest(series).ema_fast = 99.0;     // sell 0.25
        latest(series).bb_width = 0.03;
        latest(series).bb_lower = close;    // buy 0.15
        latest(series).price_change = 0.003; // buy 0.10

        auto r = low_bar.analyze(series);
        assert(near(r.buy_score, r.sell_score));
        assert(r.type == SignalType::HOLD);
        assert(near(r.confidence, 0.25));
    }

    // Volume never breaks a tie
    {
        auto series = neutralSeries();
        latest(series).volume_ratio = 3.0;
        auto r = strategy.analyze(series);
        assert(near(r.buy_score, 0.0) && near(r.sell_score, 0.0));
        assert(r.type == SignalType::HOLD);
    }

    // Below min confidence
    {
        auto series = neutralSeries();
        latest(series).rsi = 25.0;
        auto r = strategy.analyze(series);
        assert(r.type == SignalType::HOLD);
        assert(near(r.confidence, 0.20));
    }

    // RSI neutral band is exclusive; outside it half weight
    {
        auto series = neutralSeries();
        latest(series).rsi = 45.0;
        assert(near(strategy.analyze(series).buy_score, 0.0));

        latest(series).rsi = 40.0;
        assert(near(strategy.analyze(series).buy_score, 0.10));

        latest(series).rsi = 65.0;
        assert(near(strategy.analyze(series).sell_score, 0.10));
    }

    // VWAP: fresh cross full weight, deviation half weight
    {
        auto series = neutralSeries();
        const double close = series.candles.back().close;
        const double prev_close = series.candles[series.size() - 2].close;
        previous(series).vwap = prev_close + 0.5;
        latest(series).vwap = close - 0.5;
        assert(near(strategy.analyze(series).buy_score, 0.15));

        previous(series).vwap = prev_close - 0.5;   // already above
        latest(series).vwap = close / 1.01;
        assert(near(strategy.analyze(series).buy_score, 0.075));
    }

    // Bands only count above the volatility floor
    {
        auto series = neutralSeries();
        const double close = series.candles.back().close;
        latest(series).bb_upper = close;
        latest(series).bb_width = 0.02;
        assert(near(strategy.analyze(series).sell_score, 0.0));
        latest(series).bb_width = 0.021;
        assert(near(strategy.analyze(series).sell_score, 0.15));
    }

    // Insufficient data
    {
        auto series = neutralSeries(49);
        latest(series).rsi = 10.0;
        latest(series).ema_fast = 110.0;
        auto r = strategy.analyze(series);
        assert(r.type == SignalType::HOLD);
        assert(near(r.confidence, 0.0));
    }

    // Data-quality gate
    {
        auto series = neutralSeries();
        latest(series).rsi = 10.0;
        latest(series).atr = std::numeric_limits<double>::quiet_NaN();
        auto r = strategy.analyze(series);
        assert(r.type == SignalType::HOLD);
        assert(near(r.confidence, 0.0));
        assert(r.reason == "missing_indicators");
    }

    // Protective levels and position size
    {
        auto levels = strategy.calculateProtectiveLevels(SignalType::SELL, 100.0, 2.0);
        assert(near(levels.stop_loss, 104.0));
        assert(near(levels.take_profit, 94.0));
        assert(near(levels.risk_reward, 1.5));

        auto flat = strategy.calculateProtectiveLevels(SignalType::BUY, 100.0, 0.0);
        assert(near(flat.risk_reward, 0.0));

        assert(near(strategy.calculatePositionSize(10000.0, 100.0, 98.0), 100.0));
        assert(near(strategy.calculatePositionSize(1000.0, 3.0, 2.7, 0.01), 33.333));
        assert(near(strategy.calculatePositionSize(10000.0, 100.0, 100.0), 0.0));
    }

    // Cooldown through the strategy
    {
        const long long t0 = 1700000000000LL;
        assert(strategy.validateSignal("BTCUSDT", SignalType::BUY, t0));
        assert(!strategy.validateSignal("BTCUSDT", SignalType::BUY, t0 + 1000));
        assert(strategy.validateSignal("BTCUSDT", SignalType::SELL, t0 + 1000));
        assert(strategy.validateSignal("BTCUSDT", SignalType::BUY, t0 + 5 * 60 * 1000 + 1));
    }

    // Invalid configurations are rejected
    {
        ScalpingStrategyConfig bad_weights;
        bad_weights.weights.ema_trend = 0.40;
        bool thrown = false;
        try {
            ScalpingStrategy s(bad_weights);
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        assert(thrown);

        ScalpingStrategyConfig bad_confidence;
        bad_confidence.min_confidence = 1.5;
        thrown = false;
        try {
            ScalpingStrategy s(bad_confidence);
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        assert(thrown);
    }

    // Description
    {
        auto stats = strategy.getStats();
        assert(stats["timeframe"] == "1m");
        assert(near(stats["signal_weights"]["ema_trend"].get<double>(), 0.25));
        assert(stats["indicators"]["atr_period"] == 14);
        assert(near(stats["indicators"]["rsi_overbought"].get<double>(), 70.0));
        assert(near(stats["indicators"]["rsi_oversold"].get<double>(), 30.0));
        assert(near(stats["filters"]["min_volume_ratio"].get<double>(), 1.5));
        assert(near(stats["filters"]["min_volatility"].get<double>(), 0.02));
        assert(strategy.getInfo().timeframe == "1m");
    }

    std::cout << "[TEST] ScalpingStrategy PASSED\n";
    return 0;
}
