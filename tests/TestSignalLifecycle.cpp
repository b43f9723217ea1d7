#include "engine/SignalGenerator.h"
#include "common/Logger.h"
#include "strategy/ScalpingStrategy.h"
#include "TestFakes.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace signaldesk;
using signaldesk::engine::EngineConfig;
using signaldesk::engine::SignalGenerator;
using signaldesk::engine::SignalRecord;

namespace {
constexpr long long kMinute = 60LL * 1000;
constexpr long long kHour = 60LL * kMinute;
constexpr long long kDay = 24LL * kHour;
constexpr long long t0 = 1700000000000LL;

bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

SignalRecord openSignal(SignalType type, double entry, double stop, double target) {
    SignalRecord s;
    s.signal_id = "BTCUSDT_1700000000";
    s.symbol = "BTCUSDT";
    s.type = type;
    s.entry_price = entry;
    s.stop_loss = stop;
    s.take_profit = target;
    s.created_at_ms = t0;
    return s;
}
}

int main() {
    // P&L and duration on closure
    {
        auto buy = openSignal(SignalType::BUY, 100.0, 98.0, 106.0);
        auto closed = SignalGenerator::closeSignal(buy, 105.0, SignalStatus::TAKE_PROFIT, t0 + 90 * kMinute);
        assert(closed.status == SignalStatus::TAKE_PROFIT);
        assert(near(*closed.pnl_percent, 5.0));
        assert(near(*closed.duration_minutes, 90.0));
        assert(*closed.closed_at_ms == t0 + 90 * kMinute);
        assert(near(*closed.close_price, 105.0));
        assert(buy.isActive());

        auto sell = openSignal(SignalType::SELL, 100.0, 102.0, 94.0);
        assert(near(*SignalGenerator::closeSignal(sell, 95.0, SignalStatus::TAKE_PROFIT, t0).pnl_percent, 5.0));
        assert(near(*SignalGenerator::closeSignal(buy, 95.0, SignalStatus::STOP_LOSS, t0).pnl_percent, -5.0));
    }

    // Closure evaluation
    {
        auto buy = openSignal(SignalType::BUY, 100.0, 98.0, 103.0);
        assert(SignalGenerator::evaluateClosure(buy, 98.0, t0, 24.0) == SignalStatus::STOP_LOSS);
        assert(SignalGenerator::evaluateClosure(buy, 103.0, t0, 24.0) == SignalStatus::TAKE_PROFIT);
        assert(SignalGenerator::evaluateClosure(buy, 101.0, t0 + 24 * kHour, 24.0) == SignalStatus::ACTIVE);
        assert(SignalGenerator::evaluateClosure(buy, 101.0, t0 + 24 * kHour + 1, 24.0) == SignalStatus::EXPIRED);
        // a level hit wins over expiry
        assert(SignalGenerator::evaluateClosure(buy, 97.0, t0 + 48 * kHour, 24.0) == SignalStatus::STOP_LOSS);

        auto sell = openSignal(SignalType::SELL, 100.0, 102.0, 97.0);
        assert(SignalGenerator::evaluateClosure(sell, 102.5, t0, 24.0) == SignalStatus::STOP_LOSS);
        assert(SignalGenerator::evaluateClosure(sell, 96.0, t0, 24.0) == SignalStatus::TAKE_PROFIT);
        assert(SignalGenerator::evaluateClosure(sell, 99.0, t0, 24.0) == SignalStatus::ACTIVE);
    }

    // Emission path: rounding, gating, caps, persistence
    {
        testing::FakeMarketData market;
        testing::MemoryStore store;
        testing::ScriptedStrategy strategy;
        market.candles["BTCUSDT"] = testing::makeAscendingCandles(100);
        market.candles["ETHUSDT"] = testing::makeAscendingCandles(100, 2000.0);
        market.candles["SOLUSDT"] = testing::makeAscendingCandles(100, 50.0);

        SignalGenerator generator(market, store, strategy, EngineConfig());

        strategy.setDraft(SignalType::BUY, 100.004, 98.001, 103.0049);
        auto signal = generator.analyzeSymbol("BTCUSDT", t0);
        assert(signal);
        assert(signal->signal_id == "BTCUSDT_1700000000");
        assert(signal->status == SignalStatus::ACTIVE);
        assert(near(signal->entry_price, 100.0));
        assert(near(signal->stop_loss, 98.0));
        assert(near(signal->take_profit, 103.0));
        assert(near(signal->risk_reward_ratio, 1.5));
        assert(near(signal->confidence, 0.65));
        assert(signal->created_at_ms == t0);
        assert(generator.getActiveSignals().size() == 1);
        assert(store.data["active_signals"].contains("BTCUSDT_1700000000"));

        // HOLD emits nothing
        strategy.setHold();
        assert(!generator.analyzeSymbol("ETHUSDT", t0));

        // Levels that collapse after rounding are dropped without touching the cooldown
        strategy.setDraft(SignalType::BUY, 2000.001, 1999.999, 2000.004);
        assert(!generator.analyzeSymbol("ETHUSDT", t0));
        strategy.setDraft(SignalType::BUY, 2000.0, 1990.0, 2015.0);
        assert(generator.analyzeSymbol("ETHUSDT", t0));

        // Cooldown per (symbol, direction)
        strategy.setDraft(SignalType::BUY, 101.0, 99.0, 104.0);
        assert(!generator.analyzeSymbol("BTCUSDT", t0 + kMinute));
        strategy.setDraft(SignalType::SELL, 101.0, 103.0, 98.0);
        assert(generator.analyzeSymbol("BTCUSDT", t0 + 2 * kMinute));

        // Per-symbol cap (2)
        strategy.setDraft(SignalType::BUY, 101.0, 99.0, 104.0);
        assert(!generator.analyzeSymbol("BTCUSDT", t0 + 6 * kMinute));
        assert(generator.countActiveSignals("BTCUSDT") == 2);

        // Market data unavailable
        const int calls = strategy.analyze_calls;
        assert(!generator.analyzeSymbol("XRPUSDT", t0));
        assert(strategy.analyze_calls == calls);

        // Save failure rolls back and propagates
        store.fail_saves = true;
        strategy.setDraft(SignalType::BUY, 50.0, 49.0, 52.0);
        const size_t before = generator.getActiveSignals().size();
        bool thrown = false;
        try {
            generator.analyzeSymbol("SOLUSDT", t0);
        } catch (const PersistenceError&) {
            thrown = true;
        }
        assert(thrown);
        assert(generator.getActiveSignals().size() == before);
        assert(!generator.getSignalById("SOLUSDT_1700000000"));

        // The failed emission did not consume the SOL BUY cooldown
        store.fail_saves = false;
        auto retried = generator.analyzeSymbol("SOLUSDT", t0 + 1000);
        assert(retried);
        assert(retried->signal_id == "SOLUSDT_1700000001");
        assert(store.data["active_signals"].contains("SOLUSDT_1700000001"));
    }

    // Candles through the real indicator pass and scoring strategy
    {
        testing::FakeMarketData market;
        testing::MemoryStore store;
        strategy::ScalpingStrategy strategy;
        market.candles["BTCUSDT"] = testing::makeReversalCandles();
        market.candles["ETHUSDT"] = testing::makeAscendingCandles(100);

        SignalGenerator generator(market, store, strategy, EngineConfig());

        auto signal = generator.analyzeSymbol("BTCUSDT", t0);
        assert(signal);
        assert(signal->type == SignalType::BUY);
        assert(signal->stop_loss < signal->entry_price && signal->entry_price < signal->take_profit);
        assert(signal->confidence >= strategy.minConfidence());
        // trend + crossover, VWAP cross, volume, price action
        assert(near(signal->confidence, 0.7));
        assert(near(signal->entry_price, 112.2));
        assert(near(signal->stop_loss, 110.07, 1e-6));
        assert(near(signal->take_profit, 115.39, 1e-6));
        assert(store.data["active_signals"].contains(signal->signal_id));

        // Steady climb: overbought RSI offsets the trend, below the minimum
        auto series = analytics::TechnicalIndicators::computeIndicators(
            market.candles["ETHUSDT"], strategy.indicatorConfig());
        auto analysis = strategy.analyze(series);
        assert(analysis.type == SignalType::HOLD);
        assert(analysis.reason == "below_min_confidence");
        assert(near(analysis.buy_score, 0.425));
        assert(near(analysis.sell_score, 0.2));
        assert(!generator.analyzeSymbol("ETHUSDT", t0));
        assert(generator.getActiveSignals().size() == 1);
    }

    // Confidence rounding never falls under the strategy minimum
    {
        testing::FakeMarketData market;
        testing::MemoryStore store;
        testing::ScriptedStrategy strategy;
        strategy.min_confidence = 0.5004;
        market.candles["BTCUSDT"] = testing::makeAscendingCandles(100);

        SignalGenerator generator(market, store, strategy, EngineConfig());
        strategy.setDraft(SignalType::BUY, 100.0, 98.0, 103.0, 0.50045);
        auto signal = generator.analyzeSymbol("BTCUSDT", t0);
        assert(signal);
        assert(signal->confidence >= strategy.min_confidence);
        assert(near(signal->confidence, 0.501));

        // Without a logger the debug summary is never built
        assert(!Logger::getInstance().shouldLog(spdlog::level::debug));
    }

    // Monitoring, retries and stats
    {
        testing::FakeMarketData market;
        testing::MemoryStore store;
        testing::ScriptedStrategy strategy;
        market.candles["BTCUSDT"] = testing::makeAscendingCandles(100);
        market.candles["ETHUSDT"] = testing::makeAscendingCandles(100, 200.0);
        market.candles["SOLUSDT"] = testing::makeAscendingCandles(100, 50.0);

        SignalGenerator generator(market, store, strategy, EngineConfig());

        strategy.setDraft(SignalType::BUY, 100.0, 98.0, 103.0);
        assert(generator.analyzeSymbol("BTCUSDT", t0));
        strategy.setDraft(SignalType::SELL, 200.0, 204.0, 194.0);
        assert(generator.analyzeSymbol("ETHUSDT", t0));

        // BTC hits its target, ETH has no price yet
        market.prices["BTCUSDT"] = 103.5;
        auto closed = generator.monitorActiveSignals(t0 + 30 * kMinute);
        assert(closed.size() == 1);
        assert(closed[0].symbol == "BTCUSDT");
        assert(closed[0].status == SignalStatus::TAKE_PROFIT);
        assert(near(*closed[0].pnl_percent, 3.5));
        assert(generator.getActiveSignals().size() == 1);
        assert(generator.getPerformanceLog().size() == 1);
        assert(store.data["performance"].size() == 1);
        assert(!store.data["active_signals"].contains("BTCUSDT_1700000000"));

        // Open-set save fails after the log was written: memory stays, retry is idempotent
        market.prices.erase("BTCUSDT");
        market.prices["ETHUSDT"] = 205.0;
        store.fail_key = "active_signals";
        bool thrown = false;
        try {
            generator.monitorActiveSignals(t0 + 40 * kMinute);
        } catch (const PersistenceError&) {
            thrown = true;
        }
        assert(thrown);
        assert(generator.getActiveSignals().size() == 1);
        assert(generator.getActiveSignals()[0].isActive());
        assert(generator.getPerformanceLog().size() == 1);
        assert(store.data["performance"].size() == 2);

        store.fail_key.clear();
        closed = generator.monitorActiveSignals(t0 + 41 * kMinute);
        assert(closed.size() == 1);
        assert(closed[0].status == SignalStatus::STOP_LOSS);
        assert(near(*closed[0].pnl_percent, -2.5));
        assert(generator.getActiveSignals().empty());
        assert(store.data["performance"].size() == 2);

        // Expiry strictly after the lifetime
        const long long t1 = t0 + kHour;
        strategy.setDraft(SignalType::BUY, 50.0, 49.0, 52.0);
        assert(generator.analyzeSymbol("SOLUSDT", t1));
        market.prices["SOLUSDT"] = 50.5;
        assert(generator.monitorActiveSignals(t1 + 24 * kHour).empty());
        closed = generator.monitorActiveSignals(t1 + 24 * kHour + 1);
        assert(closed.size() == 1);
        assert(closed[0].status == SignalStatus::EXPIRED);
        assert(near(*closed[0].pnl_percent, 1.0));
        assert(near(*closed[0].duration_minutes, 1440.0));

        // Performance aggregate: +3.5, -2.5, +1.0
        auto stats = generator.getPerformanceStats(7, t1 + 24 * kHour + 1);
        assert(stats);
        assert(stats->total_signals == 3);
        assert(stats->winners == 2);
        assert(stats->losers == 1);
        assert(near(stats->win_rate, 2.0 / 3.0));
        assert(near(stats->avg_win, 2.25));
        assert(near(stats->avg_loss, -2.5));
        assert(near(stats->profit_factor, 1.8));
        assert(near(stats->total_pnl, 2.0));
        assert(!generator.getPerformanceStats(7, t1 + 9 * kDay));

        // Reload from the same store
        testing::ScriptedStrategy other;
        SignalGenerator reloaded(market, store, other, EngineConfig());
        assert(reloaded.getActiveSignals().empty());
        assert(reloaded.getPerformanceLog().size() == 3);
        auto eth = reloaded.getSignalById("ETHUSDT_1700000000");
        assert(eth && eth->status == SignalStatus::STOP_LOSS);
    }

    std::cout << "[TEST] SignalLifecycle PASSED\n";
    return 0;
}
