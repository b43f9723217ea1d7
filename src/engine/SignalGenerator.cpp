#include "engine/SignalGenerator.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"
#include "core/state/SignalJson.h"
#include <algorithm>
#include <cmath>
#include <set>

namespace signaldesk {
namespace engine {
namespace {
constexpr long long kMsPerMinute = 60LL * 1000LL;
constexpr long long kMsPerHour = 60LL * kMsPerMinute;
constexpr long long kMsPerDay = 24LL * kMsPerHour;

bool hasValidOrdering(const SignalRecord& signal) {
    if (signal.type == SignalType::BUY) {
        return signal.stop_loss < signal.entry_price && signal.entry_price < signal.take_profit;
    }
    if (signal.type == SignalType::SELL) {
        return signal.take_profit < signal.entry_price && signal.entry_price < signal.stop_loss;
    }
    return false;
}
}

SignalGenerator::SignalGenerator(
    core::IMarketDataSource& market_data,
    core::ISignalStore& store,
    strategy::IStrategy& strategy,
    const EngineConfig& config
)
    : market_data_(market_data)
    , store_(store)
    , strategy_(strategy)
    , config_(config)
{
    active_signals_ = core::activeSignalsFromJson(
        store_.load(ACTIVE_SIGNALS_KEY, nlohmann::json::object()));
    performance_log_ = core::performanceLogFromJson(
        store_.load(PERFORMANCE_KEY, nlohmann::json::array()));

    LOG_INFO("Signal generator initialized: {} active, {} in history",
             active_signals_.size(), performance_log_.size());
}

std::optional<SignalRecord> SignalGenerator::analyzeSymbol(const std::string& symbol) {
    return analyzeSymbol(symbol, currentTimestampMs());
}

std::optional<SignalRecord> SignalGenerator::analyzeSymbol(const std::string& symbol, long long now_ms) {
    try {
        const auto info = strategy_.getInfo();
        auto candles = market_data_.getCandles(symbol, info.timeframe, config_.candle_limit);
        if (!candles || candles->empty()) {
            LOG_WARN("{} - market data unavailable", symbol);
            return std::nullopt;
        }

        auto series = analytics::TechnicalIndicators::computeIndicators(*candles, strategy_.indicatorConfig());
        if (Logger::getInstance().shouldLog(spdlog::level::debug)) {
            LOG_DEBUG("{} - {}", symbol, analytics::TechnicalIndicators::marketSummary(series, symbol).dump());
        }
        auto analysis = strategy_.analyze(series);

        if (analysis.type == SignalType::HOLD) {
            LOG_DEBUG("{} - HOLD (confidence {:.3f}, {})", symbol, analysis.confidence, analysis.reason);
            return std::nullopt;
        }

        auto signal = buildSignal(symbol, analysis, now_ms);
        if (!signal) {
            return std::nullopt;
        }

        if (static_cast<int>(active_signals_.size()) >= config_.max_active_signals) {
            LOG_INFO("{} - {} skipped, active signal cap reached ({})",
                     symbol, toString(signal->type), config_.max_active_signals);
            return std::nullopt;
        }
        if (countActiveSignals(symbol) >= config_.max_signals_per_symbol) {
            LOG_INFO("{} - {} skipped, per-symbol cap reached ({})",
                     symbol, toString(signal->type), config_.max_signals_per_symbol);
            return std::nullopt;
        }
        if (hasSignalId(signal->signal_id)) {
            LOG_WARN("{} - duplicate signal id {}, skipping", symbol, signal->signal_id);
            return std::nullopt;
        }

        if (!strategy_.validateSignal(symbol, signal->type, now_ms)) {
            return std::nullopt;
        }

        active_signals_.push_back(*signal);
        if (!store_.save(ACTIVE_SIGNALS_KEY, core::activeSignalsToJson(active_signals_))) {
            // not emitted: the next cycle may retry the same direction
            active_signals_.pop_back();
            strategy_.releaseSignal(symbol, signal->type);
            throw PersistenceError("failed to save active signals after emitting " + signal->signal_id);
        }

        LOG_INFO("SIGNAL {} {} @ {:.2f} (confidence {:.1f}%, SL {:.2f}, TP {:.2f}, R:R {:.2f})",
                 toString(signal->type), symbol, signal->entry_price, signal->confidence * 100.0,
                 signal->stop_loss, signal->take_profit, signal->risk_reward_ratio);
        LOG_INFO("{} - suggested size {} units per 1000 capital at {:.1f}% risk",
                 signal->signal_id,
                 strategy_.calculatePositionSize(1000.0, signal->entry_price, signal->stop_loss,
                                                 config_.recommended_risk_per_trade),
                 config_.recommended_risk_per_trade * 100.0);
        return signal;
    } catch (const PersistenceError&) {
        throw;
    } catch (const std::exception& e) {
        LOG_ERROR("{} - analysis failed: {}", symbol, e.what());
        return std::nullopt;
    }
}

std::optional<SignalRecord> SignalGenerator::buildSignal(
    const std::string& symbol,
    const strategy::AnalysisResult& analysis,
    long long now_ms
) const {
    if (!analysis.levels) {
        LOG_WARN("{} - {} draft without protective levels, discarded", symbol, toString(analysis.type));
        return std::nullopt;
    }

    const int decimals = config_.price_decimals;
    const auto& levels = *analysis.levels;

    SignalRecord signal;
    signal.signal_id = symbol + "_" + std::to_string(now_ms / 1000);
    signal.symbol = symbol;
    signal.type = analysis.type;
    signal.entry_price = roundTo(levels.entry_price, decimals);
    signal.confidence = roundTo(analysis.confidence, 3);
    if (signal.confidence < strategy_.minConfidence() && analysis.confidence >= strategy_.minConfidence()) {
        // rounding must not push an accepted score under the threshold
        signal.confidence = std::ceil(analysis.confidence * 1000.0) / 1000.0;
    }
    signal.stop_loss = roundTo(levels.stop_loss, decimals);
    signal.take_profit = roundTo(levels.take_profit, decimals);
    signal.atr_at_entry = roundTo(levels.atr, decimals);
    signal.risk_reward_ratio = roundTo(levels.risk_reward, 2);
    signal.status = SignalStatus::ACTIVE;
    signal.created_at_ms = now_ms;

    if (!hasValidOrdering(signal)) {
        LOG_WARN("{} - {} draft discarded, invalid levels after rounding (SL {}, entry {}, TP {})",
                 symbol, toString(signal.type), signal.stop_loss, signal.entry_price, signal.take_profit);
        return std::nullopt;
    }
    return signal;
}

std::vector<SignalRecord> SignalGenerator::monitorActiveSignals() {
    return monitorActiveSignals(currentTimestampMs());
}

std::vector<SignalRecord> SignalGenerator::monitorActiveSignals(long long now_ms) {
    std::vector<SignalRecord> closed;
    if (active_signals_.empty()) {
        return closed;
    }

    LOG_DEBUG("Monitoring {} active signals", active_signals_.size());

    for (const auto& signal : active_signals_) {
        try {
            auto price = market_data_.getCurrentPrice(signal.symbol);
            if (!price || !std::isfinite(*price) || *price <= 0.0) {
                LOG_DEBUG("{} - no price for {}, retry next pass", signal.symbol, signal.signal_id);
                continue;
            }

            const auto status = evaluateClosure(signal, *price, now_ms, config_.max_signal_lifetime_hours);
            if (status == SignalStatus::ACTIVE) {
                continue;
            }
            closed.push_back(closeSignal(signal, *price, status, now_ms));
        } catch (const std::exception& e) {
            LOG_ERROR("Monitoring {} failed: {}", signal.signal_id, e.what());
        }
    }

    if (closed.empty()) {
        return closed;
    }

    // Commit all closures together: performance log first, then the open set
    std::set<std::string> closed_ids;
    std::vector<SignalRecord> next_performance = performance_log_;
    for (const auto& signal : closed) {
        closed_ids.insert(signal.signal_id);
        auto logged = std::find_if(next_performance.begin(), next_performance.end(),
            [&signal](const SignalRecord& s) { return s.signal_id == signal.signal_id; });
        if (logged == next_performance.end()) {
            next_performance.push_back(signal);
        }
    }

    std::vector<SignalRecord> next_active;
    next_active.reserve(active_signals_.size());
    for (const auto& signal : active_signals_) {
        if (closed_ids.count(signal.signal_id) == 0) {
            next_active.push_back(signal);
        }
    }

    if (!store_.save(PERFORMANCE_KEY, core::performanceLogToJson(next_performance))) {
        throw PersistenceError("failed to save performance log (" + std::to_string(closed.size()) + " closures pending)");
    }
    if (!store_.save(ACTIVE_SIGNALS_KEY, core::activeSignalsToJson(next_active))) {
        throw PersistenceError("failed to save active signals (" + std::to_string(closed.size()) + " closures pending)");
    }

    performance_log_ = std::move(next_performance);
    active_signals_ = std::move(next_active);

    for (const auto& signal : closed) {
        LOG_INFO("Signal closed: {} {} {} ({:+.2f}%) after {:.0f}min",
                 signal.symbol, signal.signal_id, toString(signal.status),
                 signal.pnl_percent.value_or(0.0), signal.duration_minutes.value_or(0.0));
    }
    LOG_INFO("{} signal(s) closed, {} still active", closed.size(), active_signals_.size());
    return closed;
}

SignalStatus SignalGenerator::evaluateClosure(
    const SignalRecord& signal,
    double price,
    long long now_ms,
    double max_lifetime_hours
) {
    if (signal.type == SignalType::BUY) {
        if (price <= signal.stop_loss) {
            return SignalStatus::STOP_LOSS;
        }
        if (price >= signal.take_profit) {
            return SignalStatus::TAKE_PROFIT;
        }
    } else if (signal.type == SignalType::SELL) {
        if (price >= signal.stop_loss) {
            return SignalStatus::STOP_LOSS;
        }
        if (price <= signal.take_profit) {
            return SignalStatus::TAKE_PROFIT;
        }
    }

    const double hours_active = static_cast<double>(now_ms - signal.created_at_ms) / kMsPerHour;
    if (hours_active > max_lifetime_hours) {
        return SignalStatus::EXPIRED;
    }
    return SignalStatus::ACTIVE;
}

SignalRecord SignalGenerator::closeSignal(
    const SignalRecord& signal,
    double price,
    SignalStatus status,
    long long now_ms
) {
    SignalRecord closed = signal;
    closed.status = status;
    closed.close_price = price;
    closed.closed_at_ms = now_ms;

    double pnl = 0.0;
    if (signal.entry_price != 0.0) {
        if (signal.type == SignalType::BUY) {
            pnl = (price - signal.entry_price) / signal.entry_price * 100.0;
        } else {
            pnl = (signal.entry_price - price) / signal.entry_price * 100.0;
        }
    }
    closed.pnl_percent = roundTo(pnl, 2);
    closed.duration_minutes = roundTo(static_cast<double>(now_ms - signal.created_at_ms) / kMsPerMinute, 1);
    return closed;
}

std::optional<PerformanceSummary> SignalGenerator::getPerformanceStats(int window_days) const {
    return getPerformanceStats(window_days, currentTimestampMs());
}

std::optional<PerformanceSummary> SignalGenerator::getPerformanceStats(int window_days, long long now_ms) const {
    PerformanceStore store;
    store.rebuild(performance_log_, now_ms - static_cast<long long>(window_days) * kMsPerDay);
    return store.summary();
}

std::optional<SignalRecord> SignalGenerator::getSignalById(const std::string& signal_id) const {
    for (const auto& signal : active_signals_) {
        if (signal.signal_id == signal_id) {
            return signal;
        }
    }
    for (const auto& signal : performance_log_) {
        if (signal.signal_id == signal_id) {
            return signal;
        }
    }
    return std::nullopt;
}

int SignalGenerator::countActiveSignals(const std::string& symbol) const {
    return static_cast<int>(std::count_if(active_signals_.begin(), active_signals_.end(),
        [&symbol](const SignalRecord& s) { return s.symbol == symbol; }));
}

bool SignalGenerator::hasSignalId(const std::string& signal_id) const {
    return getSignalById(signal_id).has_value();
}

} // namespace engine
} // namespace signaldesk
