#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"
#include <cmath>
#include <algorithm>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace signaldesk {
namespace analytics {

namespace {
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

// Runs one family computation; exceptions turn into a failed result.
template <typename Columns, typename Fn>
IndicatorFamilyResult<Columns> runFamily(IndicatorFamily family, Fn&& fn) {
    IndicatorFamilyResult<Columns> result;
    try {
        result.columns = fn();
    } catch (const std::exception& e) {
        result.error = e.what();
        LOG_ERROR("{} calculation failed: {}", toString(family), e.what());
    }
    return result;
}

void requirePeriod(int period, const char* name) {
    if (period < 1) {
        throw std::invalid_argument(std::string(name) + " must be >= 1");
    }
}

std::optional<double> readNumber(const nlohmann::json& val) {
    try {
        if (val.is_string()) {
            return std::stod(val.get<std::string>());
        }
        if (val.is_number()) {
            return val.get<double>();
        }
    } catch (const std::exception&) {
        // not numeric
    }
    return std::nullopt;
}
}

std::string toString(IndicatorFamily family) {
    switch (family) {
        case IndicatorFamily::EMA: return "EMA";
        case IndicatorFamily::RSI: return "RSI";
        case IndicatorFamily::BOLLINGER: return "BOLLINGER";
        case IndicatorFamily::VWAP: return "VWAP";
        case IndicatorFamily::VOLUME: return "VOLUME";
        case IndicatorFamily::ATR: return "ATR";
        case IndicatorFamily::PRICE_ACTION: return "PRICE_ACTION";
    }
    return "UNKNOWN";
}

void IndicatorConfig::validate() const {
    requirePeriod(ema_fast, "ema_fast");
    requirePeriod(ema_slow, "ema_slow");
    requirePeriod(rsi_period, "rsi_period");
    requirePeriod(bollinger_period, "bollinger_period");
    requirePeriod(atr_period, "atr_period");
    if (ema_fast >= ema_slow) {
        throw std::invalid_argument("ema_fast must be shorter than ema_slow");
    }
    if (!(bollinger_std > 0.0)) {
        throw std::invalid_argument("bollinger_std must be positive");
    }
}

IndicatorSnapshot::IndicatorSnapshot()
    : ema_fast(kNaN), ema_slow(kNaN), rsi(kNaN)
    , bb_upper(kNaN), bb_middle(kNaN), bb_lower(kNaN), bb_width(kNaN)
    , vwap(kNaN), volume_ma(kNaN), volume_ratio(kNaN)
    , true_range(kNaN), atr(kNaN)
    , price_change(kNaN), price_change_ma(kNaN), momentum(kNaN)
{}

IndicatorSeries TechnicalIndicators::computeIndicators(
    const std::vector<Candle>& candles,
    const IndicatorConfig& config
) {
    if (candles.empty()) {
        throw MissingFieldError({"open", "high", "low", "close", "volume"});
    }

    // A non-finite field is treated the same as an absent one
    std::vector<std::string> missing;
    auto check = [&](bool finite, const char* name) {
        if (!finite && std::find(missing.begin(), missing.end(), name) == missing.end()) {
            missing.push_back(name);
        }
    };
    for (const auto& c : candles) {
        check(std::isfinite(c.open), "open");
        check(std::isfinite(c.high), "high");
        check(std::isfinite(c.low), "low");
        check(std::isfinite(c.close), "close");
        check(std::isfinite(c.volume), "volume");
    }
    if (!missing.empty()) {
        MissingFieldError error(missing);
        LOG_ERROR("{}", error.what());
        throw error;
    }

    IndicatorSeries series;
    series.candles = candles;
    series.snapshots.resize(candles.size());
    auto& snaps = series.snapshots;
    const auto closes = extractClosePrices(candles);

    // 1. EMA
    struct EmaColumns { std::vector<double> fast, slow; };
    auto ema = runFamily<EmaColumns>(IndicatorFamily::EMA, [&] {
        requirePeriod(config.ema_fast, "ema_fast");
        requirePeriod(config.ema_slow, "ema_slow");
        return EmaColumns{calculateEMAVector(closes, config.ema_fast),
                          calculateEMAVector(closes, config.ema_slow)};
    });
    if (ema.ok()) {
        for (size_t i = 0; i < snaps.size(); ++i) {
            snaps[i].ema_fast = ema.columns->fast[i];
            snaps[i].ema_slow = ema.columns->slow[i];
        }
    } else {
        series.failures[IndicatorFamily::EMA] = ema.error;
    }

    // 2. RSI
    auto rsi = runFamily<std::vector<double>>(IndicatorFamily::RSI, [&] {
        return calculateRSIVector(closes, config.rsi_period);
    });
    if (rsi.ok()) {
        for (size_t i = 0; i < snaps.size(); ++i) snaps[i].rsi = (*rsi.columns)[i];
    } else {
        series.failures[IndicatorFamily::RSI] = rsi.error;
    }

    // 3. Bollinger Bands
    auto bands = runFamily<BollingerColumns>(IndicatorFamily::BOLLINGER, [&] {
        return calculateBollingerBands(closes, config.bollinger_period, config.bollinger_std);
    });
    if (bands.ok()) {
        for (size_t i = 0; i < snaps.size(); ++i) {
            snaps[i].bb_upper = bands.columns->upper[i];
            snaps[i].bb_middle = bands.columns->middle[i];
            snaps[i].bb_lower = bands.columns->lower[i];
            snaps[i].bb_width = bands.columns->width[i];
        }
    } else {
        series.failures[IndicatorFamily::BOLLINGER] = bands.error;
    }

    // 4. VWAP
    auto vwap = runFamily<std::vector<double>>(IndicatorFamily::VWAP, [&] {
        return calculateVWAPVector(candles);
    });
    if (vwap.ok()) {
        for (size_t i = 0; i < snaps.size(); ++i) snaps[i].vwap = (*vwap.columns)[i];
    } else {
        series.failures[IndicatorFamily::VWAP] = vwap.error;
    }

    // 5. Volume
    auto volume = runFamily<VolumeColumns>(IndicatorFamily::VOLUME, [&] {
        return calculateVolumeAnalysis(candles, VOLUME_MA_WINDOW);
    });
    if (volume.ok()) {
        for (size_t i = 0; i < snaps.size(); ++i) {
            snaps[i].volume_ma = volume.columns->ma[i];
            snaps[i].volume_ratio = volume.columns->ratio[i];
        }
    } else {
        series.failures[IndicatorFamily::VOLUME] = volume.error;
    }

    // 6. ATR
    auto atr = runFamily<AtrColumns>(IndicatorFamily::ATR, [&] {
        return calculateATR(candles, config.atr_period);
    });
    if (atr.ok()) {
        for (size_t i = 0; i < snaps.size(); ++i) {
            snaps[i].true_range = atr.columns->true_range[i];
            snaps[i].atr = atr.columns->atr[i];
        }
    } else {
        series.failures[IndicatorFamily::ATR] = atr.error;
    }

    // 7. Price action
    auto action = runFamily<PriceActionColumns>(IndicatorFamily::PRICE_ACTION, [&] {
        return calculatePriceAction(closes, PRICE_CHANGE_MA_WINDOW, MOMENTUM_LAG);
    });
    if (action.ok()) {
        for (size_t i = 0; i < snaps.size(); ++i) {
            snaps[i].price_change = action.columns->change[i];
            snaps[i].price_change_ma = action.columns->change_ma[i];
            snaps[i].momentum = action.columns->momentum[i];
        }
    } else {
        series.failures[IndicatorFamily::PRICE_ACTION] = action.error;
    }

    LOG_DEBUG("{} candles with indicators ({} failed families)", snaps.size(), series.failures.size());
    return series;
}

// EMA (Exponential Moving Average)
std::vector<double> TechnicalIndicators::calculateEMAVector(
    const std::vector<double>& prices,
    int period
) {
    requirePeriod(period, "ema period");
    std::vector<double> ema_values;
    if (prices.empty()) return ema_values;
    ema_values.reserve(prices.size());

    const double multiplier = 2.0 / (period + 1.0);

    double ema = prices.front();
    ema_values.push_back(ema);
    for (size_t i = 1; i < prices.size(); ++i) {
        ema = (prices[i] - ema) * multiplier + ema;
        ema_values.push_back(ema);
    }

    return ema_values;
}

// RSI with Wilder's smoothing
std::vector<double> TechnicalIndicators::calculateRSIVector(
    const std::vector<double>& prices,
    int period
) {
    requirePeriod(period, "rsi period");
    std::vector<double> rsi_values;
    if (prices.empty()) return rsi_values;
    rsi_values.reserve(prices.size());

    const double alpha = 1.0 / period;
    double avg_gain = 0.0;
    double avg_loss = 0.0;

    rsi_values.push_back(50.0);
    for (size_t i = 1; i < prices.size(); ++i) {
        const double change = prices[i] - prices[i-1];
        const double gain = (change > 0) ? change : 0.0;
        const double loss = (change < 0) ? -change : 0.0;

        avg_gain = (1.0 - alpha) * avg_gain + alpha * gain;
        avg_loss = (1.0 - alpha) * avg_loss + alpha * loss;

        double rsi;
        if (avg_loss <= 0.0) {
            rsi = (avg_gain <= 0.0) ? 50.0 : 100.0;
        } else {
            const double rs = avg_gain / avg_loss;
            rsi = 100.0 - (100.0 / (1.0 + rs));
        }
        rsi_values.push_back(std::clamp(rsi, 0.0, 100.0));
    }

    return rsi_values;
}

// Bollinger Bands
BollingerColumns TechnicalIndicators::calculateBollingerBands(
    const std::vector<double>& prices,
    int period,
    double std_dev_mult
) {
    requirePeriod(period, "bollinger period");
    BollingerColumns result;
    const size_t n = prices.size();
    result.upper.reserve(n);
    result.middle.reserve(n);
    result.lower.reserve(n);
    result.width.reserve(n);

    for (size_t i = 0; i < n; ++i) {
        const size_t start = (i + 1 >= static_cast<size_t>(period)) ? i + 1 - period : 0;
        std::vector<double> window(prices.begin() + start, prices.begin() + i + 1);

        const double middle = calculateMean(window);
        const double std_dev = calculateStandardDeviation(window, middle);
        const double upper = middle + (std_dev * std_dev_mult);
        const double lower = middle - (std_dev * std_dev_mult);

        result.middle.push_back(middle);
        result.upper.push_back(upper);
        result.lower.push_back(lower);
        result.width.push_back(std::abs(middle) > 0.0 ? (upper - lower) / middle : 0.0);
    }

    return result;
}

// VWAP (Volume Weighted Average Price)
std::vector<double> TechnicalIndicators::calculateVWAPVector(const std::vector<Candle>& candles) {
    std::vector<double> vwap_values;
    vwap_values.reserve(candles.size());

    double cumulative_tpv = 0.0;
    double cumulative_volume = 0.0;

    for (const auto& candle : candles) {
        const double typical_price = (candle.high + candle.low + candle.close) / 3.0;
        cumulative_tpv += typical_price * candle.volume;
        cumulative_volume += candle.volume;

        // No traded volume yet: the typical price is the only reference
        if (cumulative_volume > 0.0) {
            vwap_values.push_back(cumulative_tpv / cumulative_volume);
        } else {
            vwap_values.push_back(typical_price);
        }
    }

    return vwap_values;
}

VolumeColumns TechnicalIndicators::calculateVolumeAnalysis(
    const std::vector<Candle>& candles,
    int window
) {
    requirePeriod(window, "volume window");
    VolumeColumns result;
    result.ma.reserve(candles.size());
    result.ratio.reserve(candles.size());

    double rolling_sum = 0.0;
    for (size_t i = 0; i < candles.size(); ++i) {
        rolling_sum += candles[i].volume;
        if (i >= static_cast<size_t>(window)) {
            rolling_sum -= candles[i - window].volume;
        }
        const size_t count = std::min(i + 1, static_cast<size_t>(window));
        const double ma = rolling_sum / static_cast<double>(count);

        double ratio = candles[i].volume / ma;
        if (!std::isfinite(ratio)) {
            ratio = 1.0;
        }

        result.ma.push_back(ma);
        result.ratio.push_back(ratio);
    }

    return result;
}

// ATR (Average True Range)
AtrColumns TechnicalIndicators::calculateATR(const std::vector<Candle>& candles, int period) {
    requirePeriod(period, "atr period");
    AtrColumns result;
    const size_t n = candles.size();
    result.true_range.reserve(n);
    result.atr.assign(n, 0.0);

    for (size_t i = 0; i < n; ++i) {
        const auto& current = candles[i];
        double tr = current.high - current.low;
        if (i > 0) {
            const double prev_close = candles[i-1].close;
            tr = std::max({tr,
                           std::abs(current.high - prev_close),
                           std::abs(current.low - prev_close)});
        }
        result.true_range.push_back(tr);
    }

    const size_t p = static_cast<size_t>(period);
    if (n < p) return result;

    // seed: mean of the first `period` true ranges
    double atr = 0.0;
    for (size_t i = 0; i < p; ++i) atr += result.true_range[i];
    atr /= period;
    result.atr[p - 1] = atr;

    // Wilder's smoothing for the rest
    for (size_t i = p; i < n; ++i) {
        atr = ((atr * (period - 1)) + result.true_range[i]) / period;
        result.atr[i] = atr;
    }

    return result;
}

PriceActionColumns TechnicalIndicators::calculatePriceAction(
    const std::vector<double>& prices,
    int change_window,
    int momentum_lag
) {
    requirePeriod(change_window, "price change window");
    requirePeriod(momentum_lag, "momentum lag");
    PriceActionColumns result;
    const size_t n = prices.size();
    result.change.assign(n, 0.0);
    result.change_ma.assign(n, 0.0);
    result.momentum.assign(n, 0.0);

    for (size_t i = 1; i < n; ++i) {
        result.change[i] = (prices[i] - prices[i-1]) / prices[i-1];
    }

    // The first candle has no change; it never enters the average
    for (size_t i = 1; i < n; ++i) {
        const size_t start = std::max<size_t>(1, (i + 1 >= static_cast<size_t>(change_window)) ? i + 1 - change_window : 0);
        double sum = 0.0;
        for (size_t k = start; k <= i; ++k) sum += result.change[k];
        result.change_ma[i] = sum / static_cast<double>(i - start + 1);
    }

    const size_t lag = static_cast<size_t>(momentum_lag);
    for (size_t i = lag; i < n; ++i) {
        result.momentum[i] = prices[i] - prices[i - lag];
    }

    return result;
}

TechnicalIndicators::Trend TechnicalIndicators::detectTrend(const IndicatorSeries& series) {
    if (series.empty() || !series.hasFamily(IndicatorFamily::EMA)) return Trend::NEUTRAL;

    const auto& latest = series.snapshots.back();
    if (latest.ema_fast > latest.ema_slow * 1.01) return Trend::BULLISH;
    if (latest.ema_fast < latest.ema_slow * 0.99) return Trend::BEARISH;
    return Trend::NEUTRAL;
}

std::string TechnicalIndicators::trendToString(Trend trend) {
    switch (trend) {
        case Trend::BULLISH: return "BULLISH";
        case Trend::BEARISH: return "BEARISH";
        case Trend::NEUTRAL: return "NEUTRAL";
    }
    return "NEUTRAL";
}

double TechnicalIndicators::latestVolatility(const IndicatorSeries& series) {
    if (series.empty() || !series.hasFamily(IndicatorFamily::BOLLINGER)) return 0.0;
    return series.snapshots.back().bb_width;
}

nlohmann::json TechnicalIndicators::marketSummary(const IndicatorSeries& series, const std::string& symbol) {
    if (series.empty()) {
        return {{"error", "No data"}};
    }

    const auto& latest = series.snapshots.back();
    return {
        {"symbol", symbol},
        {"price", series.candles.back().close},
        {"trend", trendToString(detectTrend(series))},
        {"volatility", latestVolatility(series)},
        {"indicators", {
            {"ema_fast", latest.ema_fast},
            {"ema_slow", latest.ema_slow},
            {"rsi", latest.rsi},
            {"bb_upper", latest.bb_upper},
            {"bb_lower", latest.bb_lower},
            {"vwap", latest.vwap},
            {"atr", latest.atr},
            {"volume_ratio", latest.volume_ratio}
        }}
    };
}

std::vector<std::string> TechnicalIndicators::missingIndicators(const IndicatorSnapshot& s) {
    std::vector<std::string> missing;
    auto require = [&](double value, const char* name) {
        if (!std::isfinite(value)) missing.push_back(name);
    };
    require(s.ema_fast, "ema_fast");
    require(s.ema_slow, "ema_slow");
    require(s.rsi, "rsi");
    require(s.bb_upper, "bb_upper");
    require(s.bb_lower, "bb_lower");
    require(s.bb_width, "bb_width");
    require(s.vwap, "vwap");
    require(s.atr, "atr");
    require(s.volume_ratio, "volume_ratio");
    require(s.price_change, "price_change");
    return missing;
}

// JSON -> Candle
std::vector<Candle> TechnicalIndicators::jsonToCandles(const nlohmann::json& json_candles) {
    std::vector<Candle> candles;
    if (!json_candles.is_array()) {
        throw MissingFieldError({"open", "high", "low", "close", "volume"});
    }
    candles.reserve(json_candles.size());

    static const char* kFields[] = {"open", "high", "low", "close", "volume"};

    for (const auto& jc : json_candles) {
        std::optional<double> values[5];
        long long timestamp = 0;

        if (jc.is_array()) {
            // Binance kline: [open_time, open, high, low, close, volume, close_time, ...]
            if (!jc.empty() && jc[0].is_number()) {
                timestamp = jc[0].get<long long>();
            }
            for (size_t k = 0; k < 5; ++k) {
                if (jc.size() > k + 1) values[k] = readNumber(jc[k + 1]);
            }
        } else if (jc.is_object()) {
            timestamp = jc.value("timestamp", jc.value("open_time", 0LL));
            for (size_t k = 0; k < 5; ++k) {
                if (jc.contains(kFields[k])) values[k] = readNumber(jc[kFields[k]]);
            }
        }

        std::vector<std::string> missing;
        for (size_t k = 0; k < 5; ++k) {
            if (!values[k]) missing.push_back(kFields[k]);
        }
        if (!missing.empty()) {
            throw MissingFieldError(missing);
        }

        candles.emplace_back(*values[0], *values[1], *values[2], *values[3], *values[4], timestamp);
    }

    std::stable_sort(candles.begin(), candles.end(),
                     [](const Candle& a, const Candle& b) {
                         return a.timestamp < b.timestamp;
                     });

    return candles;
}

// Close prices only
std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<Candle>& candles) {
    std::vector<double> prices;
    prices.reserve(candles.size());

    for (const auto& candle : candles) {
        prices.push_back(candle.close);
    }

    return prices;
}

// ========== private helpers ==========

double TechnicalIndicators::calculateStandardDeviation(
    const std::vector<double>& values,
    double mean
) {
    if (values.empty()) return 0.0;
    double sum_sq_diff = 0.0;
    for (double val : values) {
        sum_sq_diff += (val - mean) * (val - mean);
    }
    return std::sqrt(sum_sq_diff / values.size());
}

double TechnicalIndicators::calculateMean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;

    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

} // namespace analytics
} // namespace signaldesk
