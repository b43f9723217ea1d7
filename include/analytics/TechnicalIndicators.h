#pragma once

#include <vector>
#include <string>
#include <map>
#include <optional>
#include <nlohmann/json.hpp>
#include "common/Types.h"

namespace signaldesk {
namespace analytics {

// Look-back windows of the indicator families
struct IndicatorConfig {
    int ema_fast = 9;
    int ema_slow = 21;
    int rsi_period = 14;
    int bollinger_period = 20;
    double bollinger_std = 2.0;
    int atr_period = 14;

    // Throws std::invalid_argument
    void validate() const;
};

enum class IndicatorFamily {
    EMA,
    RSI,
    BOLLINGER,
    VWAP,
    VOLUME,
    ATR,
    PRICE_ACTION
};

std::string toString(IndicatorFamily family);

// Indicator values for one candle. A field stays NaN when its family failed.
struct IndicatorSnapshot {
    double ema_fast;
    double ema_slow;
    double rsi;             // 0 ~ 100
    double bb_upper;
    double bb_middle;
    double bb_lower;
    double bb_width;        // (upper - lower) / middle
    double vwap;
    double volume_ma;
    double volume_ratio;    // volume / volume_ma
    double true_range;
    double atr;
    double price_change;    // close pct change (0.002 = +0.2%)
    double price_change_ma;
    double momentum;        // close - close[4 candles back]

    IndicatorSnapshot();
};

// Candle window plus one snapshot per candle
struct IndicatorSeries {
    std::vector<Candle> candles;
    std::vector<IndicatorSnapshot> snapshots;
    std::map<IndicatorFamily, std::string> failures;   // family -> reason

    size_t size() const { return snapshots.size(); }
    bool empty() const { return snapshots.empty(); }
    bool hasFamily(IndicatorFamily family) const { return failures.count(family) == 0; }
};

// Outcome of one indicator family: columns on success, reason on failure
template <typename Columns>
struct IndicatorFamilyResult {
    std::optional<Columns> columns;
    std::string error;

    bool ok() const { return columns.has_value(); }
};

struct BollingerColumns {
    std::vector<double> upper;
    std::vector<double> middle;
    std::vector<double> lower;
    std::vector<double> width;
};

struct VolumeColumns {
    std::vector<double> ma;
    std::vector<double> ratio;
};

struct AtrColumns {
    std::vector<double> true_range;
    std::vector<double> atr;
};

struct PriceActionColumns {
    std::vector<double> change;
    std::vector<double> change_ma;
    std::vector<double> momentum;
};

class TechnicalIndicators {
public:
    static constexpr int VOLUME_MA_WINDOW = 20;
    static constexpr int PRICE_CHANGE_MA_WINDOW = 5;
    static constexpr int MOMENTUM_LAG = 4;

    // Full indicator pass over the window.
    // Throws MissingFieldError for an empty window or a candle with a
    // non-finite OHLCV field. A failing family is logged and recorded in
    // IndicatorSeries::failures; the other families are still produced.
    static IndicatorSeries computeIndicators(const std::vector<Candle>& candles,
                                             const IndicatorConfig& config);

    // EMA seeded with the first price (no missing leading values)
    static std::vector<double> calculateEMAVector(const std::vector<double>& prices, int period);

    // RSI with Wilder smoothing. First value is the neutral 50.
    // >= 70 overbought, <= 30 oversold
    static std::vector<double> calculateRSIVector(const std::vector<double>& prices, int period = 14);

    // SMA +/- k population std-dev; expanding window until `period` samples exist
    static BollingerColumns calculateBollingerBands(const std::vector<double>& prices,
                                                    int period = 20,
                                                    double std_dev_mult = 2.0);

    // Cumulative (not windowed) volume weighted average of the typical price
    static std::vector<double> calculateVWAPVector(const std::vector<Candle>& candles);

    // Rolling mean of volume and current/mean ratio (degenerate ratios -> 1.0)
    static VolumeColumns calculateVolumeAnalysis(const std::vector<Candle>& candles,
                                                 int window = VOLUME_MA_WINDOW);

    // True range and Wilder ATR; ATR is 0 until `period` true ranges exist
    static AtrColumns calculateATR(const std::vector<Candle>& candles, int period = 14);

    static PriceActionColumns calculatePriceAction(const std::vector<double>& prices,
                                                   int change_window = PRICE_CHANGE_MA_WINDOW,
                                                   int momentum_lag = MOMENTUM_LAG);

    // Trend from the latest EMA pair (fast beyond slow by more than 1%)
    enum class Trend {
        BULLISH,
        BEARISH,
        NEUTRAL
    };
    static Trend detectTrend(const IndicatorSeries& series);
    static std::string trendToString(Trend trend);

    // Latest Bollinger width, 0 when unavailable
    static double latestVolatility(const IndicatorSeries& series);

    static nlohmann::json marketSummary(const IndicatorSeries& series, const std::string& symbol);

    // Data-quality gate: required fields that are missing or non-finite
    static std::vector<std::string> missingIndicators(const IndicatorSnapshot& snapshot);
    static bool hasRequiredIndicators(const IndicatorSnapshot& snapshot) {
        return missingIndicators(snapshot).empty();
    }

    // Helper: Binance kline arrays or {timestamp, open, high, low, close, volume}
    // objects to Candle, sorted by timestamp. Throws MissingFieldError.
    static std::vector<Candle> jsonToCandles(const nlohmann::json& json_candles);

    static std::vector<double> extractClosePrices(const std::vector<Candle>& candles);

private:
    static double calculateStandardDeviation(const std::vector<double>& values, double mean);
    static double calculateMean(const std::vector<double>& values);
};

} // namespace analytics
} // namespace signaldesk
