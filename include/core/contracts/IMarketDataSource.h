#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"

namespace signaldesk {
namespace core {

class IMarketDataSource {
public:
    virtual ~IMarketDataSource() = default;

    // Ascending candles, nullopt when the source is unavailable
    virtual std::optional<std::vector<Candle>> getCandles(
        const std::string& symbol,
        const std::string& interval,
        int limit
    ) = 0;

    virtual std::optional<double> getCurrentPrice(const std::string& symbol) = 0;
};

} // namespace core
} // namespace signaldesk
