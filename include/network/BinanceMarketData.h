#pragma once

#include "core/contracts/IMarketDataSource.h"
#include "network/IHttpClient.h"
#include <memory>

namespace signaldesk {
namespace network {

// IMarketDataSource over the public kline and ticker endpoints.
// HTTP, status and parse failures are logged and reported as unavailable.
class BinanceMarketData : public core::IMarketDataSource {
public:
    explicit BinanceMarketData(std::shared_ptr<IHttpClient> http_client);

    std::optional<std::vector<Candle>> getCandles(
        const std::string& symbol,
        const std::string& interval,
        int limit
    ) override;

    std::optional<double> getCurrentPrice(const std::string& symbol) override;

private:
    std::optional<nlohmann::json> fetchJson(
        const std::string& endpoint,
        const std::map<std::string, std::string>& query_params
    );

    std::shared_ptr<IHttpClient> http_client_;
};

} // namespace network
} // namespace signaldesk
