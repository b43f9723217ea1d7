#include "network/BinanceMarketData.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"
#include <cmath>
#include <stdexcept>

namespace signaldesk {
namespace network {

BinanceMarketData::BinanceMarketData(std::shared_ptr<IHttpClient> http_client)
    : http_client_(std::move(http_client))
{
    if (!http_client_) {
        throw std::invalid_argument("BinanceMarketData requires an HTTP client");
    }
}

std::optional<nlohmann::json> BinanceMarketData::fetchJson(
    const std::string& endpoint,
    const std::map<std::string, std::string>& query_params
) {
    try {
        auto response = http_client_->get(endpoint, query_params);
        if (!response.isSuccess()) {
            LOG_ERROR("{} failed: HTTP {} {}", endpoint, response.status_code, response.body.substr(0, 200));
            return std::nullopt;
        }
        return response.json();
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("{} returned invalid JSON: {}", endpoint, e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("{} request failed: {}", endpoint, e.what());
    }
    return std::nullopt;
}

std::optional<std::vector<Candle>> BinanceMarketData::getCandles(
    const std::string& symbol,
    const std::string& interval,
    int limit
) {
    auto raw = fetchJson("/fapi/v1/klines", {
        {"symbol", symbol},
        {"interval", interval},
        {"limit", std::to_string(limit)}
    });
    if (!raw) {
        return std::nullopt;
    }

    try {
        auto candles = analytics::TechnicalIndicators::jsonToCandles(*raw);
        if (candles.empty()) {
            LOG_WARN("{} - no klines returned", symbol);
            return std::nullopt;
        }
        return candles;
    } catch (const std::exception& e) {
        LOG_ERROR("{} - kline decode failed: {}", symbol, e.what());
        return std::nullopt;
    }
}

std::optional<double> BinanceMarketData::getCurrentPrice(const std::string& symbol) {
    auto raw = fetchJson("/fapi/v1/ticker/price", {{"symbol", symbol}});
    if (!raw) {
        return std::nullopt;
    }

    try {
        const auto& field = raw->at("price");
        double price = field.is_string() ? std::stod(field.get<std::string>()) : field.get<double>();
        if (!std::isfinite(price) || price <= 0.0) {
            LOG_WARN("{} - invalid ticker price", symbol);
            return std::nullopt;
        }
        return price;
    } catch (const std::exception& e) {
        LOG_ERROR("{} - ticker decode failed: {}", symbol, e.what());
        return std::nullopt;
    }
}

} // namespace network
} // namespace signaldesk
