#include "network/BinanceMarketData.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>

using namespace signaldesk;

namespace {
class FakeHttpClient : public network::IHttpClient {
public:
    network::HttpResponse next;
    bool throw_next = false;
    std::string last_endpoint;
    std::map<std::string, std::string> last_params;

    network::HttpResponse get(const std::string& endpoint,
                              const std::map<std::string, std::string>& query_params) override {
        last_endpoint = endpoint;
        last_params = query_params;
        if (throw_next) {
            throw std::runtime_error("CURL error: Couldn't resolve host name");
        }
        return next;
    }
};

network::HttpResponse respond(int status, const std::string& body) {
    network::HttpResponse r;
    r.status_code = status;
    r.body = body;
    return r;
}
}

int main() {
    auto http = std::make_shared<FakeHttpClient>();
    network::BinanceMarketData market(http);

    // Klines are decoded and sorted
    {
        http->next = respond(200,
            "[[1700000060000,\"101.0\",\"102.0\",\"100.5\",\"101.5\",\"12.5\",1700000119999,\"0\",10,\"0\",\"0\",\"0\"],"
            " [1700000000000,\"100.0\",\"101.0\",\"99.5\",\"101.0\",\"10.0\",1700000059999,\"0\",8,\"0\",\"0\",\"0\"]]");
        auto candles = market.getCandles("BTCUSDT", "1m", 100);
        assert(candles);
        assert(candles->size() == 2);
        assert((*candles)[0].timestamp == 1700000000000LL);
        assert(std::abs((*candles)[1].close - 101.5) < 1e-9);
        assert(http->last_endpoint == "/fapi/v1/klines");
        assert(http->last_params["symbol"] == "BTCUSDT");
        assert(http->last_params["interval"] == "1m");
        assert(http->last_params["limit"] == "100");
    }

    // Failures are reported as unavailable
    {
        http->next = respond(500, "{\"code\":-1000}");
        assert(!market.getCandles("BTCUSDT", "1m", 100));

        http->next = respond(200, "not json");
        assert(!market.getCandles("BTCUSDT", "1m", 100));

        http->next = respond(200, "[[1700000000000,\"100.0\",\"101.0\"]]");
        assert(!market.getCandles("BTCUSDT", "1m", 100));

        http->next = respond(200, "[]");
        assert(!market.getCandles("BTCUSDT", "1m", 100));

        http->throw_next = true;
        assert(!market.getCandles("BTCUSDT", "1m", 100));
        assert(!market.getCurrentPrice("BTCUSDT"));
        http->throw_next = false;
    }

    // Ticker price
    {
        http->next = respond(200, "{\"symbol\":\"ETHUSDT\",\"price\":\"2034.57\",\"time\":1700000000000}");
        auto price = market.getCurrentPrice("ETHUSDT");
        assert(price && std::abs(*price - 2034.57) < 1e-9);
        assert(http->last_endpoint == "/fapi/v1/ticker/price");
        assert(http->last_params["symbol"] == "ETHUSDT");

        http->next = respond(200, "{\"symbol\":\"ETHUSDT\"}");
        assert(!market.getCurrentPrice("ETHUSDT"));

        http->next = respond(429, "{\"code\":-1003}");
        http->next.headers["retry-after"] = "7";
        assert(http->next.isRateLimited());
        assert(http->next.header("Retry-After").value_or("") == "7");
        assert(!market.getCurrentPrice("ETHUSDT"));
    }

    std::cout << "[TEST] BinanceMarketData PASSED\n";
    return 0;
}
