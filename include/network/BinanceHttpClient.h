#pragma once

#include "network/IHttpClient.h"
#include <curl/curl.h>
#include <mutex>

namespace signaldesk {
namespace network {

// Public (unsigned) Binance futures REST endpoints over libcurl
class BinanceHttpClient : public IHttpClient {
public:
    explicit BinanceHttpClient(const std::string& base_url = "https://fapi.binance.com");
    ~BinanceHttpClient();

    BinanceHttpClient(const BinanceHttpClient&) = delete;
    BinanceHttpClient& operator=(const BinanceHttpClient&) = delete;

    HttpResponse get(
        const std::string& endpoint,
        const std::map<std::string, std::string>& query_params = {}
    ) override;

private:
    std::string base_url_;
    CURL* curl_;
    std::mutex mutex_;

    HttpResponse performRequest(const std::string& url);

    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata);

    std::string buildQueryString(const std::map<std::string, std::string>& params);
};

} // namespace network
} // namespace signaldesk
