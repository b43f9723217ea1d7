#pragma once

#include <algorithm>
#include <cctype>
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace signaldesk {
namespace network {

struct HttpResponse {
    int status_code = 0;
    std::string body;
    std::map<std::string, std::string> headers;

    bool isSuccess() const { return status_code >= 200 && status_code < 300; }
    // Binance answers 429 when the request weight is exceeded and 418 once the IP is banned
    bool isRateLimited() const { return status_code == 429; }
    bool isBlocked() const { return status_code == 418; }

    // Case-insensitive header lookup
    std::optional<std::string> header(const std::string& name) const {
        auto lower = [](std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        };
        const auto wanted = lower(name);
        for (const auto& [key, value] : headers) {
            if (lower(key) == wanted) {
                return value;
            }
        }
        return std::nullopt;
    }

    // Throws nlohmann::json::parse_error
    nlohmann::json json() const {
        return nlohmann::json::parse(body);
    }
};

// Read-only transport for public market-data endpoints
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // Throws std::runtime_error on transport failure
    virtual HttpResponse get(
        const std::string& endpoint,
        const std::map<std::string, std::string>& query_params = {}
    ) = 0;
};

} // namespace network
} // namespace signaldesk
