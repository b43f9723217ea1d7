#include "common/Types.h"

#include <cmath>

namespace signaldesk {

namespace {
std::string joinFields(const std::vector<std::string>& fields) {
    std::string out;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) out += ", ";
        out += fields[i];
    }
    return out;
}
}

MissingFieldError::MissingFieldError(const std::vector<std::string>& fields)
    : std::runtime_error("missing candle fields: " + joinFields(fields))
    , fields_(fields) {}

std::string toString(SignalType type) {
    switch (type) {
        case SignalType::BUY: return "BUY";
        case SignalType::SELL: return "SELL";
        case SignalType::HOLD: return "HOLD";
    }
    return "HOLD";
}

std::string toString(SignalStatus status) {
    switch (status) {
        case SignalStatus::ACTIVE: return "ACTIVE";
        case SignalStatus::STOP_LOSS: return "STOP_LOSS";
        case SignalStatus::TAKE_PROFIT: return "TAKE_PROFIT";
        case SignalStatus::EXPIRED: return "EXPIRED";
    }
    return "ACTIVE";
}

std::optional<SignalType> signalTypeFromString(const std::string& value) {
    if (value == "BUY") return SignalType::BUY;
    if (value == "SELL") return SignalType::SELL;
    if (value == "HOLD") return SignalType::HOLD;
    return std::nullopt;
}

std::optional<SignalStatus> signalStatusFromString(const std::string& value) {
    if (value == "ACTIVE") return SignalStatus::ACTIVE;
    if (value == "STOP_LOSS") return SignalStatus::STOP_LOSS;
    if (value == "TAKE_PROFIT") return SignalStatus::TAKE_PROFIT;
    if (value == "EXPIRED") return SignalStatus::EXPIRED;
    return std::nullopt;
}

double roundTo(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

} // namespace signaldesk
