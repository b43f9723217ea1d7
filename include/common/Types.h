#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <stdexcept>

namespace signaldesk {

// Signal direction. HOLD only appears in analysis results, never on a stored signal.
enum class SignalType { BUY, SELL, HOLD };

enum class SignalStatus { ACTIVE, STOP_LOSS, TAKE_PROFIT, EXPIRED };

struct Candle {
    double open;
    double high;
    double low;
    double close;
    double volume;
    long long timestamp;    // epoch ms (open time)

    Candle() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Candle(double o, double h, double l, double c, double v, long long t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}
};

// Raised when candle input lacks one of the OHLCV fields.
class MissingFieldError : public std::runtime_error {
public:
    explicit MissingFieldError(const std::vector<std::string>& fields);

    const std::vector<std::string>& fields() const { return fields_; }

private:
    std::vector<std::string> fields_;
};

// Raised when the open-signal set or the performance log could not be saved.
class PersistenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

std::string toString(SignalType type);
std::string toString(SignalStatus status);
std::optional<SignalType> signalTypeFromString(const std::string& value);
std::optional<SignalStatus> signalStatusFromString(const std::string& value);

inline long long currentTimestampMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

double roundTo(double value, int decimals);

} // namespace signaldesk
