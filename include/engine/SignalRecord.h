#pragma once

#include "common/Types.h"
#include <optional>
#include <string>

namespace signaldesk {
namespace engine {

// One emitted signal. Status and closing fields are only written by
// SignalGenerator, exactly once, when the signal leaves ACTIVE.
struct SignalRecord {
    std::string signal_id;      // SYMBOL_<epoch seconds>
    std::string symbol;
    SignalType type = SignalType::BUY;
    double entry_price = 0.0;
    double confidence = 0.0;
    double stop_loss = 0.0;
    double take_profit = 0.0;
    double atr_at_entry = 0.0;
    double risk_reward_ratio = 0.0;
    SignalStatus status = SignalStatus::ACTIVE;
    long long created_at_ms = 0;

    // Closing fields
    std::optional<long long> closed_at_ms;
    std::optional<double> close_price;
    std::optional<double> pnl_percent;
    std::optional<double> duration_minutes;

    bool isActive() const { return status == SignalStatus::ACTIVE; }
};

} // namespace engine
} // namespace signaldesk
