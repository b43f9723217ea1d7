#include "strategy/SignalCooldownTracker.h"

namespace signaldesk {
namespace strategy {

SignalCooldownTracker::SignalCooldownTracker(long long cooldown_ms)
    : cooldown_ms_(cooldown_ms) {}

bool SignalCooldownTracker::tryAcquire(const std::string& symbol, SignalType type, long long now_ms) {
    const auto key = std::make_pair(symbol, type);
    auto it = last_emission_ms_.find(key);
    if (it == last_emission_ms_.end()) {
        last_emission_ms_.emplace(key, now_ms);
        return true;
    }

    if ((now_ms - it->second) > cooldown_ms_) {
        it->second = now_ms;
        return true;
    }
    return false;
}

void SignalCooldownTracker::release(const std::string& symbol, SignalType type) {
    last_emission_ms_.erase(std::make_pair(symbol, type));
}

std::optional<long long> SignalCooldownTracker::remainingMs(
    const std::string& symbol,
    SignalType type,
    long long now_ms
) const {
    auto it = last_emission_ms_.find(std::make_pair(symbol, type));
    if (it == last_emission_ms_.end()) {
        return std::nullopt;
    }
    const long long elapsed = now_ms - it->second;
    if (elapsed > cooldown_ms_) {
        return std::nullopt;
    }
    return cooldown_ms_ - elapsed;
}

} // namespace strategy
} // namespace signaldesk
