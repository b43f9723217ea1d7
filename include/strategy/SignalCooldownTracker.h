#pragma once

#include "common/Types.h"
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace signaldesk {
namespace strategy {

// Last passing emission per (symbol, direction). Lives as long as its owner;
// nothing here is persisted.
class SignalCooldownTracker {
public:
    explicit SignalCooldownTracker(long long cooldown_ms);

    // First call for a key passes. Later calls pass only when more than the
    // cooldown elapsed since the last passing call. Passing resets the timer.
    bool tryAcquire(const std::string& symbol, SignalType type, long long now_ms);

    // Time left before the key may pass again, nullopt if it may pass now
    std::optional<long long> remainingMs(const std::string& symbol, SignalType type,
                                         long long now_ms) const;

    // Forget the key. Only valid right after a passing tryAcquire: that pass
    // already proved the previous emission had left the window.
    void release(const std::string& symbol, SignalType type);

    size_t size() const { return last_emission_ms_.size(); }

private:
    long long cooldown_ms_;
    std::map<std::pair<std::string, SignalType>, long long> last_emission_ms_;
};

} // namespace strategy
} // namespace signaldesk
