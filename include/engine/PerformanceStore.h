#pragma once

#include "engine/SignalRecord.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <vector>

namespace signaldesk {
namespace engine {

// Aggregate over closed signals in a trailing window
struct PerformanceSummary {
    int total_signals = 0;
    int winners = 0;            // pnl > 0
    int losers = 0;             // pnl <= 0
    double win_rate = 0.0;      // fraction 0 ~ 1
    double avg_win = 0.0;
    double avg_loss = 0.0;      // <= 0
    double profit_factor = 0.0; // 0 when there are no losses
    double total_pnl = 0.0;

    nlohmann::json toJson() const;
};

struct PnlTally {
    int signals = 0;
    int wins = 0;
    int losses = 0;
    double gross_profit = 0.0;
    double gross_loss_abs = 0.0;
    double net_pnl = 0.0;

    void add(double pnl_percent);
};

// Aggregates realized signal outcomes, rebuilt on demand from the performance log
class PerformanceStore {
public:
    // Only signals with closed_at_ms > since_ms are counted
    void rebuild(const std::vector<SignalRecord>& closed, long long since_ms);

    // nullopt when no signal fell inside the window
    std::optional<PerformanceSummary> summary() const;

private:
    PnlTally tally_;
};

} // namespace engine
} // namespace signaldesk
