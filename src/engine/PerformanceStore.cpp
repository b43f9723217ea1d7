#include "engine/PerformanceStore.h"

#include <cmath>

namespace signaldesk {
namespace engine {

nlohmann::json PerformanceSummary::toJson() const {
    return {
        {"total_signals", total_signals},
        {"winners", winners},
        {"losers", losers},
        {"win_rate", win_rate},
        {"avg_win", avg_win},
        {"avg_loss", avg_loss},
        {"profit_factor", profit_factor},
        {"total_pnl", total_pnl}
    };
}

void PnlTally::add(double pnl_percent) {
    signals++;
    net_pnl += pnl_percent;
    if (pnl_percent > 0.0) {
        wins++;
        gross_profit += pnl_percent;
    } else {
        losses++;
        gross_loss_abs += std::abs(pnl_percent);
    }
}

void PerformanceStore::rebuild(const std::vector<SignalRecord>& closed, long long since_ms) {
    tally_ = PnlTally();

    for (const auto& signal : closed) {
        if (!signal.closed_at_ms || !signal.pnl_percent) {
            continue;
        }
        if (*signal.closed_at_ms <= since_ms) {
            continue;
        }
        tally_.add(*signal.pnl_percent);
    }
}

std::optional<PerformanceSummary> PerformanceStore::summary() const {
    if (tally_.signals == 0) {
        return std::nullopt;
    }

    PerformanceSummary s;
    s.total_signals = tally_.signals;
    s.winners = tally_.wins;
    s.losers = tally_.losses;
    s.win_rate = static_cast<double>(tally_.wins) / static_cast<double>(tally_.signals);
    s.avg_win = (s.winners > 0) ? tally_.gross_profit / s.winners : 0.0;
    s.avg_loss = (s.losers > 0) ? -tally_.gross_loss_abs / s.losers : 0.0;
    s.profit_factor = (tally_.gross_loss_abs > 1e-12) ? tally_.gross_profit / tally_.gross_loss_abs : 0.0;
    s.total_pnl = tally_.net_pnl;
    return s;
}

} // namespace engine
} // namespace signaldesk
