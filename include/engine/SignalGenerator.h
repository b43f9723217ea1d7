#pragma once

#include "core/contracts/IMarketDataSource.h"
#include "core/contracts/ISignalStore.h"
#include "engine/EngineConfig.h"
#include "engine/PerformanceStore.h"
#include "engine/SignalRecord.h"
#include "strategy/IStrategy.h"
#include <optional>
#include <string>
#include <vector>

namespace signaldesk {
namespace engine {

// Owns the open-signal set and the performance log.
// Signals move ACTIVE -> STOP_LOSS | TAKE_PROFIT | EXPIRED exactly once.
// Not thread safe; driven from a single worker.
class SignalGenerator {
public:
    static constexpr const char* ACTIVE_SIGNALS_KEY = "active_signals";
    static constexpr const char* PERFORMANCE_KEY = "performance";

    // Loads the open set and the performance log from the store
    SignalGenerator(
        core::IMarketDataSource& market_data,
        core::ISignalStore& store,
        strategy::IStrategy& strategy,
        const EngineConfig& config
    );

    // Fetch, score, gate and persist one symbol. Returns the new signal or
    // nullopt. Throws PersistenceError when the open set cannot be saved.
    std::optional<SignalRecord> analyzeSymbol(const std::string& symbol);
    std::optional<SignalRecord> analyzeSymbol(const std::string& symbol, long long now_ms);

    // Close every open signal that hit its stop, target or lifetime.
    // Returns the signals closed in this pass. Throws PersistenceError and
    // keeps the in-memory state when the closures cannot be saved.
    std::vector<SignalRecord> monitorActiveSignals();
    std::vector<SignalRecord> monitorActiveSignals(long long now_ms);

    std::optional<PerformanceSummary> getPerformanceStats(int window_days) const;
    std::optional<PerformanceSummary> getPerformanceStats(int window_days, long long now_ms) const;

    const std::vector<SignalRecord>& getActiveSignals() const { return active_signals_; }
    const std::vector<SignalRecord>& getPerformanceLog() const { return performance_log_; }
    std::optional<SignalRecord> getSignalById(const std::string& signal_id) const;
    int countActiveSignals(const std::string& symbol) const;

    // ACTIVE when nothing triggers. Stop/target win over expiry.
    static SignalStatus evaluateClosure(const SignalRecord& signal, double price,
                                        long long now_ms, double max_lifetime_hours);

    // Copy of the signal with status and closing fields filled in
    static SignalRecord closeSignal(const SignalRecord& signal, double price,
                                    SignalStatus status, long long now_ms);

private:
    std::optional<SignalRecord> buildSignal(const std::string& symbol,
                                            const strategy::AnalysisResult& analysis,
                                            long long now_ms) const;
    bool hasSignalId(const std::string& signal_id) const;

    core::IMarketDataSource& market_data_;
    core::ISignalStore& store_;
    strategy::IStrategy& strategy_;
    EngineConfig config_;

    std::vector<SignalRecord> active_signals_;
    std::vector<SignalRecord> performance_log_;
};

} // namespace engine
} // namespace signaldesk
