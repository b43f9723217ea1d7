#pragma once

#include "core/contracts/ISignalDistributor.h"

namespace signaldesk {
namespace engine {

// Writes emitted signals and closures to the trade log (signals.log)
class LogSignalDistributor : public core::ISignalDistributor {
public:
    int distributeSignal(const SignalRecord& signal) override;
    int sendSignalUpdate(const std::string& signal_id, SignalStatus status, double pnl_percent) override;
};

} // namespace engine
} // namespace signaldesk
