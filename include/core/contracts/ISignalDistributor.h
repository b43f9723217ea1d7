#pragma once

#include <string>

#include "engine/SignalRecord.h"

namespace signaldesk {
namespace core {

class ISignalDistributor {
public:
    virtual ~ISignalDistributor() = default;

    // Both return the number of recipients reached
    virtual int distributeSignal(const engine::SignalRecord& signal) = 0;
    virtual int sendSignalUpdate(const std::string& signal_id, SignalStatus status, double pnl_percent) = 0;
};

} // namespace core
} // namespace signaldesk
