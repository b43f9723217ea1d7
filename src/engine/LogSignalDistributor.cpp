#include "engine/LogSignalDistributor.h"
#include "common/Logger.h"

namespace signaldesk {
namespace engine {

int LogSignalDistributor::distributeSignal(const SignalRecord& signal) {
    Logger::getInstance().logSignal(
        signal.signal_id,
        signal.symbol,
        toString(signal.type),
        signal.entry_price,
        signal.stop_loss,
        signal.take_profit,
        signal.confidence
    );
    return 1;
}

int LogSignalDistributor::sendSignalUpdate(const std::string& signal_id, SignalStatus status, double pnl_percent) {
    // signal_id is SYMBOL_<epoch seconds>
    const auto sep = signal_id.rfind('_');
    const std::string symbol = (sep == std::string::npos) ? signal_id : signal_id.substr(0, sep);

    Logger::getInstance().logClosure(signal_id, symbol, toString(status), pnl_percent);
    return 1;
}

} // namespace engine
} // namespace signaldesk
