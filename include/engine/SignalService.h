#pragma once

#include "core/contracts/ISignalDistributor.h"
#include "engine/EngineConfig.h"
#include "engine/SignalGenerator.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace signaldesk {
namespace engine {

struct CycleReport {
    int symbols_analyzed = 0;
    int signals_emitted = 0;
    int signals_closed = 0;
    bool interrupted = false;   // stop requested between symbols
};

// Drives the analyze / distribute / monitor / sleep cycle on one worker thread
class SignalService {
public:
    SignalService(SignalGenerator& generator,
                  core::ISignalDistributor& distributor,
                  const EngineConfig& config);
    ~SignalService();

    bool start();
    // Wakes the worker and joins it. An in-flight symbol or monitoring pass completes first.
    void stop();
    bool isRunning() const { return running_; }

    // Blocking loop used by the worker thread
    void run();

    // One synchronous cycle. PersistenceError propagates.
    CycleReport runCycle();

    long long totalCycles() const { return total_cycles_; }

private:
    // false when woken by stop()
    bool waitFor(std::chrono::seconds duration);

    SignalGenerator& generator_;
    core::ISignalDistributor& distributor_;
    EngineConfig config_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<long long> total_cycles_{0};
    std::unique_ptr<std::thread> worker_thread_;

    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
};

} // namespace engine
} // namespace signaldesk
