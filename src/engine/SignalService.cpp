#include "engine/SignalService.h"
#include "common/Logger.h"

namespace signaldesk {
namespace engine {

SignalService::SignalService(
    SignalGenerator& generator,
    core::ISignalDistributor& distributor,
    const EngineConfig& config
)
    : generator_(generator)
    , distributor_(distributor)
    , config_(config)
{
}

SignalService::~SignalService() {
    stop();
}

// ===== service control =====

bool SignalService::start() {
    if (running_) {
        LOG_WARN("Signal service is already running");
        return false;
    }

    LOG_INFO("========================================");
    LOG_INFO("Signal service start ({} symbols, every {}s)",
             config_.symbols.size(), config_.analysis_interval_seconds);
    LOG_INFO("========================================");

    stop_requested_ = false;
    running_ = true;
    worker_thread_ = std::make_unique<std::thread>(&SignalService::run, this);
    return true;
}

void SignalService::stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        stop_requested_ = true;
        running_ = false;
    }
    wait_cv_.notify_all();

    if (worker_thread_ && worker_thread_->joinable()) {
        worker_thread_->join();
        worker_thread_.reset();
        LOG_INFO("Signal service stopped after {} cycles", total_cycles_.load());
    }
}

// ===== main loop =====

void SignalService::run() {
    LOG_INFO("Main signal loop started");

    const auto interval = std::chrono::seconds(config_.analysis_interval_seconds);
    const auto backoff = std::chrono::seconds(config_.error_backoff_seconds);

    while (running_) {
        try {
            auto report = runCycle();
            LOG_DEBUG("Cycle {} done: {} analyzed, {} emitted, {} closed",
                      total_cycles_.load(), report.symbols_analyzed,
                      report.signals_emitted, report.signals_closed);

            if (!waitFor(interval)) {
                break;
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Signal cycle failed: {} (retry in {}s)", e.what(), config_.error_backoff_seconds);
            if (!waitFor(backoff)) {
                break;
            }
        }
    }

    LOG_INFO("Main signal loop finished");
}

CycleReport SignalService::runCycle() {
    CycleReport report;
    total_cycles_++;

    // 1. analyze every symbol in order
    for (const auto& symbol : config_.symbols) {
        if (stop_requested_) {
            report.interrupted = true;
            return report;
        }

        auto signal = generator_.analyzeSymbol(symbol);
        report.symbols_analyzed++;
        if (!signal) {
            continue;
        }

        report.signals_emitted++;
        try {
            int reached = distributor_.distributeSignal(*signal);
            LOG_INFO("{} distributed to {} recipient(s)", signal->signal_id, reached);
        } catch (const std::exception& e) {
            LOG_ERROR("Distribution of {} failed: {}", signal->signal_id, e.what());
        }
    }

    if (stop_requested_) {
        report.interrupted = true;
        return report;
    }

    // 2. monitor open signals
    auto closed = generator_.monitorActiveSignals();
    report.signals_closed = static_cast<int>(closed.size());

    for (const auto& signal : closed) {
        try {
            distributor_.sendSignalUpdate(signal.signal_id, signal.status, signal.pnl_percent.value_or(0.0));
        } catch (const std::exception& e) {
            LOG_ERROR("Closure update for {} failed: {}", signal.signal_id, e.what());
        }
    }

    return report;
}

bool SignalService::waitFor(std::chrono::seconds duration) {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait_for(lock, duration, [this] { return stop_requested_.load(); });
    return !stop_requested_;
}

} // namespace engine
} // namespace signaldesk
