#include "common/Logger.h"
#include "common/Config.h"
#include "common/PathUtils.h"
#include "core/state/JsonFileSignalStore.h"
#include "engine/LogSignalDistributor.h"
#include "engine/SignalGenerator.h"
#include "engine/SignalService.h"
#include "network/BinanceHttpClient.h"
#include "network/BinanceMarketData.h"
#include "strategy/ScalpingStrategy.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace signaldesk;

namespace {
// Set by SIGINT/SIGTERM, polled by the main thread
std::atomic<bool> g_stop_requested{false};

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_stop_requested = true;
    }
}

void logPerformance(const engine::SignalGenerator& generator, int window_days) {
    auto stats = generator.getPerformanceStats(window_days);
    if (!stats) {
        LOG_INFO("No closed signals in the last {} days", window_days);
        return;
    }

    LOG_INFO("===== Performance (last {} days) =====", window_days);
    LOG_INFO("Signals: {} (win {}, loss {}), win rate {:.1f}%",
             stats->total_signals, stats->winners, stats->losers, stats->win_rate * 100.0);
    LOG_INFO("Avg win {:+.2f}%, avg loss {:+.2f}%, profit factor {:.2f}, total {:+.2f}%",
             stats->avg_win, stats->avg_loss, stats->profit_factor, stats->total_pnl);
}
}

int main(int argc, char* argv[]) {
    std::string config_path = "config/config.json";
    bool run_once = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--once") {
            run_once = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: signaldesk [config_path] [--once]\n";
            return 0;
        } else {
            config_path = arg;
        }
    }

    try {
        Config& config = Config::getInstance();
        config.load(config_path);

        Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel());

        const auto engine_config = config.getEngineConfig();
        const auto scalping_config = config.getScalpingConfig();

        LOG_INFO("========================================");
        LOG_INFO("SignalDesk - {} symbols on {}", engine_config.symbols.size(), scalping_config.timeframe);
        LOG_INFO("========================================");

        auto http_client = std::make_shared<network::BinanceHttpClient>(engine_config.market_data_base_url);
        network::BinanceMarketData market_data(http_client);
        core::JsonFileSignalStore store(utils::PathUtils::resolve(engine_config.data_dir));
        engine::LogSignalDistributor distributor;
        strategy::ScalpingStrategy strategy(scalping_config);

        LOG_INFO("Strategy: {}", strategy.getStats().dump());

        engine::SignalGenerator generator(market_data, store, strategy, engine_config);
        logPerformance(generator, engine_config.performance_window_days);

        engine::SignalService service(generator, distributor, engine_config);

        if (run_once) {
            auto report = service.runCycle();
            LOG_INFO("Single cycle: {} analyzed, {} emitted, {} closed",
                     report.symbols_analyzed, report.signals_emitted, report.signals_closed);
            Logger::getInstance().shutdown();
            return 0;
        }

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        if (!service.start()) {
            LOG_ERROR("Signal service failed to start");
            return 1;
        }

        while (service.isRunning() && !g_stop_requested) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        LOG_INFO("Shutdown requested");
        service.stop();
        logPerformance(generator, engine_config.performance_window_days);

        LOG_INFO("Program terminated");
        Logger::getInstance().shutdown();
        return 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
