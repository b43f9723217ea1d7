#include "common/Config.h"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

// Simple manual test runner
int main() {
    using namespace signaldesk;

    std::cout << "[TEST] Starting Config Test..." << std::endl;

    Config& config = Config::getInstance();
    config.reset();

    // 1. Defaults
    {
        auto engine = config.getEngineConfig();
        auto scalping = config.getScalpingConfig();
        assert(engine.symbols.size() == 4);
        assert(engine.symbols.front() == "BTCUSDT");
        assert(engine.analysis_interval_seconds == 10);
        assert(engine.error_backoff_seconds == 30);
        assert(engine.max_signal_lifetime_hours == 24.0);
        assert(scalping.timeframe == "1m");
        assert(std::abs(scalping.weights.sum() - 1.0) < 1e-9);
        assert(scalping.signal_cooldown_minutes == 5);
    }

    // 2. Partial document overrides only what it names
    {
        nlohmann::json j = {
            {"service", {{"symbols", nlohmann::json::array({"btcusdt", " xrpusdt "})}, {"timeframe", "5m"}}},
            {"indicators", {{"ema_fast", 12}, {"ema_slow", 26}}},
            {"strategy", {{"min_confidence", 0.6}, {"weights", {{"volume", 0.10}, {"price_action", 0.15}}}}},
            {"signals", {{"max_active_signals", 4}}}
        };
        config.apply(j);

        auto engine = config.getEngineConfig();
        auto scalping = config.getScalpingConfig();
        assert(engine.symbols.size() == 2);
        assert(engine.symbols[0] == "BTCUSDT");
        assert(engine.symbols[1] == "XRPUSDT");
        assert(engine.max_active_signals == 4);
        assert(engine.max_signals_per_symbol == 2);
        assert(scalping.timeframe == "5m");
        assert(scalping.indicators.ema_fast == 12);
        assert(scalping.indicators.rsi_period == 14);
        assert(std::abs(scalping.min_confidence - 0.6) < 1e-9);
        assert(std::abs(scalping.weights.price_action - 0.15) < 1e-9);
    }

    // 3. Weights that do not sum to 1 are rejected and nothing changes
    {
        nlohmann::json j = {
            {"service", {{"timeframe", "15m"}}},
            {"strategy", {{"weights", {{"ema_trend", 0.50}}}}}
        };
        bool thrown = false;
        try {
            config.apply(j);
        } catch (const std::invalid_argument& e) {
            thrown = true;
            std::cout << "[TEST] rejected: " << e.what() << std::endl;
        }
        assert(thrown);
        assert(config.getScalpingConfig().timeframe == "5m");
        assert(std::abs(config.getScalpingConfig().weights.ema_trend - 0.25) < 1e-9);
    }

    // 4. Other semantic violations
    {
        const nlohmann::json invalid[] = {
            {{"service", {{"timeframe", "7m"}}}},
            {{"service", {{"symbols", nlohmann::json::array()}}}},
            {{"indicators", {{"ema_fast", 30}, {"ema_slow", 21}}}},
            {{"indicators", {{"atr_period", 0}}}},
            {{"strategy", {{"stop_loss_multiplier", 0.0}}}},
            {{"strategy", {{"min_confidence", -0.1}}}}
        };
        for (const auto& j : invalid) {
            bool thrown = false;
            try {
                config.apply(j);
            } catch (const std::invalid_argument&) {
                thrown = true;
            }
            assert(thrown);
        }
    }

    // 5. Type errors keep the previous values
    {
        config.apply({{"service", {{"analysis_interval_seconds", "fast"}}}});
        assert(config.getEngineConfig().analysis_interval_seconds == 10);
    }

    // 6. File round trip through toJson
    {
        const auto path = std::filesystem::absolute("test_data/config_roundtrip.json");
        std::filesystem::create_directories(path.parent_path());
        {
            std::ofstream out(path);
            out << config.toJson().dump(2);
        }

        auto expected = config.toJson();
        config.reset();
        config.load(path.string());
        assert(config.toJson() == expected);
        assert(config.getScalpingConfig().timeframe == "5m");
    }

    // 7. Missing file keeps the current values
    {
        config.reset();
        config.load(std::filesystem::absolute("test_data/does_not_exist.json").string());
        assert(config.getEngineConfig().symbols.size() == 4);
    }

    std::cout << "[TEST] Config Test PASSED!" << std::endl;
    return 0;
}
