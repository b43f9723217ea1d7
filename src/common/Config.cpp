#include "common/Config.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace signaldesk {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string normalizeSymbol(std::string symbol) {
    symbol = trimCopy(symbol);
    std::transform(symbol.begin(), symbol.end(), symbol.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return symbol;
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    log_level_ = "info";
    log_dir_ = "logs";
    engine_config_ = engine::EngineConfig();
    scalping_config_ = strategy::ScalpingStrategyConfig();
}

void Config::load(const std::string& path) {
    const auto config_path = utils::PathUtils::resolve(path);

    std::cout << "Config file: " << config_path << std::endl;

    if (!std::filesystem::exists(config_path)) {
        std::cout << "Warning: config file not found: " << config_path << std::endl;
        std::cout << "Using defaults." << std::endl;
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        std::cout << "Warning: config file could not be opened." << std::endl;
        return;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Config parse error: " << e.what() << std::endl;
        return;
    }

    apply(j);
    std::cout << "Config loaded: " << engine_config_.symbols.size() << " symbols, timeframe="
              << scalping_config_.timeframe << ", min_confidence=" << scalping_config_.min_confidence
              << std::endl;
}

void Config::apply(const nlohmann::json& j) {
    std::string log_level = log_level_;
    std::string log_dir = log_dir_;
    engine::EngineConfig engine_config = engine_config_;
    strategy::ScalpingStrategyConfig scalping = scalping_config_;

    try {
        if (j.contains("service")) {
            const auto& s = j["service"];

            if (s.contains("symbols")) {
                engine_config.symbols = s["symbols"].get<std::vector<std::string>>();
                for (auto& symbol : engine_config.symbols) {
                    symbol = normalizeSymbol(symbol);
                }
            }
            scalping.timeframe = s.value("timeframe", scalping.timeframe);
            engine_config.analysis_interval_seconds = s.value("analysis_interval_seconds", engine_config.analysis_interval_seconds);
            engine_config.error_backoff_seconds = s.value("error_backoff_seconds", engine_config.error_backoff_seconds);
            engine_config.candle_limit = s.value("candle_limit", engine_config.candle_limit);
            engine_config.data_dir = s.value("data_dir", engine_config.data_dir);
            engine_config.market_data_base_url = s.value("market_data_base_url", engine_config.market_data_base_url);
            log_dir = s.value("log_dir", log_dir);
            log_level = s.value("log_level", log_level);
        }

        if (j.contains("indicators")) {
            const auto& s = j["indicators"];
            auto& ind = scalping.indicators;
            ind.ema_fast = s.value("ema_fast", ind.ema_fast);
            ind.ema_slow = s.value("ema_slow", ind.ema_slow);
            ind.rsi_period = s.value("rsi_period", ind.rsi_period);
            ind.bollinger_period = s.value("bollinger_period", ind.bollinger_period);
            ind.bollinger_std = s.value("bollinger_std", ind.bollinger_std);
            ind.atr_period = s.value("atr_period", ind.atr_period);
        }

        if (j.contains("strategy")) {
            const auto& s = j["strategy"];
            scalping.rsi_overbought = s.value("rsi_overbought", scalping.rsi_overbought);
            scalping.rsi_oversold = s.value("rsi_oversold", scalping.rsi_oversold);
            scalping.stop_loss_multiplier = s.value("stop_loss_multiplier", scalping.stop_loss_multiplier);
            scalping.take_profit_multiplier = s.value("take_profit_multiplier", scalping.take_profit_multiplier);
            scalping.min_confidence = s.value("min_confidence", scalping.min_confidence);
            scalping.min_volume_ratio = s.value("min_volume_ratio", scalping.min_volume_ratio);
            scalping.min_volatility = s.value("min_volatility", scalping.min_volatility);
            scalping.signal_cooldown_minutes = s.value("signal_cooldown_minutes", scalping.signal_cooldown_minutes);

            if (s.contains("weights")) {
                const auto& w = s["weights"];
                auto& weights = scalping.weights;
                weights.ema_trend = w.value("ema_trend", weights.ema_trend);
                weights.rsi_momentum = w.value("rsi_momentum", weights.rsi_momentum);
                weights.bollinger = w.value("bollinger", weights.bollinger);
                weights.vwap = w.value("vwap", weights.vwap);
                weights.volume = w.value("volume", weights.volume);
                weights.price_action = w.value("price_action", weights.price_action);
            }
        }

        if (j.contains("signals")) {
            const auto& s = j["signals"];
            engine_config.max_signal_lifetime_hours = s.value("max_signal_lifetime_hours", engine_config.max_signal_lifetime_hours);
            engine_config.max_active_signals = s.value("max_active_signals", engine_config.max_active_signals);
            engine_config.max_signals_per_symbol = s.value("max_signals_per_symbol", engine_config.max_signals_per_symbol);
            engine_config.price_decimals = s.value("price_decimals", engine_config.price_decimals);
            engine_config.recommended_risk_per_trade = s.value("recommended_risk_per_trade", engine_config.recommended_risk_per_trade);
            engine_config.performance_window_days = s.value("performance_window_days", engine_config.performance_window_days);
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Config load error: " << e.what() << std::endl;
        return;
    }

    // Rejected settings never replace the active ones
    scalping.validate();
    engine_config.validate();

    log_level_ = log_level;
    log_dir_ = log_dir;
    engine_config_ = engine_config;
    scalping_config_ = scalping;
}

nlohmann::json Config::toJson() const {
    const auto& ind = scalping_config_.indicators;
    const auto& w = scalping_config_.weights;
    return {
        {"service", {
            {"symbols", engine_config_.symbols},
            {"timeframe", scalping_config_.timeframe},
            {"analysis_interval_seconds", engine_config_.analysis_interval_seconds},
            {"error_backoff_seconds", engine_config_.error_backoff_seconds},
            {"candle_limit", engine_config_.candle_limit},
            {"data_dir", engine_config_.data_dir},
            {"log_dir", log_dir_},
            {"log_level", log_level_},
            {"market_data_base_url", engine_config_.market_data_base_url}
        }},
        {"indicators", {
            {"ema_fast", ind.ema_fast},
            {"ema_slow", ind.ema_slow},
            {"rsi_period", ind.rsi_period},
            {"bollinger_period", ind.bollinger_period},
            {"bollinger_std", ind.bollinger_std},
            {"atr_period", ind.atr_period}
        }},
        {"strategy", {
            {"rsi_overbought", scalping_config_.rsi_overbought},
            {"rsi_oversold", scalping_config_.rsi_oversold},
            {"stop_loss_multiplier", scalping_config_.stop_loss_multiplier},
            {"take_profit_multiplier", scalping_config_.take_profit_multiplier},
            {"min_confidence", scalping_config_.min_confidence},
            {"min_volume_ratio", scalping_config_.min_volume_ratio},
            {"min_volatility", scalping_config_.min_volatility},
            {"signal_cooldown_minutes", scalping_config_.signal_cooldown_minutes},
            {"weights", {
                {"ema_trend", w.ema_trend},
                {"rsi_momentum", w.rsi_momentum},
                {"bollinger", w.bollinger},
                {"vwap", w.vwap},
                {"volume", w.volume},
                {"price_action", w.price_action}
            }}
        }},
        {"signals", {
            {"max_signal_lifetime_hours", engine_config_.max_signal_lifetime_hours},
            {"max_active_signals", engine_config_.max_active_signals},
            {"max_signals_per_symbol", engine_config_.max_signals_per_symbol},
            {"price_decimals", engine_config_.price_decimals},
            {"recommended_risk_per_trade", engine_config_.recommended_risk_per_trade},
            {"performance_window_days", engine_config_.performance_window_days}
        }}
    };
}

} // namespace signaldesk
