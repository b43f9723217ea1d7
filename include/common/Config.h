#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"
#include "strategy/StrategyConfig.h"

namespace signaldesk {

class Config {
public:
    static Config& getInstance();

    // JSON syntax or type errors keep the previous values (logged to stdout).
    // Semantic validation failures throw std::invalid_argument and leave the
    // previous values untouched.
    void load(const std::string& config_path);

    // Same as load() for an already parsed document
    void apply(const nlohmann::json& j);
    
    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }
    engine::EngineConfig getEngineConfig() const { return engine_config_; }
    strategy::ScalpingStrategyConfig getScalpingConfig() const { return scalping_config_; }

    nlohmann::json toJson() const;

    // Restore built-in defaults
    void reset();

private:
    Config() = default;
    std::string log_level_ = "info";
    std::string log_dir_ = "logs";

    engine::EngineConfig engine_config_;
    strategy::ScalpingStrategyConfig scalping_config_;
};

} // namespace signaldesk
