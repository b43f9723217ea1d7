#include "common/Logger.h"
#include "common/PathUtils.h"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>

#include <filesystem>
#include <stdexcept>
#include <vector>

namespace signaldesk {

namespace {
constexpr size_t MAIN_LOG_MAX_BYTES = 10 * 1024 * 1024;
constexpr size_t MAIN_LOG_MAX_FILES = 3;
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_dir, const std::string& level) {
    if (initialized_) return;

    const auto logs_path = utils::PathUtils::resolve(log_dir);

    try {
        std::filesystem::create_directories(logs_path);

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (logs_path / "signaldesk.log").string(), MAIN_LOG_MAX_BYTES, MAIN_LOG_MAX_FILES
        );
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [t%t] %v");

        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        main_logger_ = std::make_shared<spdlog::logger>("main", sinks.begin(), sinks.end());

        auto parsed_level = spdlog::level::from_str(level);
        const bool unknown_level = parsed_level == spdlog::level::off && level != "off";
        if (unknown_level) {
            parsed_level = spdlog::level::info;
        }
        main_logger_->set_level(parsed_level);
        main_logger_->flush_on(spdlog::level::warn);
        spdlog::register_logger(main_logger_);

        signal_logger_ = spdlog::daily_logger_mt("signals", (logs_path / "signals.log").string());
        signal_logger_->set_pattern("%Y-%m-%d %H:%M:%S,%v");
        signal_logger_->flush_on(spdlog::level::info);

        initialized_ = true;
        main_logger_->info("Logger initialized ({})", logs_path.string());
        if (unknown_level) {
            main_logger_->warn("Unknown log level '{}', using info", level);
        }
    } catch (const std::exception& ex) {
        main_logger_.reset();
        signal_logger_.reset();
        spdlog::drop_all();
        throw std::runtime_error(std::string("Log init failed: ") + ex.what());
    }
}

void Logger::shutdown() {
    if (!initialized_) return;
    main_logger_->flush();
    signal_logger_->flush();
    main_logger_.reset();
    signal_logger_.reset();
    spdlog::drop_all();
    initialized_ = false;
}

void Logger::logSignal(const std::string& signal_id, const std::string& symbol,
                       const std::string& direction, double entry_price,
                       double stop_loss, double take_profit, double confidence) {
    if (signal_logger_) {
        signal_logger_->info("OPEN,{},{},{},{:.8f},{:.8f},{:.8f},{:.3f}",
                             signal_id, symbol, direction,
                             entry_price, stop_loss, take_profit, confidence);
    }
}

void Logger::logClosure(const std::string& signal_id, const std::string& symbol,
                        const std::string& status, double pnl_percent) {
    if (signal_logger_) {
        signal_logger_->info("CLOSE,{},{},{},{:.2f}", signal_id, symbol, status, pnl_percent);
    }
}

} // namespace signaldesk
