#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace signaldesk {

// Process-wide logging. Before initialize() every call is a no-op, so the
// library and its tests can log without setting up sinks.
class Logger {
public:
    static Logger& getInstance();

    // Console + rotating signaldesk.log + daily signals.log under log_dir.
    // Throws std::runtime_error when the sinks cannot be created.
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");
    void shutdown();

    // Skip building expensive messages the level would drop
    bool shouldLog(spdlog::level::level_enum level) const {
        return main_logger_ && main_logger_->should_log(level);
    }

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->error(fmt, std::forward<Args>(args)...);
        }
    }

    // signals.log rows
    // OPEN,<id>,<symbol>,<BUY|SELL>,<entry>,<stop>,<target>,<confidence>
    // CLOSE,<id>,<symbol>,<status>,<pnl %>
    void logSignal(const std::string& signal_id, const std::string& symbol,
                   const std::string& direction, double entry_price,
                   double stop_loss, double take_profit, double confidence);
    void logClosure(const std::string& signal_id, const std::string& symbol,
                    const std::string& status, double pnl_percent);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> signal_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) signaldesk::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) signaldesk::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) signaldesk::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) signaldesk::Logger::getInstance().error(__VA_ARGS__)

} // namespace signaldesk
