#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <string>

namespace edgebook {

class Logger {
public:
    static Logger& getInstance();
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");
    bool isInitialized() const { return initialized_; }

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

    // One line per evaluated strategy in the dedicated summary log.
    void logStrategySummary(const std::string& strategy_id, int bets, int wins,
                            double total_staked, double total_profit);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> summary_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) edgebook::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) edgebook::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) edgebook::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) edgebook::Logger::getInstance().error(__VA_ARGS__)

} // namespace edgebook
