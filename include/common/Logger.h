#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace tradebrain {

class Logger {
public:
    static Logger& getInstance();
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");

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

    // One CSV line per strategy per rebalance: number,strategy,from,to,delta
    void logRebalance(int rebalance_number, const std::string& strategy,
                      double from_pct, double to_pct, double delta_pct);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> rebalance_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) tradebrain::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) tradebrain::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) tradebrain::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) tradebrain::Logger::getInstance().error(__VA_ARGS__)

} // namespace tradebrain
