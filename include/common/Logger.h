#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <string>

namespace chartsense {

class Logger {
public:
    static Logger& getInstance();
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");
    bool isInitialized() const { return initialized_; }
    // spdlog 레벨 이름 (trace, debug, info, warn/warning, err/error, critical, off)
    static bool isKnownLevel(const std::string& level);

    // 초기화 전에는 아무것도 기록하지 않음
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

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) chartsense::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) chartsense::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) chartsense::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) chartsense::Logger::getInstance().error(__VA_ARGS__)

} // namespace chartsense
