#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace quantcore {

class Logger {
public:
    static Logger& getInstance();
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");
    void setLevel(const std::string& level);
    bool isInitialized() const { return initialized_; }
    
    // 초기화 전에는 아무것도 출력하지 않는다 (라이브러리/테스트 경로)
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
    
    void logTrade(const std::string& symbol, const std::string& side,
                  double price, double quantity, double pnl);
    
private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> trade_logger_;
    bool initialized_ = false;
};

#define LOG_INFO(...) quantcore::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) quantcore::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) quantcore::Logger::getInstance().error(__VA_ARGS__)

} // namespace quantcore
