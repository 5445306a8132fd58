#pragma once

#include "config.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <memory>
#include <string>

namespace etabar {
namespace common {

enum class LogMode {
    CONSOLE_ONLY,
    FILE_ONLY
};

// Process-wide logger. Until initialize() runs every call is a no-op, so the
// render code can log unconditionally.
class Logger {
public:
    static Logger& instance();
    
    void initialize(LogMode mode, const std::string& log_file, LogLevel level, const LoggingConfig& logging_config);
    void shutdown();
    
    template<typename... Args>
    void error(const std::string& format, Args&&... args) {
        log(spdlog::level::err, format, std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void warn(const std::string& format, Args&&... args) {
        log(spdlog::level::warn, format, std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void info(const std::string& format, Args&&... args) {
        log(spdlog::level::info, format, std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void debug(const std::string& format, Args&&... args) {
        log(spdlog::level::debug, format, std::forward<Args>(args)...);
    }

    // File the FILE_ONLY sink writes to; JSON logs get ".json" before the extension.
    static std::string resolveLogFile(const std::string& base_path, LogFormat format);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> logger_;
    
    template<typename... Args>
    void log(spdlog::level::level_enum level, const std::string& format, Args&&... args) {
        if (logger_) logger_->log(level, fmt::runtime(format), std::forward<Args>(args)...);
    }
    
    static spdlog::level::level_enum toSpdlogLevel(LogLevel level);
    static spdlog::sink_ptr makeFileSink(const std::string& log_file, const LoggingConfig& logging_config);
};

}}
