#include "etabar/common/logger.hpp"
#include "etabar/common/constants.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <filesystem>

namespace etabar {
namespace common {

namespace {

constexpr const char* TEXT_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";
constexpr const char* JSON_PATTERN = R"({"timestamp":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","message":"%v"})";

}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(LogMode mode, const std::string& log_file, LogLevel level, const LoggingConfig& logging_config) {
    if (logger_) {
        logger_->warn("[Logger] Already initialized, ignoring duplicate initialization");
        return;
    }
    
    auto spdlog_level = toSpdlogLevel(level);
    
    spdlog::sink_ptr sink;
    bool json = false;
    if (mode == LogMode::FILE_ONLY) {
        sink = makeFileSink(log_file, logging_config);
        json = sink && logging_config.format == LogFormat::JSON;
    }
    
    // The bar owns stdout, so console logging always goes to stderr
    if (!sink) {
        sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    }
    sink->set_level(spdlog_level);
    
    logger_ = std::make_shared<spdlog::logger>(constants::system::LOGGER_NAME, sink);
    logger_->set_pattern(json ? JSON_PATTERN : TEXT_PATTERN);
    logger_->set_level(spdlog_level);
    
    if (mode == LogMode::FILE_ONLY) {
        logger_->flush_on(spdlog::level::info);
    }
}

spdlog::sink_ptr Logger::makeFileSink(const std::string& log_file, const LoggingConfig& logging_config) {
    if (log_file.empty()) {
        std::cerr << "[Logger] No log file given, logging to stderr" << std::endl;
        return nullptr;
    }
    
    std::filesystem::path log_dir = std::filesystem::path(log_file).parent_path();
    std::error_code ec;
    if (!log_dir.empty() && !std::filesystem::exists(log_dir, ec) &&
        !std::filesystem::create_directories(log_dir, ec)) {
        std::cerr << "[Logger] Failed to create log directory: " << log_dir
                  << " - " << ec.message() << ", logging to stderr" << std::endl;
        return nullptr;
    }
    
    try {
        return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            resolveLogFile(log_file, logging_config.format),
            logging_config.rotation_size_mb * 1024 * 1024,
            logging_config.max_files);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "[Logger] Failed to open log file: " << log_file
                  << " - " << ex.what() << ", logging to stderr" << std::endl;
        return nullptr;
    }
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        logger_.reset();
    }
}

spdlog::level::level_enum Logger::toSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::DEBUG: return spdlog::level::debug;
    }
    return spdlog::level::info;
}

std::string Logger::resolveLogFile(const std::string& base_path, LogFormat format) {
    if (format != LogFormat::JSON) {
        return base_path;
    }
    std::filesystem::path p(base_path);
    p.replace_filename(p.stem().string() + ".json" + p.extension().string());
    return p.string();
}

}}
