#pragma once

#include <string>
#include <optional>
#include <vector>
#include <cstddef>

namespace etabar {
namespace common {

enum class LogLevel {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

enum class LogFormat {
    TEXT,
    JSON
};

enum class ColorMode {
    AUTO,
    ALWAYS,
    NEVER
};

struct BarConfig {
    std::string fill_char;
    std::string track_char;
    std::string fill_color;
    std::string track_color;
    ColorMode color_mode;
    int width;
};

struct LoggingConfig {
    size_t rotation_size_mb;
    size_t max_files;
    LogFormat format;
};

struct RunConfig {
    int total;
    int interval_ms;
};

struct GlobalConfig {
    std::string log_file;
    LogLevel log_level;
    BarConfig bar;
    LoggingConfig logging;
    RunConfig run;
};

std::string to_string(LogLevel level);
std::string to_string(ColorMode mode);
std::optional<LogLevel> parseLogLevel(const std::string& value);
std::optional<ColorMode> parseColorMode(const std::string& value);

class Config {
public:
    static Config& instance();

    static GlobalConfig createDefaultConfig();

    bool load(const std::string& config_file = "");
    bool save(const std::string& config_file = "");
    bool exists() const;
    void reset();

    std::optional<std::string> findBestConfig() const;

    const GlobalConfig& global() const { return global_; }
    GlobalConfig& global() { return global_; }

    bool setValue(const std::string& key, const std::string& value);
    std::optional<std::string> getValue(const std::string& key) const;

    static const std::vector<std::string>& knownKeys();

    std::string getConfigPath() const;

private:
    Config();
    GlobalConfig global_;
    std::string current_config_path_;

    bool tryLoadTomlFile(const std::string& path);
};

}}
