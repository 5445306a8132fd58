#include "etabar/common/config.hpp"
#include "etabar/common/constants.hpp"
#include "etabar/common/paths.hpp"
#include "etabar/common/logger.hpp"
#include <toml.hpp>
#include <cctype>
#include <stdexcept>
#include <fstream>
#include <filesystem>
#include <unistd.h>

namespace etabar {
namespace common {

namespace {

void requireDigits(const std::string& value) {
    if (value.empty() || std::isspace(static_cast<unsigned char>(value.front()))) {
        throw std::invalid_argument("not a number");
    }
}

int parseInt(const std::string& value) {
    requireDigits(value);
    size_t pos = 0;
    int result = std::stoi(value, &pos);
    if (pos != value.size()) {
        throw std::invalid_argument("trailing characters");
    }
    return result;
}

size_t parseSize(const std::string& value) {
    requireDigits(value);
    if (value.front() == '-') {
        throw std::invalid_argument("negative value");
    }
    size_t pos = 0;
    unsigned long long result = std::stoull(value, &pos);
    if (pos != value.size()) {
        throw std::invalid_argument("trailing characters");
    }
    return static_cast<size_t>(result);
}

}

std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN: return "WARN";
        case LogLevel::INFO: return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
    }
    return "INFO";
}

std::string to_string(ColorMode mode) {
    switch (mode) {
        case ColorMode::AUTO: return "auto";
        case ColorMode::ALWAYS: return "always";
        case ColorMode::NEVER: return "never";
    }
    return "auto";
}

std::optional<LogLevel> parseLogLevel(const std::string& value) {
    if (value == "DEBUG") return LogLevel::DEBUG;
    if (value == "INFO") return LogLevel::INFO;
    if (value == "WARN") return LogLevel::WARN;
    if (value == "ERROR") return LogLevel::ERROR;
    return std::nullopt;
}

std::optional<ColorMode> parseColorMode(const std::string& value) {
    if (value == "auto") return ColorMode::AUTO;
    if (value == "always") return ColorMode::ALWAYS;
    if (value == "never") return ColorMode::NEVER;
    return std::nullopt;
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() {
    global_ = createDefaultConfig();
}

GlobalConfig Config::createDefaultConfig() {
    using namespace constants::config_defaults;

    GlobalConfig config;

    config.log_level = LogLevel::WARN;
    config.log_file = "";

    config.bar.fill_char = constants::bar::DEFAULT_FILL_CHAR;
    config.bar.track_char = constants::bar::DEFAULT_TRACK_CHAR;
    config.bar.fill_color = constants::bar::DEFAULT_COLOR;
    config.bar.track_color = constants::bar::DEFAULT_COLOR;
    config.bar.color_mode = ColorMode::AUTO;
    config.bar.width = BAR_WIDTH;

    config.logging.rotation_size_mb = LOG_ROTATION_SIZE_MB;
    config.logging.max_files = LOG_MAX_FILES;
    config.logging.format = LogFormat::TEXT;

    config.run.total = RUN_TOTAL;
    config.run.interval_ms = RUN_INTERVAL_MS;

    return config;
}

void Config::reset() {
    global_ = createDefaultConfig();
    current_config_path_.clear();
}

std::optional<std::string> Config::findBestConfig() const {
    auto paths = PathManager::instance().getConfigSearchPaths();

    for (const auto& path : paths) {
        if (std::filesystem::exists(path) && access(path.c_str(), R_OK) == 0) {
            return path;
        }
    }

    return std::nullopt;
}

bool Config::load(const std::string& config_file) {
    global_ = createDefaultConfig();

    std::string effective_config_file = config_file;
    if (effective_config_file.empty()) {
        auto best = findBestConfig();
        effective_config_file = best ? *best : PathManager::instance().getConfigFile();
    }

    current_config_path_ = effective_config_file;

    if (!std::filesystem::exists(effective_config_file)) {
        Logger::instance().debug("[Config] Not found, using defaults | path={}", effective_config_file);
        return true;
    }

    return tryLoadTomlFile(effective_config_file);
}

bool Config::tryLoadTomlFile(const std::string& path) {
    if (access(path.c_str(), R_OK) != 0) {
        Logger::instance().warn("[Config] Not readable | path={}", path);
        return false;
    }

    try {
        auto data = toml::parse(path);

        if (data.contains("global")) {
            auto global_section = data.at("global");

            if (global_section.contains("log_file")) {
                global_.log_file = toml::find<std::string>(global_section, "log_file");
            }
            if (global_section.contains("log_level")) {
                auto level = parseLogLevel(toml::find<std::string>(global_section, "log_level"));
                if (level) {
                    global_.log_level = *level;
                }
            }
        }

        if (data.contains("bar")) {
            auto bar_section = data.at("bar");

            if (bar_section.contains("fill_char")) {
                global_.bar.fill_char = toml::find<std::string>(bar_section, "fill_char");
            }
            if (bar_section.contains("track_char")) {
                global_.bar.track_char = toml::find<std::string>(bar_section, "track_char");
            }
            if (bar_section.contains("fill_color")) {
                global_.bar.fill_color = toml::find<std::string>(bar_section, "fill_color");
            }
            if (bar_section.contains("track_color")) {
                global_.bar.track_color = toml::find<std::string>(bar_section, "track_color");
            }
            if (bar_section.contains("color")) {
                auto mode = parseColorMode(toml::find<std::string>(bar_section, "color"));
                if (mode) {
                    global_.bar.color_mode = *mode;
                }
            }
            if (bar_section.contains("width")) {
                global_.bar.width = toml::find<int>(bar_section, "width");
            }
        }

        if (data.contains("logging")) {
            auto logging_section = data.at("logging");

            if (logging_section.contains("rotation_size_mb")) {
                global_.logging.rotation_size_mb = toml::find<size_t>(logging_section, "rotation_size_mb");
            }
            if (logging_section.contains("max_files")) {
                global_.logging.max_files = toml::find<size_t>(logging_section, "max_files");
            }
            if (logging_section.contains("format")) {
                std::string format_str = toml::find<std::string>(logging_section, "format");
                global_.logging.format = format_str == "json" ? LogFormat::JSON : LogFormat::TEXT;
            }
        }

        if (data.contains("run")) {
            auto run_section = data.at("run");

            if (run_section.contains("total")) {
                global_.run.total = toml::find<int>(run_section, "total");
            }
            if (run_section.contains("interval_ms")) {
                global_.run.interval_ms = toml::find<int>(run_section, "interval_ms");
            }
        }

        Logger::instance().info("[Config] Loaded | path={}", path);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Parse failed | path={} | error={}", path, e.what());
        return false;
    }
}

bool Config::save(const std::string& config_file) {
    try {
        std::string effective_config_file = config_file;
        if (effective_config_file.empty()) {
            effective_config_file = getConfigPath();
        }

        std::filesystem::path config_dir = std::filesystem::path(effective_config_file).parent_path();
        if (!config_dir.empty() && !std::filesystem::exists(config_dir)) {
            std::filesystem::create_directories(config_dir);
        }

        toml::value data = toml::table{
            {"global", toml::table{
                {"log_file", global_.log_file},
                {"log_level", to_string(global_.log_level)}
            }},
            {"bar", toml::table{
                {"fill_char", global_.bar.fill_char},
                {"track_char", global_.bar.track_char},
                {"fill_color", global_.bar.fill_color},
                {"track_color", global_.bar.track_color},
                {"color", to_string(global_.bar.color_mode)},
                {"width", global_.bar.width}
            }},
            {"logging", toml::table{
                {"rotation_size_mb", global_.logging.rotation_size_mb},
                {"max_files", global_.logging.max_files},
                {"format", global_.logging.format == LogFormat::JSON ? "json" : "text"}
            }},
            {"run", toml::table{
                {"total", global_.run.total},
                {"interval_ms", global_.run.interval_ms}
            }}
        };

        std::ofstream file(effective_config_file);
        if (!file) {
            Logger::instance().error("[Config] File open failed | path={}", effective_config_file);
            return false;
        }

        file << toml::format(data);
        file.close();

        current_config_path_ = effective_config_file;

        Logger::instance().info("[Config] Saved | path={}", effective_config_file);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Save failed | error={}", e.what());
        return false;
    }
}

bool Config::exists() const {
    return std::filesystem::exists(getConfigPath());
}

const std::vector<std::string>& Config::knownKeys() {
    static const std::vector<std::string> keys = {
        "log_file", "log_level",
        "bar.fill_char", "bar.track_char", "bar.fill_color", "bar.track_color",
        "bar.color", "bar.width",
        "logging.rotation_size_mb", "logging.max_files", "logging.format",
        "run.total", "run.interval_ms"
    };
    return keys;
}

bool Config::setValue(const std::string& key, const std::string& value) {
    try {
        if (key == "log_file") global_.log_file = value;
        else if (key == "log_level") {
            auto level = parseLogLevel(value);
            if (!level) return false;
            global_.log_level = *level;
        }
        else if (key == "bar.fill_char") global_.bar.fill_char = value;
        else if (key == "bar.track_char") global_.bar.track_char = value;
        else if (key == "bar.fill_color") global_.bar.fill_color = value;
        else if (key == "bar.track_color") global_.bar.track_color = value;
        else if (key == "bar.color") {
            auto mode = parseColorMode(value);
            if (!mode) return false;
            global_.bar.color_mode = *mode;
        }
        else if (key == "bar.width") global_.bar.width = parseInt(value);
        else if (key == "logging.rotation_size_mb") global_.logging.rotation_size_mb = parseSize(value);
        else if (key == "logging.max_files") global_.logging.max_files = parseSize(value);
        else if (key == "logging.format") {
            if (value != "json" && value != "text") return false;
            global_.logging.format = (value == "json") ? LogFormat::JSON : LogFormat::TEXT;
        }
        else if (key == "run.total") global_.run.total = parseInt(value);
        else if (key == "run.interval_ms") global_.run.interval_ms = parseInt(value);
        else {
            Logger::instance().debug("[Config] Unknown key | key={}", key);
            return false;
        }
    } catch (const std::exception& e) {
        Logger::instance().debug("[Config] Invalid value | key={} | value={} | error={}", key, value, e.what());
        return false;
    }

    return true;
}

std::optional<std::string> Config::getValue(const std::string& key) const {
    if (key == "log_file") return global_.log_file;
    else if (key == "log_level") return to_string(global_.log_level);
    else if (key == "bar.fill_char") return global_.bar.fill_char;
    else if (key == "bar.track_char") return global_.bar.track_char;
    else if (key == "bar.fill_color") return global_.bar.fill_color;
    else if (key == "bar.track_color") return global_.bar.track_color;
    else if (key == "bar.color") return to_string(global_.bar.color_mode);
    else if (key == "bar.width") return std::to_string(global_.bar.width);
    else if (key == "logging.rotation_size_mb") return std::to_string(global_.logging.rotation_size_mb);
    else if (key == "logging.max_files") return std::to_string(global_.logging.max_files);
    else if (key == "logging.format") return global_.logging.format == LogFormat::JSON ? "json" : "text";
    else if (key == "run.total") return std::to_string(global_.run.total);
    else if (key == "run.interval_ms") return std::to_string(global_.run.interval_ms);

    return std::nullopt;
}

std::string Config::getConfigPath() const {
    if (!current_config_path_.empty()) {
        return current_config_path_;
    }
    return PathManager::instance().getConfigFile();
}

}}
