#pragma once

#include <string>
#include <cstdint>
#include <cstddef>

namespace etabar {
namespace constants {

namespace version {
    constexpr const char* CLI_VERSION = "1.0.0";

    inline std::string getFullVersion() {
        return std::string("etabar v") + CLI_VERSION;
    }
}

namespace system {
    constexpr const char* APPLICATION_NAME = "etabar";
    constexpr const char* CONFIG_ENV = "ETABAR_CONFIG";
    constexpr const char* CONFIG_FILE_NAME = "etabar.toml";
    constexpr const char* LOGGER_NAME = "etabar";
}

namespace bar {
    constexpr const char* DEFAULT_FILL_CHAR = "=";
    constexpr const char* DEFAULT_TRACK_CHAR = " ";
    constexpr const char* DEFAULT_COLOR = "default";
    constexpr const char* ETA_PREFIX = "(ETA: ";
    constexpr const char* ETA_SUFFIX = ")";
    constexpr int PERCENTAGE_PRECISION = 2;

    // "[" + " " before the percentage + "] " after the track
    constexpr int OPEN_BRACKET_WIDTH = 1;
    constexpr int PERCENTAGE_GAP_WIDTH = 1;
    constexpr int CLOSE_BRACKET_WIDTH = 2;
}

namespace limits {
    constexpr double MIN_TOTAL = 1.0;
    constexpr int DEFAULT_RUN_TOTAL = 100;
    constexpr int DEFAULT_RUN_INTERVAL_MS = 50;
    constexpr int MAX_WIDTH = 4096;

    // 100 years; keeps start + elapsed inside steady_clock's nanosecond range
    constexpr double MAX_ELAPSED_SECONDS = 3153600000.0;

    constexpr size_t DEFAULT_LOG_ROTATION_SIZE_MB = 10;
    constexpr size_t DEFAULT_LOG_MAX_FILES = 3;
}

namespace config_defaults {
    constexpr int BAR_WIDTH = 0;

    constexpr int RUN_TOTAL = limits::DEFAULT_RUN_TOTAL;
    constexpr int RUN_INTERVAL_MS = limits::DEFAULT_RUN_INTERVAL_MS;

    constexpr size_t LOG_ROTATION_SIZE_MB = limits::DEFAULT_LOG_ROTATION_SIZE_MB;
    constexpr size_t LOG_MAX_FILES = limits::DEFAULT_LOG_MAX_FILES;
}

}
}
