#include "etabar/render/bar_layout.hpp"
#include "etabar/common/constants.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>

namespace etabar {
namespace render {

namespace {

std::string repeat(const std::string& unit, long long count) {
    std::string result;
    if (count <= 0 || unit.empty()) {
        return result;
    }
    result.reserve(unit.size() * static_cast<size_t>(count));
    for (long long i = 0; i < count; ++i) {
        result += unit;
    }
    return result;
}

}

std::string formatPercentage(double percentage, int precision) {
    return fmt::format("{:.{}f}%", percentage, precision);
}

std::string formatEtaSuffix(const std::string& eta_text) {
    if (eta_text.empty()) {
        return "";
    }
    return std::string(constants::bar::ETA_PREFIX) + eta_text + constants::bar::ETA_SUFFIX;
}

BarMetrics computeBarMetrics(double percentage, int width, const std::string& eta_text) {
    using namespace constants::bar;
    
    BarMetrics metrics;
    metrics.percentage_text = formatPercentage(percentage, PERCENTAGE_PRECISION);
    metrics.eta_suffix = formatEtaSuffix(eta_text);
    
    metrics.inner_width = static_cast<long long>(width)
                        - OPEN_BRACKET_WIDTH
                        - static_cast<long long>(metrics.eta_suffix.size())
                        - PERCENTAGE_GAP_WIDTH
                        - static_cast<long long>(metrics.percentage_text.size())
                        - CLOSE_BRACKET_WIDTH;
    
    long long budget = std::max(metrics.inner_width, 0LL);
    
    double raw_filled = std::ceil(static_cast<double>(metrics.inner_width) * (percentage / 100.0));
    long long filled = 0;
    if (std::isfinite(raw_filled) && raw_filled > 0.0) {
        filled = raw_filled >= static_cast<double>(budget) ? budget : static_cast<long long>(raw_filled);
    }
    
    metrics.filled = filled;
    metrics.track = budget - filled;
    return metrics;
}

std::string layoutBar(double percentage, int width, const std::string& eta_text,
                      const BarStyle& style, const Colorizer& colorizer) {
    BarMetrics metrics = computeBarMetrics(percentage, width, eta_text);
    
    std::string row = "[";
    row += repeat(colorizer.colorize(style.fill_color, style.fill_char), metrics.filled);
    row += repeat(colorizer.colorize(style.track_color, style.track_char), metrics.track);
    row += "] ";
    row += metrics.percentage_text;
    row += " ";
    row += metrics.eta_suffix;
    return row;
}

}}
