#pragma once

#include "colorizer.hpp"
#include <string>

namespace etabar {
namespace render {

struct BarStyle {
    std::string fill_char = "=";
    std::string track_char = " ";
    std::string fill_color = "default";
    std::string track_color = "default";
};

struct BarMetrics {
    std::string percentage_text;
    std::string eta_suffix;
    long long inner_width = 0;
    long long filled = 0;
    long long track = 0;
};

std::string formatPercentage(double percentage, int precision = 2);

std::string formatEtaSuffix(const std::string& eta_text);

/**
 * Splits the row budget between the bar and its labels.
 *
 * inner_width = width - 1 - len(eta_suffix) - 1 - len(percentage_text) - 2
 * filled      = ceil(inner_width * percentage / 100), clamped to [0, inner_width]
 * track       = inner_width - filled
 *
 * A negative inner_width (narrow terminal or unknown width) yields zero cells.
 */
BarMetrics computeBarMetrics(double percentage, int width, const std::string& eta_text);

// "[" + fill cells + track cells + "] " + percentage + " " + eta suffix.
// Every cell is colorized on its own.
std::string layoutBar(double percentage, int width, const std::string& eta_text,
                      const BarStyle& style, const Colorizer& colorizer);

}}
