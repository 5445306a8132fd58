#pragma once

#include "bar_layout.hpp"
#include "colorizer.hpp"
#include "width_provider.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace etabar {
namespace render {

/**
 * Single-line progress bar for a loop with a known number of steps.
 *
 * Each render() call advances progress (by one, or to an explicit value),
 * re-reads the terminal width and returns a carriage-return prefixed row:
 *
 *   \r[=========          ] 45.00% (ETA: 1 minute 4 seconds)
 *
 * Progress never moves backwards. Not safe for concurrent use.
 */
class ProgressRenderer {
public:
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;
    
    explicit ProgressRenderer(double total,
                              BarStyle style = BarStyle{},
                              std::shared_ptr<const WidthProvider> width_provider = nullptr,
                              std::shared_ptr<const Colorizer> colorizer = nullptr,
                              TimeSource time_source = nullptr);
    
    // Throws InvalidArgument on regression or a non-finite value.
    std::string render(std::optional<double> current = std::nullopt);
    
    // Remaining time for the given percentage, empty when unknown.
    std::string estimate(double percentage) const;
    
    double percentage() const;
    double current() const { return current_; }
    double total() const { return total_; }
    const BarStyle& style() const { return style_; }
    
    static double parseTotal(const std::string& text);
    static double parseProgress(const std::string& text);

private:
    double total_;
    double current_ = 0.0;
    BarStyle style_;
    std::shared_ptr<const WidthProvider> width_provider_;
    std::shared_ptr<const Colorizer> colorizer_;
    TimeSource time_source_;
    Clock::time_point start_time_;
    
    void advance(std::optional<double> current);
};

}}
