#include "etabar/render/progress_renderer.hpp"
#include "etabar/render/error_codes.hpp"
#include "etabar/render/eta.hpp"
#include "etabar/common/constants.hpp"
#include "etabar/common/logger.hpp"
#include <spdlog/fmt/fmt.h>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <initializer_list>
#include <utility>

namespace etabar {
namespace render {

namespace {

bool isPlainNumber(const std::string& text) {
    if (text.empty()) {
        return false;
    }
    for (char c : text) {
        bool allowed = (c >= '0' && c <= '9') || c == '.' || c == '-' || c == '+' || c == 'e' || c == 'E';
        if (!allowed) {
            return false;
        }
    }
    return true;
}

std::optional<double> parseStrictNumber(const std::string& text) {
    if (!isPlainNumber(text)) {
        return std::nullopt;
    }
    
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(text.c_str(), &end);
    if (errno != 0 || end != text.c_str() + text.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

common::ErrorContext makeContext(std::initializer_list<std::pair<const std::string, std::string>> details) {
    common::ErrorContext ctx;
    ctx.component = "ProgressRenderer";
    ctx.details = details;
    return ctx;
}

}

ProgressRenderer::ProgressRenderer(double total,
                                   BarStyle style,
                                   std::shared_ptr<const WidthProvider> width_provider,
                                   std::shared_ptr<const Colorizer> colorizer,
                                   TimeSource time_source)
    : total_(total),
      style_(std::move(style)),
      width_provider_(std::move(width_provider)),
      colorizer_(std::move(colorizer)),
      time_source_(std::move(time_source)) {
    if (!std::isfinite(total_) || total_ < constants::limits::MIN_TOTAL) {
        throw InvalidArgument(RenderErrorCode::INVALID_TOTAL,
                              makeContext({{"total", fmt::format("{}", total_)}}));
    }
    
    if (!width_provider_) {
        width_provider_ = std::make_shared<TerminalWidthProvider>();
    }
    if (!colorizer_) {
        colorizer_ = std::make_shared<AnsiColorizer>();
    }
    if (!time_source_) {
        time_source_ = [] { return Clock::now(); };
    }
    
    start_time_ = time_source_();
    
    common::Logger::instance().debug("[Renderer] Created | total={} | fill={} | track={} | fill_color={} | track_color={}",
                                     total_, style_.fill_char, style_.track_char,
                                     style_.fill_color, style_.track_color);
}

void ProgressRenderer::advance(std::optional<double> current) {
    if (!current) {
        current_ += 1.0;
        return;
    }
    
    if (!std::isfinite(*current)) {
        throw InvalidArgument(RenderErrorCode::INVALID_PROGRESS,
                              makeContext({{"requested", fmt::format("{}", *current)}}));
    }
    
    if (*current < current_) {
        throw InvalidArgument(RenderErrorCode::PROGRESS_REGRESSION,
                              makeContext({{"current", fmt::format("{}", current_)},
                                           {"requested", fmt::format("{}", *current)}}));
    }
    
    // -0 compares equal to 0 but would print as "-0.00%"
    current_ = *current == 0.0 ? 0.0 : *current;
}

std::string ProgressRenderer::render(std::optional<double> current) {
    advance(current);
    
    double progress = percentage();
    int width = width_provider_->columns();
    std::string eta = estimate(progress);
    
    return "\r" + layoutBar(progress, width, eta, style_, *colorizer_);
}

std::string ProgressRenderer::estimate(double percentage) const {
    std::chrono::duration<double> elapsed = time_source_() - start_time_;
    return formatEta(percentage, elapsed);
}

double ProgressRenderer::percentage() const {
    return current_ / total_ * 100.0;
}

double ProgressRenderer::parseTotal(const std::string& text) {
    auto value = parseStrictNumber(text);
    if (!value || *value < constants::limits::MIN_TOTAL) {
        throw InvalidArgument(RenderErrorCode::INVALID_TOTAL,
                              makeContext({{"total", text}}));
    }
    return *value;
}

double ProgressRenderer::parseProgress(const std::string& text) {
    auto value = parseStrictNumber(text);
    if (!value || *value < 0.0) {
        throw InvalidArgument(RenderErrorCode::INVALID_PROGRESS,
                              makeContext({{"requested", text}}));
    }
    return *value == 0.0 ? 0.0 : *value;
}

}}
