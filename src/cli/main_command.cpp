#include "main_command.hpp"
#include "etabar/common/constants.hpp"
#include "etabar/common/logger.hpp"
#include <unistd.h>

namespace etabar {
namespace cli {

void StyleOptions::addTo(CLI::App* subcommand) {
    subcommand->add_option("--fill", fill_char, "Text drawn for each completed cell");
    subcommand->add_option("--track", track_char, "Text drawn for each remaining cell");
    subcommand->add_option("--fill-color", fill_color, "Color name for completed cells");
    subcommand->add_option("--track-color", track_color, "Color name for remaining cells");
    subcommand->add_option("--color", color_mode, "Color output: auto, always or never")
              ->check(CLI::IsMember({"auto", "always", "never"}));
    subcommand->add_option("-w,--width", width, "Row width in columns (0 = detect)")
              ->check(CLI::Range(0, constants::limits::MAX_WIDTH));
}

render::BarStyle StyleOptions::resolveStyle(const common::BarConfig& config) const {
    render::BarStyle style;
    style.fill_char = fill_char.value_or(config.fill_char);
    style.track_char = track_char.value_or(config.track_char);
    style.fill_color = fill_color.value_or(config.fill_color);
    style.track_color = track_color.value_or(config.track_color);
    return style;
}

std::shared_ptr<const render::WidthProvider> StyleOptions::resolveWidthProvider(const common::BarConfig& config) const {
    int fixed = width.value_or(config.width);
    if (fixed > 0) {
        return std::make_shared<render::FixedWidthProvider>(fixed);
    }
    return std::make_shared<render::TerminalWidthProvider>(STDOUT_FILENO);
}

std::shared_ptr<const render::Colorizer> StyleOptions::resolveColorizer(const common::BarConfig& config) const {
    common::ColorMode mode = config.color_mode;
    if (color_mode) {
        mode = common::parseColorMode(*color_mode).value_or(common::ColorMode::AUTO);
    }
    
    bool use_colors = false;
    switch (mode) {
        case common::ColorMode::ALWAYS: use_colors = true; break;
        case common::ColorMode::NEVER: use_colors = false; break;
        case common::ColorMode::AUTO: use_colors = isatty(STDOUT_FILENO) != 0; break;
    }
    
    common::Logger::instance().debug("[Cli] Color output | mode={} | enabled={}",
                                     common::to_string(mode), use_colors);
    
    if (use_colors) {
        return std::make_shared<render::AnsiColorizer>();
    }
    return std::make_shared<render::PlainColorizer>();
}

MainCommand::MainCommand() = default;
MainCommand::~MainCommand() = default;

bool MainCommand::wasCalled() const {
    return was_called_;
}

void MainCommand::markCalledOnParse(CLI::App* subcommand) {
    subcommand->callback([this]() { was_called_ = true; });
}

}}
