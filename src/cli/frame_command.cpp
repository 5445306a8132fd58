#include "frame_command.hpp"
#include "etabar/common/config.hpp"
#include "etabar/common/constants.hpp"
#include "etabar/common/logger.hpp"
#include "etabar/render/error_codes.hpp"
#include "etabar/render/eta.hpp"
#include "etabar/render/progress_renderer.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <iostream>
#include <memory>

namespace etabar {
namespace cli {

FrameCommand::FrameCommand() = default;

void FrameCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    
    subcommand->add_option("-t,--total", total_text_, "Number of steps")->required();
    subcommand->add_option("-c,--current", current_text_, "Completed steps")->required();
    subcommand->add_option("-e,--elapsed", elapsed_seconds_, "Seconds spent so far, used for the ETA")
              ->check(CLI::Range(0.0, constants::limits::MAX_ELAPSED_SECONDS));
    subcommand->add_flag("--json", json_output_, "Print the frame and its parts as JSON");
    subcommand->add_flag("--newline", newline_, "Terminate the row with a newline");
    style_.addTo(subcommand);
    
    markCalledOnParse(subcommand);
}

int FrameCommand::execute() {
    return renderTo(std::cout, std::cerr);
}

int FrameCommand::renderTo(std::ostream& out, std::ostream& err) {
    using Clock = render::ProgressRenderer::Clock;
    
    const auto& config = common::Config::instance().global();
    
    try {
        double total = render::ProgressRenderer::parseTotal(total_text_);
        double current = render::ProgressRenderer::parseProgress(current_text_);
        
        auto now = std::make_shared<Clock::time_point>(Clock::now());
        auto width_provider = style_.resolveWidthProvider(config.bar);
        
        render::ProgressRenderer renderer(total,
                                          style_.resolveStyle(config.bar),
                                          width_provider,
                                          style_.resolveColorizer(config.bar),
                                          [now] { return *now; });
        
        std::chrono::duration<double> elapsed(elapsed_seconds_);
        *now += std::chrono::duration_cast<Clock::duration>(elapsed);
        
        std::string row = renderer.render(current);
        
        if (!json_output_) {
            out << row;
            if (newline_) {
                out << "\n";
            }
            out << std::flush;
            return 0;
        }
        
        double percentage = renderer.percentage();
        auto remaining = render::estimateRemainingSeconds(percentage, elapsed);
        
        nlohmann::json frame;
        frame["row"] = row;
        frame["percentage"] = percentage;
        frame["percentage_text"] = render::formatPercentage(percentage);
        frame["eta"] = renderer.estimate(percentage);
        frame["eta_seconds"] = remaining ? nlohmann::json(*remaining) : nlohmann::json(nullptr);
        frame["width"] = width_provider->columns();
        
        out << frame.dump(2) << std::endl;
        return 0;
        
    } catch (const render::InvalidArgument& e) {
        common::Logger::instance().error("[Frame] Rejected | code={} | error={}",
                                         render::RenderErrorCodeHelper::toString(e.code()), e.what());
        err << "Error: " << e.what() << "\n";
        return 1;
    }
}

}}
