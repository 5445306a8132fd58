#include "run_command.hpp"
#include "etabar/common/config.hpp"
#include "etabar/common/logger.hpp"
#include "etabar/render/error_codes.hpp"
#include "etabar/render/progress_renderer.hpp"
#include <iostream>
#include <thread>
#include <chrono>

namespace etabar {
namespace cli {

RunCommand::RunCommand() = default;

void RunCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    
    subcommand->add_option("-t,--total", total_text_, "Number of steps (default: run.total)");
    subcommand->add_option("-i,--interval-ms", interval_ms_, "Delay between steps in milliseconds")
              ->check(CLI::NonNegativeNumber);
    style_.addTo(subcommand);
    
    markCalledOnParse(subcommand);
}

int RunCommand::execute() {
    const auto& config = common::Config::instance().global();
    
    try {
        double total = total_text_.empty()
            ? static_cast<double>(config.run.total)
            : render::ProgressRenderer::parseTotal(total_text_);
        int interval_ms = interval_ms_.value_or(config.run.interval_ms);
        
        render::ProgressRenderer renderer(total,
                                          style_.resolveStyle(config.bar),
                                          style_.resolveWidthProvider(config.bar),
                                          style_.resolveColorizer(config.bar));
        
        common::Logger::instance().info("[Run] Started | total={} | interval_ms={}", total, interval_ms);
        
        while (renderer.current() + 1.0 <= total) {
            std::this_thread::sleep_for(std::chrono::milliseconds(interval_ms));
            std::cout << renderer.render() << std::flush;
        }
        
        if (renderer.current() < total) {
            std::this_thread::sleep_for(std::chrono::milliseconds(interval_ms));
            std::cout << renderer.render(total) << std::flush;
        }
        
        std::cout << std::endl;
        common::Logger::instance().info("[Run] Finished | steps={}", renderer.current());
        return 0;
        
    } catch (const render::InvalidArgument& e) {
        common::Logger::instance().error("[Run] Rejected | code={} | error={}",
                                         render::RenderErrorCodeHelper::toString(e.code()), e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}}
