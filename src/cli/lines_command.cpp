#include "lines_command.hpp"
#include "etabar/common/config.hpp"
#include "etabar/common/logger.hpp"
#include "etabar/render/error_codes.hpp"
#include "etabar/render/progress_renderer.hpp"
#include <iostream>

namespace etabar {
namespace cli {

namespace {

std::string trim(const std::string& line) {
    const char* whitespace = " \t\r\n";
    auto begin = line.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = line.find_last_not_of(whitespace);
    return line.substr(begin, end - begin + 1);
}

}

LinesCommand::LinesCommand() = default;

void LinesCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    
    subcommand->add_option("-t,--total", total_text_, "Expected number of lines")->required();
    subcommand->add_flag("-n,--numeric", numeric_,
                         "Treat each line as the absolute progress value instead of one step");
    style_.addTo(subcommand);
    
    markCalledOnParse(subcommand);
}

int LinesCommand::execute() {
    return process(std::cin, std::cout, std::cerr);
}

int LinesCommand::process(std::istream& in, std::ostream& out, std::ostream& err) {
    const auto& config = common::Config::instance().global();
    bool drawn = false;
    
    try {
        double total = render::ProgressRenderer::parseTotal(total_text_);
        
        render::ProgressRenderer renderer(total,
                                          style_.resolveStyle(config.bar),
                                          style_.resolveWidthProvider(config.bar),
                                          style_.resolveColorizer(config.bar));
        
        std::string line;
        size_t line_number = 0;
        size_t skipped = 0;
        
        while (std::getline(in, line)) {
            ++line_number;
            
            if (!numeric_) {
                out << renderer.render() << std::flush;
                drawn = true;
                continue;
            }
            
            double value = 0.0;
            try {
                value = render::ProgressRenderer::parseProgress(trim(line));
            } catch (const render::InvalidArgument& e) {
                ++skipped;
                common::Logger::instance().warn("[Lines] Skipped | line={} | error={}", line_number, e.what());
                continue;
            }
            
            out << renderer.render(value) << std::flush;
            drawn = true;
        }
        
        if (drawn) {
            out << std::endl;
        }
        
        if (skipped > 0) {
            err << "Skipped " << skipped << " non-numeric line" << (skipped == 1 ? "" : "s") << "\n";
        }
        
        common::Logger::instance().info("[Lines] Finished | lines={} | skipped={} | current={}",
                                        line_number, skipped, renderer.current());
        return 0;
        
    } catch (const render::InvalidArgument& e) {
        if (drawn) {
            out << std::endl;
        }
        common::Logger::instance().error("[Lines] Rejected | code={} | error={}",
                                         render::RenderErrorCodeHelper::toString(e.code()), e.what());
        err << "Error: " << e.what() << "\n";
        return 1;
    }
}

}}
