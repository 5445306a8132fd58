#include "colors_command.hpp"
#include "etabar/common/config.hpp"
#include "etabar/render/colorizer.hpp"
#include <iomanip>
#include <iostream>

namespace etabar {
namespace cli {

ColorsCommand::ColorsCommand() = default;

void ColorsCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    
    subcommand->add_option("--color", color_mode_, "Color output: auto, always or never")
              ->check(CLI::IsMember({"auto", "always", "never"}));
    subcommand->add_option("-s,--sample", sample_, "Text drawn in each color");
    
    markCalledOnParse(subcommand);
}

int ColorsCommand::execute() {
    return run(std::cout);
}

int ColorsCommand::run(std::ostream& out) {
    StyleOptions options;
    options.color_mode = color_mode_;
    auto colorizer = options.resolveColorizer(common::Config::instance().global().bar);
    
    for (const auto& name : render::AnsiColorizer::names()) {
        out << "  " << std::left << std::setw(14) << name
                  << colorizer->colorize(name, sample_) << "\n";
    }
    
    return 0;
}

}}
