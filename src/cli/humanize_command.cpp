#include "humanize_command.hpp"
#include "etabar/render/duration.hpp"
#include <iostream>

namespace etabar {
namespace cli {

HumanizeCommand::HumanizeCommand() = default;

void HumanizeCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    
    subcommand->add_option("seconds", seconds_, "Duration in seconds")
              ->required()
              ->check(CLI::NonNegativeNumber);
    
    markCalledOnParse(subcommand);
}

int HumanizeCommand::execute() {
    return run(std::cout);
}

int HumanizeCommand::run(std::ostream& out) {
    out << render::humanize(seconds_) << "\n";
    return 0;
}

}}
