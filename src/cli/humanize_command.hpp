#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <cstdint>
#include <ostream>

namespace etabar {
namespace cli {

class HumanizeCommand : public MainCommand {
public:
    HumanizeCommand();
    
    void setup(CLI::App* subcommand) override;
    int execute() override;
    
    int run(std::ostream& out);

private:
    std::int64_t seconds_ = 0;
};

}}
