#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <istream>
#include <ostream>
#include <string>

namespace etabar {
namespace cli {

// Draws one frame per line read from stdin, e.g. `make 2>&1 | etabar lines -t 420`.
class LinesCommand : public MainCommand {
public:
    LinesCommand();
    
    void setup(CLI::App* subcommand) override;
    int execute() override;
    
    int process(std::istream& in, std::ostream& out, std::ostream& err);

private:
    std::string total_text_;
    bool numeric_ = false;
    StyleOptions style_;
};

}}
