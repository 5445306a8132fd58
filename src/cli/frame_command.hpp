#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <ostream>
#include <string>

namespace etabar {
namespace cli {

class FrameCommand : public MainCommand {
public:
    FrameCommand();
    
    void setup(CLI::App* subcommand) override;
    int execute() override;
    
    int renderTo(std::ostream& out, std::ostream& err);

private:
    std::string total_text_;
    std::string current_text_;
    double elapsed_seconds_ = 0.0;
    bool json_output_ = false;
    bool newline_ = false;
    StyleOptions style_;
};

}}
