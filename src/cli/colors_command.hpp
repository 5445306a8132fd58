#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <optional>
#include <ostream>
#include <string>

namespace etabar {
namespace cli {

class ColorsCommand : public MainCommand {
public:
    ColorsCommand();
    
    void setup(CLI::App* subcommand) override;
    int execute() override;
    
    int run(std::ostream& out);

private:
    std::optional<std::string> color_mode_;
    std::string sample_ = "=====";
};

}}
