#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <optional>
#include <string>

namespace etabar {
namespace cli {

class RunCommand : public MainCommand {
public:
    RunCommand();
    
    void setup(CLI::App* subcommand) override;
    int execute() override;

private:
    std::string total_text_;
    std::optional<int> interval_ms_;
    StyleOptions style_;
};

}}
