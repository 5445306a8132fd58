#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <ostream>
#include <string>

namespace etabar {
namespace cli {

class ConfigCommand : public MainCommand {
public:
    ConfigCommand();
    
    void setup(CLI::App* subcommand) override;
    int execute() override;
    
    int run(std::ostream& out, std::ostream& err);

private:
    CLI::App* init_cmd_ = nullptr;
    bool init_force_ = false;
    
    CLI::App* set_cmd_ = nullptr;
    std::string set_key_;
    std::string set_value_;
    
    CLI::App* get_cmd_ = nullptr;
    std::string get_key_;
    
    CLI::App* show_cmd_ = nullptr;
    
    CLI::App* validate_cmd_ = nullptr;
    
    int executeInit(std::ostream& out, std::ostream& err);
    int executeSet(std::ostream& out, std::ostream& err);
    int executeGet(std::ostream& out, std::ostream& err);
    int executeShow(std::ostream& out, std::ostream& err);
    int executeValidate(std::ostream& out);
};

}}
